#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "core/Endpoint.hpp"

namespace interfaces {

// ============================================================================
// IMessageChannel - one established, authenticated connection
// ============================================================================
// Owned and driven by a single IO thread; implementations need no internal
// locking.
//
// Error codes:
//   - Cancelled: peer closed the connection
//   - IoError / ProtocolError: connection is unusable, caller reconnects
// ============================================================================

class IMessageChannel {
public:
    virtual ~IMessageChannel() = default;

    virtual common::EmptyResult send_text(const std::string& text) = 0;
    virtual common::EmptyResult send_binary(const std::vector<uint8_t>& data) = 0;

    // Waits up to `timeout` for the next inbound text message.
    // Returns nullopt when nothing arrived (control frames are handled inside).
    virtual common::Result<std::optional<std::string>> poll_text(std::chrono::milliseconds timeout) = 0;

    // Graceful close, bounded by `timeout`
    virtual void close(std::chrono::milliseconds timeout) = 0;
};

// ============================================================================
// IChannelConnector - strategy that opens channels
// ============================================================================
// A rejected credential must be reported as ErrorCode::AuthRejected.
// The attempt must honor `cancel` and give up after `timeout`.
// ============================================================================

class IChannelConnector {
public:
    virtual ~IChannelConnector() = default;

    virtual common::Result<std::unique_ptr<IMessageChannel>> connect(
        const core::Endpoint& endpoint,
        const std::string& auth_token,
        std::chrono::milliseconds timeout,
        const common::CancellationToken& cancel
    ) = 0;
};

} // namespace interfaces
