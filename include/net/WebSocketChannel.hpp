#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "interfaces/IMessageChannel.hpp"
#include "net/StreamSocket.hpp"

namespace net {

/**
 * @brief WebSocket frame opcodes (RFC 6455)
 */
enum class WsOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::TEXT;
    std::vector<uint8_t> payload;
};

// Builds one frame. Client frames must be masked with `mask_key`.
std::vector<uint8_t> encode_frame(WsOpcode opcode, const uint8_t* payload, size_t len,
                                  const uint8_t* mask_key);

// Tries to decode one frame from the front of `buffer`.
// Returns bytes consumed (0 when the frame is incomplete), or an error for a
// malformed or oversized frame.
common::Result<size_t> decode_frame(const std::vector<uint8_t>& buffer, WsFrame& out,
                                    size_t max_payload);

// base64(SHA-1(key + RFC 6455 GUID))
std::string compute_accept_key(const std::string& client_key);

// ============================================================================
// WebSocketChannel - client side of an upgraded connection
// ============================================================================

class WebSocketChannel : public interfaces::IMessageChannel {
public:
    static constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

    WebSocketChannel(std::unique_ptr<StreamSocket> socket, std::vector<uint8_t> leftover);
    ~WebSocketChannel() override;

    common::EmptyResult send_text(const std::string& text) override;
    common::EmptyResult send_binary(const std::vector<uint8_t>& data) override;
    common::Result<std::optional<std::string>> poll_text(std::chrono::milliseconds timeout) override;
    void close(std::chrono::milliseconds timeout) override;

    common::EmptyResult send_ping(const std::string& payload = "");

private:
    common::EmptyResult send_frame(WsOpcode opcode, const uint8_t* data, size_t len);

    // Handles one decoded frame; fills `text` when a full text message completed
    common::EmptyResult handle_frame(WsFrame&& frame, std::optional<std::string>& text);

    std::unique_ptr<StreamSocket> socket_;
    std::vector<uint8_t> rx_buffer_;
    std::vector<uint8_t> fragments_;
    std::optional<WsOpcode> fragment_opcode_;
    bool close_sent_ = false;
    bool close_received_ = false;
    std::mt19937 mask_rng_;

    static constexpr std::chrono::milliseconds SEND_TIMEOUT{5000};
};

// ============================================================================
// WebSocketConnector - opens authenticated channels
// ============================================================================
// Token travels twice: as the `token` query parameter and as an
// `Authorization: Bearer` header. A 401/403 upgrade response is reported as
// ErrorCode::AuthRejected.
// ============================================================================

class WebSocketConnector : public interfaces::IChannelConnector {
public:
    explicit WebSocketConnector(std::string user_agent = "ShikenMatrix-Reporter/1.0");

    common::Result<std::unique_ptr<interfaces::IMessageChannel>> connect(
        const core::Endpoint& endpoint,
        const std::string& auth_token,
        std::chrono::milliseconds timeout,
        const common::CancellationToken& cancel
    ) override;

private:
    std::string user_agent_;
};

} // namespace net
