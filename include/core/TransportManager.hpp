#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "core/Endpoint.hpp"
#include "core/ReporterTypes.hpp"
#include "interfaces/IMessageChannel.hpp"

namespace core {

// ============================================================================
// TransportManager - persistent authenticated connection to the endpoint
// ============================================================================
// Owns an IO thread that runs the connection state machine:
//
//   Disconnected -> Connecting -> Connected -> (Disconnected | Closing) -> Closed
//
// - Connect attempts back off exponentially between reconnect_min and
//   reconnect_max; a successful connect resets the delay.
// - A rejected credential is an attempt failure like any other (recorded as
//   the last error, retried with backoff).
// - Outbound messages go through a bounded FIFO. enqueue() never blocks;
//   when full, the oldest message is dropped and counted.
// - A message whose send fails is put back at the front, so order survives
//   reconnects.
// - stop() discards the queue, closes gracefully within close_timeout and
//   ends in Closed. Closed is reached only through stop().
//
// Usage:
//   TransportManager transport(endpoint, token, options, connector, logger, errors);
//   transport.start();
//   transport.enqueue(OutboundMessage::text(json));
//   transport.stop();
// ============================================================================

struct OutboundMessage {
    std::string text;
    std::optional<std::vector<uint8_t>> attachment; // binary frame sent right after `text`
    std::string artwork_id; // claimed upload this message carries, empty otherwise

    static OutboundMessage plain(std::string text) {
        return OutboundMessage{std::move(text), std::nullopt, std::string()};
    }
    static OutboundMessage with_attachment(std::string text, std::vector<uint8_t> bytes) {
        return OutboundMessage{std::move(text), std::move(bytes), std::string()};
    }
    static OutboundMessage artwork_upload(std::string text, std::vector<uint8_t> bytes,
                                          std::string content_item_identifier) {
        return OutboundMessage{std::move(text), std::move(bytes), std::move(content_item_identifier)};
    }
};

class TransportManager {
public:
    enum class State {
        Disconnected,
        Connecting,
        Connected,
        Closing,
        Closed
    };

    struct Stats {
        uint64_t messages_sent = 0;
        uint64_t messages_dropped = 0;
        uint64_t messages_received = 0;
        uint64_t bytes_sent = 0;
        uint64_t connect_attempts = 0;
        uint64_t connect_failures = 0;
        uint64_t auth_rejections = 0;
        uint64_t connections = 0;
    };

    TransportManager(Endpoint endpoint,
                     std::string auth_token,
                     EngineOptions options,
                     std::shared_ptr<interfaces::IChannelConnector> connector,
                     std::shared_ptr<common::ILogger> logger,
                     std::shared_ptr<ErrorSlot> errors);
    ~TransportManager();

    TransportManager(const TransportManager&) = delete;
    TransportManager& operator=(const TransportManager&) = delete;

    // ========== Lifecycle ==========

    // Starts the IO thread; the first connect attempt is immediate
    common::EmptyResult start();

    // Moves to Closing, discards queued messages, closes, ends in Closed
    void stop();

    State state() const;
    bool is_connected() const;

    // ========== Send ==========

    // Non-blocking. Returns false when the message was refused (stopping) or
    // an older message had to be dropped to make room.
    bool enqueue(OutboundMessage message);

    size_t queued() const;
    Stats stats() const;

    // ========== Artwork cache ==========

    // URL acknowledged by the server for a content item
    std::optional<std::string> artwork_url(const std::string& content_item_identifier) const;

    // Marks an upload as pending. Returns false if already uploaded, or if a
    // claim younger than artwork_ack_timeout is still waiting for its ack.
    // The claim is released when its message is dropped before being sent.
    bool claim_artwork_upload(const std::string& content_item_identifier);

    static const char* state_name(State state);

private:
    void io_loop(common::CancellationToken token);
    void run_session(interfaces::IMessageChannel& channel, const common::CancellationToken& token);
    common::EmptyResult flush_queue(interfaces::IMessageChannel& channel,
                                    const common::CancellationToken& token);
    void handle_inbound(const std::string& text);

    // Refuses to leave Closing/Closed except Closing -> Closed
    void set_state(State next);

    void record_error(const std::string& message);

    // Frees the upload claims of messages that will never be sent
    void release_artwork_claims(const std::vector<std::string>& content_item_identifiers);

    Endpoint endpoint_;
    std::string auth_token_;
    EngineOptions options_;
    std::shared_ptr<interfaces::IChannelConnector> connector_;
    std::shared_ptr<common::ILogger> logger_;
    std::shared_ptr<ErrorSlot> errors_;

    mutable std::mutex state_mutex_;
    State state_ = State::Disconnected;
    bool started_ = false;

    common::CancellationSource cancel_source_;
    std::thread io_thread_;

    mutable std::mutex queue_mutex_;
    std::deque<OutboundMessage> queue_;

    mutable std::mutex artwork_mutex_;
    std::map<std::string, std::string> artwork_urls_;
    std::map<std::string, std::chrono::steady_clock::time_point> artwork_pending_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    static constexpr std::chrono::milliseconds RECEIVE_SLICE{50};
};

} // namespace core
