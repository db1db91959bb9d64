#include "core/TransportManager.hpp"
#include <algorithm>
#include <system_error>
#include "core/EventCodec.hpp"

namespace core {

// ============================================================================
// Construction / Destruction
// ============================================================================

TransportManager::TransportManager(
    Endpoint endpoint,
    std::string auth_token,
    EngineOptions options,
    std::shared_ptr<interfaces::IChannelConnector> connector,
    std::shared_ptr<common::ILogger> logger,
    std::shared_ptr<ErrorSlot> errors
)
    : endpoint_(std::move(endpoint))
    , auth_token_(std::move(auth_token))
    , options_(options)
    , connector_(std::move(connector))
    , logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>())
    , errors_(errors ? std::move(errors) : std::make_shared<ErrorSlot>())
{
    options_.send_queue_capacity = std::max<size_t>(1, options_.send_queue_capacity);
    if (options_.reconnect_max < options_.reconnect_min) {
        options_.reconnect_max = options_.reconnect_min;
    }
}

TransportManager::~TransportManager() {
    stop();
}

const char* TransportManager::state_name(State state) {
    switch (state) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting:   return "Connecting";
        case State::Connected:    return "Connected";
        case State::Closing:      return "Closing";
        case State::Closed:       return "Closed";
    }
    return "Unknown";
}

// ============================================================================
// Lifecycle
// ============================================================================

common::EmptyResult TransportManager::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (started_) {
        return common::EmptyResult::err(common::ErrorCode::Busy, "Transport already started");
    }
    if (!connector_) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument, "No channel connector");
    }

    cancel_source_.reset();
    try {
        io_thread_ = std::thread(&TransportManager::io_loop, this, cancel_source_.get_token());
    } catch (const std::system_error& e) {
        return common::EmptyResult::err(common::ErrorCode::CriticalError,
                                        std::string("Cannot start transport thread: ") + e.what());
    }

    started_ = true;
    return common::EmptyResult::success();
}

void TransportManager::stop() {
    set_state(State::Closing);

    size_t discarded = 0;
    std::vector<std::string> unsent_artwork;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        discarded = queue_.size();
        for (const auto& message : queue_) {
            if (!message.artwork_id.empty()) unsent_artwork.push_back(message.artwork_id);
        }
        queue_.clear();
    }
    release_artwork_claims(unsent_artwork);
    if (discarded > 0) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_dropped += discarded;
    }

    cancel_source_.cancel();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    set_state(State::Closed);
}

TransportManager::State TransportManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool TransportManager::is_connected() const {
    return state() == State::Connected;
}

void TransportManager::set_state(State next) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == State::Closed) return;
    if (state_ == State::Closing && next != State::Closed) return;
    if (state_ == next) return;

    logger_->debug(std::string("[Transport] ") + state_name(state_) + " -> " + state_name(next));
    state_ = next;
}

void TransportManager::record_error(const std::string& message) {
    errors_->record(message);
}

// ============================================================================
// Send Operations
// ============================================================================

bool TransportManager::enqueue(OutboundMessage message) {
    bool refused = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        refused = state_ == State::Closing || state_ == State::Closed;
    }
    if (refused) {
        if (!message.artwork_id.empty()) release_artwork_claims({message.artwork_id});
        return false;
    }

    size_t dropped = 0;
    std::vector<std::string> unsent_artwork;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (queue_.size() >= options_.send_queue_capacity) {
            if (!queue_.front().artwork_id.empty()) unsent_artwork.push_back(queue_.front().artwork_id);
            queue_.pop_front();
            ++dropped;
        }
        queue_.push_back(std::move(message));
    }
    release_artwork_claims(unsent_artwork);

    if (dropped > 0) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_dropped += dropped;
        logger_->debug("[Transport] Send queue full; dropped oldest message (total dropped: " +
                       std::to_string(stats_.messages_dropped) + ")");
    }
    return dropped == 0;
}

size_t TransportManager::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

TransportManager::Stats TransportManager::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// Artwork cache
// ============================================================================

std::optional<std::string> TransportManager::artwork_url(const std::string& content_item_identifier) const {
    std::lock_guard<std::mutex> lock(artwork_mutex_);
    auto it = artwork_urls_.find(content_item_identifier);
    if (it == artwork_urls_.end()) return std::nullopt;
    return it->second;
}

bool TransportManager::claim_artwork_upload(const std::string& content_item_identifier) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(artwork_mutex_);
    if (artwork_urls_.count(content_item_identifier) > 0) return false;

    auto pending = artwork_pending_.find(content_item_identifier);
    if (pending != artwork_pending_.end()) {
        if (now - pending->second < options_.artwork_ack_timeout) return false;
        logger_->debug("[Transport] No acknowledgement for artwork " + content_item_identifier +
                       "; allowing another upload");
    }
    artwork_pending_[content_item_identifier] = now;
    return true;
}

void TransportManager::release_artwork_claims(const std::vector<std::string>& content_item_identifiers) {
    if (content_item_identifiers.empty()) return;
    std::lock_guard<std::mutex> lock(artwork_mutex_);
    for (const auto& id : content_item_identifiers) {
        artwork_pending_.erase(id);
    }
}

// ============================================================================
// IO Loop
// ============================================================================

void TransportManager::io_loop(common::CancellationToken token) {
    logger_->info("[Transport] Reporting to " + endpoint_.to_string());

    auto backoff = options_.reconnect_min;
    std::unique_ptr<interfaces::IMessageChannel> channel;

    while (!token.is_cancellation_requested()) {
        set_state(State::Connecting);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.connect_attempts++;
        }

        auto result = connector_->connect(endpoint_, auth_token_, options_.connect_timeout, token);

        if (result.is_err()) {
            const auto& err = result.error();
            if (token.is_cancellation_requested()) break;

            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.connect_failures++;
                if (err.code == common::ErrorCode::AuthRejected) stats_.auth_rejections++;
            }

            std::string message = err.code == common::ErrorCode::AuthRejected
                ? "Authentication rejected by " + endpoint_.host_header() + ": " + err.message
                : "Connection to " + endpoint_.host_header() + " failed: " + err.message;
            record_error(message);
            logger_->error("[Transport] " + message + "; retrying in " +
                           std::to_string(backoff.count()) + "ms");

            set_state(State::Disconnected);
            if (token.wait_for(backoff)) break;
            backoff = std::min(backoff * 2, options_.reconnect_max);
            continue;
        }

        channel = result.take();
        if (token.is_cancellation_requested()) break;

        backoff = options_.reconnect_min;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.connections++;
        }
        set_state(State::Connected);
        logger_->info("[Transport] Connected to " + endpoint_.host_header());

        run_session(*channel, token);

        if (token.is_cancellation_requested()) break;

        channel.reset();
        set_state(State::Disconnected);
        if (token.wait_for(backoff)) break;
        backoff = std::min(backoff * 2, options_.reconnect_max);
    }

    if (channel) {
        channel->close(options_.close_timeout);
        channel.reset();
    }
    logger_->debug("[Transport] IO thread stopped");
}

void TransportManager::run_session(interfaces::IMessageChannel& channel,
                                   const common::CancellationToken& token) {
    while (!token.is_cancellation_requested()) {
        auto flushed = flush_queue(channel, token);
        if (flushed.is_err()) {
            std::string message = "Send failed: " + flushed.error().message;
            record_error(message);
            logger_->error("[Transport] " + message);
            return;
        }

        auto inbound = channel.poll_text(RECEIVE_SLICE);
        if (inbound.is_err()) {
            const auto& err = inbound.error();
            std::string message = err.code == common::ErrorCode::Cancelled
                ? "Connection closed: " + err.message
                : "Connection lost: " + err.message;
            record_error(message);
            logger_->error("[Transport] " + message);
            return;
        }

        if (inbound.unwrap()) {
            handle_inbound(*inbound.unwrap());
        }
    }
}

common::EmptyResult TransportManager::flush_queue(interfaces::IMessageChannel& channel,
                                                  const common::CancellationToken& token) {
    while (!token.is_cancellation_requested()) {
        OutboundMessage message;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) break;
            message = std::move(queue_.front());
            queue_.pop_front();
        }

        auto sent = channel.send_text(message.text);
        if (sent.is_ok() && message.attachment) {
            sent = channel.send_binary(*message.attachment);
        }

        if (sent.is_err()) {
            // Put it back so ordering survives the reconnect
            bool requeued = false;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (!token.is_cancellation_requested() &&
                    queue_.size() < options_.send_queue_capacity) {
                    queue_.push_front(std::move(message));
                    requeued = true;
                }
            }
            if (!requeued) {
                if (!message.artwork_id.empty()) release_artwork_claims({message.artwork_id});
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.messages_dropped++;
            }
            return sent;
        }

        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_sent++;
        stats_.bytes_sent += message.text.size() +
                             (message.attachment ? message.attachment->size() : 0);
    }
    return common::EmptyResult::success();
}

void TransportManager::handle_inbound(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_received++;
    }

    auto message = codec::parse_server_message(text);
    if (!message) {
        logger_->warning("[Transport] Ignoring malformed server message");
        return;
    }

    if (message->type == "artwork_uploaded") {
        const auto& f = message->fields;
        auto id = f.find("content_item_identifier");
        auto url = f.find("artwork_url");
        if (id == f.end() || url == f.end()) {
            logger_->warning("[Transport] artwork_uploaded without identifier or url");
            return;
        }
        {
            std::lock_guard<std::mutex> lock(artwork_mutex_);
            artwork_urls_[id->second] = url->second;
            artwork_pending_.erase(id->second);
        }
        logger_->info("[Transport] Artwork uploaded for " + id->second);
        return;
    }

    logger_->debug("[Transport] Unhandled server message type '" + message->type + "'");
}

} // namespace core
