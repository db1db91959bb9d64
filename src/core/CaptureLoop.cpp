#include "core/CaptureLoop.hpp"
#include <cmath>

namespace core {

namespace {

constexpr double kTimeEpsilon = 0.001;

bool differs(double a, double b) {
    return std::fabs(a - b) > kTimeEpsilon;
}

} // namespace

// ============================================================================
// EventSampler
// ============================================================================

EventSampler::EventSampler(
    ReporterConfig config,
    EngineOptions options,
    std::shared_ptr<PermissionGate> gate,
    std::shared_ptr<interfaces::IDesktopApi> desktop,
    std::shared_ptr<CallbackRegistry> callbacks,
    std::shared_ptr<interfaces::IEventSink> sink,
    std::shared_ptr<common::ILogger> logger,
    std::shared_ptr<ErrorSlot> errors
)
    : config_(std::move(config))
    , options_(options)
    , gate_(std::move(gate))
    , desktop_(std::move(desktop))
    , callbacks_(std::move(callbacks))
    , sink_(std::move(sink))
    , logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>())
    , errors_(errors ? std::move(errors) : std::make_shared<ErrorSlot>())
{
}

void EventSampler::sample_once(Clock::time_point now, const common::CancellationToken& token) {
    if (token.is_cancellation_requested()) return;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cycles++;
    }
    sample_window(token);
    sample_media(now, token);
}

bool EventSampler::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::recursive_timed_mutex> lock(emit_mutex_, std::defer_lock);
    return lock.try_lock_for(timeout);
}

EventSampler::Stats EventSampler::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void EventSampler::warn_once(bool& latch, const std::string& message) {
    if (latch) return;
    latch = true;
    logger_->warning(message);
    errors_->record(message);
}

// ---------------------------------------------------------------------------
// Window
// ---------------------------------------------------------------------------

void EventSampler::sample_window(const common::CancellationToken& token) {
    bool trusted = gate_->check_accessibility();
    if (token.is_cancellation_requested()) return;

    if (!trusted) {
        warn_once(accessibility_warned_,
                  "[Capture] Accessibility permission not granted; window reporting paused");
        // Report the current window again once access is back
        last_window_.reset();
        return;
    }
    if (accessibility_warned_) {
        accessibility_warned_ = false;
        logger_->info("[Capture] Accessibility permission granted; window reporting resumed");
    }

    auto result = desktop_->query_focused_window();
    if (token.is_cancellation_requested()) return;

    if (result.is_err()) {
        const auto& err = result.error();
        if (err.code == common::ErrorCode::NotFound) {
            logger_->debug("[Capture] No focused window");
            return;
        }
        warn_once(window_query_warned_, "[Capture] Focused window query failed: " + err.message);
        return;
    }
    window_query_warned_ = false;

    WindowEvent event = result.take();
    if (last_window_ && last_window_->same_identity(event)) {
        return;
    }

    last_window_ = event;
    emit_window(event, token);
}

void EventSampler::emit_window(const WindowEvent& event, const common::CancellationToken& token) {
    std::lock_guard<std::recursive_timed_mutex> emitting(emit_mutex_);
    if (token.is_cancellation_requested()) return;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.window_events++;
    }

    try {
        callbacks_->dispatch_window(event);
    } catch (const std::exception& e) {
        logger_->error(std::string("[Capture] Window callback failed: ") + e.what());
    }

    if (!sink_) return;
    try {
        sink_->publish_window(event);
    } catch (const std::exception& e) {
        logger_->error(std::string("[Capture] Publishing window event failed: ") + e.what());
    }
}

// ---------------------------------------------------------------------------
// Media
// ---------------------------------------------------------------------------

bool EventSampler::media_changed(const MediaEvent& prev, const MediaEvent& next) const {
    return prev.title != next.title ||
           prev.artist != next.artist ||
           prev.album != next.album ||
           prev.player != next.player ||
           prev.content_item_identifier != next.content_item_identifier ||
           prev.playing != next.playing ||
           differs(prev.playback_rate, next.playback_rate) ||
           differs(prev.duration, next.duration) ||
           prev.artwork.empty() != next.artwork.empty();
}

bool EventSampler::media_permitted(Clock::time_point now) {
    // A grant is reused until media_recheck_interval elapses
    if (media_granted_at_ && now - *media_granted_at_ < options_.media_recheck_interval &&
        gate_->media_verdict() == PermissionVerdict::Granted) {
        return true;
    }

    if (gate_->check_media()) {
        media_granted_at_ = now;
        return true;
    }
    media_granted_at_.reset();
    return false;
}

void EventSampler::sample_media(Clock::time_point now, const common::CancellationToken& token) {
    if (!config_.enable_media_reporting || token.is_cancellation_requested()) return;

    bool permitted = media_permitted(now);
    if (token.is_cancellation_requested()) return;

    if (!permitted) {
        warn_once(media_permission_warned_,
                  std::string("[Capture] Media access ") + verdict_name(gate_->media_verdict()) +
                  "; media reporting paused");
        last_media_.reset();
        return;
    }
    if (media_permission_warned_) {
        media_permission_warned_ = false;
        logger_->info("[Capture] Media access granted; media reporting resumed");
    }

    auto result = desktop_->query_now_playing();
    if (token.is_cancellation_requested()) return;

    if (result.is_err()) {
        // Re-check access next cycle in case it was withdrawn
        media_granted_at_.reset();
        warn_once(media_query_warned_, "[Capture] Now-playing query failed: " + result.error().message);
        return;
    }
    media_query_warned_ = false;

    std::optional<MediaEvent> current = result.take();
    if (!current) {
        // Nothing playing; the next track always emits
        last_media_.reset();
        return;
    }

    bool emit = false;
    bool track_changed = false;

    if (!last_media_ || last_media_->content_item_identifier != current->content_item_identifier) {
        emit = true;
        track_changed = true;
    } else if (media_changed(*last_media_, *current)) {
        emit = true;
    } else if (differs(last_media_->elapsed_time, current->elapsed_time)) {
        // Seeks while paused go out immediately; progress while playing is throttled
        emit = !current->playing || (now - last_media_emit_) >= options_.media_elapsed_interval;
    }

    if (!emit) return;

    last_media_ = *current;
    last_media_emit_ = now;
    emit_media(*current, track_changed, token);
}

void EventSampler::emit_media(const MediaEvent& event, bool track_changed,
                              const common::CancellationToken& token) {
    std::lock_guard<std::recursive_timed_mutex> emitting(emit_mutex_);
    if (token.is_cancellation_requested()) return;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.media_events++;
    }

    try {
        callbacks_->dispatch_media(event);
    } catch (const std::exception& e) {
        logger_->error(std::string("[Capture] Media callback failed: ") + e.what());
    }

    if (!sink_) return;
    try {
        sink_->publish_media(event);
        if (track_changed && !event.artwork.empty()) {
            sink_->publish_artwork(event.content_item_identifier, event.artwork, event.artwork_mime_type);
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.artwork_uploads++;
        }
    } catch (const std::exception& e) {
        logger_->error(std::string("[Capture] Publishing media event failed: ") + e.what());
    }
}

// ============================================================================
// CaptureLoop
// ============================================================================

CaptureLoop::CaptureLoop(
    std::shared_ptr<EventSampler> sampler,
    std::chrono::milliseconds poll_interval,
    std::shared_ptr<common::ILogger> logger
)
    : sampler_(std::move(sampler))
    , poll_interval_(poll_interval)
    , logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>())
{
}

CaptureLoop::~CaptureLoop() {
    stop(std::chrono::milliseconds(0));
}

common::EmptyResult CaptureLoop::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (running_) {
        return common::EmptyResult::err(common::ErrorCode::Busy, "Capture loop already running");
    }

    cancel_source_.reset();
    auto finished = std::make_shared<std::promise<void>>();
    finished_ = finished->get_future();

    try {
        worker_thread_ = std::thread(&CaptureLoop::worker_routine, sampler_, poll_interval_,
                                     logger_, cancel_source_.get_token(), finished);
    } catch (const std::system_error& e) {
        return common::EmptyResult::err(common::ErrorCode::CriticalError,
                                        std::string("Cannot start capture thread: ") + e.what());
    }

    running_ = true;
    return common::EmptyResult::success();
}

bool CaptureLoop::stop(std::chrono::milliseconds grace) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) return true;
        running_ = false;
    }

    cancel_source_.cancel();

    if (finished_.valid() && finished_.wait_for(grace) == std::future_status::ready) {
        if (worker_thread_.joinable()) worker_thread_.join();
        return true;
    }

    // Stuck inside an OS query; it owns its state, let it finish on its own.
    // The token is already cancelled, so waiting out an emission in flight
    // is enough to keep it from reaching consumers later.
    logger_->warning("[Capture] Worker did not stop within " + std::to_string(grace.count()) +
                     "ms; abandoning it");
    if (!sampler_->wait_idle(grace)) {
        logger_->warning("[Capture] A callback is still running on the abandoned worker");
    }
    if (worker_thread_.joinable()) worker_thread_.detach();
    return false;
}

bool CaptureLoop::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

void CaptureLoop::worker_routine(
    std::shared_ptr<EventSampler> sampler,
    std::chrono::milliseconds poll_interval,
    std::shared_ptr<common::ILogger> logger,
    common::CancellationToken token,
    std::shared_ptr<std::promise<void>> finished
) {
    logger->debug("[Capture] Worker thread started");

    while (!token.is_cancellation_requested()) {
        try {
            sampler->sample_once(EventSampler::Clock::now(), token);
        } catch (const std::exception& e) {
            if (token.is_cancellation_requested()) break;
            logger->error(std::string("[Capture] Cycle failed: ") + e.what());
        }

        if (token.wait_for(poll_interval)) break;
    }

    logger->debug("[Capture] Worker thread stopped");
    finished->set_value();
}

} // namespace core
