#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/CallbackRegistry.hpp"
#include "core/PermissionGate.hpp"
#include "core/ReporterTypes.hpp"
#include "interfaces/IDesktopApi.hpp"
#include "interfaces/IEventSink.hpp"

namespace core {

// ============================================================================
// EventSampler - one capture cycle with change detection
// ============================================================================
// Stateful between cycles (last emitted window/media, throttle clock, warning
// latches). Not thread-safe: driven by exactly one thread at a time.
//
// Emission rules:
//   - the first sample of each kind always emits
//   - window: emit when title, process name or pid changed
//   - media: emit immediately on any metadata or play-state change;
//     an elapsed-time-only change while playing emits at most once per
//     `media_elapsed_interval`
//
// Each event goes to the callback registry, then to the remote sink. A
// failure in one path is logged and does not affect the other.
//
// A cycle runs against a cancellation token. Results of OS queries that
// return after cancellation are discarded, and emission re-checks the token
// under the emission lock, so once wait_idle() succeeds no further event
// reaches a callback or the sink.
// ============================================================================

class EventSampler {
public:
    using Clock = std::chrono::steady_clock;

    EventSampler(ReporterConfig config,
                 EngineOptions options,
                 std::shared_ptr<PermissionGate> gate,
                 std::shared_ptr<interfaces::IDesktopApi> desktop,
                 std::shared_ptr<CallbackRegistry> callbacks,
                 std::shared_ptr<interfaces::IEventSink> sink,
                 std::shared_ptr<common::ILogger> logger,
                 std::shared_ptr<ErrorSlot> errors);

    void sample_once(Clock::time_point now, const common::CancellationToken& token);
    void sample_once(Clock::time_point now) { sample_once(now, common::CancellationToken()); }
    void sample_once() { sample_once(Clock::now()); }

    // Waits for an emission in progress to finish. False on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    struct Stats {
        uint64_t cycles = 0;
        uint64_t window_events = 0;
        uint64_t media_events = 0;
        uint64_t artwork_uploads = 0;
    };
    Stats stats() const;

private:
    void sample_window(const common::CancellationToken& token);
    void sample_media(Clock::time_point now, const common::CancellationToken& token);
    bool media_permitted(Clock::time_point now);

    bool media_changed(const MediaEvent& prev, const MediaEvent& next) const;

    void emit_window(const WindowEvent& event, const common::CancellationToken& token);
    void emit_media(const MediaEvent& event, bool track_changed,
                    const common::CancellationToken& token);

    // Logs `message` once until `latch` is cleared by a successful cycle
    void warn_once(bool& latch, const std::string& message);

    ReporterConfig config_;
    EngineOptions options_;
    std::shared_ptr<PermissionGate> gate_;
    std::shared_ptr<interfaces::IDesktopApi> desktop_;
    std::shared_ptr<CallbackRegistry> callbacks_;
    std::shared_ptr<interfaces::IEventSink> sink_;
    std::shared_ptr<common::ILogger> logger_;
    std::shared_ptr<ErrorSlot> errors_;

    std::optional<WindowEvent> last_window_;
    std::optional<MediaEvent> last_media_;
    Clock::time_point last_media_emit_{};
    std::optional<Clock::time_point> media_granted_at_;

    bool accessibility_warned_ = false;
    bool window_query_warned_ = false;
    bool media_permission_warned_ = false;
    bool media_query_warned_ = false;

    // Recursive: a callback may stop the reporter from the capture thread
    std::recursive_timed_mutex emit_mutex_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

// ============================================================================
// CaptureLoop - runs the sampler on a dedicated thread
// ============================================================================
// stop() signals cancellation and waits up to the grace period. A worker that
// is stuck inside an OS query is detached instead of joined; it owns shared
// references to everything it uses and emits nothing once it resumes.
// ============================================================================

class CaptureLoop {
public:
    CaptureLoop(std::shared_ptr<EventSampler> sampler,
                std::chrono::milliseconds poll_interval,
                std::shared_ptr<common::ILogger> logger);
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    common::EmptyResult start();

    // Returns true when the worker finished within `grace`, false when it was
    // abandoned.
    bool stop(std::chrono::milliseconds grace);

    bool is_running() const;

private:
    static void worker_routine(std::shared_ptr<EventSampler> sampler,
                               std::chrono::milliseconds poll_interval,
                               std::shared_ptr<common::ILogger> logger,
                               common::CancellationToken token,
                               std::shared_ptr<std::promise<void>> finished);

    std::shared_ptr<EventSampler> sampler_;
    std::chrono::milliseconds poll_interval_;
    std::shared_ptr<common::ILogger> logger_;

    mutable std::mutex state_mutex_;
    bool running_ = false;
    common::CancellationSource cancel_source_;
    std::thread worker_thread_;
    std::future<void> finished_;
};

} // namespace core
