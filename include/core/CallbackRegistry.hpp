#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include "core/ReporterTypes.hpp"

namespace core {

// ============================================================================
// CallbackRegistry - local consumers of engine events
// ============================================================================
// One slot per event kind. A slot holds a callable that already carries the
// consumer's opaque context (the C boundary binds fn + user_data into it).
//
// - Last writer wins; an empty handler clears the slot.
// - Replacement is atomic with respect to dispatch: each event is delivered
//   to exactly one of the old or the new handler, never to a torn state.
// - Handlers are invoked outside the registry lock, so a handler may
//   register or clear callbacks without deadlocking.
// - No handler registered -> the event is dropped for that kind.
// - Window and media events are dispatched from the capture thread only.
//   Log events come from any engine thread, so log handler calls are
//   serialised: the log handler never runs on two threads at once. A log
//   event that cannot get its turn within kLogDispatchWait is dropped.
// ============================================================================

class CallbackRegistry {
public:
    static constexpr std::chrono::milliseconds kLogDispatchWait{2000};

    using LogHandler = std::function<void(const LogEvent&)>;
    using WindowHandler = std::function<void(const WindowEvent&)>;
    using MediaHandler = std::function<void(const MediaEvent&)>;

    void set_log_handler(LogHandler handler);
    void set_window_handler(WindowHandler handler);
    void set_media_handler(MediaHandler handler);

    // Returns true when a handler received the event
    bool dispatch_log(const LogEvent& event) const;
    bool dispatch_window(const WindowEvent& event) const;
    bool dispatch_media(const MediaEvent& event) const;

    bool has_log_handler() const;

private:
    template <typename Handler>
    static void replace(std::shared_ptr<const Handler>& slot, Handler handler, std::mutex& mutex) {
        std::shared_ptr<const Handler> next;
        if (handler) next = std::make_shared<const Handler>(std::move(handler));
        std::lock_guard<std::mutex> lock(mutex);
        slot = std::move(next);
    }

    template <typename Handler>
    static std::shared_ptr<const Handler> snapshot(const std::shared_ptr<const Handler>& slot,
                                                   std::mutex& mutex) {
        std::lock_guard<std::mutex> lock(mutex);
        return slot;
    }

    mutable std::mutex mutex_;
    // Recursive: a log handler may itself trigger engine logging
    mutable std::recursive_timed_mutex log_dispatch_mutex_;
    std::shared_ptr<const LogHandler> log_;
    std::shared_ptr<const WindowHandler> window_;
    std::shared_ptr<const MediaHandler> media_;
};

} // namespace core
