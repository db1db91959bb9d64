#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include "common/Logger.hpp"
#include "core/ReporterTypes.hpp"
#include "interfaces/IConfigStore.hpp"
#include "interfaces/IDesktopApi.hpp"

namespace core {

// ============================================================================
// PermissionGate - bounded-time permission checks
// ============================================================================
// Accessibility is asked directly every time (prompt, uncached).
//
// The media API may hang indefinitely when the OS gatekeeps it. check_media()
// runs the probe on a detached thread and waits at most `probe_timeout`.
// On timeout the verdict becomes Blocked and stays Blocked (every later call
// returns false immediately) until reset_media_check(). The abandoned probe
// only holds shared ownership of what it touches, so it may outlive the gate.
//
// When a config store is supplied, Blocked is also persisted as a marker so
// the next process skips the hanging call.
// ============================================================================

class PermissionGate {
public:
    PermissionGate(std::shared_ptr<interfaces::IDesktopApi> desktop,
                   std::shared_ptr<interfaces::IConfigStore> marker_store,
                   std::chrono::milliseconds probe_timeout,
                   std::shared_ptr<common::ILogger> logger);

    bool check_accessibility();

    // Interactive; may block the calling thread until the user answers
    bool request_accessibility();

    bool check_media();
    void reset_media_check();

    PermissionVerdict media_verdict() const;

    void set_probe_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds probe_timeout() const;

private:
    std::shared_ptr<interfaces::IDesktopApi> desktop_;
    std::shared_ptr<interfaces::IConfigStore> marker_store_;
    std::shared_ptr<common::ILogger> logger_;

    mutable std::mutex mutex_;
    PermissionVerdict media_verdict_ = PermissionVerdict::Unknown;
    std::chrono::milliseconds probe_timeout_;
};

} // namespace core
