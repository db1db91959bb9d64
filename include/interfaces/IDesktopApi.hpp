#pragma once
#include <optional>
#include "common/Result.hpp"
#include "core/ReporterTypes.hpp"

namespace interfaces {

// ============================================================================
// IDesktopApi - OS accessibility and media collaborator
// ============================================================================
// The engine never talks to the window system or the media service directly.
// Every call may be made from the capture thread, a probe thread or a host
// thread, so implementations must be thread-safe.
//
// Any call may block for an unbounded time (a hung media daemon, a stuck X
// server). Callers that must stay responsive go through core::PermissionGate,
// which bounds the media probe.
// ============================================================================

class IDesktopApi {
public:
    virtual ~IDesktopApi() = default;

    // ========== Accessibility ==========

    // Non-interactive trust check
    virtual bool is_accessibility_trusted() = 0;

    // May show a system prompt and block the caller until it is answered
    virtual bool request_accessibility() = 0;

    // ========== Media ==========

    // Exercises the media API once. May hang when the OS gatekeeps the call.
    virtual bool probe_media_access() = 0;

    // ========== Queries ==========

    // Focused window with owning process details
    virtual common::Result<core::WindowEvent> query_focused_window() = 0;

    // Current now-playing state; nullopt when nothing is playing or paused
    virtual common::Result<std::optional<core::MediaEvent>> query_now_playing() = 0;

    // Backend name for logging (e.g., "Linux-X11")
    virtual const char* backend_name() const noexcept = 0;
};

} // namespace interfaces
