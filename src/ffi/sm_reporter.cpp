#include "shikenmatrix.h"
#include "Runtime.hpp"
#include <exception>

namespace {

// Handles are registry ids carried in an opaque pointer
SmReporter* to_pointer(core::ReporterRegistry::Handle handle) {
    return reinterpret_cast<SmReporter*>(static_cast<uintptr_t>(handle));
}

core::ReporterRegistry::Handle from_pointer(const SmReporter* pointer) {
    return static_cast<core::ReporterRegistry::Handle>(reinterpret_cast<uintptr_t>(pointer));
}

SmLogLevel to_c_level(common::LogLevel level) {
    switch (level) {
        case common::LogLevel::Warning: return SM_LOG_WARNING;
        case common::LogLevel::Error:   return SM_LOG_ERROR;
        default:                        return SM_LOG_INFO;
    }
}

} // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

SmReporter* sm_reporter_start(const SmConfig* config) {
    if (!config) {
        ffi::report_failure("sm_reporter_start", "null config pointer");
        return nullptr;
    }
    try {
        core::ReporterConfig cfg;
        cfg.enabled = config->enabled;
        cfg.endpoint = ffi::from_c(config->ws_url);
        cfg.auth_token = ffi::from_c(config->token);
        cfg.enable_media_reporting = config->enable_media_reporting;

        auto started = ffi::registry().start(cfg);
        if (started.is_err()) return nullptr;
        return to_pointer(started.unwrap());
    } catch (const std::exception& e) {
        ffi::report_failure("sm_reporter_start", e.what());
        return nullptr;
    }
}

bool sm_reporter_stop(SmReporter* handle) {
    try {
        auto& reg = ffi::registry();
        auto stopped = reg.stop(from_pointer(handle));
        if (stopped.is_err()) {
            if (auto logger = reg.logger()) logger->warning("[Reporter] Stop refused: " + stopped.error().message);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        ffi::report_failure("sm_reporter_stop", e.what());
        return false;
    }
}

SmStatus sm_reporter_get_status(const SmReporter* /*handle*/) {
    SmStatus out{false, false, nullptr};
    try {
        core::ReporterStatus status = ffi::registry().status();
        out.is_running = status.is_running;
        out.is_connected = status.is_connected;
        if (status.last_error) out.last_error = ffi::dup_string(*status.last_error);
    } catch (const std::exception& e) {
        ffi::report_failure("sm_reporter_get_status", e.what());
    }
    return out;
}

bool sm_reporter_is_running(void) {
    return core::ReporterRegistry::instance().is_running();
}

// ============================================================================
// Callbacks
// ============================================================================

void sm_reporter_set_log_callback(SmLogCallback callback, uintptr_t user_data) {
    try {
        core::CallbackRegistry::LogHandler handler;
        if (callback) {
            handler = [callback, user_data](const core::LogEvent& event) {
                callback(to_c_level(event.level), event.message.c_str(), user_data);
            };
        }
        ffi::registry().callbacks()->set_log_handler(std::move(handler));
    } catch (const std::exception& e) {
        ffi::report_failure("sm_reporter_set_log_callback", e.what());
    }
}

void sm_reporter_set_window_callback(SmWindowDataCallback callback, uintptr_t user_data) {
    try {
        core::CallbackRegistry::WindowHandler handler;
        if (callback) {
            handler = [callback, user_data](const core::WindowEvent& event) {
                callback(event.title.c_str(),
                         event.process_name.c_str(),
                         event.pid,
                         event.icon.empty() ? nullptr : event.icon.data(),
                         static_cast<uintptr_t>(event.icon.size()),
                         user_data);
            };
        }
        ffi::registry().callbacks()->set_window_handler(std::move(handler));
    } catch (const std::exception& e) {
        ffi::report_failure("sm_reporter_set_window_callback", e.what());
    }
}

void sm_reporter_set_media_callback(SmMediaDataCallback callback, uintptr_t user_data) {
    try {
        core::CallbackRegistry::MediaHandler handler;
        if (callback) {
            handler = [callback, user_data](const core::MediaEvent& event) {
                callback(event.title.c_str(),
                         event.artist.c_str(),
                         event.album.c_str(),
                         event.duration,
                         event.elapsed_time,
                         event.playing,
                         event.artwork.empty() ? nullptr : event.artwork.data(),
                         static_cast<uintptr_t>(event.artwork.size()),
                         user_data);
            };
        }
        ffi::registry().callbacks()->set_media_handler(std::move(handler));
    } catch (const std::exception& e) {
        ffi::report_failure("sm_reporter_set_media_callback", e.what());
    }
}

} // extern "C"
