#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/Logger.hpp"

namespace core {

// ============================================================================
// Reporter data model
// ============================================================================

// Snapshot of the user-facing settings, taken at start and never mutated by
// the engine afterwards.
struct ReporterConfig {
    bool enabled = false;
    std::string endpoint;
    std::string auth_token;
    bool enable_media_reporting = false;
};

// Tuning knobs. Defaults are the production values.
struct EngineOptions {
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds media_elapsed_interval{1000};
    std::chrono::milliseconds media_probe_timeout{300};
    // How long a granted media verdict is trusted before the capture loop
    // asks the gate again. A failing now-playing query forces an earlier check.
    std::chrono::milliseconds media_recheck_interval{30000};
    std::chrono::milliseconds reconnect_min{1000};
    std::chrono::milliseconds reconnect_max{30000};
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds stop_grace{2000};
    std::chrono::milliseconds close_timeout{1000};
    // An artwork upload without an acknowledgement may be retried after this
    std::chrono::milliseconds artwork_ack_timeout{60000};
    size_t send_queue_capacity = 256;
};

// Persisted document (config store)
struct AppConfig {
    ReporterConfig reporter;
    EngineOptions engine;
};

struct ReporterStatus {
    bool is_running = false;
    bool is_connected = false;
    std::optional<std::string> last_error;
};

enum class PermissionVerdict {
    Unknown,  // never probed
    Granted,
    Denied,
    Blocked   // probe hung past its deadline; sticky until reset
};

inline const char* verdict_name(PermissionVerdict v) {
    switch (v) {
        case PermissionVerdict::Unknown: return "unknown";
        case PermissionVerdict::Granted: return "granted";
        case PermissionVerdict::Denied:  return "denied";
        case PermissionVerdict::Blocked: return "blocked";
    }
    return "unknown";
}

struct WindowEvent {
    std::string title;
    std::string process_name;
    uint32_t pid = 0;
    std::string app_id;          // WM_CLASS / bundle id, may be empty
    std::vector<uint8_t> icon;   // encoded image, empty when unavailable

    // Identity used for change detection. The icon is not part of it.
    bool same_identity(const WindowEvent& other) const {
        return pid == other.pid &&
               title == other.title &&
               process_name == other.process_name;
    }
};

struct MediaEvent {
    std::string title;
    std::string artist;
    std::string album;
    std::string player;                    // bundle identifier of the source app
    std::string content_item_identifier;   // player:title:album
    double duration = 0.0;                 // seconds
    double elapsed_time = 0.0;             // seconds
    double playback_rate = 0.0;
    bool playing = false;
    std::vector<uint8_t> artwork;          // empty when unavailable
    std::string artwork_mime_type;
};

using LogLevel = common::LogLevel;

struct LogEvent {
    LogLevel level = LogLevel::Info;
    std::string message;
};

inline std::string make_content_item_identifier(const std::string& player,
                                                const std::string& title,
                                                const std::string& album) {
    return player + ":" + title + ":" + album;
}

// ============================================================================
// ErrorSlot - most recent error reported by any engine component
// ============================================================================

class ErrorSlot {
public:
    void record(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = message;
    }

    std::optional<std::string> last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<std::string> last_;
};

} // namespace core
