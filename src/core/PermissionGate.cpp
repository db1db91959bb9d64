#include "core/PermissionGate.hpp"
#include <future>
#include <string>
#include <system_error>
#include <thread>

namespace core {

PermissionGate::PermissionGate(
    std::shared_ptr<interfaces::IDesktopApi> desktop,
    std::shared_ptr<interfaces::IConfigStore> marker_store,
    std::chrono::milliseconds probe_timeout,
    std::shared_ptr<common::ILogger> logger
)
    : desktop_(std::move(desktop))
    , marker_store_(std::move(marker_store))
    , logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>())
    , probe_timeout_(probe_timeout)
{
    if (marker_store_ && marker_store_->media_blocked_marker()) {
        media_verdict_ = PermissionVerdict::Blocked;
        logger_->warning("[Permission] Media access was blocked in a previous session; "
                         "reset the media permission check to probe again");
    }
}

bool PermissionGate::check_accessibility() {
    return desktop_ && desktop_->is_accessibility_trusted();
}

bool PermissionGate::request_accessibility() {
    if (!desktop_) return false;
    logger_->info("[Permission] Requesting accessibility permission");
    return desktop_->request_accessibility();
}

bool PermissionGate::check_media() {
    std::chrono::milliseconds timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (media_verdict_ == PermissionVerdict::Blocked) return false;
        timeout = probe_timeout_;
    }
    if (!desktop_) return false;

    // Probe state is shared with the worker so an abandoned probe never
    // touches freed memory.
    auto outcome = std::make_shared<std::promise<bool>>();
    std::future<bool> result = outcome->get_future();
    auto desktop = desktop_;
    auto logger = logger_;

    try {
        std::thread([desktop, outcome, logger] {
            bool granted = false;
            try {
                granted = desktop->probe_media_access();
            } catch (const std::exception& e) {
                logger->error(std::string("[Permission] Media probe threw: ") + e.what());
            }
            outcome->set_value(granted);
        }).detach();
    } catch (const std::system_error& e) {
        logger_->error(std::string("[Permission] Cannot start media probe: ") + e.what());
        return false;
    }

    if (result.wait_for(timeout) == std::future_status::ready) {
        bool granted = result.get();
        std::lock_guard<std::mutex> lock(mutex_);
        // A concurrent probe may have timed out meanwhile; Blocked wins.
        if (media_verdict_ != PermissionVerdict::Blocked) {
            media_verdict_ = granted ? PermissionVerdict::Granted : PermissionVerdict::Denied;
        }
        return granted && media_verdict_ == PermissionVerdict::Granted;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        media_verdict_ = PermissionVerdict::Blocked;
    }
    logger_->warning("[Permission] Media probe did not return within " +
                     std::to_string(timeout.count()) + "ms; media access marked as blocked");

    if (marker_store_) {
        auto saved = marker_store_->set_media_blocked_marker(true);
        if (saved.is_err()) {
            logger_->warning("[Permission] Could not persist blocked marker: " + saved.error().message);
        }
    }
    return false;
}

void PermissionGate::reset_media_check() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        media_verdict_ = PermissionVerdict::Unknown;
    }
    if (marker_store_) {
        auto cleared = marker_store_->set_media_blocked_marker(false);
        if (cleared.is_err()) {
            logger_->warning("[Permission] Could not clear blocked marker: " + cleared.error().message);
        }
    }
    logger_->info("[Permission] Media permission check reset");
}

PermissionVerdict PermissionGate::media_verdict() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return media_verdict_;
}

void PermissionGate::set_probe_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_timeout_ = timeout;
}

std::chrono::milliseconds PermissionGate::probe_timeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_timeout_;
}

} // namespace core
