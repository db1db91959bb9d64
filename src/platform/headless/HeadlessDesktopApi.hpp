#pragma once
#include "interfaces/IDesktopApi.hpp"
#include "interfaces/IPlatformFactory.hpp"

namespace platform {
namespace headless {

    /**
     * Desktop backend for hosts without a supported window system.
     * Every capability reports unavailable; the transport still runs.
     */
    class HeadlessDesktopApi : public interfaces::IDesktopApi {
    public:
        bool is_accessibility_trusted() override { return false; }
        bool request_accessibility() override { return false; }
        bool probe_media_access() override { return false; }

        common::Result<core::WindowEvent> query_focused_window() override {
            return common::Result<core::WindowEvent>::err(
                common::ErrorCode::NotImplemented, "No window system available");
        }

        common::Result<std::optional<core::MediaEvent>> query_now_playing() override {
            return common::Result<std::optional<core::MediaEvent>>::err(
                common::ErrorCode::NotImplemented, "No media service available");
        }

        const char* backend_name() const noexcept override { return "Headless"; }
    };

    // Always matches; register it last
    class HeadlessPlatformFactory final : public interfaces::IPlatformFactory {
    public:
        std::shared_ptr<interfaces::IDesktopApi> create_desktop_api() override;
        std::shared_ptr<interfaces::IConfigStore> create_config_store() override;

        const char* platform_name() const noexcept override { return "Headless"; }
        bool is_current_platform() const noexcept override { return true; }
    };

} // namespace headless

// Registers every factory built into this binary with core::PlatformRegistry.
// Safe to call more than once.
void register_builtin_platforms();

} // namespace platform
