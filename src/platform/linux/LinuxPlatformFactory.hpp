#pragma once
#include "interfaces/IPlatformFactory.hpp"

#ifdef PLATFORM_LINUX

namespace platform {
namespace linux_platform {

// ============================================================================
// LinuxPlatformFactory - Factory for Linux platform components
// ============================================================================
// X11 window tracking, MPRIS now-playing through playerctl, YAML config.
// Under Wayland only XWayland clients are visible to the desktop backend.
// ============================================================================

class LinuxPlatformFactory final : public interfaces::IPlatformFactory {
public:
    LinuxPlatformFactory() = default;
    ~LinuxPlatformFactory() override = default;

    // ========== IPlatformFactory Implementation ==========

    std::shared_ptr<interfaces::IDesktopApi> create_desktop_api() override;
    std::shared_ptr<interfaces::IConfigStore> create_config_store() override;

    const char* platform_name() const noexcept override { return "Linux"; }

    bool is_current_platform() const noexcept override {
        return PLATFORM_IS_LINUX;
    }

    void initialize() override;
    void shutdown() override;

private:
    bool initialized_ = false;
    bool is_wayland_ = false;  // Detected at runtime
};

} // namespace linux_platform
} // namespace platform

#endif // PLATFORM_LINUX
