#ifdef PLATFORM_LINUX

#include "LinuxPlatformFactory.hpp"
#include "LinuxDesktopApi.hpp"
#include "../YamlConfigStore.hpp"
#include <iostream>
#include <cstdlib>

namespace platform {
namespace linux_platform {

// ============================================================================
// Factory Method Implementations
// ============================================================================

std::shared_ptr<interfaces::IDesktopApi> LinuxPlatformFactory::create_desktop_api() {
    return std::make_shared<linux_os::LinuxDesktopApi>();
}

std::shared_ptr<interfaces::IConfigStore> LinuxPlatformFactory::create_config_store() {
    return std::make_shared<YamlConfigStore>(YamlConfigStore::default_directory());
}

// ============================================================================
// Lifecycle
// ============================================================================

void LinuxPlatformFactory::initialize() {
    if (initialized_) return;

    std::cout << "[LinuxPlatform] Initializing..." << std::endl;

    const char* wayland_display = std::getenv("WAYLAND_DISPLAY");
    const char* xdg_session = std::getenv("XDG_SESSION_TYPE");

    is_wayland_ = (wayland_display != nullptr) ||
                  (xdg_session && std::string(xdg_session) == "wayland");

    if (is_wayland_) {
        std::cout << "[LinuxPlatform] Wayland session: only XWayland windows are tracked" << std::endl;
    }
    if (!std::getenv("DISPLAY")) {
        std::cerr << "[LinuxPlatform] DISPLAY is not set, window tracking unavailable" << std::endl;
    }

    initialized_ = true;
}

void LinuxPlatformFactory::shutdown() {
    if (!initialized_) return;
    std::cout << "[LinuxPlatform] Shutting down..." << std::endl;
    initialized_ = false;
}

} // namespace linux_platform
} // namespace platform

#endif // PLATFORM_LINUX
