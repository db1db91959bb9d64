#pragma once
#include <memory>
#include <string>
#include "interfaces/IDesktopApi.hpp"
#include "interfaces/IConfigStore.hpp"

namespace interfaces {

// ============================================================================
// IPlatformFactory - Abstract Factory for platform-specific collaborators
// ============================================================================
// Each platform provides its own implementation. The reporter core only sees
// IDesktopApi and IConfigStore.
//
// Usage:
//   auto* factory = PlatformRegistry::instance().get_current_platform();
//   auto desktop = factory->create_desktop_api();
// ============================================================================

class IPlatformFactory {
public:
    virtual ~IPlatformFactory() = default;

    // ========== Component Factory Methods ==========

    virtual std::shared_ptr<IDesktopApi> create_desktop_api() = 0;

    // Store rooted at the platform's default configuration directory
    virtual std::shared_ptr<IConfigStore> create_config_store() = 0;

    // ========== Platform Info ==========

    // Platform name for logging/debugging (e.g., "Linux-X11", "Headless")
    virtual const char* platform_name() const noexcept = 0;

    // Check if this platform is currently the running platform
    virtual bool is_current_platform() const noexcept = 0;

    // ========== Optional: Lazy Initialization ==========

    virtual void initialize() {}
    virtual void shutdown() {}
};

// ============================================================================
// Helper: Platform Detection Macros
// ============================================================================

#if defined(__linux__)
    #define PLATFORM_IS_LINUX 1
#else
    #define PLATFORM_IS_LINUX 0
#endif

} // namespace interfaces
