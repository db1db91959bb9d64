#pragma once
#include <memory>
#include <vector>
#include <string>
#include <mutex>
#include "interfaces/IPlatformFactory.hpp"

namespace core {

// ============================================================================
// PlatformRegistry - Singleton registry for platform factories
// ============================================================================
// Factories are registered once at startup (platform::register_builtin_platforms).
// get_current_platform() returns the first registered factory whose
// is_current_platform() is true, so register the most specific first and the
// headless fallback last.
// ============================================================================

class PlatformRegistry {
public:
    // ========== Singleton Access ==========

    static PlatformRegistry& instance();

    // Deleted copy/move (singleton)
    PlatformRegistry(const PlatformRegistry&) = delete;
    PlatformRegistry& operator=(const PlatformRegistry&) = delete;
    PlatformRegistry(PlatformRegistry&&) = delete;
    PlatformRegistry& operator=(PlatformRegistry&&) = delete;

    // ========== Factory Registration ==========

    void register_factory(std::unique_ptr<interfaces::IPlatformFactory> factory);

    // ========== Platform Access ==========

    // Returns nullptr if no matching factory is registered
    interfaces::IPlatformFactory* get_current_platform();

    interfaces::IPlatformFactory* get_platform(const std::string& name);

    std::vector<std::string> list_platforms() const;

private:
    PlatformRegistry() = default;

    // Shuts the selected platform down at process exit
    ~PlatformRegistry();
    void shutdown();

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<interfaces::IPlatformFactory>> factories_;
    interfaces::IPlatformFactory* current_platform_ = nullptr;
};

} // namespace core
