#include "HeadlessDesktopApi.hpp"
#include "../YamlConfigStore.hpp"
#include "core/PlatformRegistry.hpp"
#include <mutex>

#ifdef PLATFORM_LINUX
#include "../linux/LinuxPlatformFactory.hpp"
#endif

namespace platform {
namespace headless {

std::shared_ptr<interfaces::IDesktopApi> HeadlessPlatformFactory::create_desktop_api() {
    return std::make_shared<HeadlessDesktopApi>();
}

std::shared_ptr<interfaces::IConfigStore> HeadlessPlatformFactory::create_config_store() {
    return std::make_shared<YamlConfigStore>(YamlConfigStore::default_directory());
}

} // namespace headless

void register_builtin_platforms() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto& registry = core::PlatformRegistry::instance();
#ifdef PLATFORM_LINUX
        registry.register_factory(std::make_unique<linux_platform::LinuxPlatformFactory>());
#endif
        registry.register_factory(std::make_unique<headless::HeadlessPlatformFactory>());
    });
}

} // namespace platform
