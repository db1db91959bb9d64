#include "core/PlatformRegistry.hpp"
#include <iostream>

namespace core {

PlatformRegistry& PlatformRegistry::instance() {
    static PlatformRegistry instance;
    return instance;
}

PlatformRegistry::~PlatformRegistry() {
    shutdown();
}

void PlatformRegistry::register_factory(
    std::unique_ptr<interfaces::IPlatformFactory> factory
) {
    if (!factory) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : factories_) {
        if (std::string(existing->platform_name()) == factory->platform_name()) {
            return; // already registered
        }
    }
    factories_.push_back(std::move(factory));
}

interfaces::IPlatformFactory* PlatformRegistry::get_current_platform() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (current_platform_) {
        return current_platform_;
    }

    for (auto& factory : factories_) {
        if (factory->is_current_platform()) {
            current_platform_ = factory.get();
            current_platform_->initialize();
            std::cout << "[Platform] Using: " << current_platform_->platform_name() << std::endl;
            return current_platform_;
        }
    }

    std::cerr << "[Platform] WARNING: No factory for current platform!" << std::endl;
    return nullptr;
}

interfaces::IPlatformFactory* PlatformRegistry::get_platform(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& factory : factories_) {
        if (factory->platform_name() == name) {
            return factory.get();
        }
    }
    return nullptr;
}

std::vector<std::string> PlatformRegistry::list_platforms() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& factory : factories_) {
        names.push_back(factory->platform_name());
    }
    return names;
}

void PlatformRegistry::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (current_platform_) {
        current_platform_->shutdown();
        current_platform_ = nullptr;
    }
}

} // namespace core
