#include "Runtime.hpp"
#include "../platform/headless/HeadlessDesktopApi.hpp"

namespace ffi {

core::ReporterRegistry& registry() {
    platform::register_builtin_platforms();
    return core::ReporterRegistry::instance();
}

void report_failure(const char* function, const std::string& message) {
    auto& reg = registry();
    const std::string line = std::string(function) + ": " + message;
    if (auto logger = reg.logger()) logger->error("[FFI] " + line);
    reg.callbacks()->dispatch_log(core::LogEvent{common::LogLevel::Error, line});
}

} // namespace ffi
