#pragma once
#include <cstdlib>
#include <cstring>
#include <string>
#include "core/ReporterRegistry.hpp"

namespace ffi {

// Process-wide registry with the built-in platforms registered
core::ReporterRegistry& registry();

// Heap copy released by sm_string_free; nullptr on allocation failure
inline char* dup_string(const std::string& value) {
    char* out = static_cast<char*>(std::malloc(value.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, value.c_str(), value.size() + 1);
    return out;
}

inline std::string from_c(const char* value) {
    return value ? std::string(value) : std::string();
}

// Boundary failures go to the console and the host's log callback
void report_failure(const char* function, const std::string& message);

} // namespace ffi
