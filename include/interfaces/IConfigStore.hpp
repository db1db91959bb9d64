#pragma once
#include <string>
#include "common/Result.hpp"
#include "core/ReporterTypes.hpp"

namespace interfaces {

// Durable configuration collaborator. Also keeps the persisted "media
// blocked" marker so a later process does not repeat a hanging probe.
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    // Missing document -> defaults. Unreadable or malformed -> error.
    virtual common::Result<core::AppConfig> load() = 0;
    virtual common::EmptyResult save(const core::AppConfig& config) = 0;

    virtual bool media_blocked_marker() = 0;
    virtual common::EmptyResult set_media_blocked_marker(bool blocked) = 0;

    // Human readable location (path) for logs
    virtual std::string location() const = 0;
};

} // namespace interfaces
