#include "shikenmatrix.h"
#include "Runtime.hpp"
#include <exception>
#include <new>

namespace {

core::AppConfig load_or_defaults(core::ReporterRegistry& reg) {
    auto store = reg.config_store();
    if (!store) return core::AppConfig{};

    auto loaded = store->load();
    if (loaded.is_err()) {
        if (auto logger = reg.logger()) {
            logger->warning("[Config] " + loaded.error().message + "; using defaults");
        }
        return core::AppConfig{};
    }
    return loaded.take();
}

} // namespace

extern "C" {

SmConfig* sm_config_load(void) {
    try {
        auto& reg = ffi::registry();
        core::AppConfig cfg = load_or_defaults(reg);
        reg.set_engine_options(cfg.engine);

        SmConfig* out = new (std::nothrow) SmConfig{};
        if (!out) return nullptr;
        out->enabled = cfg.reporter.enabled;
        out->ws_url = ffi::dup_string(cfg.reporter.endpoint);
        out->token = ffi::dup_string(cfg.reporter.auth_token);
        out->enable_media_reporting = cfg.reporter.enable_media_reporting;
        return out;
    } catch (const std::exception& e) {
        ffi::report_failure("sm_config_load", e.what());
        return nullptr;
    }
}

bool sm_config_save(const SmConfig* config) {
    if (!config) {
        ffi::report_failure("sm_config_save", "null config pointer");
        return false;
    }
    try {
        auto& reg = ffi::registry();
        auto store = reg.config_store();
        if (!store) {
            ffi::report_failure("sm_config_save", "no configuration store available");
            return false;
        }

        // Engine tuning is not part of SmConfig; keep what is stored.
        core::AppConfig cfg = load_or_defaults(reg);
        cfg.reporter.enabled = config->enabled;
        cfg.reporter.endpoint = ffi::from_c(config->ws_url);
        cfg.reporter.auth_token = ffi::from_c(config->token);
        cfg.reporter.enable_media_reporting = config->enable_media_reporting;

        auto saved = store->save(cfg);
        if (saved.is_err()) {
            ffi::report_failure("sm_config_save", saved.error().message);
            return false;
        }
        if (auto logger = reg.logger()) logger->info("[Config] Saved to " + store->location());
        return true;
    } catch (const std::exception& e) {
        ffi::report_failure("sm_config_save", e.what());
        return false;
    }
}

void sm_config_free(SmConfig* config) {
    if (!config) return;
    std::free(config->ws_url);
    std::free(config->token);
    delete config;
}

void sm_string_free(char* s) {
    std::free(s);
}

} // extern "C"
