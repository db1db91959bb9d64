#include "YamlConfigStore.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace platform {
namespace fs = std::filesystem;

namespace {

bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

template <typename T>
void maybe_set(const YAML::Node& n, const char* key, T& out) {
    if (!n || !n[key]) return;
    out = n[key].as<T>();
}

void maybe_set_ms(const YAML::Node& n, const char* key, std::chrono::milliseconds& out) {
    if (!n || !n[key]) return;
    out = std::chrono::milliseconds(n[key].as<long long>());
}

common::EmptyResult validate(const core::AppConfig& cfg) {
    const auto& e = cfg.engine;
    auto positive = [](std::chrono::milliseconds v) { return v.count() > 0; };

    if (!positive(e.poll_interval) || !positive(e.media_elapsed_interval) ||
        !positive(e.media_probe_timeout) || !positive(e.media_recheck_interval) ||
        !positive(e.reconnect_min) || !positive(e.reconnect_max) || !positive(e.connect_timeout) ||
        !positive(e.artwork_ack_timeout) ||
        e.stop_grace.count() < 0 || e.close_timeout.count() < 0) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument,
                                        "engine intervals must be positive");
    }
    if (e.reconnect_max < e.reconnect_min) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument,
                                        "engine.reconnect_max_ms must be >= reconnect_min_ms");
    }
    if (e.send_queue_capacity == 0) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument,
                                        "engine.send_queue_capacity must be at least 1");
    }
    return common::EmptyResult::success();
}

} // namespace

YamlConfigStore::YamlConfigStore(fs::path directory)
    : directory_(std::move(directory))
{
}

fs::path YamlConfigStore::default_directory() {
    if (const char* dir = std::getenv("SHIKENMATRIX_CONFIG_DIR")) {
        if (*dir) return fs::path(dir);
    }
    if (const char* home = std::getenv("HOME")) {
        if (*home) return fs::path(home) / ".shikenmatrix";
    }
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

// ============================================================================
// Parse / Serialize
// ============================================================================

common::Result<core::AppConfig> YamlConfigStore::parse(const std::string& yaml_text) {
    using R = common::Result<core::AppConfig>;
    core::AppConfig cfg;  // defaults

    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) return R::ok(cfg);  // empty document
        if (!root.IsMap()) {
            return R::err(common::ErrorCode::InvalidArgument, "config root must be a map");
        }

        if (is_map(root["reporter"])) {
            const auto r = root["reporter"];
            maybe_set(r, "enabled", cfg.reporter.enabled);
            maybe_set(r, "ws_url", cfg.reporter.endpoint);
            maybe_set(r, "token", cfg.reporter.auth_token);
            maybe_set(r, "enable_media_reporting", cfg.reporter.enable_media_reporting);
        }

        if (is_map(root["engine"])) {
            const auto e = root["engine"];
            maybe_set_ms(e, "poll_interval_ms", cfg.engine.poll_interval);
            maybe_set_ms(e, "media_elapsed_interval_ms", cfg.engine.media_elapsed_interval);
            maybe_set_ms(e, "media_probe_timeout_ms", cfg.engine.media_probe_timeout);
            maybe_set_ms(e, "media_recheck_interval_ms", cfg.engine.media_recheck_interval);
            maybe_set_ms(e, "reconnect_min_ms", cfg.engine.reconnect_min);
            maybe_set_ms(e, "reconnect_max_ms", cfg.engine.reconnect_max);
            maybe_set_ms(e, "connect_timeout_ms", cfg.engine.connect_timeout);
            maybe_set_ms(e, "stop_grace_ms", cfg.engine.stop_grace);
            maybe_set_ms(e, "close_timeout_ms", cfg.engine.close_timeout);
            maybe_set_ms(e, "artwork_ack_timeout_ms", cfg.engine.artwork_ack_timeout);
            maybe_set(e, "send_queue_capacity", cfg.engine.send_queue_capacity);
        }
    } catch (const YAML::Exception& e) {
        return R::err(common::ErrorCode::InvalidArgument, std::string("YAML parse error: ") + e.what());
    }

    auto valid = validate(cfg);
    if (valid.is_err()) return R::err(valid.error());
    return R::ok(cfg);
}

std::string YamlConfigStore::serialize(const core::AppConfig& cfg) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "reporter" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << cfg.reporter.enabled;
    out << YAML::Key << "ws_url" << YAML::Value << cfg.reporter.endpoint;
    out << YAML::Key << "token" << YAML::Value << cfg.reporter.auth_token;
    out << YAML::Key << "enable_media_reporting" << YAML::Value << cfg.reporter.enable_media_reporting;
    out << YAML::EndMap;

    const auto& e = cfg.engine;
    out << YAML::Key << "engine" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "poll_interval_ms" << YAML::Value << static_cast<long long>(e.poll_interval.count());
    out << YAML::Key << "media_elapsed_interval_ms" << YAML::Value << static_cast<long long>(e.media_elapsed_interval.count());
    out << YAML::Key << "media_probe_timeout_ms" << YAML::Value << static_cast<long long>(e.media_probe_timeout.count());
    out << YAML::Key << "media_recheck_interval_ms" << YAML::Value << static_cast<long long>(e.media_recheck_interval.count());
    out << YAML::Key << "reconnect_min_ms" << YAML::Value << static_cast<long long>(e.reconnect_min.count());
    out << YAML::Key << "reconnect_max_ms" << YAML::Value << static_cast<long long>(e.reconnect_max.count());
    out << YAML::Key << "connect_timeout_ms" << YAML::Value << static_cast<long long>(e.connect_timeout.count());
    out << YAML::Key << "stop_grace_ms" << YAML::Value << static_cast<long long>(e.stop_grace.count());
    out << YAML::Key << "close_timeout_ms" << YAML::Value << static_cast<long long>(e.close_timeout.count());
    out << YAML::Key << "artwork_ack_timeout_ms" << YAML::Value << static_cast<long long>(e.artwork_ack_timeout.count());
    out << YAML::Key << "send_queue_capacity" << YAML::Value << static_cast<unsigned long long>(e.send_queue_capacity);
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

// ============================================================================
// Load / Save
// ============================================================================

common::Result<core::AppConfig> YamlConfigStore::load() {
    using R = common::Result<core::AppConfig>;
    const fs::path path = config_path();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return R::ok(core::AppConfig{});
    }

    std::ifstream in(path);
    if (!in) {
        return R::err(common::ErrorCode::IoError, "cannot read " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse(buffer.str());
    if (parsed.is_err()) {
        return R::err(parsed.error().code, path.string() + ": " + parsed.error().message);
    }
    return parsed;
}

common::EmptyResult YamlConfigStore::save(const core::AppConfig& config) {
    auto valid = validate(config);
    if (valid.is_err()) return valid;

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return common::EmptyResult::err(common::ErrorCode::IoError,
                                        "cannot create " + directory_.string() + ": " + ec.message());
    }

    const fs::path path = config_path();
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return common::EmptyResult::err(common::ErrorCode::IoError, "cannot write " + tmp.string());
        }
        out << serialize(config);
        out.flush();
        if (!out) {
            return common::EmptyResult::err(common::ErrorCode::IoError, "write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return common::EmptyResult::err(common::ErrorCode::IoError,
                                        "cannot replace " + path.string());
    }
    return common::EmptyResult::success();
}

bool YamlConfigStore::media_blocked_marker() {
    std::error_code ec;
    return fs::exists(marker_path(), ec);
}

common::EmptyResult YamlConfigStore::set_media_blocked_marker(bool blocked) {
    std::error_code ec;
    const fs::path marker = marker_path();

    if (!blocked) {
        fs::remove(marker, ec);
        if (ec) {
            return common::EmptyResult::err(common::ErrorCode::IoError,
                                            "cannot remove " + marker.string() + ": " + ec.message());
        }
        return common::EmptyResult::success();
    }

    fs::create_directories(directory_, ec);
    std::ofstream out(marker, std::ios::trunc);
    if (!out) {
        return common::EmptyResult::err(common::ErrorCode::IoError, "cannot write " + marker.string());
    }
    out << "media probe timed out\n";
    return common::EmptyResult::success();
}

} // namespace platform
