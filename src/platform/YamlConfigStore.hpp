#pragma once
#include <filesystem>
#include <string>
#include "interfaces/IConfigStore.hpp"

namespace platform {

// ============================================================================
// YamlConfigStore - AppConfig persisted as YAML
// ============================================================================
// <dir>/config.yaml:
//
//   reporter:
//     enabled: true
//     ws_url: wss://example.com/ws
//     token: secret
//     enable_media_reporting: false
//   engine:              # optional, milliseconds unless noted
//     poll_interval_ms: 500
//     ...
//
// <dir>/media_blocked is the sticky media marker.
// Writes go to a temporary file renamed over the target.
// ============================================================================

class YamlConfigStore : public interfaces::IConfigStore {
public:
    explicit YamlConfigStore(std::filesystem::path directory);

    common::Result<core::AppConfig> load() override;
    common::EmptyResult save(const core::AppConfig& config) override;

    bool media_blocked_marker() override;
    common::EmptyResult set_media_blocked_marker(bool blocked) override;

    std::string location() const override { return config_path().string(); }

    std::filesystem::path config_path() const { return directory_ / "config.yaml"; }
    std::filesystem::path marker_path() const { return directory_ / "media_blocked"; }

    // $SHIKENMATRIX_CONFIG_DIR, else ~/.shikenmatrix, else the working directory
    static std::filesystem::path default_directory();

    // Parses a YAML document; exposed for tests
    static common::Result<core::AppConfig> parse(const std::string& yaml_text);
    static std::string serialize(const core::AppConfig& config);

private:
    std::filesystem::path directory_;
};

} // namespace platform
