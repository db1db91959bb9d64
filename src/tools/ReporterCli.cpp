#include "shikenmatrix.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  --config-dir <dir>   configuration directory (default ~/.shikenmatrix)\n"
              << "  --endpoint <url>     ws://, wss://, http:// or https:// endpoint\n"
              << "  --token <token>      authentication token\n"
              << "  --media              enable media reporting\n"
              << "  --save               persist the effective configuration\n";
}

void on_log(SmLogLevel level, const char* message, uintptr_t) {
    const char* tag = level == SM_LOG_ERROR ? "ERROR" : level == SM_LOG_WARNING ? "WARN" : "INFO";
    std::cout << "[Log:" << tag << "] " << message << std::endl;
}

void on_window(const char* title, const char* process_name, uint32_t pid,
               const uint8_t*, uintptr_t icon_size, uintptr_t) {
    std::cout << "[Window] " << process_name << " (" << pid << ") \"" << title << "\"";
    if (icon_size > 0) std::cout << " icon=" << icon_size << "B";
    std::cout << std::endl;
}

void on_media(const char* title, const char* artist, const char* album,
              double duration, double elapsed, bool playing,
              const uint8_t*, uintptr_t artwork_size, uintptr_t) {
    std::cout << "[Media] " << (playing ? "playing " : "paused ") << artist << " - " << title
              << " [" << album << "] " << elapsed << "/" << duration << "s";
    if (artwork_size > 0) std::cout << " artwork=" << artwork_size << "B";
    std::cout << std::endl;
}

void replace_string(char*& field, const std::string& value) {
    sm_string_free(field);
    field = static_cast<char*>(std::malloc(value.size() + 1));
    if (field) std::memcpy(field, value.c_str(), value.size() + 1);
}

} // namespace

int main(int argc, char** argv) {
    std::string endpoint;
    std::string token;
    bool has_endpoint = false;
    bool has_token = false;
    bool media = false;
    bool save = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--config-dir") {
            ::setenv("SHIKENMATRIX_CONFIG_DIR", next(), 1);
        } else if (arg == "--endpoint") {
            endpoint = next();
            has_endpoint = true;
        } else if (arg == "--token") {
            token = next();
            has_token = true;
        } else if (arg == "--media") {
            media = true;
        } else if (arg == "--save") {
            save = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::cout << "[Main] ShikenMatrix reporter starting..." << std::endl;

    SmConfig* config = sm_config_load();
    if (!config) {
        std::cerr << "Fatal error: cannot load configuration\n";
        return 1;
    }
    if (has_endpoint) {
        replace_string(config->ws_url, endpoint);
        config->enabled = true;
    }
    if (has_token) replace_string(config->token, token);
    if (media) config->enable_media_reporting = true;

    if (save && !sm_config_save(config)) {
        std::cerr << "[Main] Could not save configuration" << std::endl;
    }

    std::cout << "[Main] Accessibility: " << (sm_check_accessibility_permission() ? "granted" : "not granted") << std::endl;
    if (config->enable_media_reporting) {
        std::cout << "[Main] Media API: " << (sm_check_media_permission() ? "available" : "unavailable") << std::endl;
    }

    sm_reporter_set_log_callback(&on_log, 0);
    sm_reporter_set_window_callback(&on_window, 0);
    sm_reporter_set_media_callback(&on_media, 0);

    SmReporter* reporter = sm_reporter_start(config);
    sm_config_free(config);

    if (!reporter) {
        SmStatus status = sm_reporter_get_status(nullptr);
        std::cerr << "Fatal error: reporter did not start: "
                  << (status.last_error ? status.last_error : "unknown reason") << "\n";
        sm_string_free(status.last_error);
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    bool was_connected = false;
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        SmStatus status = sm_reporter_get_status(reporter);
        if (status.is_connected != was_connected) {
            was_connected = status.is_connected;
            std::cout << "[Main] " << (was_connected ? "Connected" : "Disconnected");
            if (!was_connected && status.last_error) std::cout << ": " << status.last_error;
            std::cout << std::endl;
        }
        sm_string_free(status.last_error);
    }

    std::cout << "[Main] Stopping..." << std::endl;
    bool stopped = sm_reporter_stop(reporter);

    sm_reporter_set_log_callback(nullptr, 0);
    sm_reporter_set_window_callback(nullptr, 0);
    sm_reporter_set_media_callback(nullptr, 0);
    return stopped ? 0 : 1;
}
