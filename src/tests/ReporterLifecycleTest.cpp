// ============================================================================
// Reporter lifecycle tests: single-instance slot, start/stop contract,
// status, concurrent start, and the C boundary on top of it
// ============================================================================

#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "shikenmatrix.h"
#include "core/PlatformRegistry.hpp"
#include "core/ReporterRegistry.hpp"
#include "platform/headless/HeadlessDesktopApi.hpp"
#include "testing/TestHarness.hpp"
#include "testing/FakeChannelConnector.hpp"
#include "testing/MemoryConfigStore.hpp"
#include "testing/MockDesktopApi.hpp"

using namespace testing;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<MockDesktopApi> g_desktop;
std::shared_ptr<MemoryConfigStore> g_store;
std::shared_ptr<FakeChannelConnector> g_connector;

void install_fakes() {
    auto& registry = core::ReporterRegistry::instance();

    g_desktop = std::make_shared<MockDesktopApi>();
    g_desktop->set_window(make_window("Terminal", "bash", 4242));
    g_store = std::make_shared<MemoryConfigStore>();
    g_connector = std::make_shared<FakeChannelConnector>();

    core::ReporterRegistry::Services services;
    services.desktop = g_desktop;
    services.config_store = g_store;
    services.connector = g_connector;
    services.logger = std::make_shared<common::NullLogger>();
    auto installed = registry.install_services(services);
    if (installed.is_err()) {
        std::cerr << "install_services failed: " << installed.error().message << std::endl;
    }

    core::EngineOptions options;
    options.poll_interval = 20ms;
    options.reconnect_min = 20ms;
    options.reconnect_max = 100ms;
    options.stop_grace = 500ms;
    options.close_timeout = 50ms;
    registry.set_engine_options(options);
}

core::ReporterConfig valid_config() {
    core::ReporterConfig config;
    config.enabled = true;
    config.endpoint = "wss://reporter.example.com/ws";
    config.auth_token = "secret";
    return config;
}

void test_invalid_config() {
    section("Invalid configuration");
    auto& registry = core::ReporterRegistry::instance();

    core::ReporterConfig disabled = valid_config();
    disabled.enabled = false;
    auto r1 = registry.start(disabled);
    log_test("Disabled config fails to start", r1.is_err() && !registry.is_running());

    auto status = registry.status();
    log_test("Failure reason is visible in status",
             !status.is_running && status.last_error && status.last_error->find("disabled") != std::string::npos);

    core::ReporterConfig empty = valid_config();
    empty.endpoint.clear();
    log_test("Empty endpoint fails to start", registry.start(empty).is_err());

    core::ReporterConfig bad = valid_config();
    bad.endpoint = "gopher://nowhere";
    log_test("Unparsable endpoint fails to start", registry.start(bad).is_err() && !registry.is_running());
}

void test_start_stop() {
    section("Start / stop");
    auto& registry = core::ReporterRegistry::instance();

    std::vector<core::WindowEvent> windows;
    std::mutex windows_mutex;
    registry.callbacks()->set_window_handler([&](const core::WindowEvent& e) {
        std::lock_guard<std::mutex> lock(windows_mutex);
        windows.push_back(e);
    });

    auto started = registry.start(valid_config());
    log_test("Valid config starts", started.is_ok() && started.unwrap() != 0 && registry.is_running());
    if (started.is_err()) return;
    auto handle = started.unwrap();

    log_test("Status reports running", registry.status().is_running);
    log_test("Status reports connected",
             wait_until([&] { return registry.status().is_connected; }, 2s));

    bool got_window = wait_until([&] {
        std::lock_guard<std::mutex> lock(windows_mutex);
        return !windows.empty();
    }, 2s);
    log_test("Window callback receives the focused window", got_window);
    log_test("Window event reaches the wire", wait_until([&] {
        for (const auto& t : g_connector->sent_texts()) {
            if (t.find("\"process_name\":\"bash\"") != std::string::npos) return true;
        }
        return false;
    }, 2s));

    auto second = registry.start(valid_config());
    log_test("Second start fails while running",
             second.is_err() && second.error().code == common::ErrorCode::Busy);

    log_test("Stop with a mismatched handle fails", registry.stop(handle + 1).is_err() && registry.is_running());

    auto t = std::chrono::steady_clock::now();
    auto stopped = registry.stop(handle);
    log_test("Stop succeeds", stopped.is_ok() && !registry.is_running(), "", elapsed_ms(t));

    auto status = registry.status();
    log_test("Status after stop", !status.is_running && !status.is_connected);
    log_test("Second stop fails", registry.stop(handle).is_err());

    auto restarted = registry.start(valid_config());
    log_test("Restart yields a new handle", restarted.is_ok() && restarted.unwrap() != handle);
    if (restarted.is_ok()) registry.stop(restarted.unwrap());

    registry.callbacks()->set_window_handler(nullptr);
}

void test_concurrent_start() {
    section("Concurrent start");
    auto& registry = core::ReporterRegistry::instance();

    std::atomic<int> successes{0};
    std::atomic<uint64_t> winner{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto r = registry.start(valid_config());
            if (r.is_ok()) {
                successes++;
                winner = r.unwrap();
            }
        });
    }
    for (auto& t : threads) t.join();

    log_test("Exactly one concurrent start succeeds", successes == 1 && registry.is_running());
    log_test("Services cannot be swapped while running",
             registry.install_services(core::ReporterRegistry::Services{}).is_err());
    registry.stop(winner.load());
}

void test_auth_failure_status() {
    section("Authentication failure");
    auto& registry = core::ReporterRegistry::instance();

    g_connector->set_auth_rejecting(true);
    auto started = registry.start(valid_config());
    bool recorded = started.is_ok() && wait_until([&] {
        auto s = registry.status();
        return s.last_error && s.last_error->find("Authentication rejected") != std::string::npos;
    }, 2s);
    log_test("Rejected credential shows in status while running", recorded && !registry.status().is_connected);
    if (started.is_ok()) registry.stop(started.unwrap());
    g_connector->set_auth_rejecting(false);
}

void test_media_denied_scenario() {
    section("Media denied scenario");
    auto& registry = core::ReporterRegistry::instance();

    g_desktop->set_media(make_track("Denied Track", 1.0));
    g_desktop->set_media_probe(MockDesktopApi::MediaProbe::Denied);

    std::atomic<int> window_events{0};
    std::atomic<int> media_events{0};
    registry.callbacks()->set_window_handler([&](const core::WindowEvent&) { window_events++; });
    registry.callbacks()->set_media_handler([&](const core::MediaEvent&) { media_events++; });

    core::ReporterConfig config;
    config.enabled = true;
    config.endpoint = "wss://example/test";
    config.auth_token = "abc";
    config.enable_media_reporting = true;

    auto started = registry.start(config);
    log_test("Reporter starts with media denied", started.is_ok());
    if (started.is_err()) return;

    log_test("Status eventually shows running",
             wait_until([&] { return registry.status().is_running; }, 2s));
    log_test("Window events are dispatched",
             wait_until([&] { return window_events.load() > 0; }, 2s));

    // Several more cycles with the track still playing
    std::this_thread::sleep_for(200ms);

    log_test("No media event reaches the callback", media_events.load() == 0);
    bool on_wire = false;
    for (const auto& t : g_connector->sent_texts()) {
        if (t.find("Denied Track") != std::string::npos) on_wire = true;
    }
    log_test("No media event reaches the wire", !on_wire);

    registry.stop(started.unwrap());
    registry.callbacks()->set_window_handler(nullptr);
    registry.callbacks()->set_media_handler(nullptr);
    g_desktop->set_media(std::nullopt);
    g_desktop->set_media_probe(MockDesktopApi::MediaProbe::Granted);
}

// ============================================================================
// C boundary
// ============================================================================

struct WindowCapture {
    std::mutex mutex;
    std::string title;
    uint32_t pid = 0;
    int calls = 0;
};

void window_cb(const char* title, const char*, uint32_t pid, const uint8_t*, uintptr_t, uintptr_t user_data) {
    auto* capture = reinterpret_cast<WindowCapture*>(user_data);
    std::lock_guard<std::mutex> lock(capture->mutex);
    capture->title = title;
    capture->pid = pid;
    capture->calls++;
}

std::atomic<int> g_log_lines{0};
std::atomic<bool> g_saw_summary{false};
void log_cb(SmLogLevel, const char* message, uintptr_t) {
    if (message && *message) g_log_lines++;
    if (message && std::strstr(message, "Session summary")) g_saw_summary = true;
}

char* c_string(const char* s) {
    char* out = static_cast<char*>(std::malloc(std::strlen(s) + 1));
    std::strcpy(out, s);
    return out;
}

void test_c_boundary() {
    section("C boundary");

    log_test("Null config is rejected", sm_reporter_start(nullptr) == nullptr);
    log_test("Null config cannot be saved", !sm_config_save(nullptr));
    sm_config_free(nullptr);
    sm_string_free(nullptr);

    WindowCapture capture;
    sm_reporter_set_window_callback(&window_cb, reinterpret_cast<uintptr_t>(&capture));
    sm_reporter_set_log_callback(&log_cb, 0);

    SmConfig config{};
    config.enabled = true;
    config.ws_url = c_string("ws://127.0.0.1:1/ws");
    config.token = c_string("abc");
    config.enable_media_reporting = false;

    SmReporter* handle = sm_reporter_start(&config);
    log_test("sm_reporter_start returns a handle", handle != nullptr && sm_reporter_is_running());

    bool delivered = wait_until([&] {
        std::lock_guard<std::mutex> lock(capture.mutex);
        return capture.calls > 0;
    }, 2s);
    {
        std::lock_guard<std::mutex> lock(capture.mutex);
        log_test("Window callback gets user_data and fields",
                 delivered && capture.title == "Terminal" && capture.pid == 4242);
    }
    log_test("Log callback receives engine lines", g_log_lines.load() > 0);

    log_test("Second sm_reporter_start returns null", sm_reporter_start(&config) == nullptr);

    SmStatus status = sm_reporter_get_status(handle);
    log_test("sm_reporter_get_status while running", status.is_running);
    sm_string_free(status.last_error);

    log_test("sm_reporter_stop succeeds", sm_reporter_stop(handle) && !sm_reporter_is_running());
    log_test("Stop logs a session summary", g_saw_summary.load());
    log_test("Second sm_reporter_stop fails", !sm_reporter_stop(handle));

    status = sm_reporter_get_status(nullptr);
    log_test("Status after stop is not running", !status.is_running && !status.is_connected);
    sm_string_free(status.last_error);

    config.enabled = false;
    log_test("Disabled config returns null", sm_reporter_start(&config) == nullptr);
    status = sm_reporter_get_status(nullptr);
    log_test("Start failure reported through status", status.last_error != nullptr);
    sm_string_free(status.last_error);

    sm_reporter_set_window_callback(nullptr, 0);
    sm_reporter_set_log_callback(nullptr, 0);
    std::free(config.ws_url);
    std::free(config.token);
}

void test_c_config() {
    section("C configuration");

    core::AppConfig stored;
    stored.reporter.enabled = true;
    stored.reporter.endpoint = "wss://a.example/ws";
    stored.reporter.auth_token = "t0";
    stored.engine.send_queue_capacity = 32;
    g_store->save(stored);

    SmConfig* loaded = sm_config_load();
    bool ok = loaded && loaded->enabled && std::string(loaded->ws_url) == "wss://a.example/ws" &&
              std::string(loaded->token) == "t0" && !loaded->enable_media_reporting;
    log_test("sm_config_load returns the stored config", ok);
    log_test("Engine options applied on load",
             core::ReporterRegistry::instance().engine_options().send_queue_capacity == 32);

    if (loaded) {
        sm_string_free(loaded->token);
        loaded->token = c_string("t1");
        loaded->enable_media_reporting = true;
        log_test("sm_config_save succeeds", sm_config_save(loaded));
        sm_config_free(loaded);
    }

    auto after = g_store->stored();
    log_test("Saved reporter fields", after.reporter.auth_token == "t1" && after.reporter.enable_media_reporting);
    log_test("Engine section preserved on save", after.engine.send_queue_capacity == 32);

    g_store->set_fail_load(true);
    SmConfig* fallback = sm_config_load();
    log_test("Malformed store falls back to defaults",
             fallback && !fallback->enabled && fallback->ws_url && std::string(fallback->ws_url).empty());
    sm_config_free(fallback);
    g_store->set_fail_load(false);
}

void test_c_permissions() {
    section("C permissions");

    g_desktop->set_trusted(true);
    log_test("Accessibility check", sm_check_accessibility_permission());
    g_desktop->set_trusted(false);
    log_test("Accessibility check is live", !sm_check_accessibility_permission());
    g_desktop->set_request_result(true);
    log_test("Accessibility request", sm_request_accessibility_permission());

    auto& registry = core::ReporterRegistry::instance();
    auto options = registry.engine_options();
    options.media_probe_timeout = 100ms;
    registry.set_engine_options(options);

    g_desktop->set_media_probe(MockDesktopApi::MediaProbe::Hang);
    auto t = std::chrono::steady_clock::now();
    bool first = sm_check_media_permission();
    double ms = elapsed_ms(t);
    log_test("Hanging media probe is bounded", !first && ms < 1000, "", ms);
    log_test("Blocked marker persisted", g_store->media_blocked_marker());

    g_desktop->set_media_probe(MockDesktopApi::MediaProbe::Granted);
    log_test("Blocked verdict is sticky", !sm_check_media_permission());

    sm_reset_media_permission_check();
    log_test("Reset re-enables the probe", sm_check_media_permission() && !g_store->media_blocked_marker());
    g_desktop->release_probe();
}

} // namespace

void test_platform_registration() {
    section("Platform registration");

    platform::register_builtin_platforms();
    platform::register_builtin_platforms();

    auto& platforms = core::PlatformRegistry::instance();
    auto names = platforms.list_platforms();
    log_test("Built-in platforms registered once",
             names.size() == 2, std::to_string(names.size()) + " factories");
    log_test("Linux factory is consulted first",
             !names.empty() && names.front() == "Linux");
    log_test("Headless fallback registered last",
             !names.empty() && names.back() == "Headless");
    log_test("Unknown platform lookup returns null",
             platforms.get_platform("Plan9") == nullptr);

    auto* headless = platforms.get_platform("Headless");
    log_test("Headless factory found by name", headless != nullptr);
    if (!headless) return;

    auto desktop = headless->create_desktop_api();
    log_test("Headless backend is untrusted",
             desktop && !desktop->is_accessibility_trusted() && !desktop->probe_media_access());
    auto window = desktop->query_focused_window();
    log_test("Headless window query is not implemented",
             window.is_err() && window.error().code == common::ErrorCode::NotImplemented);
    log_test("Headless factory provides a config store",
             headless->create_config_store() != nullptr);
}

int main() {
    std::cout << "Reporter Lifecycle Test Suite" << std::endl;
    std::cout << "=============================" << std::endl;

    install_fakes();

    test_invalid_config();
    test_start_stop();
    test_concurrent_start();
    test_auth_failure_status();
    test_media_denied_scenario();
    test_c_boundary();
    test_c_config();
    test_c_permissions();
    test_platform_registration();

    return print_summary();
}
