// ============================================================================
// CallbackRegistry tests: slot replacement, re-entrancy, concurrent dispatch
// ============================================================================

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "core/CallbackRegistry.hpp"
#include "core/DispatchLogger.hpp"
#include "testing/TestHarness.hpp"
#include "testing/MockDesktopApi.hpp"

using namespace testing;
using namespace core;

namespace {

void test_slots() {
    section("Slots");

    CallbackRegistry registry;
    WindowEvent w = make_window("t", "p", 1);

    log_test("No handler -> event dropped", !registry.dispatch_window(w));

    int first = 0, second = 0;
    registry.set_window_handler([&](const WindowEvent&) { first++; });
    registry.dispatch_window(w);
    registry.set_window_handler([&](const WindowEvent&) { second++; });
    registry.dispatch_window(w);
    log_test("Last writer wins", first == 1 && second == 1);

    registry.set_window_handler(nullptr);
    log_test("Empty handler clears the slot", !registry.dispatch_window(w) && second == 1);

    int media = 0, logs = 0;
    registry.set_media_handler([&](const MediaEvent&) { media++; });
    registry.set_log_handler([&](const LogEvent&) { logs++; });
    registry.dispatch_media(make_track("a", 0));
    registry.dispatch_log(LogEvent{LogLevel::Info, "x"});
    log_test("Slots are independent", media == 1 && logs == 1 && registry.has_log_handler());
}

void test_reentrant_registration() {
    section("Re-entrancy");

    CallbackRegistry registry;
    int calls = 0;
    registry.set_window_handler([&](const WindowEvent&) {
        calls++;
        // Replacing our own slot from inside dispatch must not deadlock
        registry.set_window_handler([&](const WindowEvent&) { calls += 100; });
    });

    registry.dispatch_window(make_window("a", "b", 1));
    registry.dispatch_window(make_window("a", "b", 1));
    log_test("Handler can replace itself during dispatch", calls == 101);
}

void test_concurrent_replacement() {
    section("Concurrent replacement");

    CallbackRegistry registry;
    std::atomic<int> old_calls{0}, new_calls{0};
    registry.set_window_handler([&](const WindowEvent&) { old_calls++; });

    std::atomic<bool> done{false};
    const WindowEvent w = make_window("a", "b", 1);
    std::thread dispatcher([&] {
        while (!done) registry.dispatch_window(w);
    });

    std::vector<std::thread> writers;
    for (int i = 0; i < 4; ++i) {
        writers.emplace_back([&] {
            for (int n = 0; n < 500; ++n) {
                registry.set_window_handler([&](const WindowEvent&) { new_calls++; });
            }
        });
    }
    for (auto& t : writers) t.join();

    int before = new_calls.load() + old_calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    done = true;
    dispatcher.join();

    int old_after = old_calls.load();
    registry.dispatch_window(w);
    log_test("Replacement under load is atomic",
             before > 0 && old_calls.load() == old_after && new_calls.load() > 0);
}

void test_dispatch_logger() {
    section("DispatchLogger");

    auto registry = std::make_shared<CallbackRegistry>();
    std::vector<LogEvent> seen;
    registry->set_log_handler([&](const LogEvent& e) { seen.push_back(e); });

    DispatchLogger logger(std::make_shared<common::NullLogger>(), registry);
    logger.debug("hidden");
    logger.info("hello");
    logger.warning("careful");
    logger.error("broken");

    bool ok = seen.size() == 3 &&
              seen[0].level == LogLevel::Info && seen[0].message == "hello" &&
              seen[1].level == LogLevel::Warning &&
              seen[2].level == LogLevel::Error;
    log_test("Info and above reach the log callback", ok,
             "received " + std::to_string(seen.size()));
}

void test_log_serialisation() {
    section("Log dispatch from several threads");

    auto registry = std::make_shared<CallbackRegistry>();
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> delivered{0};
    registry->set_log_handler([&](const LogEvent&) {
        int now = ++inside;
        int seen = max_inside.load();
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        delivered++;
        --inside;
    });

    // Capture, transport and host threads all log through the same registry
    DispatchLogger logger(std::make_shared<common::NullLogger>(), registry);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            for (int n = 0; n < 100; ++n) logger.info("line");
        });
    }
    for (auto& t : threads) t.join();

    log_test("Every log line is delivered", delivered.load() == 400,
             std::to_string(delivered.load()) + " delivered");
    log_test("Log handler never runs on two threads at once", max_inside.load() == 1,
             "max concurrent " + std::to_string(max_inside.load()));

    int nested = 0;
    registry->set_log_handler([&](const LogEvent& e) {
        nested++;
        if (e.message == "outer") registry->dispatch_log(LogEvent{LogLevel::Info, "inner"});
    });
    registry->dispatch_log(LogEvent{LogLevel::Info, "outer"});
    log_test("Log handler may log from inside the callback", nested == 2);
}

} // namespace

int main() {
    std::cout << "Callback Registry Test Suite" << std::endl;
    std::cout << "============================" << std::endl;

    test_slots();
    test_reentrant_registration();
    test_concurrent_replacement();
    test_dispatch_logger();
    test_log_serialisation();

    return print_summary();
}
