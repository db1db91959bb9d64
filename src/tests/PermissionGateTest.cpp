// ============================================================================
// PermissionGate tests: bounded media probe, sticky Blocked verdict
// ============================================================================

#include <chrono>
#include <memory>
#include "core/PermissionGate.hpp"
#include "testing/TestHarness.hpp"
#include "testing/MockDesktopApi.hpp"
#include "testing/MemoryConfigStore.hpp"

using namespace testing;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<core::PermissionGate> make_gate(std::shared_ptr<MockDesktopApi> desktop,
                                                std::shared_ptr<MemoryConfigStore> store,
                                                std::chrono::milliseconds timeout = 100ms) {
    return std::make_shared<core::PermissionGate>(desktop, store, timeout,
                                                  std::make_shared<common::NullLogger>());
}

void test_accessibility() {
    section("Accessibility");

    auto desktop = std::make_shared<MockDesktopApi>();
    auto gate = make_gate(desktop, nullptr);

    desktop->set_trusted(true);
    bool first = gate->check_accessibility();
    desktop->set_trusted(false);
    bool second = gate->check_accessibility();
    log_test("Accessibility is checked live, not cached", first && !second);

    desktop->set_request_result(true);
    bool requested = gate->request_accessibility();
    log_test("Request grants when the user accepts",
             requested && desktop->request_calls() == 1 && gate->check_accessibility());
}

void test_media_granted_and_denied() {
    section("Media probe");

    auto desktop = std::make_shared<MockDesktopApi>();
    auto gate = make_gate(desktop, nullptr);

    desktop->set_media_probe(MockDesktopApi::MediaProbe::Granted);
    log_test("Granted probe returns true",
             gate->check_media() && gate->media_verdict() == core::PermissionVerdict::Granted);

    desktop->set_media_probe(MockDesktopApi::MediaProbe::Denied);
    log_test("Denied probe returns false, not sticky",
             !gate->check_media() && gate->media_verdict() == core::PermissionVerdict::Denied);

    desktop->set_media_probe(MockDesktopApi::MediaProbe::Granted);
    log_test("Denied verdict recovers on the next probe", gate->check_media());
}

void test_media_blocked() {
    section("Blocked media probe");

    auto desktop = std::make_shared<MockDesktopApi>();
    auto store = std::make_shared<MemoryConfigStore>();
    auto gate = make_gate(desktop, store, 100ms);

    desktop->set_media_probe(MockDesktopApi::MediaProbe::Hang);

    auto start = std::chrono::steady_clock::now();
    bool result = gate->check_media();
    double ms = elapsed_ms(start);
    log_test("Hanging probe returns false within the timeout",
             !result && ms < 1000, "", ms);
    log_test("Verdict becomes Blocked",
             gate->media_verdict() == core::PermissionVerdict::Blocked);
    log_test("Blocked marker is persisted", store->media_blocked_marker());

    int calls_before = desktop->probe_calls();
    start = std::chrono::steady_clock::now();
    bool again = gate->check_media();
    double ms2 = elapsed_ms(start);
    log_test("Blocked is sticky: no new probe, immediate false",
             !again && desktop->probe_calls() == calls_before && ms2 < 50, "", ms2);

    // A probe that finishes late must not overwrite Blocked
    desktop->release_probe();
    std::this_thread::sleep_for(50ms);
    log_test("Late probe completion keeps Blocked",
             gate->media_verdict() == core::PermissionVerdict::Blocked);

    auto restarted = make_gate(desktop, store);
    log_test("New gate starts Blocked from the persisted marker",
             restarted->media_verdict() == core::PermissionVerdict::Blocked && !restarted->check_media());

    desktop->set_media_probe(MockDesktopApi::MediaProbe::Granted);
    gate->reset_media_check();
    log_test("Reset clears the marker", !store->media_blocked_marker() &&
             gate->media_verdict() == core::PermissionVerdict::Unknown);
    log_test("Probe runs again after reset", gate->check_media() &&
             desktop->probe_calls() > calls_before);
}

void test_missing_desktop() {
    section("No desktop backend");
    auto gate = std::make_shared<core::PermissionGate>(nullptr, nullptr, 50ms, nullptr);
    log_test("Every check reports unavailable",
             !gate->check_accessibility() && !gate->request_accessibility() && !gate->check_media());
}

} // namespace

int main() {
    std::cout << "Permission Gate Test Suite" << std::endl;
    std::cout << "==========================" << std::endl;

    test_accessibility();
    test_media_granted_and_denied();
    test_media_blocked();
    test_missing_desktop();

    return print_summary();
}
