// ============================================================================
// Capture tests: change detection, elapsed-time throttle, permission
// handling, path isolation and loop shutdown
// ============================================================================

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>
#include "core/CaptureLoop.hpp"
#include "testing/TestHarness.hpp"
#include "testing/MockDesktopApi.hpp"

using namespace testing;
using namespace core;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public interfaces::IEventSink {
public:
    void publish_window(const WindowEvent& e) override {
        if (throw_on_window) throw std::runtime_error("sink down");
        std::lock_guard<std::mutex> lock(mutex);
        windows.push_back(e);
    }
    void publish_media(const MediaEvent& e) override {
        std::lock_guard<std::mutex> lock(mutex);
        media.push_back(e);
    }
    void publish_artwork(const std::string& id, const std::vector<uint8_t>&, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex);
        artwork.push_back(id);
    }

    size_t window_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return windows.size();
    }

    std::mutex mutex;
    std::vector<WindowEvent> windows;
    std::vector<MediaEvent> media;
    std::vector<std::string> artwork;
    std::atomic<bool> throw_on_window{false};
};

struct Fixture {
    std::shared_ptr<MockDesktopApi> desktop = std::make_shared<MockDesktopApi>();
    std::shared_ptr<CallbackRegistry> callbacks = std::make_shared<CallbackRegistry>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::shared_ptr<ErrorSlot> errors = std::make_shared<ErrorSlot>();
    std::shared_ptr<PermissionGate> gate;
    std::shared_ptr<EventSampler> sampler;

    std::vector<WindowEvent> cb_windows;
    std::vector<MediaEvent> cb_media;

    explicit Fixture(bool media_enabled = true) {
        gate = std::make_shared<PermissionGate>(desktop, nullptr, 100ms, nullptr);

        ReporterConfig config;
        config.enabled = true;
        config.endpoint = "ws://localhost/";
        config.enable_media_reporting = media_enabled;

        sampler = std::make_shared<EventSampler>(config, EngineOptions{}, gate, desktop,
                                                 callbacks, sink,
                                                 std::make_shared<common::NullLogger>(), errors);

        callbacks->set_window_handler([this](const WindowEvent& e) { cb_windows.push_back(e); });
        callbacks->set_media_handler([this](const MediaEvent& e) { cb_media.push_back(e); });

        desktop->set_window(make_window("Editor", "code", 100));
    }
};

void test_first_sample_and_dedup() {
    section("Change detection");

    Fixture f;
    f.desktop->set_media(make_track("Song", 10.0));
    auto t0 = EventSampler::Clock::now();

    f.sampler->sample_once(t0);
    log_test("First sample emits window and media",
             f.cb_windows.size() == 1 && f.cb_media.size() == 1 &&
             f.sink->windows.size() == 1 && f.sink->media.size() == 1);

    f.sampler->sample_once(t0 + 500ms);
    log_test("Unchanged sample emits nothing",
             f.cb_windows.size() == 1 && f.cb_media.size() == 1);

    f.desktop->set_window(make_window("Editor - other.cpp", "code", 100));
    f.sampler->sample_once(t0 + 600ms);
    log_test("Title change emits a window event", f.cb_windows.size() == 2);

    WindowEvent same = make_window("Editor - other.cpp", "code", 100);
    same.icon = {1, 2, 3};
    f.desktop->set_window(same);
    f.sampler->sample_once(t0 + 700ms);
    log_test("Icon alone is not a change", f.cb_windows.size() == 2);

    f.desktop->set_window(make_window("Editor - other.cpp", "code", 101));
    f.sampler->sample_once(t0 + 800ms);
    log_test("Pid change emits a window event", f.cb_windows.size() == 3);

    f.desktop->set_media(make_track("Song", 10.0, false));
    f.sampler->sample_once(t0 + 900ms);
    log_test("Play-state change emits immediately", f.cb_media.size() == 2 && !f.cb_media.back().playing);

    f.desktop->set_media(make_track("Song", 95.0, false));
    f.sampler->sample_once(t0 + 950ms);
    log_test("Seek while paused emits immediately", f.cb_media.size() == 3);

    f.desktop->set_media(make_track("Next", 0.0));
    f.sampler->sample_once(t0 + 960ms);
    log_test("Track change emits immediately",
             f.cb_media.size() == 4 && f.cb_media.back().content_item_identifier == "spotify:Next:Album");

    f.desktop->set_media(std::nullopt);
    f.sampler->sample_once(t0 + 1000ms);
    f.desktop->set_media(make_track("Next", 0.0));
    f.sampler->sample_once(t0 + 1100ms);
    log_test("Track resumes after nothing was playing", f.cb_media.size() == 5);
}

void test_elapsed_throttle() {
    section("Elapsed-time throttle");

    Fixture f;
    auto t0 = EventSampler::Clock::now();

    // 10 Hz sampling for 5 seconds, only elapsed time advances
    for (int i = 0; i < 50; ++i) {
        f.desktop->set_media(make_track("Song", 0.1 * i));
        f.sampler->sample_once(t0 + std::chrono::milliseconds(100 * i));
    }

    size_t emitted = f.cb_media.size();
    log_test("Elapsed-only changes emit at most once per second",
             emitted >= 5 && emitted <= 6, "emitted " + std::to_string(emitted));

    bool spaced = true;
    for (size_t i = 1; i < f.cb_media.size(); ++i) {
        if (f.cb_media[i].elapsed_time - f.cb_media[i - 1].elapsed_time < 0.95) spaced = false;
    }
    log_test("Throttled emissions are at least 1s apart", spaced);
    log_test("Sink sees the same media stream", f.sink->media.size() == emitted);
    log_test("Window emitted only once", f.cb_windows.size() == 1);
}

void test_media_denied() {
    section("Media permission denied");

    Fixture f;
    f.desktop->set_media_probe(MockDesktopApi::MediaProbe::Denied);
    f.desktop->set_media(make_track("Song", 1.0));

    auto t0 = EventSampler::Clock::now();
    for (int i = 0; i < 5; ++i) {
        f.desktop->set_window(make_window("W" + std::to_string(i), "app", 1));
        f.sampler->sample_once(t0 + std::chrono::milliseconds(500 * i));
    }

    log_test("Only window events are emitted",
             f.cb_windows.size() == 5 && f.cb_media.empty() && f.sink->media.empty());
    log_test("Media API is never queried", f.desktop->media_queries() == 0);
    log_test("Denial is recorded as last error", f.errors->last().has_value());

    f.desktop->set_media_probe(MockDesktopApi::MediaProbe::Granted);
    f.sampler->sample_once(t0 + 5s);
    log_test("Granting permission resumes media without restart", f.cb_media.size() == 1);
}

void test_media_recheck() {
    section("Media permission recheck");

    Fixture f;
    f.desktop->set_media(make_track("Song", 1.0));
    auto t0 = EventSampler::Clock::now();

    for (int i = 0; i < 20; ++i) {
        f.sampler->sample_once(t0 + std::chrono::milliseconds(500 * i));
    }
    log_test("Granted media access is checked once per recheck interval",
             f.desktop->probe_calls() == 1, std::to_string(f.desktop->probe_calls()) + " checks");

    f.sampler->sample_once(t0 + 31s);
    log_test("Access is checked again after the recheck interval", f.desktop->probe_calls() == 2);

    f.desktop->set_media_error(common::ErrorCode::ExternalToolMissing);
    f.sampler->sample_once(t0 + 31500ms);
    f.desktop->set_media_probe(MockDesktopApi::MediaProbe::Denied);
    f.sampler->sample_once(t0 + 32s);
    log_test("Failing media query forces a check on the next cycle", f.desktop->probe_calls() == 3);

    size_t before = f.cb_media.size();
    f.desktop->set_media(make_track("Other", 1.0));
    f.sampler->sample_once(t0 + 32500ms);
    log_test("Withdrawn access stops media on the next cycle",
             f.cb_media.size() == before && f.gate->media_verdict() == PermissionVerdict::Denied);
}

void test_media_disabled() {
    section("Media reporting disabled");

    Fixture f(false);
    f.desktop->set_media(make_track("Song", 1.0));
    f.sampler->sample_once();
    log_test("No media queries when disabled",
             f.desktop->media_queries() == 0 && f.desktop->probe_calls() == 0 && f.cb_media.empty());
}

void test_accessibility_revoked() {
    section("Accessibility revoked");

    Fixture f;
    f.sampler->sample_once();
    f.desktop->set_trusted(false);
    f.sampler->sample_once();
    f.sampler->sample_once();
    int queries = f.desktop->window_queries();
    log_test("Window capture pauses while untrusted", f.cb_windows.size() == 1 && queries == 1);

    f.desktop->set_trusted(true);
    f.sampler->sample_once();
    log_test("Current window is re-emitted once trust returns", f.cb_windows.size() == 2);
}

void test_path_isolation() {
    section("Path isolation");

    Fixture f;
    f.sink->throw_on_window = true;
    f.sampler->sample_once();
    log_test("Sink failure does not block the callback", f.cb_windows.size() == 1);

    Fixture g;
    g.callbacks->set_window_handler([](const WindowEvent&) { throw std::runtime_error("consumer bug"); });
    g.sampler->sample_once();
    log_test("Callback failure does not block the sink", g.sink->windows.size() == 1);

    Fixture h;
    h.desktop->set_window_error(common::ErrorCode::IoError);
    h.desktop->set_media(make_track("Song", 1.0));
    h.sampler->sample_once();
    log_test("Window query failure does not block media",
             h.cb_windows.empty() && h.cb_media.size() == 1 && h.errors->last().has_value());
}

void test_artwork() {
    section("Artwork");

    Fixture f;
    MediaEvent track = make_track("Song", 1.0);
    track.artwork = {0x89, 'P', 'N', 'G'};
    track.artwork_mime_type = "image/png";
    f.desktop->set_media(track);

    auto t0 = EventSampler::Clock::now();
    f.sampler->sample_once(t0);
    track.elapsed_time = 5.0;
    f.desktop->set_media(track);
    f.sampler->sample_once(t0 + 2s);

    log_test("Artwork published once per track",
             f.sink->artwork.size() == 1 && f.sink->artwork[0] == "spotify:Song:Album" &&
             f.sampler->stats().artwork_uploads == 1);
    log_test("Artwork bytes reach the media callback",
             !f.cb_media.empty() && f.cb_media[0].artwork.size() == 4);
}

// Desktop whose window query blocks until released
class StuckDesktop : public MockDesktopApi {
public:
    common::Result<WindowEvent> query_focused_window() override {
        {
            std::unique_lock<std::mutex> lock(m_);
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
        }
        auto result = MockDesktopApi::query_focused_window();
        returned_ = true;
        return result;
    }
    bool returned() const { return returned_.load(); }
    bool wait_entered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(m_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
    std::atomic<bool> returned_{false};
};

void test_capture_loop() {
    section("CaptureLoop");

    {
        Fixture f(false);
        auto sink = f.sink;
        CaptureLoop loop(f.sampler, 10ms, nullptr);
        bool started = loop.start().is_ok();
        log_test("Loop starts", started && loop.is_running());
        log_test("Second start is refused", loop.start().is_err());

        bool emitted = wait_until([&] { return sink->window_count() > 0; }, 2s);
        log_test("Worker thread samples", emitted);

        auto t = std::chrono::steady_clock::now();
        bool clean = loop.stop(1s);
        log_test("Stop joins promptly", clean && !loop.is_running(), "", elapsed_ms(t));
    }

    {
        auto desktop = std::make_shared<StuckDesktop>();
        desktop->set_window(make_window("a", "b", 1));
        desktop->set_media(make_track("Song", 1.0));
        auto gate = std::make_shared<PermissionGate>(desktop, nullptr, 100ms, nullptr);
        auto callbacks = std::make_shared<CallbackRegistry>();
        auto sink = std::make_shared<RecordingSink>();
        auto window_calls = std::make_shared<std::atomic<int>>(0);
        auto media_calls = std::make_shared<std::atomic<int>>(0);
        callbacks->set_window_handler([window_calls](const WindowEvent&) { (*window_calls)++; });
        callbacks->set_media_handler([media_calls](const MediaEvent&) { (*media_calls)++; });

        ReporterConfig config;
        config.enable_media_reporting = true;
        auto sampler = std::make_shared<EventSampler>(config, EngineOptions{}, gate, desktop,
                                                      callbacks, sink, nullptr, nullptr);
        CaptureLoop loop(sampler, 10ms, nullptr);
        loop.start();
        desktop->wait_entered(2s);

        auto t = std::chrono::steady_clock::now();
        bool clean = loop.stop(100ms);
        double ms = elapsed_ms(t);
        log_test("Stuck worker is abandoned after the grace period",
                 !clean && ms < 1000 && !loop.is_running(), "", ms);

        desktop->release();
        bool returned = wait_until([&] { return desktop->returned(); }, 2s);
        std::this_thread::sleep_for(100ms);

        log_test("Abandoned worker emits nothing once its query returns",
                 returned && window_calls->load() == 0 && media_calls->load() == 0 &&
                 sink->window_count() == 0 && sink->media.empty() && desktop->media_queries() == 0);
    }
}

} // namespace

int main() {
    std::cout << "Capture Sampler Test Suite" << std::endl;
    std::cout << "==========================" << std::endl;

    test_first_sample_and_dedup();
    test_elapsed_throttle();
    test_media_denied();
    test_media_recheck();
    test_media_disabled();
    test_accessibility_revoked();
    test_path_isolation();
    test_artwork();
    test_capture_loop();

    return print_summary();
}
