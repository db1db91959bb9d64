// ============================================================================
// Linux backend helpers that run without a display: artwork files,
// playerctl output parsing, icon encoding
// ============================================================================

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "platform/linux/LinuxDesktopApi.hpp"
#include "testing/TestHarness.hpp"

using namespace testing;
using namespace platform::linux_os;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir() {
    fs::path base = fs::temp_directory_path() /
                    ("sm-linux-test-" + std::to_string(::getpid()));
    fs::remove_all(base);
    fs::create_directories(base);
    return base;
}

void write_bytes(const fs::path& path, size_t count) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    std::string chunk(count, '\x7f');
    out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
}

void test_artwork_file(const fs::path& root) {
    section("Artwork files");

    write_bytes(root / "cover.png", 16);
    auto small = read_artwork_file((root / "cover.png").string(), 32);
    log_test("File within the limit is read whole", small.size() == 16);

    auto exact = read_artwork_file((root / "cover.png").string(), 16);
    log_test("File at the limit is accepted", exact.size() == 16);

    write_bytes(root / "huge.jpg", 64);
    log_test("Oversized file is refused",
             read_artwork_file((root / "huge.jpg").string(), 32).empty());

    write_bytes(root / "empty.png", 0);
    log_test("Empty file yields no artwork",
             read_artwork_file((root / "empty.png").string(), 32).empty());
    log_test("Missing file yields no artwork",
             read_artwork_file((root / "missing.png").string(), 32).empty());
    log_test("Directory yields no artwork", read_artwork_file(root.string(), 32).empty());
}

void test_playerctl_line() {
    section("playerctl output");

    const std::string sep(1, '\x1f');
    std::string art;
    auto playing = parse_playerctl_line(
        "spotify" + sep + "Playing" + sep + "Song" + sep + "Artist" + sep + "Album" + sep +
        "240000000" + sep + "12500000" + sep + "file:///tmp/a.png\n", &art);
    bool ok = playing && playing->player == "spotify" && playing->playing &&
              playing->title == "Song" && playing->duration == 240.0 &&
              playing->elapsed_time == 12.5 && playing->playback_rate == 1.0 &&
              playing->content_item_identifier == "spotify:Song:Album";
    log_test("Playing line parses metadata and position", ok);
    log_test("Art URL returned separately", art == "file:///tmp/a.png");

    auto paused = parse_playerctl_line(
        "vlc" + sep + "Paused" + sep + "T" + sep + "A" + sep + "B" + sep + "" + sep + "" + sep, nullptr);
    log_test("Paused line has zero rate and unknown duration",
             paused && !paused->playing && paused->playback_rate == 0.0 && paused->duration == 0.0);

    log_test("Stopped player is not reported",
             !parse_playerctl_line("vlc" + sep + "Stopped" + sep + sep + sep + sep + sep + sep, nullptr));
    log_test("Short line is rejected", !parse_playerctl_line("vlc" + sep + "Playing", nullptr));
}

void test_icon_encoding() {
    section("Icon encoding");

    auto pam = encode_pam_rgba(1, 1, {0x80112233u});
    std::string header = "P7\nWIDTH 1\nHEIGHT 1\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
    bool ok = pam.size() == header.size() + 4 &&
              std::string(pam.begin(), pam.begin() + header.size()) == header &&
              pam[header.size()] == 0x11 && pam[header.size() + 1] == 0x22 &&
              pam[header.size() + 2] == 0x33 && pam[header.size() + 3] == 0x80;
    log_test("ARGB pixel becomes a PAM RGBA tuple", ok);
    log_test("Too few pixels yields no icon", encode_pam_rgba(2, 2, {0u}).empty());
}

} // namespace

int main() {
    std::cout << "Linux Desktop Test Suite" << std::endl;
    std::cout << "========================" << std::endl;

    fs::path root = make_temp_dir();
    test_artwork_file(root);
    test_playerctl_line();
    test_icon_encoding();
    fs::remove_all(root);

    return print_summary();
}
