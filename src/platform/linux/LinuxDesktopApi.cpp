#include "LinuxDesktopApi.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <sys/wait.h>

// X11 Headers - only included in the .cpp file
#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>

namespace platform {
namespace linux_os {

    namespace {

        constexpr uint32_t kMaxIconEdge = 64;
        constexpr long kMaxIconLongs = 1 << 20;
        constexpr size_t kMaxArtworkBytes = 4 * 1024 * 1024;
        constexpr char kFieldSep = '\x1f';

        // Stale windows raise BadWindow; the default handler would exit the process
        int ignore_x_error(Display*, XErrorEvent*) { return 0; }

        struct XFreeDeleter {
            void operator()(unsigned char* p) const { if (p) XFree(p); }
        };
        using XData = std::unique_ptr<unsigned char, XFreeDeleter>;

        // Reads a window property. Format-32 items come back as C longs.
        bool read_property(Display* d, Window w, Atom property, Atom req_type, long max_longs,
                           XData& data, unsigned long& nitems, int& format) {
            Atom actual_type = None;
            unsigned long bytes_after = 0;
            unsigned char* raw = nullptr;
            int status = XGetWindowProperty(d, w, property, 0, max_longs, False, req_type,
                                            &actual_type, &format, &nitems, &bytes_after, &raw);
            data.reset(raw);
            return status == Success && actual_type != None && raw != nullptr && nitems > 0;
        }

        // Runs a shell command, returns stdout and the exit status
        int run_command(const std::string& cmd, std::string& output) {
            FILE* fp = popen(cmd.c_str(), "r");
            if (!fp) return -1;

            char buffer[4096];
            size_t n;
            while ((n = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
                output.append(buffer, n);
            }
            int status = pclose(fp);
            if (status == -1) return -1;
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }

        std::string percent_decode(const std::string& s) {
            std::string out;
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '%' && i + 2 < s.size()) {
                    char hex[3] = {s[i + 1], s[i + 2], 0};
                    char* end = nullptr;
                    long v = std::strtol(hex, &end, 16);
                    if (end == hex + 2) {
                        out.push_back(static_cast<char>(v));
                        i += 2;
                        continue;
                    }
                }
                out.push_back(s[i]);
            }
            return out;
        }

        std::string mime_for_path(const std::string& path) {
            auto dot = path.rfind('.');
            std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
            for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (ext == "png") return "image/png";
            if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
            if (ext == "webp") return "image/webp";
            if (ext == "gif") return "image/gif";
            if (ext == "bmp") return "image/bmp";
            return "application/octet-stream";
        }

        double micros_to_seconds(const std::string& field) {
            if (field.empty()) return 0.0;
            char* end = nullptr;
            double v = std::strtod(field.c_str(), &end);
            if (end == field.c_str()) return 0.0;
            return v / 1e6;
        }

    } // namespace

    // ========================================================================
    // Helpers
    // ========================================================================

    std::string process_name_for_pid(uint32_t pid) {
        if (pid == 0) return "";
        std::ifstream comm("/proc/" + std::to_string(pid) + "/comm");
        std::string name;
        if (comm && std::getline(comm, name)) {
            while (!name.empty() && (name.back() == '\n' || name.back() == '\r')) name.pop_back();
        }
        return name;
    }

    std::vector<uint8_t> encode_pam_rgba(uint32_t width, uint32_t height,
                                         const std::vector<uint32_t>& argb) {
        std::vector<uint8_t> out;
        if (width == 0 || height == 0 || argb.size() < static_cast<size_t>(width) * height) {
            return out;
        }

        std::ostringstream header;
        header << "P7\nWIDTH " << width << "\nHEIGHT " << height
               << "\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
        std::string h = header.str();

        out.reserve(h.size() + static_cast<size_t>(width) * height * 4);
        out.insert(out.end(), h.begin(), h.end());
        for (size_t i = 0; i < static_cast<size_t>(width) * height; ++i) {
            uint32_t p = argb[i];
            out.push_back(static_cast<uint8_t>(p >> 16)); // R
            out.push_back(static_cast<uint8_t>(p >> 8));  // G
            out.push_back(static_cast<uint8_t>(p));       // B
            out.push_back(static_cast<uint8_t>(p >> 24)); // A
        }
        return out;
    }

    std::vector<uint8_t> read_artwork_file(const std::string& path, size_t max_bytes) {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec || size == 0 || size > max_bytes) return {};

        std::ifstream in(path, std::ios::binary);
        if (!in) return {};
        std::vector<uint8_t> bytes(static_cast<size_t>(size));
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        // The file may have shrunk since it was measured
        bytes.resize(static_cast<size_t>(in.gcount()));
        return bytes;
    }

    std::optional<core::MediaEvent> parse_playerctl_line(const std::string& line,
                                                         std::string* art_url) {
        std::vector<std::string> fields;
        std::string field;
        for (char c : line) {
            if (c == kFieldSep) {
                fields.push_back(field);
                field.clear();
            } else if (c != '\n' && c != '\r') {
                field.push_back(c);
            }
        }
        fields.push_back(field);

        // player, status, title, artist, album, length, position, artUrl
        if (fields.size() < 8) return std::nullopt;

        const std::string& status = fields[1];
        if (status != "Playing" && status != "Paused") return std::nullopt;

        core::MediaEvent event;
        event.player = fields[0];
        event.playing = status == "Playing";
        event.playback_rate = event.playing ? 1.0 : 0.0;
        event.title = fields[2];
        event.artist = fields[3];
        event.album = fields[4];
        event.duration = micros_to_seconds(fields[5]);
        event.elapsed_time = micros_to_seconds(fields[6]);
        event.content_item_identifier =
            core::make_content_item_identifier(event.player, event.title, event.album);

        if (art_url) *art_url = fields[7];
        return event;
    }

    // ========================================================================
    // Construction / Destruction
    // ========================================================================

    LinuxDesktopApi::LinuxDesktopApi() {
        static std::once_flag handler_once;
        std::call_once(handler_once, [] {
            XInitThreads();
            XSetErrorHandler(ignore_x_error);
        });
    }

    LinuxDesktopApi::~LinuxDesktopApi() {
        std::lock_guard<std::mutex> lock(x_mutex_);
        if (display_) {
            XCloseDisplay(display_);
            display_ = nullptr;
        }
    }

    bool LinuxDesktopApi::ensure_display() {
        if (display_) return true;

        display_ = XOpenDisplay(nullptr);
        if (!display_) {
            std::cerr << "[LinuxDesktopApi] Failed to open X display. "
                      << "Are you running in an X11 session?" << std::endl;
            return false;
        }

        atom_active_window_ = XInternAtom(display_, "_NET_ACTIVE_WINDOW", False);
        atom_wm_name_ = XInternAtom(display_, "_NET_WM_NAME", False);
        atom_wm_pid_ = XInternAtom(display_, "_NET_WM_PID", False);
        atom_wm_icon_ = XInternAtom(display_, "_NET_WM_ICON", False);
        atom_utf8_string_ = XInternAtom(display_, "UTF8_STRING", False);
        return true;
    }

    // ========================================================================
    // Accessibility
    // ========================================================================

    bool LinuxDesktopApi::is_accessibility_trusted() {
        std::lock_guard<std::mutex> lock(x_mutex_);
        if (!ensure_display()) return false;

        XData data;
        unsigned long nitems = 0;
        int format = 0;
        return read_property(display_, DefaultRootWindow(display_), atom_active_window_,
                             XA_WINDOW, 1, data, nitems, format);
    }

    bool LinuxDesktopApi::request_accessibility() {
        bool trusted = is_accessibility_trusted();
        if (!trusted) {
            std::cerr << "[LinuxDesktopApi] Focused-window tracking needs an X11 session "
                      << "with an EWMH window manager; there is nothing to grant." << std::endl;
        }
        return trusted;
    }

    // ========================================================================
    // Focused window
    // ========================================================================

    unsigned long LinuxDesktopApi::active_window() {
        XData data;
        unsigned long nitems = 0;
        int format = 0;
        if (!read_property(display_, DefaultRootWindow(display_), atom_active_window_,
                           XA_WINDOW, 1, data, nitems, format) || format != 32) {
            return 0;
        }
        return reinterpret_cast<unsigned long*>(data.get())[0];
    }

    std::string LinuxDesktopApi::window_title(unsigned long window) {
        XData data;
        unsigned long nitems = 0;
        int format = 0;
        if (read_property(display_, window, atom_wm_name_, atom_utf8_string_, 4096,
                          data, nitems, format) && format == 8) {
            return std::string(reinterpret_cast<char*>(data.get()), nitems);
        }

        char* name = nullptr;
        std::string title;
        if (XFetchName(display_, window, &name) && name) {
            title = name;
            XFree(name);
        }
        return title;
    }

    uint32_t LinuxDesktopApi::window_pid(unsigned long window) {
        XData data;
        unsigned long nitems = 0;
        int format = 0;
        if (!read_property(display_, window, atom_wm_pid_, XA_CARDINAL, 1, data, nitems, format) ||
            format != 32) {
            return 0;
        }
        return static_cast<uint32_t>(reinterpret_cast<unsigned long*>(data.get())[0]);
    }

    std::string LinuxDesktopApi::window_class(unsigned long window) {
        XClassHint hint;
        hint.res_name = nullptr;
        hint.res_class = nullptr;
        std::string out;
        if (XGetClassHint(display_, window, &hint)) {
            if (hint.res_class) out = hint.res_class;
            if (hint.res_name) XFree(hint.res_name);
            if (hint.res_class) XFree(hint.res_class);
        }
        return out;
    }

    std::vector<uint8_t> LinuxDesktopApi::window_icon(unsigned long window) {
        XData data;
        unsigned long nitems = 0;
        int format = 0;
        if (!read_property(display_, window, atom_wm_icon_, XA_CARDINAL, kMaxIconLongs,
                           data, nitems, format) || format != 32) {
            return {};
        }

        const unsigned long* longs = reinterpret_cast<unsigned long*>(data.get());

        // Several sizes back to back: [w, h, w*h pixels]...
        size_t best = 0;
        uint32_t best_w = 0, best_h = 0;
        bool found = false;
        for (size_t i = 0; i + 2 <= nitems;) {
            uint32_t w = static_cast<uint32_t>(longs[i]);
            uint32_t h = static_cast<uint32_t>(longs[i + 1]);
            size_t count = static_cast<size_t>(w) * h;
            if (w == 0 || h == 0 || i + 2 + count > nitems) break;

            uint32_t edge = std::max(w, h);
            uint32_t best_edge = std::max(best_w, best_h);
            bool better = !found ||
                (edge <= kMaxIconEdge && (best_edge > kMaxIconEdge || edge > best_edge)) ||
                (edge > kMaxIconEdge && best_edge > kMaxIconEdge && edge < best_edge);
            if (better) {
                best = i + 2;
                best_w = w;
                best_h = h;
                found = true;
            }
            i += 2 + count;
        }
        if (!found) return {};

        std::vector<uint32_t> argb(static_cast<size_t>(best_w) * best_h);
        for (size_t p = 0; p < argb.size(); ++p) {
            argb[p] = static_cast<uint32_t>(longs[best + p]);
        }
        return encode_pam_rgba(best_w, best_h, argb);
    }

    common::Result<core::WindowEvent> LinuxDesktopApi::query_focused_window() {
        using R = common::Result<core::WindowEvent>;
        std::lock_guard<std::mutex> lock(x_mutex_);

        if (!ensure_display()) {
            return R::err(common::ErrorCode::PermissionDenied, "X display unavailable");
        }

        unsigned long window = active_window();
        if (window == 0) {
            return R::err(common::ErrorCode::NotFound, "no active window");
        }

        core::WindowEvent event;
        event.title = window_title(window);
        event.pid = window_pid(window);
        event.app_id = window_class(window);
        event.process_name = process_name_for_pid(event.pid);
        if (event.process_name.empty()) event.process_name = event.app_id;

        if (window != icon_window_) {
            icon_cache_ = window_icon(window);
            icon_window_ = window;
        }
        event.icon = icon_cache_;

        return R::ok(std::move(event));
    }

    // ========================================================================
    // Media
    // ========================================================================

    bool LinuxDesktopApi::probe_media_access() {
        // Exit 0: players found, 1: none running. Both mean the bus answered.
        std::string output;
        int rc = run_command("playerctl --list-all 2>/dev/null", output);
        if (rc == 127) {
            std::cerr << "[LinuxDesktopApi] playerctl not found; media reporting unavailable" << std::endl;
        }
        return rc == 0 || rc == 1;
    }

    void LinuxDesktopApi::load_artwork(const std::string& art_url, core::MediaEvent& event) {
        std::lock_guard<std::mutex> lock(art_mutex_);

        if (art_url != art_url_) {
            art_url_ = art_url;
            art_bytes_.clear();
            art_mime_.clear();

            const std::string prefix = "file://";
            if (art_url.compare(0, prefix.size(), prefix) == 0) {
                std::string path = percent_decode(art_url.substr(prefix.size()));
                art_bytes_ = read_artwork_file(path, kMaxArtworkBytes);
                if (!art_bytes_.empty()) art_mime_ = mime_for_path(path);
            }
        }

        event.artwork = art_bytes_;
        event.artwork_mime_type = art_mime_;
    }

    common::Result<std::optional<core::MediaEvent>> LinuxDesktopApi::query_now_playing() {
        using R = common::Result<std::optional<core::MediaEvent>>;

        const std::string sep(1, kFieldSep);
        const std::string format =
            "{{playerName}}" + sep + "{{status}}" + sep + "{{xesam:title}}" + sep +
            "{{xesam:artist}}" + sep + "{{xesam:album}}" + sep + "{{mpris:length}}" + sep +
            "{{position}}" + sep + "{{mpris:artUrl}}";

        std::string output;
        int rc = run_command("playerctl metadata --format '" + format + "' 2>/dev/null", output);
        if (rc == 127 || rc == -1) {
            return R::err(common::ErrorCode::ExternalToolMissing, "playerctl is not available");
        }
        if (rc != 0 || output.empty()) {
            return R::ok(std::nullopt); // no player
        }

        std::string first_line = output.substr(0, output.find('\n'));
        std::string art_url;
        auto event = parse_playerctl_line(first_line, &art_url);
        if (!event) return R::ok(std::nullopt);

        load_artwork(art_url, *event);
        return R::ok(std::move(event));
    }

} // namespace linux_os
} // namespace platform
