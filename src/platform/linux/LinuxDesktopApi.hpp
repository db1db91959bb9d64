#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "interfaces/IDesktopApi.hpp"

// Forward declarations to avoid including X11 headers in the header file
typedef struct _XDisplay Display;

namespace platform {
namespace linux_os {

    /**
     * Linux desktop collaborator
     *
     * Focused window: EWMH properties on the X11 root window
     * (_NET_ACTIVE_WINDOW, _NET_WM_NAME, _NET_WM_PID, _NET_WM_ICON), process
     * name from /proc/<pid>/comm.
     *
     * Now playing: MPRIS through the `playerctl` tool.
     *
     * NOTE: Under Wayland only XWayland clients are visible. There is no
     * accessibility prompt on X11: "trusted" means the display is reachable
     * and the window manager publishes _NET_ACTIVE_WINDOW.
     *
     * Dependencies:
     *   - libX11-dev / libX11-devel
     *   - playerctl (runtime, optional)
     */
    class LinuxDesktopApi : public interfaces::IDesktopApi {
    public:
        LinuxDesktopApi();
        ~LinuxDesktopApi() override;

        bool is_accessibility_trusted() override;
        bool request_accessibility() override;
        bool probe_media_access() override;

        common::Result<core::WindowEvent> query_focused_window() override;
        common::Result<std::optional<core::MediaEvent>> query_now_playing() override;

        const char* backend_name() const noexcept override { return "Linux-X11"; }

    private:
        // Caller holds x_mutex_
        bool ensure_display();
        unsigned long active_window();
        std::string window_title(unsigned long window);
        uint32_t window_pid(unsigned long window);
        std::string window_class(unsigned long window);
        std::vector<uint8_t> window_icon(unsigned long window);

        // Artwork bytes for an MPRIS art URL (file:// only), cached by URL
        void load_artwork(const std::string& art_url, core::MediaEvent& event);

        std::mutex x_mutex_;
        Display* display_ = nullptr;
        unsigned long atom_active_window_ = 0;
        unsigned long atom_wm_name_ = 0;
        unsigned long atom_wm_pid_ = 0;
        unsigned long atom_wm_icon_ = 0;
        unsigned long atom_utf8_string_ = 0;

        unsigned long icon_window_ = 0;
        std::vector<uint8_t> icon_cache_;

        std::mutex art_mutex_;
        std::string art_url_;
        std::vector<uint8_t> art_bytes_;
        std::string art_mime_;
    };

    // Reads /proc/<pid>/comm; empty when the process is gone
    std::string process_name_for_pid(uint32_t pid);

    // Netpbm PAM (P7, RGB_ALPHA) from _NET_WM_ICON ARGB pixels
    std::vector<uint8_t> encode_pam_rgba(uint32_t width, uint32_t height,
                                         const std::vector<uint32_t>& argb);

    // Contents of a local artwork file. Empty when the file is missing, empty
    // or larger than max_bytes; an oversized file is not read.
    std::vector<uint8_t> read_artwork_file(const std::string& path, size_t max_bytes);

    // Parses one line of `playerctl metadata --format` output
    std::optional<core::MediaEvent> parse_playerctl_line(const std::string& line,
                                                         std::string* art_url);

} // namespace linux_os
} // namespace platform
