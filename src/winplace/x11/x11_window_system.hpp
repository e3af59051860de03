#pragma once

#include "connection.hpp"
#include "ewmh.hpp"
#include "winplace/core/window_system.hpp"
#include <optional>
#include <string>
#include <vector>

namespace winplace::x11 {

/**
 * @brief WindowSystem backed by an EWMH-compliant X11 window manager
 *
 * Windows come from _NET_CLIENT_LIST, monitors from RandR CRTCs (sorted
 * left to right, whole screen when RandR is unavailable). Every state change
 * is a client message to the root window, so the window manager keeps its
 * own bookkeeping consistent.
 */
class X11WindowSystem : public WindowSystem
{
public:
    X11WindowSystem(Connection& conn, Ewmh& ewmh);

    /// Re-read the RandR layout. Called at startup, on reload and on screen changes.
    void refresh_monitors();

    std::vector<WindowSnapshot> enumerate_windows() override;
    std::optional<WindowSnapshot> query_window(WindowHandle handle) override;
    std::vector<MonitorInfo> enumerate_monitors() override;
    Geometry get_monitor_work_area(size_t index) override;

    void move_resize(WindowHandle handle, Geometry const& geometry) override;
    void set_maximized(WindowHandle handle, bool maximized) override;
    void set_minimized(WindowHandle handle, bool minimized) override;
    void move_to_workspace(WindowHandle handle, size_t workspace) override;

    bool is_handle_valid(WindowHandle handle) override;

private:
    Connection& conn_;
    Ewmh& ewmh_;
    xcb_atom_t wm_change_state_ = XCB_NONE;
    std::vector<MonitorInfo> monitors_; // work_area left equal to area; filled in per query

    void detect_monitors();
    void create_fallback_monitor();

    void require_valid(WindowHandle handle, char const* operation);
    std::optional<Geometry> root_geometry(xcb_window_t window);
    std::string window_title(xcb_window_t window);
    std::string window_class(xcb_window_t window);
    std::string process_name(xcb_window_t window);
    std::optional<Geometry> desktop_work_area();
};

} // namespace winplace::x11
