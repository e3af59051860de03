#include "x11_window_system.hpp"
#include "winplace/core/geometry.hpp"
#include "winplace/core/log.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <spdlog/fmt/fmt.h>
#include <xcb/xcb_icccm.h>

namespace winplace::x11 {

namespace {

constexpr uint32_t ICONIC_STATE = 3;

Geometry intersect(Geometry const& a, Geometry const& b)
{
    int32_t x1 = std::max(a.x, b.x);
    int32_t y1 = std::max(a.y, b.y);
    int32_t x2 = std::min(a.right(), b.right());
    int32_t y2 = std::min(a.bottom(), b.bottom());
    if (x2 <= x1 || y2 <= y1)
        return {};
    return { x1, y1, x2 - x1, y2 - y1 };
}

std::string read_comm(uint32_t pid)
{
    std::ifstream f(fmt::format("/proc/{}/comm", pid));
    std::string name;
    if (f)
        std::getline(f, name);
    return name;
}

}

X11WindowSystem::X11WindowSystem(Connection& conn, Ewmh& ewmh)
    : conn_(conn)
    , ewmh_(ewmh)
{
    wm_change_state_ = conn_.intern_atom("WM_CHANGE_STATE");
    detect_monitors();
}

void X11WindowSystem::refresh_monitors()
{
    detect_monitors();
    LOG_INFO("Detected {} monitor(s)", monitors_.size());
    for (size_t i = 0; i < monitors_.size(); ++i)
    {
        auto const& m = monitors_[i];
        LOG_DEBUG("  monitor_{} '{}' {}x{} at ({}, {})", i + 1, m.name, m.area.width, m.area.height, m.area.x, m.area.y);
    }
}

void X11WindowSystem::detect_monitors()
{
    monitors_.clear();

    if (!conn_.has_randr())
    {
        create_fallback_monitor();
        return;
    }

    auto res_cookie = xcb_randr_get_screen_resources_current(conn_.get(), conn_.root());
    auto* res_reply = xcb_randr_get_screen_resources_current_reply(conn_.get(), res_cookie, nullptr);

    if (!res_reply)
    {
        create_fallback_monitor();
        return;
    }

    int num_outputs = xcb_randr_get_screen_resources_current_outputs_length(res_reply);
    xcb_randr_output_t* outputs = xcb_randr_get_screen_resources_current_outputs(res_reply);

    for (int i = 0; i < num_outputs; ++i)
    {
        auto out_cookie = xcb_randr_get_output_info(conn_.get(), outputs[i], res_reply->config_timestamp);
        auto* out_reply = xcb_randr_get_output_info_reply(conn_.get(), out_cookie, nullptr);

        if (!out_reply)
            continue;
        if (out_reply->connection != XCB_RANDR_CONNECTION_CONNECTED || out_reply->crtc == XCB_NONE)
        {
            free(out_reply);
            continue;
        }

        int name_len = xcb_randr_get_output_info_name_length(out_reply);
        uint8_t* name_data = xcb_randr_get_output_info_name(out_reply);
        std::string output_name(reinterpret_cast<char*>(name_data), name_len);

        auto crtc_cookie = xcb_randr_get_crtc_info(conn_.get(), out_reply->crtc, res_reply->config_timestamp);
        auto* crtc_reply = xcb_randr_get_crtc_info_reply(conn_.get(), crtc_cookie, nullptr);

        if (crtc_reply && crtc_reply->width > 0 && crtc_reply->height > 0)
        {
            MonitorInfo monitor;
            monitor.name = output_name;
            monitor.area = { crtc_reply->x, crtc_reply->y, crtc_reply->width, crtc_reply->height };
            monitor.work_area = monitor.area;
            monitors_.push_back(monitor);
        }

        free(crtc_reply);
        free(out_reply);
    }

    free(res_reply);

    if (monitors_.empty())
    {
        create_fallback_monitor();
        return;
    }

    std::ranges::sort(monitors_, [](MonitorInfo const& a, MonitorInfo const& b) { return a.area.x < b.area.x; });
}

void X11WindowSystem::create_fallback_monitor()
{
    MonitorInfo monitor;
    monitor.name = "default";
    monitor.area = { 0, 0, conn_.screen()->width_in_pixels, conn_.screen()->height_in_pixels };
    monitor.work_area = monitor.area;
    monitors_.push_back(monitor);
}

std::optional<Geometry> X11WindowSystem::desktop_work_area()
{
    auto desktop = ewmh_.current_desktop().value_or(0);
    return ewmh_.workarea(desktop);
}

std::vector<MonitorInfo> X11WindowSystem::enumerate_monitors()
{
    std::vector<MonitorInfo> result = monitors_;
    auto workarea = desktop_work_area();
    if (!workarea)
        return result;

    for (auto& monitor : result)
    {
        // _NET_WORKAREA spans the whole screen; clip it per output
        Geometry clipped = intersect(monitor.area, *workarea);
        if (clipped.width > 0 && clipped.height > 0)
            monitor.work_area = clipped;
    }
    return result;
}

Geometry X11WindowSystem::get_monitor_work_area(size_t index)
{
    auto monitors = enumerate_monitors();
    if (index >= monitors.size())
    {
        throw WindowSystemError(
            WindowSystemError::Kind::InvalidMonitor,
            fmt::format("monitor {} does not exist ({} detected)", index + 1, monitors.size())
        );
    }
    return monitors[index].work_area;
}

std::vector<WindowSnapshot> X11WindowSystem::enumerate_windows()
{
    auto clients = ewmh_.client_list();
    if (!clients)
    {
        throw WindowSystemError(
            WindowSystemError::Kind::RequestFailed,
            "_NET_CLIENT_LIST unavailable (is an EWMH window manager running?)"
        );
    }

    std::vector<WindowSnapshot> result;
    result.reserve(clients->size());
    for (xcb_window_t window : *clients)
    {
        // Windows can vanish between the list read and the property reads
        if (auto snapshot = query_window(window))
            result.push_back(std::move(*snapshot));
    }
    return result;
}

std::optional<WindowSnapshot> X11WindowSystem::query_window(WindowHandle handle)
{
    auto geometry = root_geometry(handle);
    if (!geometry)
        return std::nullopt;

    WindowSnapshot snapshot;
    snapshot.handle = handle;
    snapshot.title = window_title(handle);
    snapshot.process = process_name(handle);
    snapshot.wm_class = window_class(handle);
    snapshot.geometry = *geometry;
    snapshot.monitor = geometry_policy::monitor_for_window(monitors_, *geometry);

    auto* ewmh = ewmh_.get();
    auto states = ewmh_.wm_state(handle);
    auto has = [&states](xcb_atom_t atom) { return std::ranges::find(states, atom) != states.end(); };
    snapshot.maximized = has(ewmh->_NET_WM_STATE_MAXIMIZED_VERT) && has(ewmh->_NET_WM_STATE_MAXIMIZED_HORZ);
    snapshot.minimized = has(ewmh->_NET_WM_STATE_HIDDEN);

    return snapshot;
}

std::optional<Geometry> X11WindowSystem::root_geometry(xcb_window_t window)
{
    auto geom_cookie = xcb_get_geometry(conn_.get(), window);
    auto* geom_reply = xcb_get_geometry_reply(conn_.get(), geom_cookie, nullptr);
    if (!geom_reply)
        return std::nullopt;

    Geometry geometry{ geom_reply->x, geom_reply->y, geom_reply->width, geom_reply->height };
    free(geom_reply);

    // Reparenting window managers report geometry relative to the frame
    auto trans_cookie = xcb_translate_coordinates(conn_.get(), window, conn_.root(), 0, 0);
    auto* trans_reply = xcb_translate_coordinates_reply(conn_.get(), trans_cookie, nullptr);
    if (trans_reply)
    {
        geometry.x = trans_reply->dst_x;
        geometry.y = trans_reply->dst_y;
        free(trans_reply);
    }
    return geometry;
}

std::string X11WindowSystem::window_title(xcb_window_t window)
{
    if (auto name = ewmh_.wm_name(window); name && !name->empty())
        return *name;

    auto cookie = xcb_get_property(conn_.get(), 0, window, XCB_ATOM_WM_NAME, XCB_ATOM_STRING, 0, 1024);
    auto* reply = xcb_get_property_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return {};

    std::string title;
    int len = xcb_get_property_value_length(reply);
    if (len > 0)
        title.assign(static_cast<char*>(xcb_get_property_value(reply)), len);
    free(reply);
    return title;
}

std::string X11WindowSystem::window_class(xcb_window_t window)
{
    xcb_icccm_get_wm_class_reply_t wm_class;
    if (!xcb_icccm_get_wm_class_reply(conn_.get(), xcb_icccm_get_wm_class(conn_.get(), window), &wm_class, nullptr))
        return {};

    std::string class_name = wm_class.class_name ? wm_class.class_name : "";
    xcb_icccm_get_wm_class_reply_wipe(&wm_class);
    return class_name;
}

std::string X11WindowSystem::process_name(xcb_window_t window)
{
    auto pid = ewmh_.wm_pid(window);
    if (!pid || *pid == 0)
        return {};
    return read_comm(*pid);
}

bool X11WindowSystem::is_handle_valid(WindowHandle handle)
{
    if (handle == NO_WINDOW)
        return false;

    auto cookie = xcb_get_window_attributes(conn_.get(), handle);
    auto* reply = xcb_get_window_attributes_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return false;
    free(reply);
    return true;
}

void X11WindowSystem::require_valid(WindowHandle handle, char const* operation)
{
    if (!is_handle_valid(handle))
    {
        throw WindowSystemError(
            WindowSystemError::Kind::InvalidHandle,
            fmt::format("{}: window {:#x} no longer exists", operation, handle)
        );
    }
}

void X11WindowSystem::move_resize(WindowHandle handle, Geometry const& geometry)
{
    require_valid(handle, "move_resize");
    if (geometry.width <= 0 || geometry.height <= 0)
    {
        throw WindowSystemError(
            WindowSystemError::Kind::RequestFailed,
            fmt::format("move_resize: invalid size {}x{}", geometry.width, geometry.height)
        );
    }
    ewmh_.request_move_resize(handle, geometry);
    conn_.flush();
}

void X11WindowSystem::set_maximized(WindowHandle handle, bool maximized)
{
    require_valid(handle, "set_maximized");
    auto* ewmh = ewmh_.get();
    ewmh_.request_state(handle, maximized, ewmh->_NET_WM_STATE_MAXIMIZED_VERT, ewmh->_NET_WM_STATE_MAXIMIZED_HORZ);
    conn_.flush();
}

void X11WindowSystem::set_minimized(WindowHandle handle, bool minimized)
{
    require_valid(handle, "set_minimized");

    if (!minimized)
    {
        ewmh_.request_activate(handle);
        conn_.flush();
        return;
    }

    if (wm_change_state_ == XCB_NONE)
    {
        throw WindowSystemError(WindowSystemError::Kind::RequestFailed, "set_minimized: WM_CHANGE_STATE not available");
    }

    // ICCCM 4.1.4: iconify by asking the window manager via the root window
    xcb_client_message_event_t event = {};
    event.response_type = XCB_CLIENT_MESSAGE;
    event.format = 32;
    event.window = handle;
    event.type = wm_change_state_;
    event.data.data32[0] = ICONIC_STATE;

    xcb_send_event(
        conn_.get(),
        0,
        conn_.root(),
        XCB_EVENT_MASK_SUBSTRUCTURE_REDIRECT | XCB_EVENT_MASK_SUBSTRUCTURE_NOTIFY,
        reinterpret_cast<char const*>(&event)
    );
    conn_.flush();
}

void X11WindowSystem::move_to_workspace(WindowHandle handle, size_t workspace)
{
    require_valid(handle, "move_to_workspace");

    auto count = ewmh_.number_of_desktops();
    if (!count)
    {
        throw WindowSystemError(
            WindowSystemError::Kind::RequestFailed,
            "move_to_workspace: _NET_NUMBER_OF_DESKTOPS unavailable"
        );
    }
    if (workspace >= *count)
    {
        throw WindowSystemError(
            WindowSystemError::Kind::InvalidWorkspace,
            fmt::format("workspace {} does not exist ({} available)", workspace + 1, *count)
        );
    }

    ewmh_.request_desktop(handle, static_cast<uint32_t>(workspace));
    conn_.flush();
}

} // namespace winplace::x11
