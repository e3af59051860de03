#include "ewmh.hpp"
#include <algorithm>
#include <stdexcept>

namespace winplace::x11 {

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }
}

Ewmh::~Ewmh()
{
    xcb_ewmh_connection_wipe(&ewmh_);
}

std::optional<std::vector<xcb_window_t>> Ewmh::client_list() const
{
    xcb_ewmh_get_windows_reply_t clients;
    auto cookie = xcb_ewmh_get_client_list(&ewmh_, conn_.screen_number());
    if (!xcb_ewmh_get_client_list_reply(&ewmh_, cookie, &clients, nullptr))
        return std::nullopt;

    std::vector<xcb_window_t> windows(clients.windows, clients.windows + clients.windows_len);
    xcb_ewmh_get_windows_reply_wipe(&clients);
    return windows;
}

std::optional<uint32_t> Ewmh::number_of_desktops() const
{
    uint32_t count = 0;
    auto cookie = xcb_ewmh_get_number_of_desktops(&ewmh_, conn_.screen_number());
    if (!xcb_ewmh_get_number_of_desktops_reply(&ewmh_, cookie, &count, nullptr))
        return std::nullopt;
    return count;
}

std::optional<uint32_t> Ewmh::current_desktop() const
{
    uint32_t desktop = 0;
    auto cookie = xcb_ewmh_get_current_desktop(&ewmh_, conn_.screen_number());
    if (!xcb_ewmh_get_current_desktop_reply(&ewmh_, cookie, &desktop, nullptr))
        return std::nullopt;
    return desktop;
}

std::optional<Geometry> Ewmh::workarea(uint32_t desktop) const
{
    xcb_ewmh_get_workarea_reply_t reply;
    auto cookie = xcb_ewmh_get_workarea(&ewmh_, conn_.screen_number());
    if (!xcb_ewmh_get_workarea_reply(&ewmh_, cookie, &reply, nullptr))
        return std::nullopt;

    std::optional<Geometry> result;
    if (reply.workarea_len > 0)
    {
        // Some window managers publish a single entry shared by all desktops
        auto const& area = reply.workarea[std::min<uint32_t>(desktop, reply.workarea_len - 1)];
        result = Geometry{ static_cast<int32_t>(area.x),
                           static_cast<int32_t>(area.y),
                           static_cast<int32_t>(area.width),
                           static_cast<int32_t>(area.height) };
    }
    xcb_ewmh_get_workarea_reply_wipe(&reply);
    return result;
}

std::optional<std::string> Ewmh::wm_name(xcb_window_t window) const
{
    xcb_ewmh_get_utf8_strings_reply_t name;
    if (!xcb_ewmh_get_wm_name_reply(&ewmh_, xcb_ewmh_get_wm_name(&ewmh_, window), &name, nullptr))
        return std::nullopt;

    std::string result(name.strings, name.strings_len);
    xcb_ewmh_get_utf8_strings_reply_wipe(&name);
    return result;
}

std::optional<uint32_t> Ewmh::wm_pid(xcb_window_t window) const
{
    uint32_t pid = 0;
    if (!xcb_ewmh_get_wm_pid_reply(&ewmh_, xcb_ewmh_get_wm_pid(&ewmh_, window), &pid, nullptr))
        return std::nullopt;
    return pid;
}

std::vector<xcb_atom_t> Ewmh::wm_state(xcb_window_t window) const
{
    xcb_ewmh_get_atoms_reply_t current_state;
    if (!xcb_ewmh_get_wm_state_reply(&ewmh_, xcb_ewmh_get_wm_state(&ewmh_, window), &current_state, nullptr))
        return {};

    std::vector<xcb_atom_t> states(current_state.atoms, current_state.atoms + current_state.atoms_len);
    xcb_ewmh_get_atoms_reply_wipe(&current_state);
    return states;
}

void Ewmh::request_move_resize(xcb_window_t window, Geometry const& geometry)
{
    auto flags = static_cast<xcb_ewmh_moveresize_window_opt_flags_t>(
        XCB_EWMH_MOVERESIZE_WINDOW_X | XCB_EWMH_MOVERESIZE_WINDOW_Y | XCB_EWMH_MOVERESIZE_WINDOW_WIDTH
        | XCB_EWMH_MOVERESIZE_WINDOW_HEIGHT
    );
    xcb_ewmh_request_moveresize_window(
        &ewmh_,
        conn_.screen_number(),
        window,
        XCB_GRAVITY_NORTH_WEST,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        flags,
        static_cast<uint32_t>(geometry.x),
        static_cast<uint32_t>(geometry.y),
        static_cast<uint32_t>(std::max<int32_t>(1, geometry.width)),
        static_cast<uint32_t>(std::max<int32_t>(1, geometry.height))
    );
}

void Ewmh::request_state(xcb_window_t window, bool enable, xcb_atom_t first, xcb_atom_t second)
{
    xcb_ewmh_request_change_wm_state(
        &ewmh_,
        conn_.screen_number(),
        window,
        enable ? XCB_EWMH_WM_STATE_ADD : XCB_EWMH_WM_STATE_REMOVE,
        first,
        second,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER
    );
}

void Ewmh::request_desktop(xcb_window_t window, uint32_t desktop)
{
    xcb_ewmh_request_change_wm_desktop(&ewmh_, conn_.screen_number(), window, desktop, XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER);
}

void Ewmh::request_activate(xcb_window_t window)
{
    xcb_ewmh_request_change_active_window(
        &ewmh_,
        conn_.screen_number(),
        window,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        XCB_CURRENT_TIME,
        XCB_NONE
    );
}

} // namespace winplace::x11
