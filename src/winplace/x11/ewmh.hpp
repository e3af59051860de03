#pragma once

#include "connection.hpp"
#include "winplace/core/types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <xcb/xcb_ewmh.h>

namespace winplace::x11 {

/**
 * @brief Client-side EWMH access
 *
 * Reads root/window properties published by the running window manager and
 * sends the client messages that ask it to move, resize or re-state a window.
 * Nothing here changes window state directly; the window manager stays in charge.
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    // Root window properties
    std::optional<std::vector<xcb_window_t>> client_list() const;
    std::optional<uint32_t> number_of_desktops() const;
    std::optional<uint32_t> current_desktop() const;
    std::optional<Geometry> workarea(uint32_t desktop) const;

    // Per-window properties
    std::optional<std::string> wm_name(xcb_window_t window) const;
    std::optional<uint32_t> wm_pid(xcb_window_t window) const;
    std::vector<xcb_atom_t> wm_state(xcb_window_t window) const;

    // Requests to the window manager
    void request_move_resize(xcb_window_t window, Geometry const& geometry);
    void request_state(xcb_window_t window, bool enable, xcb_atom_t first, xcb_atom_t second = XCB_ATOM_NONE);
    void request_desktop(xcb_window_t window, uint32_t desktop);
    void request_activate(xcb_window_t window);

    xcb_ewmh_connection_t* get() const { return &ewmh_; }

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct
};

} // namespace winplace::x11
