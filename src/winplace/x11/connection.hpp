#pragma once

#include <cstdint>
#include <memory>
#include <xcb/randr.h>
#include <xcb/xcb.h>

namespace winplace::x11 {

/// Owning wrapper around an XCB client connection to the default display.
class Connection
{
public:
    Connection();
    ~Connection() = default;

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;
    Connection(Connection&&) = default;
    Connection& operator=(Connection&&) = default;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }
    xcb_window_t root() const { return screen_->root; }
    int screen_number() const { return screen_number_; }
    int fd() const { return xcb_get_file_descriptor(conn_.get()); }

    bool has_randr() const { return randr_available_; }
    uint8_t randr_event_base() const { return randr_event_base_; }
    bool has_error() const { return xcb_connection_has_error(conn_.get()) != 0; }

    void flush() { xcb_flush(conn_.get()); }

    xcb_atom_t intern_atom(char const* name) const;

private:
    int screen_number_ = 0; // filled in by xcb_connect, so declared before conn_
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_;

    bool randr_available_ = false;
    uint8_t randr_event_base_ = 0;

    void init_randr();
};

} // namespace winplace::x11
