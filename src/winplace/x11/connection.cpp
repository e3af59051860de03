#include "connection.hpp"
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace winplace::x11 {

namespace {

xcb_screen_t* screen_for_number(xcb_connection_t* conn, int number)
{
    auto iter = xcb_setup_roots_iterator(xcb_get_setup(conn));
    for (int i = 0; iter.rem; ++i, xcb_screen_next(&iter))
    {
        if (i == number)
            return iter.data;
    }
    return nullptr;
}

}

Connection::Connection()
    : conn_(xcb_connect(nullptr, &screen_number_), xcb_disconnect)
    , screen_(nullptr)
{
    if (xcb_connection_has_error(conn_.get()))
    {
        throw std::runtime_error("Failed to connect to X server");
    }

    screen_ = screen_for_number(conn_.get(), screen_number_);
    if (!screen_)
    {
        throw std::runtime_error("Failed to get screen");
    }

    init_randr();
}

void Connection::init_randr()
{
    auto ext_cookie = xcb_query_extension(conn_.get(), 5, "RANDR");
    auto* ext_reply = xcb_query_extension_reply(conn_.get(), ext_cookie, nullptr);
    if (!ext_reply)
        return;

    bool present = ext_reply->present;
    randr_event_base_ = ext_reply->first_event;
    free(ext_reply);

    if (!present)
        return;

    auto cookie = xcb_randr_query_version(conn_.get(), XCB_RANDR_MAJOR_VERSION, XCB_RANDR_MINOR_VERSION);
    auto* reply = xcb_randr_query_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    free(reply);
    randr_available_ = true;
}

xcb_atom_t Connection::intern_atom(char const* name) const
{
    auto cookie = xcb_intern_atom(conn_.get(), 0, static_cast<uint16_t>(strlen(name)), name);
    auto* reply = xcb_intern_atom_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return XCB_NONE;

    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

} // namespace winplace::x11
