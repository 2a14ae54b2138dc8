#pragma once

#include <memory>
#include <xcb/randr.h>
#include <xcb/xcb.h>
#include <xcb/xcb_keysyms.h>

namespace topclock {

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
    int screen_number() const { return screen_number_; }
    xcb_key_symbols_t* keysyms() const { return keysyms_.get(); }

    bool has_randr() const { return randr_available_; }
    uint8_t randr_event_base() const { return randr_event_base_; }

    bool has_error() const { return xcb_connection_has_error(conn_.get()) != 0; }
    int file_descriptor() const { return xcb_get_file_descriptor(conn_.get()); }

    xcb_atom_t intern_atom(char const* name) const;

    void flush() { xcb_flush(conn_.get()); }

private:
    int screen_number_ = 0; // filled in by xcb_connect, so declared before conn_
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_;
    std::unique_ptr<xcb_key_symbols_t, decltype(&xcb_key_symbols_free)> keysyms_;

    bool randr_available_ = false;
    uint8_t randr_event_base_ = 0;

    void init_randr();
};

} // namespace topclock
