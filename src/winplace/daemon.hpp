#pragma once

#include "winplace/config/config.hpp"
#include "winplace/core/scheduler.hpp"
#include "winplace/core/window_rules.hpp"
#include "winplace/x11/connection.hpp"
#include "winplace/x11/ewmh.hpp"
#include "winplace/x11/x11_window_system.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace winplace {

/**
 * @brief Event loop tying the X connection, control signals and the scheduler together
 *
 * Discovery runs every polling_interval and shortly after _NET_CLIENT_LIST
 * changes. Control signals arrive through a signalfd:
 *
 *   SIGUSR1          pause / resume
 *   SIGHUP           reload the configuration file
 *   SIGUSR2          clear the log file
 *   SIGINT, SIGTERM  quit
 */
class Daemon
{
public:
    using Clock = std::chrono::steady_clock;

    Daemon(Config const& config, std::shared_ptr<RuleSet const> rules, std::string config_path);
    ~Daemon();

    Daemon(Daemon const&) = delete;
    Daemon& operator=(Daemon const&) = delete;

    void run();

    // Control actions, also reachable through signals
    void toggle_pause();
    void reload();

private:
    std::string config_path_;
    x11::Connection conn_;
    x11::Ewmh ewmh_;
    x11::X11WindowSystem windows_;
    TrackingScheduler scheduler_;

    int signal_fd_ = -1;
    bool running_ = true;
    xcb_atom_t net_client_list_ = XCB_NONE;

    Clock::time_point next_poll_;
    std::optional<Clock::time_point> discovery_due_; // debounced client list change

    void setup_root();
    void setup_signals();

    void handle_event(xcb_generic_event_t const& event);
    void handle_signals();
    void handle_signal(uint32_t signo);

    std::optional<Clock::time_point> next_wakeup() const;
    Clock::duration polling_interval() const;
};

} // namespace winplace
