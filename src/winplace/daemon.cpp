#include "daemon.hpp"
#include "winplace/core/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <sys/signalfd.h>
#include <unistd.h>

namespace winplace {

namespace {

constexpr auto CLIENT_LIST_DEBOUNCE = std::chrono::milliseconds(100);

sigset_t control_signals()
{
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigaddset(&mask, SIGUSR1);
    sigaddset(&mask, SIGUSR2);
    return mask;
}

}

Daemon::Daemon(Config const& config, std::shared_ptr<RuleSet const> rules, std::string config_path)
    : config_path_(std::move(config_path))
    , conn_()
    , ewmh_(conn_)
    , windows_(conn_, ewmh_)
    , scheduler_(windows_, std::move(rules), config.global)
{
    net_client_list_ = ewmh_.get()->_NET_CLIENT_LIST;
    setup_root();
    setup_signals();
    windows_.refresh_monitors();
    next_poll_ = Clock::now();
}

Daemon::~Daemon()
{
    if (signal_fd_ >= 0)
        close(signal_fd_);

    sigset_t mask = control_signals();
    sigprocmask(SIG_UNBLOCK, &mask, nullptr);
}

void Daemon::setup_root()
{
    uint32_t values[] = { XCB_EVENT_MASK_PROPERTY_CHANGE };
    auto cookie = xcb_change_window_attributes_checked(conn_.get(), conn_.root(), XCB_CW_EVENT_MASK, values);
    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        free(err);
        throw std::runtime_error("Failed to select PropertyChange events on the root window");
    }

    if (conn_.has_randr())
    {
        xcb_randr_select_input(conn_.get(), conn_.root(), XCB_RANDR_NOTIFY_MASK_SCREEN_CHANGE);
    }
    conn_.flush();
}

void Daemon::setup_signals()
{
    sigset_t mask = control_signals();
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0)
    {
        throw std::runtime_error(std::string("signalfd failed: ") + std::strerror(errno));
    }
}

Daemon::Clock::duration Daemon::polling_interval() const
{
    return std::chrono::milliseconds(scheduler_.settings().polling_interval_ms);
}

std::optional<Daemon::Clock::time_point> Daemon::next_wakeup() const
{
    std::optional<Clock::time_point> wakeup;
    auto consider = [&wakeup](std::optional<Clock::time_point> t)
    {
        if (t && (!wakeup || *t < *wakeup))
            wakeup = t;
    };

    if (scheduler_.state() == EngineState::Running)
    {
        consider(next_poll_);
        consider(discovery_due_);
    }
    consider(scheduler_.next_deadline());
    return wakeup;
}

void Daemon::run()
{
    LOG_INFO(
        "Watching windows ({} rules, {} ignore entries, polling every {}ms)",
        scheduler_.rules()->rule_count(),
        scheduler_.rules()->ignore_count(),
        scheduler_.settings().polling_interval_ms
    );

    pollfd fds[2] = {};
    fds[0].fd = conn_.fd();
    fds[0].events = POLLIN;
    fds[1].fd = signal_fd_;
    fds[1].events = POLLIN;

    while (running_)
    {
        int timeout_ms = -1;
        auto now = Clock::now();

        if (auto wakeup = next_wakeup())
        {
            if (*wakeup <= now)
            {
                timeout_ms = 0;
            }
            else
            {
                auto delta = std::chrono::ceil<std::chrono::milliseconds>(*wakeup - now);
                timeout_ms = static_cast<int>(delta.count());
            }
        }

        int poll_result = poll(fds, 2, timeout_ms);
        if (poll_result < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll failed: {}", std::strerror(errno));
            break;
        }

        if (poll_result > 0)
        {
            if (fds[1].revents & POLLIN)
                handle_signals();

            while (auto event = xcb_poll_for_event(conn_.get()))
            {
                std::unique_ptr<xcb_generic_event_t, decltype(&free)> eventPtr(event, free);
                handle_event(*eventPtr);
            }
        }

        now = Clock::now();
        bool poll_due = now >= next_poll_;
        bool debounce_due = discovery_due_ && now >= *discovery_due_;
        if (poll_due || debounce_due)
        {
            scheduler_.discover(now);
            next_poll_ = now + polling_interval();
            discovery_due_.reset();
        }
        scheduler_.run_due(now);

        if (conn_.has_error())
        {
            LOG_ERROR("Lost connection to the X server");
            break;
        }
    }
}

void Daemon::handle_event(xcb_generic_event_t const& event)
{
    uint8_t response_type = event.response_type & ~0x80;

    if (response_type == XCB_PROPERTY_NOTIFY)
    {
        auto const& e = reinterpret_cast<xcb_property_notify_event_t const&>(event);
        if (e.window == conn_.root() && e.atom == net_client_list_ && !discovery_due_)
        {
            discovery_due_ = Clock::now() + CLIENT_LIST_DEBOUNCE;
        }
        return;
    }

    if (conn_.has_randr() && response_type == conn_.randr_event_base() + XCB_RANDR_SCREEN_CHANGE_NOTIFY)
    {
        LOG_INFO("Screen layout changed");
        windows_.refresh_monitors();
    }
}

void Daemon::handle_signals()
{
    signalfd_siginfo info;
    while (read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info)))
    {
        handle_signal(info.ssi_signo);
    }
}

void Daemon::handle_signal(uint32_t signo)
{
    switch (signo)
    {
        case SIGUSR1:
            toggle_pause();
            break;
        case SIGHUP:
            reload();
            break;
        case SIGUSR2:
            log::clear();
            LOG_INFO("Log cleared");
            break;
        case SIGINT:
        case SIGTERM:
            LOG_INFO("Received {}, shutting down", strsignal(static_cast<int>(signo)));
            running_ = false;
            break;
        default:
            break;
    }
}

void Daemon::toggle_pause()
{
    if (scheduler_.state() == EngineState::Running)
    {
        scheduler_.pause();
        return;
    }

    scheduler_.resume();
    next_poll_ = Clock::now();
}

void Daemon::reload()
{
    LOG_INFO("Reloading configuration from {}", config_path_);

    auto loaded = load_config(config_path_);
    if (!loaded)
    {
        LOG_ERROR("Reload aborted, keeping the previous rules");
        return;
    }

    std::shared_ptr<RuleSet const> rules;
    try
    {
        rules = std::make_shared<RuleSet const>(RuleSet::compile(loaded->ignores, loaded->rules));
    }
    catch (ConfigError const& e)
    {
        LOG_ERROR("Reload aborted, keeping the previous rules: {}", e.what());
        return;
    }

    log::set_level(loaded->global.log_level);
    windows_.refresh_monitors();
    scheduler_.reload(std::move(rules), loaded->global);
    next_poll_ = Clock::now();
}

} // namespace winplace
