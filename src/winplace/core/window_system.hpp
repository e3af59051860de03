#pragma once

#include "winplace/core/types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace winplace {

/// Failure reported by a WindowSystem primitive.
class WindowSystemError : public std::runtime_error
{
public:
    enum class Kind
    {
        InvalidHandle,
        AccessDenied,
        InvalidMonitor,
        InvalidWorkspace,
        RequestFailed
    };

    WindowSystemError(Kind kind, std::string const& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief Capabilities the placement engine needs from the desktop
 *
 * Monitor indices are 0-based, workspace indices are 0-based; the 1-based
 * numbering of the configuration is converted by the caller. Every primitive
 * may throw WindowSystemError.
 */
class WindowSystem
{
public:
    virtual ~WindowSystem() = default;

    /// Managed top-level windows, in a stable order.
    virtual std::vector<WindowSnapshot> enumerate_windows() = 0;

    /// Fresh snapshot of one window, nullopt when the handle is gone.
    virtual std::optional<WindowSnapshot> query_window(WindowHandle handle) = 0;

    virtual std::vector<MonitorInfo> enumerate_monitors() = 0;

    /// Raw (strut-adjusted) work area of one monitor.
    virtual Geometry get_monitor_work_area(size_t index) = 0;

    virtual void move_resize(WindowHandle handle, Geometry const& geometry) = 0;
    virtual void set_maximized(WindowHandle handle, bool maximized) = 0;
    virtual void set_minimized(WindowHandle handle, bool minimized) = 0;
    virtual void move_to_workspace(WindowHandle handle, size_t workspace) = 0;

    virtual bool is_handle_valid(WindowHandle handle) = 0;
};

} // namespace winplace
