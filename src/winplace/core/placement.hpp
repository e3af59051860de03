#pragma once

#include "winplace/config/config.hpp"
#include "winplace/core/types.hpp"
#include "winplace/core/window_system.hpp"
#include <optional>
#include <span>
#include <string>
#include <utility>

namespace winplace {

namespace placement_policy {

/**
 * @brief Concrete operations for one window, in execution order
 *
 * 1. workspace            move to virtual desktop
 * 2. restore_maximized    un-maximize so the new geometry sticks
 * 3. geometry             move/resize (omitted when already in place)
 * 4. maximized            final maximize state
 * 5. minimized            final minimize state
 */
struct PlacementPlan
{
    std::optional<size_t> workspace; // 0-based
    bool restore_maximized = false;
    std::optional<Geometry> geometry;
    std::optional<bool> maximized;
    std::optional<bool> minimized;

    bool empty() const { return !workspace && !restore_maximized && !geometry && !maximized && !minimized; }
};

PlacementPlan plan(
    ActionConfig const& action,
    WindowSnapshot const& window,
    std::span<MonitorInfo const> monitors,
    MonitorOffsetsConfig const& offsets
);

} // namespace placement_policy

/**
 * @brief Applies a matched rule's action to one window
 *
 * Delays are handled by the caller (TrackingScheduler); apply() always runs
 * immediately. The first failing primitive aborts the remaining steps for that
 * window and is reported through the return value, never thrown.
 */
class PlacementEngine
{
public:
    PlacementEngine(WindowSystem& windows, MonitorOffsetsConfig offsets);

    void set_monitor_offsets(MonitorOffsetsConfig offsets) { offsets_ = std::move(offsets); }
    MonitorOffsetsConfig const& monitor_offsets() const { return offsets_; }

    /// @return true when every planned step succeeded
    bool apply(std::string const& rule_name, ActionConfig const& action, WindowSnapshot const& window);

private:
    WindowSystem& windows_;
    MonitorOffsetsConfig offsets_;

    void execute(placement_policy::PlacementPlan const& plan, WindowSnapshot const& window);
};

} // namespace winplace
