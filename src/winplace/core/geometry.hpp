#pragma once

#include "winplace/config/config.hpp"
#include "winplace/core/types.hpp"
#include <optional>
#include <span>

namespace winplace::geometry_policy {

/// Fractional position of an anchor on each axis (Left/Top = 0, Center = 0.5, Right/Bottom = 1).
struct AnchorFraction
{
    double x = 0.0;
    double y = 0.0;
};

AnchorFraction anchor_fraction(AnchorPoint anchor);

/// Pixels stay as-is (truncated); percentages are taken of `reference`.
int32_t resolve_length(Length const& length, int32_t reference);

/// Shrink `area` by the given insets. Width and height never drop below 1.
Geometry apply_monitor_offset(Geometry const& area, MonitorOffset const& offset);

/// Index of the monitor whose area contains the point, if any.
std::optional<size_t> monitor_at_point(std::span<MonitorInfo const> monitors, int32_t x, int32_t y);

/// Monitor containing the window centre; monitor 0 (primary) when none does.
size_t monitor_for_window(std::span<MonitorInfo const> monitors, Geometry const& window);

/**
 * @brief Pick the monitor a placement targets
 *
 * `target_monitor` is 1-based. Out-of-range targets fall back to
 * `current_monitor` (reported through `fell_back`).
 */
size_t select_monitor(
    std::optional<int> target_monitor,
    size_t current_monitor,
    size_t monitor_count,
    bool* fell_back = nullptr
);

/**
 * @brief Resolve an action's rectangle inside one monitor
 *
 * Steps, in order:
 * 1. Effective area: `work_area` minus `offset`, except for explicit
 *    coordinate placement which uses `work_area` untouched.
 * 2. Size: width/height in pixels or percent of the effective area;
 *    unspecified dimensions keep `current`'s.
 * 3. Position: named anchor → the window's own anchor point lands on the
 *    matching point of the effective area; explicit {x, y} → pixels or
 *    percent of the work area, measured from its top-left corner.
 *    No move_to keeps `current`'s position.
 * 4. The action's pixel offset is added last.
 *
 * Pure function: no I/O, identical inputs give identical output.
 */
Geometry resolve(ActionConfig const& action, Geometry const& work_area, MonitorOffset const& offset, Geometry const& current);

/**
 * @brief Resolve against a monitor list
 *
 * Selects the target (or current) monitor, looks up its offset in `offsets`
 * and delegates to resolve().
 */
Geometry resolve(
    ActionConfig const& action,
    std::span<MonitorInfo const> monitors,
    MonitorOffsetsConfig const& offsets,
    WindowSnapshot const& window
);

} // namespace winplace::geometry_policy
