#include "geometry.hpp"
#include "winplace/core/log.hpp"
#include <algorithm>
#include <cmath>
#include <variant>

namespace winplace::geometry_policy {

AnchorFraction anchor_fraction(AnchorPoint anchor)
{
    switch (anchor)
    {
        case AnchorPoint::TopLeft:
            return { 0.0, 0.0 };
        case AnchorPoint::TopCenter:
            return { 0.5, 0.0 };
        case AnchorPoint::TopRight:
            return { 1.0, 0.0 };
        case AnchorPoint::MiddleLeft:
            return { 0.0, 0.5 };
        case AnchorPoint::MiddleCenter:
            return { 0.5, 0.5 };
        case AnchorPoint::MiddleRight:
            return { 1.0, 0.5 };
        case AnchorPoint::BottomLeft:
            return { 0.0, 1.0 };
        case AnchorPoint::BottomCenter:
            return { 0.5, 1.0 };
        case AnchorPoint::BottomRight:
            return { 1.0, 1.0 };
    }
    return { 0.0, 0.0 };
}

int32_t resolve_length(Length const& length, int32_t reference)
{
    double pixels = length.value;
    if (length.unit == Length::Unit::Percent)
    {
        pixels = static_cast<double>(reference) * length.value / 100.0;
    }
    if (std::isnan(pixels))
        return 0;
    // Keep the result and later offset arithmetic inside int32_t
    constexpr double limit = static_cast<double>(MAX_PIXELS) * 10.0;
    return static_cast<int32_t>(std::clamp(pixels, -limit, limit));
}

Geometry apply_monitor_offset(Geometry const& area, MonitorOffset const& offset)
{
    return { area.x + offset.left,
             area.y + offset.top,
             std::max<int32_t>(1, area.width - offset.left - offset.right),
             std::max<int32_t>(1, area.height - offset.top - offset.bottom) };
}

std::optional<size_t> monitor_at_point(std::span<MonitorInfo const> monitors, int32_t x, int32_t y)
{
    for (size_t i = 0; i < monitors.size(); ++i)
    {
        if (monitors[i].area.contains(x, y))
            return i;
    }
    return std::nullopt;
}

size_t monitor_for_window(std::span<MonitorInfo const> monitors, Geometry const& window)
{
    int32_t center_x = window.x + window.width / 2;
    int32_t center_y = window.y + window.height / 2;
    return monitor_at_point(monitors, center_x, center_y).value_or(0);
}

size_t select_monitor(std::optional<int> target_monitor, size_t current_monitor, size_t monitor_count, bool* fell_back)
{
    if (fell_back)
        *fell_back = false;

    if (!target_monitor)
        return current_monitor;

    if (*target_monitor >= 1 && static_cast<size_t>(*target_monitor) <= monitor_count)
        return static_cast<size_t>(*target_monitor - 1);

    if (fell_back)
        *fell_back = true;
    return current_monitor;
}

Geometry resolve(ActionConfig const& action, Geometry const& work_area, MonitorOffset const& offset, Geometry const& current)
{
    bool explicit_coordinates = action.move_to && std::holds_alternative<CoordinateTarget>(*action.move_to);

    // 1. Effective area (monitor offsets are bypassed for explicit coordinates)
    Geometry area = explicit_coordinates ? work_area : apply_monitor_offset(work_area, offset);

    // 2. Size
    Geometry result = current;
    if (action.resize_to)
    {
        if (action.resize_to->width)
            result.width = resolve_length(*action.resize_to->width, area.width);
        if (action.resize_to->height)
            result.height = resolve_length(*action.resize_to->height, area.height);
    }

    // 3. Position
    if (action.move_to)
    {
        if (auto const* target = std::get_if<AnchorPoint>(&*action.move_to))
        {
            AnchorFraction on_area = anchor_fraction(*target);
            AnchorFraction on_window = anchor_fraction(action.effective_anchor());

            int32_t base_x = area.x + static_cast<int32_t>(area.width * on_area.x);
            int32_t base_y = area.y + static_cast<int32_t>(area.height * on_area.y);
            result.x = base_x - static_cast<int32_t>(result.width * on_window.x);
            result.y = base_y - static_cast<int32_t>(result.height * on_window.y);
        }
        else
        {
            auto const& coords = std::get<CoordinateTarget>(*action.move_to);
            result.x = area.x + resolve_length(coords.x, area.width);
            result.y = area.y + resolve_length(coords.y, area.height);
        }
    }

    // 4. Per-rule offset
    if (action.offset)
    {
        result.x += action.offset->x;
        result.y += action.offset->y;
    }

    return result;
}

Geometry resolve(
    ActionConfig const& action,
    std::span<MonitorInfo const> monitors,
    MonitorOffsetsConfig const& offsets,
    WindowSnapshot const& window
)
{
    if (monitors.empty())
    {
        LOG_WARN("No monitors known; resolving against the window's own rectangle");
        return resolve(action, window.geometry, MonitorOffset{}, window.geometry);
    }

    size_t current = std::min(window.monitor, monitors.size() - 1);
    bool fell_back = false;
    size_t index = select_monitor(action.target_monitor, current, monitors.size(), &fell_back);
    if (fell_back)
    {
        LOG_WARN(
            "target_monitor {} is out of range (1-{}), using monitor {}",
            *action.target_monitor,
            monitors.size(),
            index + 1
        );
    }

    auto const& monitor = monitors[index];
    Geometry current_geometry = window.geometry;
    if (index != current && !action.move_to)
    {
        // Keep the window's position relative to the work area when it only changes monitor
        current_geometry.x += monitor.work_area.x - monitors[current].work_area.x;
        current_geometry.y += monitor.work_area.y - monitors[current].work_area.y;
    }

    Geometry result = resolve(action, monitor.work_area, offsets.for_monitor(index), current_geometry);
    LOG_DEBUG(
        "Resolved geometry on monitor {} ({}): {}x{} at ({}, {})",
        index + 1,
        monitor.name,
        result.width,
        result.height,
        result.x,
        result.y
    );
    return result;
}

} // namespace winplace::geometry_policy
