#include "placement.hpp"
#include "winplace/core/geometry.hpp"
#include "winplace/core/log.hpp"

namespace winplace {

namespace placement_policy {

PlacementPlan plan(
    ActionConfig const& action,
    WindowSnapshot const& window,
    std::span<MonitorInfo const> monitors,
    MonitorOffsetsConfig const& offsets
)
{
    PlacementPlan result;

    if (action.target_workspace)
    {
        result.workspace = static_cast<size_t>(*action.target_workspace - 1);
    }

    if (action.changes_geometry())
    {
        Geometry target = geometry_policy::resolve(action, monitors, offsets, window);
        if (window.maximized || target != window.geometry)
        {
            result.restore_maximized = window.maximized;
            result.geometry = target;
        }
    }

    // After a restore the window is no longer maximized, whatever the snapshot says
    bool maximized_now = window.maximized && !result.restore_maximized;
    if (action.maximize)
    {
        if (*action.maximize != maximized_now)
            result.maximized = *action.maximize;
    }

    if (action.minimize)
    {
        if (*action.minimize != window.minimized)
            result.minimized = *action.minimize;
    }

    return result;
}

} // namespace placement_policy

PlacementEngine::PlacementEngine(WindowSystem& windows, MonitorOffsetsConfig offsets)
    : windows_(windows)
    , offsets_(std::move(offsets))
{
}

void PlacementEngine::execute(placement_policy::PlacementPlan const& plan, WindowSnapshot const& window)
{
    if (plan.workspace)
    {
        LOG_INFO(" -> moving to workspace {}", *plan.workspace + 1);
        windows_.move_to_workspace(window.handle, *plan.workspace);
    }

    if (plan.restore_maximized)
    {
        LOG_DEBUG(" -> restoring maximized window before resize");
        windows_.set_maximized(window.handle, false);
    }

    if (plan.geometry)
    {
        auto const& g = *plan.geometry;
        LOG_INFO(" -> geometry {}x{} at ({}, {})", g.width, g.height, g.x, g.y);
        windows_.move_resize(window.handle, g);
    }

    if (plan.maximized)
    {
        LOG_INFO(" -> {}", *plan.maximized ? "maximizing" : "un-maximizing");
        windows_.set_maximized(window.handle, *plan.maximized);
    }

    if (plan.minimized)
    {
        LOG_INFO(" -> {}", *plan.minimized ? "minimizing" : "restoring from minimized");
        windows_.set_minimized(window.handle, *plan.minimized);
    }
}

bool PlacementEngine::apply(std::string const& rule_name, ActionConfig const& action, WindowSnapshot const& window)
{
    LOG_INFO("Applying rule '{}' to window {:#x} '{}'", rule_name, window.handle, window.title);

    try
    {
        auto monitors = windows_.enumerate_monitors();
        auto plan = placement_policy::plan(action, window, monitors, offsets_);
        if (plan.empty())
        {
            LOG_DEBUG("Window {:#x} already satisfies rule '{}'", window.handle, rule_name);
            return true;
        }
        execute(plan, window);
        return true;
    }
    catch (WindowSystemError const& e)
    {
        LOG_WARN("Rule '{}' could not be applied to window {:#x} '{}': {}", rule_name, window.handle, window.title, e.what());
        return false;
    }
}

} // namespace winplace
