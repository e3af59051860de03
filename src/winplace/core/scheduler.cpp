#include "scheduler.hpp"
#include "winplace/core/log.hpp"
#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace winplace {

namespace {

// Windows without a title or currently minimized are left for a later cycle
bool is_discoverable(WindowSnapshot const& window)
{
    return !window.title.empty() && !window.minimized;
}

char const* outcome_name(Classification::Kind kind)
{
    switch (kind)
    {
        case Classification::Kind::Ignored:
            return "ignored";
        case Classification::Kind::Matched:
            return "matched";
        case Classification::Kind::Unmatched:
            return "unmatched";
    }
    return "?";
}

}

TrackingScheduler::TrackingScheduler(WindowSystem& windows, std::shared_ptr<RuleSet const> rules, GlobalConfig settings)
    : windows_(windows)
    , rules_(rules ? std::move(rules) : std::make_shared<RuleSet const>())
    , settings_(std::move(settings))
    , placement_(windows_, settings_.monitor_offsets)
{
}

TrackedWindowState const* TrackingScheduler::tracked(WindowHandle handle) const
{
    auto it = tracked_.find(handle);
    return it != tracked_.end() ? &it->second : nullptr;
}

bool TrackingScheduler::has_pending(WindowHandle handle) const
{
    return std::ranges::any_of(pending_, [handle](auto const& entry) { return entry.second.handle == handle; });
}

TrackingScheduler::Clock::duration TrackingScheduler::cleanup_interval() const
{
    return std::chrono::seconds(std::max<uint32_t>(1, settings_.cleanup_interval_seconds));
}

void TrackingScheduler::discover(Clock::time_point now)
{
    if (state_ != EngineState::Running)
        return;

    std::vector<WindowSnapshot> windows;
    try
    {
        windows = windows_.enumerate_windows();
    }
    catch (WindowSystemError const& e)
    {
        LOG_ERROR("Window enumeration failed, skipping cycle: {}", e.what());
        return;
    }

    bool startup = std::exchange(startup_cycle_, false);
    bool skip_existing = startup && !settings_.apply_on_startup;

    for (auto const& window : windows)
    {
        if (!is_discoverable(window))
            continue;

        auto [it, inserted] = tracked_.try_emplace(window.handle);
        auto& state = it->second;
        state.last_seen = now;

        if (inserted)
        {
            state.handle = window.handle;
            state.title = window.title;
            if (skip_existing)
            {
                LOG_DEBUG("Skipping existing window {:#x} '{}' at startup", window.handle, window.title);
                state.processed = true;
                continue;
            }
        }
        else if (state.title != window.title)
        {
            if (settings_.recheck_on_title_change && state.processed
                && state.outcome == Classification::Kind::Unmatched)
            {
                LOG_DEBUG("Title of {:#x} changed '{}' -> '{}', rechecking", window.handle, state.title, window.title);
                state.processed = false;
            }
            state.title = window.title;
        }

        if (state.processed)
            continue;

        try
        {
            dispatch(window, state, now);
        }
        catch (std::exception const& e)
        {
            // Left processed so a persistent error is not repeated every cycle
            LOG_ERROR("Processing window {:#x} '{}' failed: {}", window.handle, window.title, e.what());
            state.processed = true;
        }
    }
}

void TrackingScheduler::dispatch(WindowSnapshot const& window, TrackedWindowState& state, Clock::time_point now)
{
    // Hold the rule set for the duration of this window's evaluation
    auto rules = rules_;
    auto classification = rules->classify(window);

    state.processed = true;
    state.outcome = classification.kind;
    LOG_DEBUG(
        "Window {:#x} '{}' (process '{}', class '{}') {}",
        window.handle,
        window.title,
        window.process,
        window.wm_class,
        outcome_name(classification.kind)
    );

    if (classification.kind != Classification::Kind::Matched)
        return;

    if (has_pending(window.handle))
    {
        LOG_DEBUG("Window {:#x} already has a pending placement", window.handle);
        return;
    }

    auto const& rule = *classification.rule;
    PendingPlacement placement{ window.handle, rule.name, rule.action };

    if (rule.action.execution_delay_ms > 0)
    {
        LOG_INFO(
            "Rule '{}' for '{}' scheduled in {}ms",
            rule.name,
            window.title,
            rule.action.execution_delay_ms
        );
        pending_.emplace(now + std::chrono::milliseconds(rule.action.execution_delay_ms), std::move(placement));
        return;
    }

    if (!placement_.apply(placement.rule_name, placement.action, window))
        state.processed = false;
}

void TrackingScheduler::mark_for_retry(WindowHandle handle)
{
    auto it = tracked_.find(handle);
    if (it != tracked_.end())
        it->second.processed = false;
}

void TrackingScheduler::fire(PendingPlacement const& placement)
{
    std::optional<WindowSnapshot> window;
    try
    {
        if (!windows_.is_handle_valid(placement.handle))
        {
            LOG_INFO("Window {:#x} closed before rule '{}' fired", placement.handle, placement.rule_name);
            return;
        }
        window = windows_.query_window(placement.handle);
    }
    catch (WindowSystemError const& e)
    {
        LOG_WARN("Window {:#x} could not be queried for rule '{}': {}", placement.handle, placement.rule_name, e.what());
        mark_for_retry(placement.handle);
        return;
    }

    if (!window)
    {
        LOG_INFO("Window {:#x} closed before rule '{}' fired", placement.handle, placement.rule_name);
        return;
    }
    if (window->minimized)
    {
        LOG_WARN("Window '{}' was minimized during the delay, dropping rule '{}'", window->title, placement.rule_name);
        return;
    }

    if (!placement_.apply(placement.rule_name, placement.action, *window))
        mark_for_retry(placement.handle);
}

void TrackingScheduler::fire_due(Clock::time_point now)
{
    if (state_ != EngineState::Running)
        return;

    std::vector<PendingPlacement> due;
    auto end = pending_.upper_bound(now);
    for (auto it = pending_.begin(); it != end; ++it)
    {
        due.push_back(std::move(it->second));
    }
    pending_.erase(pending_.begin(), end);

    for (auto const& placement : due)
    {
        try
        {
            fire(placement);
        }
        catch (std::exception const& e)
        {
            LOG_ERROR("Rule '{}' for window {:#x} failed: {}", placement.rule_name, placement.handle, e.what());
        }
    }
}

void TrackingScheduler::run_due(Clock::time_point now)
{
    fire_due(now);

    if (!next_cleanup_)
    {
        next_cleanup_ = now + cleanup_interval();
    }
    else if (now >= *next_cleanup_)
    {
        cleanup();
        next_cleanup_ = now + cleanup_interval();
    }
}

void TrackingScheduler::tick(Clock::time_point now)
{
    discover(now);
    run_due(now);
}

size_t TrackingScheduler::cleanup()
{
    size_t removed = std::erase_if(
        tracked_,
        [this](auto const& entry) { return !windows_.is_handle_valid(entry.first); }
    );
    LOG_DEBUG("Cleanup removed {} stale window(s), {} tracked", removed, tracked_.size());
    return removed;
}

void TrackingScheduler::force_reprocess(char const* reason)
{
    for (auto& [handle, state] : tracked_)
    {
        state.processed = false;
    }
    LOG_INFO("Rules will be re-applied to all windows ({})", reason);
}

void TrackingScheduler::pause()
{
    if (state_ == EngineState::Paused)
        return;

    state_ = EngineState::Paused;
    LOG_INFO("Paused ({} placement(s) held until resume)", pending_.size());
}

void TrackingScheduler::resume()
{
    if (state_ == EngineState::Running)
        return;

    state_ = EngineState::Running;
    LOG_INFO("Resumed");

    if (settings_.apply_on_resume)
        force_reprocess("resume");
    else
        LOG_INFO("Only new windows will be handled");
}

void TrackingScheduler::reload(std::shared_ptr<RuleSet const> rules, GlobalConfig settings)
{
    if (!rules)
        return;

    rules_ = std::move(rules);
    settings_ = std::move(settings);
    placement_.set_monitor_offsets(settings_.monitor_offsets);
    next_cleanup_.reset();

    LOG_INFO("Rule set replaced: {} ignore entries, {} rules", rules_->ignore_count(), rules_->rule_count());

    if (settings_.apply_on_reload)
        force_reprocess("reload");
}

std::optional<TrackingScheduler::Clock::time_point> TrackingScheduler::next_deadline() const
{
    std::optional<Clock::time_point> deadline = next_cleanup_;
    if (state_ == EngineState::Running && !pending_.empty())
    {
        auto first = pending_.begin()->first;
        if (!deadline || first < *deadline)
            deadline = first;
    }
    return deadline;
}

} // namespace winplace
