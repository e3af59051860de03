#pragma once

#include "winplace/config/config.hpp"
#include "winplace/core/placement.hpp"
#include "winplace/core/types.hpp"
#include "winplace/core/window_rules.hpp"
#include "winplace/core/window_system.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace winplace {

enum class EngineState
{
    Running,
    Paused
};

/**
 * @brief Per-window bookkeeping owned by the scheduler
 *
 * `outcome` is empty for windows that were present at startup with
 * apply_on_startup disabled: those were never classified.
 */
struct TrackedWindowState
{
    WindowHandle handle = NO_WINDOW;
    bool processed = false;
    std::optional<Classification::Kind> outcome;
    std::string title;
    std::chrono::steady_clock::time_point last_seen;
};

/// A placement waiting for its execution_delay. Holds its own copy of the action.
struct PendingPlacement
{
    WindowHandle handle = NO_WINDOW;
    std::string rule_name;
    ActionConfig action;
};

/**
 * @brief Long-running discovery/dispatch state machine
 *
 * Single-threaded: the daemon loop calls discover() when windows may have
 * appeared and run_due() whenever next_deadline() passes. Delayed placements
 * sit in a deadline-ordered queue, so the loop never blocks on them.
 *
 * State transitions happen only through pause(), resume() and reload().
 */
class TrackingScheduler
{
public:
    using Clock = std::chrono::steady_clock;

    TrackingScheduler(WindowSystem& windows, std::shared_ptr<RuleSet const> rules, GlobalConfig settings);

    /// One discovery cycle: classify and dispatch every unprocessed window.
    void discover(Clock::time_point now);

    /// Fire delayed placements whose deadline passed and run cleanup when due.
    void run_due(Clock::time_point now);

    /// discover() followed by run_due().
    void tick(Clock::time_point now);

    /**
     * @brief Drop tracked windows whose handle no longer resolves
     * @return number of entries removed
     */
    size_t cleanup();

    void pause();
    void resume();

    /// Swap in a fully built rule set and new global options. State is unchanged.
    void reload(std::shared_ptr<RuleSet const> rules, GlobalConfig settings);

    /// Earliest time run_due() has work to do.
    std::optional<Clock::time_point> next_deadline() const;

    EngineState state() const { return state_; }
    std::shared_ptr<RuleSet const> rules() const { return rules_; }
    GlobalConfig const& settings() const { return settings_; }

    TrackedWindowState const* tracked(WindowHandle handle) const;
    size_t tracked_count() const { return tracked_.size(); }
    size_t pending_count() const { return pending_.size(); }
    bool has_pending(WindowHandle handle) const;

private:
    WindowSystem& windows_;
    std::shared_ptr<RuleSet const> rules_;
    GlobalConfig settings_;
    PlacementEngine placement_;

    EngineState state_ = EngineState::Running;
    bool startup_cycle_ = true;

    std::unordered_map<WindowHandle, TrackedWindowState> tracked_;
    std::multimap<Clock::time_point, PendingPlacement> pending_;
    std::optional<Clock::time_point> next_cleanup_;

    void dispatch(WindowSnapshot const& window, TrackedWindowState& state, Clock::time_point now);
    void fire(PendingPlacement const& placement);
    void mark_for_retry(WindowHandle handle);
    void fire_due(Clock::time_point now);
    void force_reprocess(char const* reason);
    Clock::duration cleanup_interval() const;
};

} // namespace winplace
