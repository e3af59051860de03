#include "fake_window_system.hpp"
#include "winplace/core/placement.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace winplace;
using winplace::test::FakeWindowSystem;

namespace {

ActionConfig centered()
{
    ActionConfig action;
    action.move_to = AnchorPoint::MiddleCenter;
    action.resize_to = SizeTarget{ Length::pixels(320), Length::percent(50) };
    return action;
}

std::vector<std::string> const CENTERED_CALL = { "move_resize 800,270 320x540" };

} // namespace

TEST_CASE("Workspace moves first, state changes last", "[placement]")
{
    FakeWindowSystem ws;
    auto window = ws.add_window(1, "Editor");

    auto action = centered();
    action.target_workspace = 2;
    action.maximize = true;

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE(engine.apply("Editor", action, window));

    std::vector<std::string> expected = { "move_to_workspace 1", "move_resize 800,270 320x540", "set_maximized on" };
    REQUIRE(ws.calls == expected);
    REQUIRE(ws.workspace_of[1] == 1);
}

TEST_CASE("Maximized window is restored before it is resized", "[placement]")
{
    FakeWindowSystem ws;
    auto& stored = ws.add_window(1, "Editor");
    stored.maximized = true;
    auto window = stored;

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE(engine.apply("Editor", centered(), window));

    std::vector<std::string> expected = { "set_maximized off", "move_resize 800,270 320x540" };
    REQUIRE(ws.calls == expected);
    REQUIRE_FALSE(ws.find(1)->maximized);
}

TEST_CASE("Maximize after resize on an already maximized window", "[placement]")
{
    FakeWindowSystem ws;
    auto& stored = ws.add_window(1, "Editor");
    stored.maximized = true;
    auto window = stored;

    auto action = centered();
    action.maximize = true;

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE(engine.apply("Editor", action, window));

    std::vector<std::string> expected = { "set_maximized off", "move_resize 800,270 320x540", "set_maximized on" };
    REQUIRE(ws.calls == expected);
}

TEST_CASE("Window already in place issues no primitives", "[placement]")
{
    FakeWindowSystem ws;
    auto window = ws.add_window(1, "Editor", "app", "App", { 800, 270, 320, 540 });

    auto action = centered();
    action.maximize = false;
    action.minimize = false;

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE(engine.apply("Editor", action, window));
    REQUIRE(ws.calls.empty());
}

TEST_CASE("Failing primitive aborts the remaining steps", "[placement][errors]")
{
    FakeWindowSystem ws;
    auto window = ws.add_window(1, "Editor");
    ws.failing.insert("move_resize");

    auto action = centered();
    action.minimize = true;

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE_FALSE(engine.apply("Editor", action, window));
    REQUIRE(ws.count_calls("set_minimized") == 0);
    REQUIRE_FALSE(ws.find(1)->minimized);
}

TEST_CASE("Invalid workspace aborts before geometry", "[placement][errors]")
{
    FakeWindowSystem ws;
    ws.workspace_count = 2;
    auto window = ws.add_window(1, "Editor");

    auto action = centered();
    action.target_workspace = 5;

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE_FALSE(engine.apply("Editor", action, window));
    REQUIRE(ws.calls.empty());
}

TEST_CASE("Vanished window is reported, not thrown", "[placement][errors]")
{
    FakeWindowSystem ws;
    auto window = ws.add_window(1, "Editor");
    ws.remove_window(1);

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE_NOTHROW(engine.apply("Editor", centered(), window));
    REQUIRE_FALSE(engine.apply("Editor", centered(), window));
}

TEST_CASE("Monitor offsets come from the engine configuration", "[placement]")
{
    FakeWindowSystem ws;
    auto window = ws.add_window(1, "Editor");

    MonitorOffsetsConfig offsets;
    offsets.default_offset.bottom = 40;

    auto action = centered();
    action.anchor = AnchorPoint::MiddleCenter;

    PlacementEngine engine(ws, offsets);
    REQUIRE(engine.apply("Editor", action, window));
    REQUIRE(ws.calls == std::vector<std::string>{ "move_resize 800,260 320x520" });

    engine.set_monitor_offsets(MonitorOffsetsConfig{});
    auto moved = *ws.query_window(1);
    ws.calls.clear();
    REQUIRE(engine.apply("Editor", action, moved));
    REQUIRE(ws.calls == CENTERED_CALL);
}

TEST_CASE("Plan only changes what differs", "[placement][plan]")
{
    std::vector<MonitorInfo> monitors = { MonitorInfo{ "DP-1", { 0, 0, 1920, 1080 }, { 0, 0, 1920, 1080 } } };

    WindowSnapshot window;
    window.handle = 7;
    window.geometry = { 10, 10, 200, 200 };
    window.minimized = false;

    ActionConfig action;
    action.minimize = false;
    action.maximize = true;
    action.target_workspace = 1;

    auto plan = placement_policy::plan(action, window, monitors, MonitorOffsetsConfig{});
    REQUIRE(plan.workspace == size_t{ 0 });
    REQUIRE_FALSE(plan.geometry.has_value());
    REQUIRE_FALSE(plan.restore_maximized);
    REQUIRE(plan.maximized == true);
    REQUIRE_FALSE(plan.minimized.has_value());

    REQUIRE(placement_policy::plan(ActionConfig{}, window, monitors, MonitorOffsetsConfig{}).empty());
}

TEST_CASE("Minimize and restore follow the requested state", "[placement]")
{
    FakeWindowSystem ws;
    auto window = ws.add_window(1, "Player");

    ActionConfig minimize;
    minimize.minimize = true;

    PlacementEngine engine(ws, MonitorOffsetsConfig{});
    REQUIRE(engine.apply("Player", minimize, window));
    REQUIRE(ws.calls == std::vector<std::string>{ "set_minimized on" });

    ActionConfig restore;
    restore.minimize = false;
    ws.calls.clear();
    REQUIRE(engine.apply("Player", restore, *ws.query_window(1)));
    REQUIRE(ws.calls == std::vector<std::string>{ "set_minimized off" });
}
