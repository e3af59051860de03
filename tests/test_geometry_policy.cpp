#include "winplace/core/geometry.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace winplace;
using namespace winplace::geometry_policy;

namespace {

constexpr Geometry FULL_HD{ 0, 0, 1920, 1080 };
constexpr Geometry CURRENT{ 100, 100, 800, 600 };

ActionConfig centered_320_by_half()
{
    ActionConfig action;
    action.anchor = AnchorPoint::MiddleCenter;
    action.move_to = AnchorPoint::MiddleCenter;
    action.resize_to = SizeTarget{ Length::pixels(320), Length::percent(50) };
    return action;
}

MonitorInfo make_monitor(std::string name, Geometry area)
{
    return MonitorInfo{ std::move(name), area, area };
}

} // namespace

TEST_CASE("Centered placement honours the monitor offset", "[geometry]")
{
    MonitorOffset bottom_panel{ 0, 40, 0, 0 };

    auto result = resolve(centered_320_by_half(), FULL_HD, bottom_panel, CURRENT);

    REQUIRE(result.width == 320);
    REQUIRE(result.height == 520);
    REQUIRE(result.x == 800);
    REQUIRE(result.y == 260);
}

TEST_CASE("Resolution is a pure function of its inputs", "[geometry]")
{
    MonitorOffset offset{ 10, 40, 5, 5 };
    auto action = centered_320_by_half();

    auto first = resolve(action, FULL_HD, offset, CURRENT);
    for (int i = 0; i < 5; ++i)
    {
        REQUIRE(resolve(action, FULL_HD, offset, CURRENT) == first);
    }
}

TEST_CASE("Explicit coordinates bypass monitor offsets", "[geometry]")
{
    ActionConfig action;
    action.move_to = CoordinateTarget{ Length::percent(10), Length::pixels(10) };

    for (auto const& offset : { MonitorOffset{}, MonitorOffset{ 30, 40, 50, 60 } })
    {
        auto result = resolve(action, FULL_HD, offset, CURRENT);
        REQUIRE(result.x == 192);
        REQUIRE(result.y == 10);
        REQUIRE(result.width == CURRENT.width);
        REQUIRE(result.height == CURRENT.height);
    }
}

TEST_CASE("Explicit coordinates are measured from the work area origin", "[geometry]")
{
    ActionConfig action;
    action.move_to = CoordinateTarget{ Length::pixels(0), Length::percent(50) };
    action.resize_to = SizeTarget{ Length::percent(50), std::nullopt };

    Geometry second_monitor{ 1920, 0, 2560, 1440 };
    auto result = resolve(action, second_monitor, MonitorOffset{ 0, 100, 0, 0 }, CURRENT);

    REQUIRE(result.x == 1920);
    REQUIRE(result.y == 720);
    REQUIRE(result.width == 1280);
    REQUIRE(result.height == CURRENT.height);
}

TEST_CASE("Offset shifts the final position for both placement forms", "[geometry]")
{
    MonitorOffset bottom_panel{ 0, 40, 0, 0 };

    auto anchored = centered_320_by_half();
    auto base = resolve(anchored, FULL_HD, bottom_panel, CURRENT);
    anchored.offset = PixelOffset{ -20, 0 };
    auto shifted = resolve(anchored, FULL_HD, bottom_panel, CURRENT);
    REQUIRE(shifted.x == base.x - 20);
    REQUIRE(shifted.y == base.y);
    REQUIRE(shifted.width == base.width);
    REQUIRE(shifted.height == base.height);

    ActionConfig explicit_coords;
    explicit_coords.move_to = CoordinateTarget{ Length::percent(10), Length::pixels(10) };
    explicit_coords.offset = PixelOffset{ -20, 0 };
    auto result = resolve(explicit_coords, FULL_HD, bottom_panel, CURRENT);
    REQUIRE(result.x == 172);
    REQUIRE(result.y == 10);
}

TEST_CASE("Window anchor and target point are independent", "[geometry]")
{
    ActionConfig action;
    action.move_to = AnchorPoint::BottomRight;
    action.anchor = AnchorPoint::BottomRight;
    action.resize_to = SizeTarget{ Length::pixels(400), Length::pixels(300) };

    auto corner = resolve(action, FULL_HD, MonitorOffset{}, CURRENT);
    REQUIRE(corner == Geometry{ 1520, 780, 400, 300 });

    action.anchor = AnchorPoint::TopLeft;
    auto hanging = resolve(action, FULL_HD, MonitorOffset{}, CURRENT);
    REQUIRE(hanging == Geometry{ 1920, 1080, 400, 300 });
}

TEST_CASE("Default anchor depends on the move_to form", "[geometry]")
{
    ActionConfig action;
    action.move_to = AnchorPoint::MiddleCenter;
    REQUIRE(action.effective_anchor() == AnchorPoint::MiddleCenter);

    action.move_to = CoordinateTarget{ Length::pixels(0), Length::pixels(0) };
    REQUIRE(action.effective_anchor() == AnchorPoint::TopLeft);

    action.move_to = AnchorPoint::TopRight;
    action.anchor = AnchorPoint::TopRight;
    REQUIRE(action.effective_anchor() == AnchorPoint::TopRight);
}

TEST_CASE("Missing move_to keeps the current position", "[geometry]")
{
    ActionConfig action;
    action.resize_to = SizeTarget{ std::nullopt, Length::pixels(300) };
    action.offset = PixelOffset{ 5, -5 };

    auto result = resolve(action, FULL_HD, MonitorOffset{ 0, 40, 0, 0 }, CURRENT);
    REQUIRE(result == Geometry{ 105, 95, 800, 300 });
}

TEST_CASE("Monitor offsets never collapse the area", "[geometry]")
{
    auto area = apply_monitor_offset({ 0, 0, 100, 100 }, MonitorOffset{ 80, 80, 80, 80 });
    REQUIRE(area.width == 1);
    REQUIRE(area.height == 1);
    REQUIRE(area.x == 80);
    REQUIRE(area.y == 80);
}

TEST_CASE("Percent lengths truncate", "[geometry]")
{
    REQUIRE(resolve_length(Length::percent(33), 1000) == 330);
    REQUIRE(resolve_length(Length::percent(50), 1041) == 520);
    REQUIRE(resolve_length(Length::pixels(99.9), 1000) == 99);
}

TEST_CASE("Oversized lengths are clamped instead of overflowing", "[geometry]")
{
    REQUIRE(resolve_length(Length::pixels(1e10), 1000) == 1000000);
    REQUIRE(resolve_length(Length::percent(-1e12), 1920) == -1000000);

    ActionConfig action;
    action.resize_to = SizeTarget{ Length::pixels(1e10), Length::percent(1e12) };
    action.offset = PixelOffset{ 50, 50 };
    auto result = resolve(action, FULL_HD, MonitorOffset{}, CURRENT);
    REQUIRE(result.width == 1000000);
    REQUIRE(result.height == 1000000);
    REQUIRE(result.x == 150);
}

TEST_CASE("Window monitor is the one containing its centre", "[geometry][multimonitor]")
{
    std::vector<MonitorInfo> monitors = { make_monitor("DP-1", { 0, 0, 1920, 1080 }),
                                          make_monitor("DP-2", { 1920, 0, 2560, 1440 }) };

    REQUIRE(monitor_for_window(monitors, { 1800, 100, 400, 300 }) == 1);
    REQUIRE(monitor_for_window(monitors, { 1700, 100, 400, 300 }) == 0);
    REQUIRE(monitor_for_window(monitors, { -5000, -5000, 10, 10 }) == 0);
}

TEST_CASE("Out-of-range target monitor falls back to the current one", "[geometry][multimonitor]")
{
    bool fell_back = false;
    REQUIRE(select_monitor(2, 0, 2, &fell_back) == 1);
    REQUIRE_FALSE(fell_back);

    REQUIRE(select_monitor(3, 1, 2, &fell_back) == 1);
    REQUIRE(fell_back);

    REQUIRE(select_monitor(0, 0, 2, &fell_back) == 0);
    REQUIRE(fell_back);

    REQUIRE(select_monitor(std::nullopt, 1, 2, &fell_back) == 1);
    REQUIRE_FALSE(fell_back);
}

TEST_CASE("Target monitor uses that monitor's work area and offset", "[geometry][multimonitor]")
{
    std::vector<MonitorInfo> monitors = { make_monitor("DP-1", { 0, 0, 1920, 1080 }),
                                          make_monitor("DP-2", { 1920, 0, 2560, 1440 }) };
    MonitorOffsetsConfig offsets;
    offsets.default_offset = MonitorOffset{ 0, 40, 0, 0 };
    offsets.per_monitor[2] = MonitorOffset{ 40, 0, 0, 0 };

    ActionConfig action;
    action.move_to = AnchorPoint::TopLeft;
    action.anchor = AnchorPoint::TopLeft;
    action.target_monitor = 2;

    WindowSnapshot window;
    window.geometry = CURRENT;
    window.monitor = 0;

    auto result = resolve(action, monitors, offsets, window);
    REQUIRE(result == Geometry{ 1920, 40, 800, 600 });
}

TEST_CASE("Changing monitor without move_to keeps the relative position", "[geometry][multimonitor]")
{
    std::vector<MonitorInfo> monitors = { make_monitor("DP-1", { 0, 0, 1920, 1080 }),
                                          make_monitor("DP-2", { 1920, 0, 2560, 1440 }) };

    ActionConfig action;
    action.target_monitor = 2;

    WindowSnapshot window;
    window.geometry = CURRENT;
    window.monitor = 0;

    auto result = resolve(action, monitors, MonitorOffsetsConfig{}, window);
    REQUIRE(result == Geometry{ 2020, 100, 800, 600 });
}
