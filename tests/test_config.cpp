#include "winplace/config/config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace winplace;
using Catch::Matchers::ContainsSubstring;

namespace {

std::string config_error(std::string_view text)
{
    try
    {
        parse_config(text);
    }
    catch (ConfigError const& e)
    {
        return e.what();
    }
    return "";
}

} // namespace

TEST_CASE("Empty document yields defaults", "[config]")
{
    auto cfg = parse_config("");
    REQUIRE(cfg.global.log_level == "INFO");
    REQUIRE(cfg.global.apply_on_startup);
    REQUIRE(cfg.global.apply_on_reload);
    REQUIRE_FALSE(cfg.global.apply_on_resume);
    REQUIRE(cfg.global.cleanup_interval_seconds == 300);
    REQUIRE(cfg.global.polling_interval_ms == 1000);
    REQUIRE(cfg.ignores.empty());
    REQUIRE(cfg.rules.empty());
}

TEST_CASE("Global options are read", "[config]")
{
    auto cfg = parse_config(R"(
[global]
log_level = "debug"
apply_on_startup = false
apply_on_reload = false
apply_on_resume = true
recheck_on_title_change = true
cleanup_interval_seconds = 60
polling_interval = 20

[global.monitor_offsets.default]
bottom = 40

[global.monitor_offsets.monitor_2]
top = 30
left = 5
)");

    REQUIRE(cfg.global.log_level == "DEBUG");
    REQUIRE_FALSE(cfg.global.apply_on_startup);
    REQUIRE_FALSE(cfg.global.apply_on_reload);
    REQUIRE(cfg.global.apply_on_resume);
    REQUIRE(cfg.global.recheck_on_title_change);
    REQUIRE(cfg.global.cleanup_interval_seconds == 60);
    REQUIRE(cfg.global.polling_interval_ms == 100);

    auto const& offsets = cfg.global.monitor_offsets;
    REQUIRE(offsets.default_offset == MonitorOffset{ 0, 40, 0, 0 });
    REQUIRE(offsets.for_monitor(0) == MonitorOffset{ 0, 40, 0, 0 });
    REQUIRE(offsets.for_monitor(1) == MonitorOffset{ 30, 0, 5, 0 });
}

TEST_CASE("Full rule with every action field", "[config]")
{
    auto cfg = parse_config(R"(
[[rules]]
name = "Editor"
condition = { title = "regex:^Untitled - Notepad$" }

[rules.action]
anchor = "TopLeft"
move_to = "MiddleCenter"
resize_to = { width = 320, height = "50%" }
offset = { x = -20, y = 0 }
target_monitor = 2
target_workspace = 1
maximize = "OFF"
minimize = "off"
execution_delay = 500
)");

    REQUIRE(cfg.rules.size() == 1);
    auto const& rule = cfg.rules[0];
    REQUIRE(rule.name == "Editor");
    REQUIRE(rule.condition.logic == MatchLogic::And);
    REQUIRE(rule.condition.conditions.size() == 1);
    REQUIRE(rule.condition.conditions[0].field == MatchField::Title);
    REQUIRE(rule.condition.conditions[0].pattern == "regex:^Untitled - Notepad$");
    REQUIRE_FALSE(rule.condition.conditions[0].case_sensitive);

    auto const& action = rule.action;
    REQUIRE(action.anchor == AnchorPoint::TopLeft);
    REQUIRE(std::get<AnchorPoint>(*action.move_to) == AnchorPoint::MiddleCenter);
    REQUIRE(action.resize_to->width == Length::pixels(320));
    REQUIRE(action.resize_to->height == Length::percent(50));
    REQUIRE(action.offset->x == -20);
    REQUIRE(action.target_monitor == 2);
    REQUIRE(action.target_workspace == 1);
    REQUIRE(action.maximize == false);
    REQUIRE(action.minimize == false);
    REQUIRE(action.execution_delay_ms == 500);
}

TEST_CASE("Condition groups default to AND for rules and OR for ignores", "[config]")
{
    auto cfg = parse_config(R"(
[[ignores]]
name = "Shell"
conditions = [ { process = "plasmashell" }, { class = "regex:^Xfce4-panel$", case_sensitive = true } ]

[[rules]]
name = "Terminal"
condition = { conditions = [ { title = "Terminal" }, { process = "kitty" } ] }
action = { move_to = { x = "10%", y = "10px" } }

[[rules]]
name = "Either"
condition = { logic = "or", conditions = [ { title = "a" }, { title = "b" } ] }
action = { minimize = "ON" }
)");

    REQUIRE(cfg.ignores.size() == 1);
    REQUIRE(cfg.ignores[0].group.logic == MatchLogic::Or);
    REQUIRE(cfg.ignores[0].group.conditions[1].field == MatchField::Class);
    REQUIRE(cfg.ignores[0].group.conditions[1].case_sensitive);

    REQUIRE(cfg.rules[0].condition.logic == MatchLogic::And);
    auto const& coords = std::get<CoordinateTarget>(*cfg.rules[0].action.move_to);
    REQUIRE(coords.x == Length::percent(10));
    REQUIRE(coords.y == Length::pixels(10));
    REQUIRE(cfg.rules[0].action.effective_anchor() == AnchorPoint::TopLeft);

    REQUIRE(cfg.rules[1].condition.logic == MatchLogic::Or);
    REQUIRE(cfg.rules[1].action.minimize == true);
}

TEST_CASE("Long size names win over aliases", "[config]")
{
    auto cfg = parse_config(R"(
[[rules]]
name = "Sized"
condition = { class = "App" }
action = { resize_to = { w = 100, width = 200, h = "10%" } }
)");

    auto const& size = *cfg.rules[0].action.resize_to;
    REQUIRE(size.width == Length::pixels(200));
    REQUIRE(size.height == Length::percent(10));
}

TEST_CASE("Length strings", "[config]")
{
    REQUIRE(parse_length("320") == Length::pixels(320));
    REQUIRE(parse_length("320px") == Length::pixels(320));
    REQUIRE(parse_length(" 12.5% ") == Length::percent(12.5));
    REQUIRE_FALSE(parse_length("abc").has_value());
    REQUIRE_FALSE(parse_length("%").has_value());
    REQUIRE_FALSE(parse_length("").has_value());
}

TEST_CASE("Anchor names round-trip", "[config]")
{
    for (auto name : { "TopLeft", "MiddleCenter", "BottomRight" })
    {
        auto anchor = parse_anchor(name);
        REQUIRE(anchor.has_value());
        REQUIRE(anchor_name(*anchor) == name);
    }
    REQUIRE_FALSE(parse_anchor("Center").has_value());
}

TEST_CASE("Schema violations are reported", "[config][errors]")
{
    CHECK_THAT(config_error("[global]\nunknown = 1\n"), ContainsSubstring("unknown key"));
    CHECK_THAT(config_error("[global]\nlog_level = \"LOUD\"\n"), ContainsSubstring("log_level"));
    CHECK_THAT(
        config_error("[global.monitor_offsets.monitor_0]\ntop = 1\n"),
        ContainsSubstring("invalid key 'monitor_0'")
    );
    CHECK_THAT(
        config_error("[[rules]]\nname = \"r\"\ncondition = { title = \"a\", process = \"b\" }\naction = {}\n"),
        ContainsSubstring("exactly one")
    );
    CHECK_THAT(
        config_error("[[rules]]\nname = \"r\"\ncondition = { conditions = [] }\naction = {}\n"),
        ContainsSubstring("at least one")
    );
    CHECK_THAT(
        config_error("[[rules]]\nname = \"r\"\ncondition = { title = \"a\" }\naction = { move_to = \"Nowhere\" }\n"),
        ContainsSubstring("unknown anchor")
    );
    CHECK_THAT(
        config_error("[[rules]]\nname = \"r\"\ncondition = { title = \"a\" }\naction = { maximize = \"MAYBE\" }\n"),
        ContainsSubstring("ON")
    );
    CHECK_THAT(
        config_error("[[rules]]\nname = \"r\"\ncondition = { title = \"a\" }\naction = { target_monitor = 0 }\n"),
        ContainsSubstring("1-based")
    );
    CHECK_THAT(config_error("[[rules]]\ncondition = { title = \"a\" }\naction = {}\n"), ContainsSubstring("'name'"));
    CHECK_THAT(config_error("this is not toml"), ContainsSubstring("line 1"));
}

TEST_CASE("Out-of-range numbers are rejected before narrowing", "[config][errors]")
{
    auto action = [](std::string const& body) {
        return config_error("[[rules]]\nname = \"r\"\ncondition = { title = \"a\" }\naction = " + body + "\n");
    };

    CHECK_THAT(action("{ resize_to = { width = 1e10 } }"), ContainsSubstring("out of range"));
    CHECK_THAT(action("{ resize_to = { height = \"1e12%\" } }"), ContainsSubstring("out of range"));
    CHECK_THAT(action("{ resize_to = { width = inf } }"), ContainsSubstring("out of range"));
    CHECK_THAT(action("{ move_to = { x = 0, y = 5000000000 } }"), ContainsSubstring("out of range"));
    CHECK_THAT(action("{ offset = { x = 3000000000, y = 0 } }"), ContainsSubstring("'x' must be between"));
    CHECK_THAT(action("{ execution_delay = 5000000000 }"), ContainsSubstring("execution_delay must be at most"));
    CHECK_THAT(action("{ target_workspace = 4294967297 }"), ContainsSubstring("target_workspace must be at most"));
    CHECK_THAT(
        config_error("[global.monitor_offsets.default]\ntop = -3000000000\n"),
        ContainsSubstring("'top' must be between")
    );
    CHECK_THAT(config_error("[global]\ncleanup_interval_seconds = 5000000000\n"), ContainsSubstring("at most"));
    CHECK_THAT(config_error("[global]\npolling_interval = -1\n"), ContainsSubstring("must be between"));

    REQUIRE_NOTHROW(parse_config(
        "[[rules]]\nname = \"r\"\ncondition = { title = \"a\" }\n"
        "action = { resize_to = { width = 100000, height = \"1000%\" }, offset = { x = -100000, y = 0 } }\n"
    ));
}

TEST_CASE("Missing config file is reported without throwing", "[config]")
{
    REQUIRE_FALSE(load_config("/nonexistent/winplace/config.toml").has_value());
}

TEST_CASE("Config file is loaded from disk", "[config]")
{
    auto path = std::filesystem::temp_directory_path() / "winplace-test-config.toml";
    {
        std::ofstream out(path);
        out << "[[rules]]\nname = \"r\"\ncondition = { title = \"a\" }\naction = { move_to = \"TopLeft\" }\n";
    }

    auto cfg = load_config(path.string());
    std::filesystem::remove(path);

    REQUIRE(cfg.has_value());
    REQUIRE(cfg->rules.size() == 1);
}
