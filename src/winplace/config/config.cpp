#include "config.hpp"
#include "winplace/core/log.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <toml++/toml.hpp>

namespace winplace {

namespace {

constexpr int64_t MAX_INDEX = 1000;
constexpr int64_t MAX_DELAY_MS = 24 * 60 * 60 * 1000;
constexpr int64_t MAX_INTERVAL_SECONDS = 24 * 60 * 60;

constexpr std::array<std::pair<std::string_view, AnchorPoint>, 9> ANCHOR_NAMES = { {
    { "TopLeft", AnchorPoint::TopLeft },
    { "TopCenter", AnchorPoint::TopCenter },
    { "TopRight", AnchorPoint::TopRight },
    { "MiddleLeft", AnchorPoint::MiddleLeft },
    { "MiddleCenter", AnchorPoint::MiddleCenter },
    { "MiddleRight", AnchorPoint::MiddleRight },
    { "BottomLeft", AnchorPoint::BottomLeft },
    { "BottomCenter", AnchorPoint::BottomCenter },
    { "BottomRight", AnchorPoint::BottomRight },
} };

std::string trim(std::string_view text)
{
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos)
        return {};
    auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(begin, end - begin + 1));
}

std::string to_upper(std::string text)
{
    std::ranges::transform(text, text.begin(), [](unsigned char c) { return std::toupper(c); });
    return text;
}

std::optional<double> parse_number(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value))
        return std::nullopt;
    return value;
}

// Reject keys the schema does not know about
void check_keys(toml::table const& tbl, std::initializer_list<std::string_view> allowed, std::string const& context)
{
    for (auto const& [key, node] : tbl)
    {
        if (std::ranges::find(allowed, key.str()) == allowed.end())
        {
            throw ConfigError(context + ": unknown key '" + std::string(key.str()) + "'");
        }
    }
}

std::optional<bool> read_bool(toml::table const& tbl, std::string_view key, std::string const& context)
{
    auto const* node = tbl.get(key);
    if (!node)
        return std::nullopt;
    if (auto v = node->value<bool>())
        return *v;
    throw ConfigError(context + ": '" + std::string(key) + "' must be a boolean");
}

std::optional<int64_t> read_integer(toml::table const& tbl, std::string_view key, std::string const& context)
{
    auto const* node = tbl.get(key);
    if (!node)
        return std::nullopt;
    if (node->is_integer())
        return node->value<int64_t>();
    throw ConfigError(context + ": '" + std::string(key) + "' must be an integer");
}

std::optional<std::string> read_string(toml::table const& tbl, std::string_view key, std::string const& context)
{
    auto const* node = tbl.get(key);
    if (!node)
        return std::nullopt;
    if (node->is_string())
        return node->value<std::string>();
    throw ConfigError(context + ": '" + std::string(key) + "' must be a string");
}

toml::table const* read_table(toml::table const& tbl, std::string_view key, std::string const& context)
{
    auto const* node = tbl.get(key);
    if (!node)
        return nullptr;
    if (auto const* t = node->as_table())
        return t;
    throw ConfigError(context + ": '" + std::string(key) + "' must be a table");
}

// Integer in [min, max], rejected with a ConfigError otherwise
std::optional<int64_t> read_bounded(
    toml::table const& tbl,
    std::string_view key,
    int64_t min,
    int64_t max,
    std::string const& context
)
{
    auto v = read_integer(tbl, key, context);
    if (v && (*v < min || *v > max))
    {
        throw ConfigError(
            context + ": '" + std::string(key) + "' must be between " + std::to_string(min) + " and "
            + std::to_string(max)
        );
    }
    return v;
}

Length checked_length(Length length, std::string const& context)
{
    if (!length.in_range())
    {
        throw ConfigError(
            context + ": length out of range (at most " + std::to_string(MAX_PIXELS) + "px or "
            + std::to_string(static_cast<int>(MAX_PERCENT)) + "%)"
        );
    }
    return length;
}

Length read_length(toml::node const& node, std::string const& context)
{
    if (node.is_integer())
        return checked_length(Length::pixels(static_cast<double>(*node.value<int64_t>())), context);
    if (node.is_floating_point())
        return checked_length(Length::pixels(*node.value<double>()), context);
    if (auto text = node.value<std::string>())
    {
        if (auto length = parse_length(*text))
            return checked_length(*length, context);
        throw ConfigError(context + ": invalid length '" + *text + "' (expected pixels, \"<n>px\" or \"<n>%\")");
    }
    throw ConfigError(context + ": length must be an integer or a string");
}

std::optional<bool> read_switch(toml::table const& tbl, std::string_view key, std::string const& context)
{
    auto const* node = tbl.get(key);
    if (!node)
        return std::nullopt;
    if (auto v = node->value<bool>())
        return *v;
    if (auto v = node->value<std::string>())
    {
        std::string upper = to_upper(*v);
        if (upper == "ON")
            return true;
        if (upper == "OFF")
            return false;
    }
    throw ConfigError(context + ": '" + std::string(key) + "' must be \"ON\" or \"OFF\"");
}

MatchLogic read_logic(toml::table const& tbl, MatchLogic fallback, std::string const& context)
{
    auto text = read_string(tbl, "logic", context);
    if (!text)
        return fallback;
    std::string upper = to_upper(*text);
    if (upper == "AND")
        return MatchLogic::And;
    if (upper == "OR")
        return MatchLogic::Or;
    throw ConfigError(context + ": logic must be \"AND\" or \"OR\", got '" + *text + "'");
}

ConditionConfig parse_condition(toml::table const& tbl, std::string const& context)
{
    check_keys(tbl, { "title", "process", "class", "case_sensitive" }, context);

    ConditionConfig condition;
    int fields = 0;

    if (auto v = read_string(tbl, "title", context))
    {
        condition.field = MatchField::Title;
        condition.pattern = *v;
        ++fields;
    }
    if (auto v = read_string(tbl, "process", context))
    {
        condition.field = MatchField::Process;
        condition.pattern = *v;
        ++fields;
    }
    if (auto v = read_string(tbl, "class", context))
    {
        condition.field = MatchField::Class;
        condition.pattern = *v;
        ++fields;
    }

    if (fields != 1)
    {
        throw ConfigError(context + ": a condition must name exactly one of 'title', 'process' or 'class'");
    }
    if (condition.pattern.empty() || condition.pattern == REGEX_PREFIX)
    {
        throw ConfigError(context + ": condition pattern is empty");
    }

    condition.case_sensitive = read_bool(tbl, "case_sensitive", context).value_or(false);
    return condition;
}

std::vector<ConditionConfig> parse_condition_list(toml::table const& tbl, std::string const& context)
{
    auto const* node = tbl.get("conditions");
    auto const* array = node ? node->as_array() : nullptr;
    if (!array)
    {
        throw ConfigError(context + ": 'conditions' must be an array of tables");
    }
    if (array->empty())
    {
        throw ConfigError(context + ": 'conditions' must contain at least one condition");
    }

    std::vector<ConditionConfig> conditions;
    size_t index = 0;
    for (auto const& item : *array)
    {
        std::string item_context = context + ".conditions[" + std::to_string(index++) + "]";
        auto const* condition = item.as_table();
        if (!condition)
        {
            throw ConfigError(item_context + ": expected a table");
        }
        conditions.push_back(parse_condition(*condition, item_context));
    }
    return conditions;
}

// A rule condition is either a single condition table or a {logic, conditions} group
ConditionGroupConfig parse_rule_condition(toml::table const& tbl, std::string const& context)
{
    ConditionGroupConfig group;
    if (tbl.contains("conditions"))
    {
        check_keys(tbl, { "logic", "conditions" }, context);
        group.logic = read_logic(tbl, MatchLogic::And, context);
        group.conditions = parse_condition_list(tbl, context);
        return group;
    }

    group.logic = MatchLogic::And;
    group.conditions.push_back(parse_condition(tbl, context));
    return group;
}

MoveTarget parse_move_to(toml::node const& node, std::string const& context)
{
    if (auto name = node.value<std::string>())
    {
        if (auto anchor = parse_anchor(*name))
            return *anchor;
        throw ConfigError(context + ": unknown anchor point '" + *name + "'");
    }

    auto const* tbl = node.as_table();
    if (!tbl)
    {
        throw ConfigError(context + ": move_to must be an anchor name or an {x, y} table");
    }

    check_keys(*tbl, { "x", "y" }, context);
    auto const* x = tbl->get("x");
    auto const* y = tbl->get("y");
    if (!x || !y)
    {
        throw ConfigError(context + ": move_to coordinates require both 'x' and 'y'");
    }
    return CoordinateTarget{ read_length(*x, context + ".x"), read_length(*y, context + ".y") };
}

SizeTarget parse_resize_to(toml::table const& tbl, std::string const& context)
{
    check_keys(tbl, { "width", "height", "w", "h" }, context);

    SizeTarget size;
    // Long names win over the w/h aliases when both are present
    if (auto const* node = tbl.get("width"))
        size.width = read_length(*node, context + ".width");
    else if (auto const* alias = tbl.get("w"))
        size.width = read_length(*alias, context + ".w");

    if (auto const* node = tbl.get("height"))
        size.height = read_length(*node, context + ".height");
    else if (auto const* alias = tbl.get("h"))
        size.height = read_length(*alias, context + ".h");

    return size;
}

ActionConfig parse_action(toml::table const& tbl, std::string const& context)
{
    check_keys(
        tbl,
        { "anchor",
          "move_to",
          "resize_to",
          "offset",
          "target_monitor",
          "target_workspace",
          "maximize",
          "minimize",
          "execution_delay" },
        context
    );

    ActionConfig action;

    if (auto name = read_string(tbl, "anchor", context))
    {
        action.anchor = parse_anchor(*name);
        if (!action.anchor)
            throw ConfigError(context + ": unknown anchor point '" + *name + "'");
    }

    if (auto const* node = tbl.get("move_to"))
        action.move_to = parse_move_to(*node, context + ".move_to");

    if (auto const* resize = read_table(tbl, "resize_to", context))
        action.resize_to = parse_resize_to(*resize, context + ".resize_to");

    if (auto const* offset = read_table(tbl, "offset", context))
    {
        std::string offset_context = context + ".offset";
        check_keys(*offset, { "x", "y" }, offset_context);
        PixelOffset delta;
        delta.x = static_cast<int32_t>(read_bounded(*offset, "x", -MAX_PIXELS, MAX_PIXELS, offset_context).value_or(0));
        delta.y = static_cast<int32_t>(read_bounded(*offset, "y", -MAX_PIXELS, MAX_PIXELS, offset_context).value_or(0));
        action.offset = delta;
    }

    if (auto v = read_integer(tbl, "target_monitor", context))
    {
        if (*v < 1)
            throw ConfigError(context + ": target_monitor is 1-based");
        if (*v > MAX_INDEX)
            throw ConfigError(context + ": target_monitor must be at most " + std::to_string(MAX_INDEX));
        action.target_monitor = static_cast<int>(*v);
    }
    if (auto v = read_integer(tbl, "target_workspace", context))
    {
        if (*v < 1)
            throw ConfigError(context + ": target_workspace is 1-based");
        if (*v > MAX_INDEX)
            throw ConfigError(context + ": target_workspace must be at most " + std::to_string(MAX_INDEX));
        action.target_workspace = static_cast<int>(*v);
    }

    action.maximize = read_switch(tbl, "maximize", context);
    action.minimize = read_switch(tbl, "minimize", context);

    if (auto v = read_integer(tbl, "execution_delay", context))
    {
        if (*v < 0)
            throw ConfigError(context + ": execution_delay must not be negative");
        if (*v > MAX_DELAY_MS)
            throw ConfigError(context + ": execution_delay must be at most " + std::to_string(MAX_DELAY_MS) + "ms");
        action.execution_delay_ms = static_cast<uint32_t>(*v);
    }

    return action;
}

MonitorOffset parse_monitor_offset(toml::table const& tbl, std::string const& context)
{
    check_keys(tbl, { "top", "bottom", "left", "right" }, context);
    MonitorOffset offset;
    offset.top = static_cast<int32_t>(read_bounded(tbl, "top", -MAX_PIXELS, MAX_PIXELS, context).value_or(0));
    offset.bottom = static_cast<int32_t>(read_bounded(tbl, "bottom", -MAX_PIXELS, MAX_PIXELS, context).value_or(0));
    offset.left = static_cast<int32_t>(read_bounded(tbl, "left", -MAX_PIXELS, MAX_PIXELS, context).value_or(0));
    offset.right = static_cast<int32_t>(read_bounded(tbl, "right", -MAX_PIXELS, MAX_PIXELS, context).value_or(0));
    return offset;
}

// Keys are "default" or "monitor_N" with N >= 1
std::optional<size_t> parse_monitor_key(std::string_view key)
{
    constexpr std::string_view prefix = "monitor_";
    if (!key.starts_with(prefix))
        return std::nullopt;

    auto digits = key.substr(prefix.size());
    if (digits.empty() || digits.front() == '0')
        return std::nullopt;

    size_t number = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
        return std::nullopt;
    return number;
}

GlobalConfig parse_global(toml::table const& tbl)
{
    std::string const context = "global";
    check_keys(
        tbl,
        { "log_level",
          "apply_on_startup",
          "apply_on_reload",
          "apply_on_resume",
          "recheck_on_title_change",
          "cleanup_interval_seconds",
          "polling_interval",
          "monitor_offsets" },
        context
    );

    GlobalConfig global;

    if (auto v = read_string(tbl, "log_level", context))
    {
        std::string upper = to_upper(*v);
        if (upper != "DEBUG" && upper != "INFO" && upper != "WARNING" && upper != "ERROR")
            throw ConfigError(context + ": log_level must be DEBUG, INFO, WARNING or ERROR");
        global.log_level = upper;
    }

    global.apply_on_startup = read_bool(tbl, "apply_on_startup", context).value_or(global.apply_on_startup);
    global.apply_on_reload = read_bool(tbl, "apply_on_reload", context).value_or(global.apply_on_reload);
    global.apply_on_resume = read_bool(tbl, "apply_on_resume", context).value_or(global.apply_on_resume);
    global.recheck_on_title_change =
        read_bool(tbl, "recheck_on_title_change", context).value_or(global.recheck_on_title_change);

    if (auto v = read_integer(tbl, "cleanup_interval_seconds", context))
    {
        if (*v < 1)
            throw ConfigError(context + ": cleanup_interval_seconds must be positive");
        if (*v > MAX_INTERVAL_SECONDS)
            throw ConfigError(context + ": cleanup_interval_seconds must be at most " + std::to_string(MAX_INTERVAL_SECONDS));
        global.cleanup_interval_seconds = static_cast<uint32_t>(*v);
    }

    if (auto v = read_bounded(tbl, "polling_interval", 0, MAX_INTERVAL_SECONDS * 1000, context))
    {
        global.polling_interval_ms = static_cast<uint32_t>(std::max<int64_t>(100, *v));
    }

    if (auto const* offsets = read_table(tbl, "monitor_offsets", context))
    {
        for (auto const& [key, node] : *offsets)
        {
            std::string offset_context = context + ".monitor_offsets." + std::string(key.str());
            auto const* entry = node.as_table();
            if (!entry)
                throw ConfigError(offset_context + ": expected a table");

            if (key.str() == "default")
            {
                global.monitor_offsets.default_offset = parse_monitor_offset(*entry, offset_context);
            }
            else if (auto number = parse_monitor_key(key.str()))
            {
                global.monitor_offsets.per_monitor[*number] = parse_monitor_offset(*entry, offset_context);
            }
            else
            {
                throw ConfigError(
                    context + ".monitor_offsets: invalid key '" + std::string(key.str())
                    + "' (expected 'default' or 'monitor_N' with N >= 1)"
                );
            }
        }
    }

    return global;
}

toml::array const* read_entry_array(toml::table const& root, std::string_view key)
{
    auto const* node = root.get(key);
    if (!node)
        return nullptr;
    if (auto const* array = node->as_array())
        return array;
    throw ConfigError("'" + std::string(key) + "' must be an array of tables");
}

} // namespace

std::optional<AnchorPoint> parse_anchor(std::string_view name)
{
    for (auto const& [text, anchor] : ANCHOR_NAMES)
    {
        if (text == name)
            return anchor;
    }
    return std::nullopt;
}

std::string_view anchor_name(AnchorPoint anchor)
{
    for (auto const& [text, value] : ANCHOR_NAMES)
    {
        if (value == anchor)
            return text;
    }
    return "TopLeft";
}

std::optional<Length> parse_length(std::string_view text)
{
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;

    if (value.ends_with('%'))
    {
        auto number = parse_number(trim(std::string_view(value).substr(0, value.size() - 1)));
        if (!number)
            return std::nullopt;
        return Length::percent(*number);
    }

    if (value.ends_with("px"))
    {
        value = trim(std::string_view(value).substr(0, value.size() - 2));
    }

    auto number = parse_number(value);
    if (!number)
        return std::nullopt;
    return Length::pixels(*number);
}

bool Length::in_range() const
{
    if (!std::isfinite(value))
        return false;
    double limit = unit == Unit::Percent ? MAX_PERCENT : static_cast<double>(MAX_PIXELS);
    return std::abs(value) <= limit;
}

AnchorPoint ActionConfig::effective_anchor() const
{
    if (anchor)
        return *anchor;
    if (move_to && std::holds_alternative<AnchorPoint>(*move_to))
        return AnchorPoint::MiddleCenter;
    return AnchorPoint::TopLeft;
}

MonitorOffset const& MonitorOffsetsConfig::for_monitor(size_t index) const
{
    auto it = per_monitor.find(index + 1);
    return it != per_monitor.end() ? it->second : default_offset;
}

Config default_config()
{
    return Config{};
}

Config parse_config(std::string_view text)
{
    toml::table root;
    try
    {
        root = toml::parse(text);
    }
    catch (toml::parse_error const& err)
    {
        std::ostringstream message;
        message << err.description() << " (line " << err.source().begin.line << ", column "
                << err.source().begin.column << ")";
        throw ConfigError(message.str());
    }

    check_keys(root, { "global", "ignores", "rules" }, "config");

    Config cfg = default_config();

    if (auto const* global = read_table(root, "global", "config"))
    {
        cfg.global = parse_global(*global);
    }

    if (auto const* ignores = read_entry_array(root, "ignores"))
    {
        size_t index = 0;
        for (auto const& item : *ignores)
        {
            std::string context = "ignores[" + std::to_string(index++) + "]";
            auto const* tbl = item.as_table();
            if (!tbl)
                throw ConfigError(context + ": expected a table");
            check_keys(*tbl, { "name", "logic", "conditions" }, context);

            IgnoreConfig ignore;
            ignore.name = read_string(*tbl, "name", context).value_or(context);
            ignore.group.logic = read_logic(*tbl, MatchLogic::Or, context);
            ignore.group.conditions = parse_condition_list(*tbl, context);
            cfg.ignores.push_back(std::move(ignore));
        }
    }

    if (auto const* rules = read_entry_array(root, "rules"))
    {
        size_t index = 0;
        for (auto const& item : *rules)
        {
            std::string context = "rules[" + std::to_string(index++) + "]";
            auto const* tbl = item.as_table();
            if (!tbl)
                throw ConfigError(context + ": expected a table");
            check_keys(*tbl, { "name", "condition", "action" }, context);

            RuleConfig rule;
            rule.name = read_string(*tbl, "name", context).value_or("");
            if (rule.name.empty())
                throw ConfigError(context + ": 'name' is required");
            context = "rule '" + rule.name + "'";

            auto const* condition = read_table(*tbl, "condition", context);
            if (!condition)
                throw ConfigError(context + ": 'condition' is required");
            rule.condition = parse_rule_condition(*condition, context + ".condition");

            auto const* action = read_table(*tbl, "action", context);
            if (!action)
                throw ConfigError(context + ": 'action' is required");
            rule.action = parse_action(*action, context + ".action");

            cfg.rules.push_back(std::move(rule));
        }
    }

    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        LOG_ERROR("Config file '{}' could not be opened", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try
    {
        Config cfg = parse_config(buffer.str());
        LOG_INFO(
            "Loaded config from {}: {} ignore entries, {} rules",
            path,
            cfg.ignores.size(),
            cfg.rules.size()
        );
        return cfg;
    }
    catch (ConfigError const& err)
    {
        LOG_ERROR("Config error in {}: {}", path, err.what());
        return std::nullopt;
    }
}

} // namespace winplace
