#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace winplace {

/// Raised for any configuration problem: TOML schema violations, invalid
/// regex patterns, malformed or contradictory actions.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// ─────────────────────────────────────────────────────────────────────────────
// Conditions
// ─────────────────────────────────────────────────────────────────────────────

enum class MatchField
{
    Title,
    Process,
    Class
};

enum class MatchLogic
{
    And,
    Or
};

/// Patterns starting with this prefix are regular expressions, anything else is literal.
constexpr std::string_view REGEX_PREFIX = "regex:";

struct ConditionConfig
{
    MatchField field = MatchField::Title;
    std::string pattern;
    bool case_sensitive = false;
};

struct ConditionGroupConfig
{
    MatchLogic logic = MatchLogic::And;
    std::vector<ConditionConfig> conditions;
};

// ─────────────────────────────────────────────────────────────────────────────
// Actions
// ─────────────────────────────────────────────────────────────────────────────

enum class AnchorPoint
{
    TopLeft,
    TopCenter,
    TopRight,
    MiddleLeft,
    MiddleCenter,
    MiddleRight,
    BottomLeft,
    BottomCenter,
    BottomRight
};

std::optional<AnchorPoint> parse_anchor(std::string_view name);
std::string_view anchor_name(AnchorPoint anchor);

/// A size or coordinate: absolute pixels or a percentage of a reference dimension.
/// Largest magnitude accepted for pixel lengths, coordinates and offsets
constexpr int32_t MAX_PIXELS = 100000;
/// Largest magnitude accepted for percentage lengths
constexpr double MAX_PERCENT = 1000.0;

struct Length
{
    enum class Unit
    {
        Pixels,
        Percent
    };

    Unit unit = Unit::Pixels;
    double value = 0.0;

    static Length pixels(double v) { return { Unit::Pixels, v }; }
    static Length percent(double v) { return { Unit::Percent, v }; }

    /// Finite and within MAX_PIXELS or MAX_PERCENT for its unit.
    bool in_range() const;

    bool operator==(Length const&) const = default;
};

/// Parse "320", "320px" or "50%". Returns nullopt for anything else.
std::optional<Length> parse_length(std::string_view text);

struct CoordinateTarget
{
    Length x;
    Length y;
};

/// move_to is either a named anchor on the work area or explicit coordinates.
using MoveTarget = std::variant<AnchorPoint, CoordinateTarget>;

struct SizeTarget
{
    std::optional<Length> width;
    std::optional<Length> height;
};

struct PixelOffset
{
    int32_t x = 0;
    int32_t y = 0;
};

struct ActionConfig
{
    std::optional<AnchorPoint> anchor;
    std::optional<MoveTarget> move_to;
    std::optional<SizeTarget> resize_to;
    std::optional<PixelOffset> offset;
    std::optional<int> target_monitor;   // 1-based
    std::optional<int> target_workspace; // 1-based
    std::optional<bool> maximize;        // ON / OFF / unset
    std::optional<bool> minimize;
    uint32_t execution_delay_ms = 0;

    /// Window anchor actually used: MiddleCenter when move_to names an anchor and
    /// none was configured, TopLeft otherwise.
    AnchorPoint effective_anchor() const;

    bool changes_geometry() const { return move_to || resize_to || offset || target_monitor; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Rules and ignore entries
// ─────────────────────────────────────────────────────────────────────────────

struct IgnoreConfig
{
    std::string name;
    ConditionGroupConfig group;
};

struct RuleConfig
{
    std::string name;
    ConditionGroupConfig condition;
    ActionConfig action;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global options
// ─────────────────────────────────────────────────────────────────────────────

/// Pixel insets removed from a monitor's work area before anchor/percentage math.
struct MonitorOffset
{
    int32_t top = 0;
    int32_t bottom = 0;
    int32_t left = 0;
    int32_t right = 0;

    bool operator==(MonitorOffset const&) const = default;
};

struct MonitorOffsetsConfig
{
    MonitorOffset default_offset;
    std::map<size_t, MonitorOffset> per_monitor; // keyed by 1-based monitor number

    /// Offset for a 0-based monitor index: per-monitor override, else default.
    MonitorOffset const& for_monitor(size_t index) const;
};

struct GlobalConfig
{
    std::string log_level = "INFO";
    bool apply_on_startup = true;
    bool apply_on_reload = true;
    bool apply_on_resume = false;
    bool recheck_on_title_change = false;
    uint32_t cleanup_interval_seconds = 300;
    uint32_t polling_interval_ms = 1000;
    MonitorOffsetsConfig monitor_offsets;
};

struct Config
{
    GlobalConfig global;
    std::vector<IgnoreConfig> ignores;
    std::vector<RuleConfig> rules;
};

/// Parse a TOML document. Throws ConfigError describing the first problem found.
Config parse_config(std::string_view text);

/// Load and parse a configuration file. Errors are logged; returns nullopt on failure.
std::optional<Config> load_config(std::string const& path);

Config default_config();

} // namespace winplace
