#include "window_rules.hpp"
#include "winplace/core/log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <variant>

namespace winplace {

namespace {

std::string fold_case(std::string_view text)
{
    std::string result(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string const& subject_for(MatchField field, WindowSnapshot const& window)
{
    switch (field)
    {
        case MatchField::Title:
            return window.title;
        case MatchField::Process:
            return window.process;
        case MatchField::Class:
            return window.wm_class;
    }
    return window.title;
}

char const* field_name(MatchField field)
{
    switch (field)
    {
        case MatchField::Title:
            return "title";
        case MatchField::Process:
            return "process";
        case MatchField::Class:
            return "class";
    }
    return "?";
}

}

CompiledCondition compile_condition(ConditionConfig const& config)
{
    CompiledCondition condition;
    condition.field = config.field;
    condition.case_sensitive = config.case_sensitive;
    condition.source = config.pattern;

    std::string_view pattern = config.pattern;
    if (!pattern.starts_with(REGEX_PREFIX))
    {
        condition.matcher = CompiledCondition::Literal{ config.case_sensitive ? config.pattern : fold_case(pattern) };
        return condition;
    }

    pattern.remove_prefix(REGEX_PREFIX.size());
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (!config.case_sensitive)
    {
        flags |= std::regex::icase;
    }

    try
    {
        condition.matcher = std::regex(std::string(pattern), flags);
    }
    catch (std::regex_error const& e)
    {
        throw ConfigError(
            std::string("invalid regex for ") + field_name(config.field) + " '" + std::string(pattern) + "': " + e.what()
        );
    }
    return condition;
}

CompiledGroup compile_group(ConditionGroupConfig const& config)
{
    CompiledGroup group;
    group.logic = config.logic;
    group.conditions.reserve(config.conditions.size());
    for (auto const& condition : config.conditions)
    {
        group.conditions.push_back(compile_condition(condition));
    }
    return group;
}

bool condition_matches(CompiledCondition const& condition, WindowSnapshot const& window)
{
    std::string const& subject = subject_for(condition.field, window);

    if (auto const* regex = std::get_if<std::regex>(&condition.matcher))
    {
        return std::regex_search(subject, *regex);
    }

    auto const& literal = std::get<CompiledCondition::Literal>(condition.matcher).text;
    std::string folded;
    std::string const& text = condition.case_sensitive ? subject : (folded = fold_case(subject));

    if (condition.field == MatchField::Process)
    {
        return text == literal;
    }
    return text.find(literal) != std::string::npos;
}

bool group_matches(CompiledGroup const& group, WindowSnapshot const& window)
{
    auto matches = [&window](CompiledCondition const& c) { return condition_matches(c, window); };

    if (group.logic == MatchLogic::Or)
    {
        return std::ranges::any_of(group.conditions, matches);
    }
    return std::ranges::all_of(group.conditions, matches);
}

void RuleSet::validate_action(RuleConfig const& rule)
{
    auto const& action = rule.action;
    if (action.maximize.value_or(false) && action.minimize.value_or(false))
    {
        throw ConfigError("rule '" + rule.name + "': maximize and minimize cannot both be ON");
    }

    if (action.resize_to)
    {
        for (auto const& length : { action.resize_to->width, action.resize_to->height })
        {
            if (length && length->value <= 0.0)
            {
                throw ConfigError("rule '" + rule.name + "': resize_to dimensions must be positive");
            }
            if (length && !length->in_range())
            {
                throw ConfigError("rule '" + rule.name + "': resize_to dimension out of range");
            }
        }
    }

    if (action.move_to)
    {
        if (auto const* coords = std::get_if<CoordinateTarget>(&*action.move_to))
        {
            if (!coords->x.in_range() || !coords->y.in_range())
                throw ConfigError("rule '" + rule.name + "': move_to coordinate out of range");
        }
    }

    if (action.offset && (std::abs(action.offset->x) > MAX_PIXELS || std::abs(action.offset->y) > MAX_PIXELS))
    {
        throw ConfigError("rule '" + rule.name + "': offset out of range");
    }
}

RuleSet RuleSet::compile(std::vector<IgnoreConfig> const& ignores, std::vector<RuleConfig> const& rules)
{
    RuleSet set;
    set.ignores_.reserve(ignores.size());
    set.rules_.reserve(rules.size());

    for (auto const& cfg : ignores)
    {
        try
        {
            set.ignores_.push_back(CompiledIgnore{ cfg.name, compile_group(cfg.group) });
        }
        catch (ConfigError const& e)
        {
            throw ConfigError("ignore '" + cfg.name + "': " + e.what());
        }
    }

    for (auto const& cfg : rules)
    {
        validate_action(cfg);
        try
        {
            set.rules_.push_back(CompiledRule{ cfg.name, compile_group(cfg.condition), cfg.action });
        }
        catch (ConfigError const& e)
        {
            throw ConfigError("rule '" + cfg.name + "': " + e.what());
        }
    }

    LOG_DEBUG("Compiled {} ignore entries and {} rules", set.ignores_.size(), set.rules_.size());
    return set;
}

Classification RuleSet::classify(WindowSnapshot const& window) const
{
    Classification result;

    for (auto const& ignore : ignores_)
    {
        if (group_matches(ignore.group, window))
        {
            LOG_TRACE("Window {:#x} '{}' ignored by '{}'", window.handle, window.title, ignore.name);
            result.kind = Classification::Kind::Ignored;
            result.ignore = &ignore;
            return result;
        }
    }

    // First match wins
    for (auto const& rule : rules_)
    {
        if (!group_matches(rule.condition, window))
        {
            continue;
        }

        LOG_TRACE("Window {:#x} '{}' matched rule '{}'", window.handle, window.title, rule.name);
        result.kind = Classification::Kind::Matched;
        result.rule = &rule;
        return result;
    }

    return result;
}

} // namespace winplace
