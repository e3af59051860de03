#pragma once

#include "winplace/config/config.hpp"
#include "winplace/core/types.hpp"
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace winplace {

/**
 * @brief Condition compiled once at load time
 *
 * Literal patterns are stored pre-folded for case-insensitive comparison;
 * `regex:` patterns are compiled to std::regex so that an invalid pattern is
 * reported when the rule set is built, never while matching.
 */
struct CompiledCondition
{
    struct Literal
    {
        std::string text;
    };

    MatchField field = MatchField::Title;
    bool case_sensitive = false;
    std::variant<Literal, std::regex> matcher;
    std::string source; // pattern as configured, for diagnostics
};

struct CompiledGroup
{
    MatchLogic logic = MatchLogic::And;
    std::vector<CompiledCondition> conditions;
};

struct CompiledIgnore
{
    std::string name;
    CompiledGroup group;
};

struct CompiledRule
{
    std::string name;
    CompiledGroup condition;
    ActionConfig action;
};

/**
 * @brief Compile a single condition
 * @throws ConfigError if a `regex:` pattern does not compile
 */
CompiledCondition compile_condition(ConditionConfig const& config);

CompiledGroup compile_group(ConditionGroupConfig const& config);

/**
 * @brief Test one condition against a window
 *
 * title/class: literal is substring containment, regex is search-anywhere.
 * process: literal is whole-string equality, regex is search-anywhere.
 */
bool condition_matches(CompiledCondition const& condition, WindowSnapshot const& window);

/**
 * @brief Combine a group's conditions under AND/OR with short-circuiting
 *
 * An empty AND group matches every window; an empty OR group matches none.
 */
bool group_matches(CompiledGroup const& group, WindowSnapshot const& window);

struct Classification
{
    enum class Kind
    {
        Ignored,
        Matched,
        Unmatched
    };

    Kind kind = Kind::Unmatched;
    CompiledRule const* rule = nullptr;       // set when Matched
    CompiledIgnore const* ignore = nullptr;   // set when Ignored
};

/**
 * @brief Ordered ignore-list plus ordered rules
 *
 * The ignore-list is consulted first; then rules in declaration order,
 * first match wins. Instances are immutable once compiled: a reload builds a
 * new RuleSet and swaps it in whole.
 */
class RuleSet
{
public:
    RuleSet() = default;

    /**
     * @brief Validate and compile ignore entries and rules
     *
     * @throws ConfigError on the first invalid regex or contradictory action;
     *         nothing is returned in that case, so the caller keeps its old set.
     */
    static RuleSet compile(std::vector<IgnoreConfig> const& ignores, std::vector<RuleConfig> const& rules);

    Classification classify(WindowSnapshot const& window) const;

    size_t rule_count() const { return rules_.size(); }
    size_t ignore_count() const { return ignores_.size(); }

private:
    std::vector<CompiledIgnore> ignores_;
    std::vector<CompiledRule> rules_;

    static void validate_action(RuleConfig const& rule);
};

} // namespace winplace
