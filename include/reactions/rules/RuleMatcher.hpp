#pragma once
// include/reactions/rules/RuleMatcher.hpp
//
// First-match search. Rules are tried in authored order and the first one whose
// condition holds wins; there is no scoring or ranking. Rule authors encode
// specificity by putting narrower rules first.

#include "reactions/rules/ConditionEvaluator.hpp"
#include "reactions/rules/Rules.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace reactions {

template <class RuleT>
[[nodiscard]] const RuleT* FindFirstMatch(const std::vector<RuleT>& rules,
                                          const FactSnapshot& facts,
                                          const ConditionToggles& toggles = {})
{
    for (const RuleT& rule : rules)
    {
        if (rule.IsMalformed())
        {
            spdlog::debug("Skipping malformed rule #{} for target '{}'.",
                          static_cast<std::size_t>(&rule - rules.data()), facts.targetId);
            continue;
        }

        if (Evaluate(rule.conditions, facts, toggles))
            return &rule;
    }
    return nullptr;
}

// Position of `match` inside `rules`, for diagnostics.
template <class RuleT>
[[nodiscard]] std::size_t RuleIndex(const std::vector<RuleT>& rules, const RuleT* match) noexcept
{
    return static_cast<std::size_t>(match - rules.data());
}

} // namespace reactions
