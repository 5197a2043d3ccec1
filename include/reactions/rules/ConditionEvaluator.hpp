#pragma once
// include/reactions/rules/ConditionEvaluator.hpp

#include "reactions/rules/Facts.hpp"
#include "reactions/rules/Rules.hpp"

#include <optional>

namespace reactions {

// Configuration switches that blank out whole condition families for every
// rule. A disabled family is ignored even when a rule authors it.
struct ConditionToggles {
    bool season     = true;
    bool weather    = true;
    bool friendship = true;
};

// Pure predicate: every set field must hold (short-circuit AND).
// A missing condition block always matches; a malformed one never does.
[[nodiscard]] bool Evaluate(const Condition& condition,
                            const FactSnapshot& facts,
                            const ConditionToggles& toggles = {});

[[nodiscard]] bool Evaluate(const std::optional<Condition>& condition,
                            const FactSnapshot& facts,
                            const ConditionToggles& toggles = {});

} // namespace reactions
