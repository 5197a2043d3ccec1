// src/reactions/rules/ConditionEvaluator.cpp
#include "reactions/rules/ConditionEvaluator.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <string_view>

namespace reactions {

namespace {

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

} // namespace

bool Evaluate(const Condition& c, const FactSnapshot& facts, const ConditionToggles& toggles)
{
    if (c.malformed)
    {
        spdlog::debug("Condition for target '{}' is malformed ({}); treating as non-matching.",
                      facts.targetId, c.malformedReason);
        return false;
    }

    // --- Actor type ---
    if (!c.characterType.empty() && !c.characterType.contains(ActorTypeName(facts.actorType)))
        return false;

    if (c.petType && facts.petType != *c.petType)
        return false;

    // --- Character-only facts ---
    if (facts.isCharacter)
    {
        if (c.name && facts.targetId != *c.name)
            return false;
        if (c.isSpouse && facts.isSpouse != *c.isSpouse)
            return false;
        if (c.isDateable && facts.isDateable != *c.isDateable)
            return false;

        if (toggles.friendship)
        {
            if (c.friendshipAtLeast && facts.relationship < *c.friendshipAtLeast)
                return false;
            if (c.friendshipBelow && facts.relationship >= *c.friendshipBelow)
                return false;
        }
    }
    else if (c.RequiresCharacter())
    {
        return false;
    }

    if (c.isBaby && facts.IsBaby() != *c.isBaby)
        return false;

    // --- World state ---
    if (toggles.season && c.season && !EqualsI(facts.season, *c.season))
        return false;

    if (toggles.weather && c.weather && !EqualsI(facts.weather, *c.weather))
        return false;

    return true;
}

bool Evaluate(const std::optional<Condition>& condition, const FactSnapshot& facts, const ConditionToggles& toggles)
{
    if (!condition)
        return true;
    return Evaluate(*condition, facts, toggles);
}

} // namespace reactions
