#pragma once
// include/reactions/rules/Rules.hpp
//
// Rule data model. Rules are loaded from JSON (see RuleLoader.hpp) and are
// immutable afterwards; a reload replaces the whole RuleSet.
//
// Field names follow the authored JSON (PascalCase):
//
//   { "Conditions": { "CharacterType": ["Pet", "FarmAnimal"], "Season": "spring" },
//     "Action": { "Emote": ["happy", "heart"], "DisplayText": "reaction.pet.happy" } }
//
// A field with the wrong JSON type does not abort loading: the owning rule is
// flagged malformed and never matches.

#include "reactions/rules/Facts.hpp"
#include "reactions/rules/OneOrMany.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reactions {

using json = nlohmann::json;

struct Condition {
    std::optional<std::string> name;
    std::optional<bool>        isSpouse;
    std::optional<bool>        isDateable;
    std::optional<bool>        isBaby;
    std::optional<int>         friendshipAtLeast;   // FriendshipGreaterThanOrEqualTo
    std::optional<int>         friendshipBelow;     // FriendshipLessThan
    OneOrMany<std::string>     characterType;       // empty: unconstrained
    std::optional<std::string> petType;
    std::optional<std::string> season;
    std::optional<std::string> weather;

    // Set when a field could not be read; the condition then fails closed.
    bool        malformed = false;
    std::string malformedReason;

    // True when the condition references facts only characters carry.
    [[nodiscard]] bool RequiresCharacter() const noexcept
    {
        return name || isSpouse || isDateable || friendshipAtLeast || friendshipBelow;
    }
};

struct Action {
    OneOrMany<std::string> emote;        // signal ids or "anim_<name>"
    OneOrMany<TextKey>     displayText;  // localization keys

    bool        malformed = false;
    std::string malformedReason;

    [[nodiscard]] bool empty() const noexcept { return emote.empty() && displayText.empty(); }
};

// Immediate reaction, fired on the first qualifying signal.
struct ReactionRule {
    std::optional<Condition> conditions;
    Action                   action;

    [[nodiscard]] bool IsMalformed() const noexcept
    {
        return action.malformed || (conditions && conditions->malformed);
    }
};

// Combo reaction, fired once a streak reaches its trigger count.
struct ComboRule {
    std::optional<Condition> conditions;
    std::optional<int>       triggerCount;  // unset: GlobalComboTarget
    Action                   action;

    bool        malformed = false;  // bad TriggerCount
    std::string malformedReason;

    [[nodiscard]] bool IsMalformed() const noexcept
    {
        return malformed || action.malformed || (conditions && conditions->malformed);
    }
};

// All rules authored for one signal.
struct SignalRules {
    std::vector<ReactionRule> reactions;
    std::vector<ComboRule>    comboReactions;
};

class RuleSet {
public:
    RuleSet() = default;
    explicit RuleSet(std::unordered_map<SignalId, SignalRules> bySignal)
        : m_bySignal(std::move(bySignal)) {}

    [[nodiscard]] const SignalRules* Find(const SignalId& signal) const
    {
        const auto it = m_bySignal.find(signal);
        return it == m_bySignal.end() ? nullptr : &it->second;
    }

    [[nodiscard]] std::size_t SignalCount() const noexcept { return m_bySignal.size(); }
    [[nodiscard]] const std::unordered_map<SignalId, SignalRules>& All() const noexcept { return m_bySignal; }

    SignalRules& Upsert(const SignalId& signal) { return m_bySignal[signal]; }

private:
    std::unordered_map<SignalId, SignalRules> m_bySignal;
};

// ---------- JSON ----------
// from_json overloads never throw for wrong field types; they set the
// malformed flags instead. Only a non-object rule entry throws (RuleLoader
// drops that entry).
void from_json(const json& j, Condition& c);
void from_json(const json& j, Action& a);
void from_json(const json& j, ReactionRule& r);
void from_json(const json& j, ComboRule& r);

void to_json(json& j, const Condition& c);
void to_json(json& j, const Action& a);

} // namespace reactions
