// src/reactions/rules/Rules.cpp
#include "reactions/rules/Rules.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace reactions {

namespace {

template <class T>
bool IsJsonType(const json& v);

template <>
bool IsJsonType<bool>(const json& v) { return v.is_boolean(); }

template <>
bool IsJsonType<int>(const json& v) { return v.is_number_integer(); }

template <>
bool IsJsonType<std::string>(const json& v) { return v.is_string(); }

// Integer values that do not fit an int would wrap on conversion.
bool FitsInt(const json& v)
{
    if (v.is_number_unsigned())
        return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());

    const std::int64_t n = v.get<std::int64_t>();
    return n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max();
}

void MarkMalformed(bool& flag, std::string& reason, const std::string& what)
{
    if (!flag)
        reason = what;
    flag = true;
}

// Reads obj[key] into out. Missing or null keys leave `out` unset.
template <class T>
void ReadOptional(const json& obj, const char* key, std::optional<T>& out,
                  bool& malformed, std::string& reason)
{
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return;

    if (!IsJsonType<T>(*it))
    {
        MarkMalformed(malformed, reason,
                      std::string(key) + ": unexpected type " + it->type_name());
        return;
    }
    if constexpr (std::is_same_v<T, int>)
    {
        if (!FitsInt(*it))
        {
            MarkMalformed(malformed, reason, std::string(key) + ": value out of range " + it->dump());
            return;
        }
    }
    out = it->template get<T>();
}

void ReadChoice(const json& obj, const char* key, OneOrMany<std::string>& out,
                bool& malformed, std::string& reason)
{
    const auto it = obj.find(key);
    if (it == obj.end())
        return;

    try
    {
        it->get_to(out);
    }
    catch (const json::exception& e)
    {
        MarkMalformed(malformed, reason, std::string(key) + ": " + e.what());
    }
}

} // namespace

// ---------- Condition ----------
void from_json(const json& j, Condition& c)
{
    c = Condition{};
    if (!j.is_object())
    {
        MarkMalformed(c.malformed, c.malformedReason,
                      std::string("Conditions: expected an object, got ") + j.type_name());
        return;
    }

    ReadOptional(j, "Name", c.name, c.malformed, c.malformedReason);
    ReadOptional(j, "IsSpouse", c.isSpouse, c.malformed, c.malformedReason);
    ReadOptional(j, "IsDateable", c.isDateable, c.malformed, c.malformedReason);
    ReadOptional(j, "IsBaby", c.isBaby, c.malformed, c.malformedReason);
    ReadOptional(j, "FriendshipGreaterThanOrEqualTo", c.friendshipAtLeast, c.malformed, c.malformedReason);
    ReadOptional(j, "FriendshipLessThan", c.friendshipBelow, c.malformed, c.malformedReason);
    ReadChoice(j, "CharacterType", c.characterType, c.malformed, c.malformedReason);
    ReadOptional(j, "PetType", c.petType, c.malformed, c.malformedReason);
    ReadOptional(j, "Season", c.season, c.malformed, c.malformedReason);
    ReadOptional(j, "Weather", c.weather, c.malformed, c.malformedReason);
}

void to_json(json& j, const Condition& c)
{
    j = json::object();
    if (c.name)              j["Name"] = *c.name;
    if (c.isSpouse)          j["IsSpouse"] = *c.isSpouse;
    if (c.isDateable)        j["IsDateable"] = *c.isDateable;
    if (c.isBaby)            j["IsBaby"] = *c.isBaby;
    if (c.friendshipAtLeast) j["FriendshipGreaterThanOrEqualTo"] = *c.friendshipAtLeast;
    if (c.friendshipBelow)   j["FriendshipLessThan"] = *c.friendshipBelow;
    if (!c.characterType.empty()) j["CharacterType"] = c.characterType;
    if (c.petType)           j["PetType"] = *c.petType;
    if (c.season)            j["Season"] = *c.season;
    if (c.weather)           j["Weather"] = *c.weather;
}

// ---------- Action ----------
void from_json(const json& j, Action& a)
{
    a = Action{};

    // Shorthand: "Action": "happy"
    if (j.is_string())
    {
        a.emote = OneOrMany<std::string>{j.get<std::string>()};
        return;
    }

    if (!j.is_object())
    {
        MarkMalformed(a.malformed, a.malformedReason,
                      std::string("Action: expected a string or an object, got ") + j.type_name());
        return;
    }

    ReadChoice(j, "Emote", a.emote, a.malformed, a.malformedReason);
    ReadChoice(j, "DisplayText", a.displayText, a.malformed, a.malformedReason);
}

void to_json(json& j, const Action& a)
{
    j = json::object();
    if (!a.emote.empty())       j["Emote"] = a.emote;
    if (!a.displayText.empty()) j["DisplayText"] = a.displayText;
}

// ---------- Rules ----------
void from_json(const json& j, ReactionRule& r)
{
    if (!j.is_object())
        throw json::type_error::create(302, std::string("rule must be an object, got ") + j.type_name(), &j);

    r = ReactionRule{};

    if (const auto it = j.find("Conditions"); it != j.end() && !it->is_null())
        r.conditions = it->get<Condition>();

    if (const auto it = j.find("Action"); it != j.end())
        r.action = it->get<Action>();
}

void from_json(const json& j, ComboRule& r)
{
    if (!j.is_object())
        throw json::type_error::create(302, std::string("combo rule must be an object, got ") + j.type_name(), &j);

    r = ComboRule{};

    if (const auto it = j.find("Conditions"); it != j.end() && !it->is_null())
        r.conditions = it->get<Condition>();

    ReadOptional(j, "TriggerCount", r.triggerCount, r.malformed, r.malformedReason);
    if (r.triggerCount && *r.triggerCount < 1)
    {
        MarkMalformed(r.malformed, r.malformedReason,
                      "TriggerCount: must be at least 1, got " + std::to_string(*r.triggerCount));
        r.triggerCount.reset();
    }

    if (const auto it = j.find("Action"); it != j.end())
    {
        // Combo actions are always objects; a bare string is not accepted here.
        if (it->is_string())
            MarkMalformed(r.action.malformed, r.action.malformedReason,
                          "Action: combo actions must be objects");
        else
            r.action = it->get<Action>();
    }
}

} // namespace reactions
