#pragma once
// include/reactions/rules/Facts.hpp
//
// Read-only world/actor facts consumed by the condition evaluator and the
// action pipeline. Everything here is already resolved by the host; the engine
// never derives these values from raw world state.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reactions {

using ActorId  = std::string;
using SignalId = std::string;
using TextKey  = std::string;

// Host-driven time (update-loop clock), in milliseconds.
using TimeMs = std::chrono::milliseconds;

enum class ActorType : std::uint8_t {
    Villager = 0,
    Pet,
    FarmAnimal,
    Baby,
    Other,
};

[[nodiscard]] const char* ActorTypeName(ActorType t) noexcept;
[[nodiscard]] std::optional<ActorType> ParseActorType(std::string_view name) noexcept;

// Pet subtype reported for targets that are not pets.
inline constexpr std::string_view kNotAPet = "NotAPet";

// Facts about the initiating actor that feed dynamic text tokens.
struct InitiatorProfile {
    std::string name;
    std::string farmName;
    std::string favoriteThing;
    std::optional<std::string> petName;
    bool        isMale  = true;
    bool        isLocal = true;
};

struct FactSnapshot {
    ActorId initiatorId;
    ActorId targetId;

    // Display name used in notifications; falls back to targetId when empty.
    std::string targetDisplayName;

    ActorType   actorType = ActorType::Other;
    std::string petType{kNotAPet};

    // True for villagers, pets and babies (the "character" family).
    // Name / spouse / dateable / friendship conditions only apply to these.
    bool isCharacter = false;

    bool isSpouse   = false;
    bool isDateable = false;

    int relationship = 0;

    std::string season;
    std::string weather;

    // Distance between initiator and target, in tiles.
    float distanceTiles = 0.0f;

    // Partner of the reacting target, for the %spouse token.
    std::optional<std::string> speakerSpouseName;

    InitiatorProfile initiator;

    [[nodiscard]] bool IsBaby() const noexcept { return actorType == ActorType::Baby; }
    [[nodiscard]] bool IsCompanion() const noexcept { return actorType == ActorType::Pet; }

    [[nodiscard]] const std::string& DisplayName() const noexcept
    {
        return targetDisplayName.empty() ? targetId : targetDisplayName;
    }
};

} // namespace reactions
