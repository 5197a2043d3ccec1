#pragma once
// tools/reaction_console/ConsoleWorld.hpp
//
// A tiny JSON-described world for driving the engine from a terminal. Port
// calls are printed through spdlog instead of being rendered.
//
//   {
//     "Season": "spring", "Weather": "sunny",
//     "Initiators": { "p1": { "Name": "Alex", "FarmName": "Sunny", "Pet": "Rex" } },
//     "Actors": {
//       "abigail": { "DisplayName": "Abigail", "Type": "Villager", "Distance": 1,
//                    "IsDateable": true, "Friendship": { "p1": 2200 } },
//       "rex":     { "Type": "Pet", "PetType": "Dog", "Distance": 2 }
//     }
//   }

#include "reactions/exec/Ports.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reactions::console {

struct ActorEntry {
    std::string                displayName;
    ActorType                  type = ActorType::Villager;
    std::string                petType{kNotAPet};
    bool                       isSpouse   = false;
    bool                       isDateable = false;
    float                      distance   = 1.0f;
    std::optional<std::string> spouse;
    std::map<ActorId, int>     friendship;  // initiator -> points; presence means "met"
};

class ConsoleWorld final : public FactProvider, public RelationshipPort {
public:
    bool LoadFromFile(const std::filesystem::path& path, std::string* outError);

    std::optional<FactSnapshot> Snapshot(const ActorId& initiator, const ActorId& target) override;

    bool HasRecord(const ActorId& initiator, const ActorId& target) override;
    int  Get(const ActorId& initiator, const ActorId& target) override;
    void Grant(const ActorId& initiator, const ActorId& target, int amount) override;

    [[nodiscard]] std::vector<ActorId> ActorIds() const;

private:
    std::string                             m_season = "spring";
    std::string                             m_weather = "sunny";
    std::map<ActorId, InitiatorProfile>     m_initiators;
    std::map<ActorId, ActorEntry>           m_actors;
};

// Prints every effect request.
class LoggingPorts final : public SignalPort,
                           public AnimationPort,
                           public TextPort,
                           public SoundPort,
                           public NotificationPort {
public:
    bool Perform(const ActorId& target, const SignalId& signal) override;
    bool PerformNamed(const ActorId& target, const std::string& animation) override;
    void Show(const ActorId& target, const std::string& text) override;
    void Play(const std::string& effectId) override;
    void Notify(const ActorId& initiator, const std::string& message) override;
};

} // namespace reactions::console
