// src/reactions/rules/Facts.cpp
#include "reactions/rules/Facts.hpp"

namespace reactions {

const char* ActorTypeName(ActorType t) noexcept
{
    switch (t)
    {
    case ActorType::Villager:   return "Villager";
    case ActorType::Pet:        return "Pet";
    case ActorType::FarmAnimal: return "FarmAnimal";
    case ActorType::Baby:       return "Baby";
    case ActorType::Other:      return "Other";
    }
    return "Other";
}

std::optional<ActorType> ParseActorType(std::string_view name) noexcept
{
    if (name == "Villager")   return ActorType::Villager;
    if (name == "Pet")        return ActorType::Pet;
    if (name == "FarmAnimal") return ActorType::FarmAnimal;
    if (name == "Baby")       return ActorType::Baby;
    if (name == "Other")      return ActorType::Other;
    return std::nullopt;
}

} // namespace reactions
