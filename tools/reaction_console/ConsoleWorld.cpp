// tools/reaction_console/ConsoleWorld.cpp
#include "ConsoleWorld.hpp"

#include "reactions/core/FileIo.hpp"
#include "reactions/rules/Rules.hpp"

#include <spdlog/spdlog.h>

namespace reactions::console {

namespace {

template <class T>
void ReadIfPresent(const json& j, const char* key, T& out)
{
    if (const auto it = j.find(key); it != j.end() && !it->is_null())
        it->get_to(out);
}

InitiatorProfile ParseInitiator(const json& j)
{
    InitiatorProfile p;
    ReadIfPresent(j, "Name", p.name);
    ReadIfPresent(j, "FarmName", p.farmName);
    ReadIfPresent(j, "FavoriteThing", p.favoriteThing);
    ReadIfPresent(j, "IsMale", p.isMale);
    ReadIfPresent(j, "IsLocal", p.isLocal);
    if (const auto it = j.find("Pet"); it != j.end() && it->is_string())
        p.petName = it->get<std::string>();
    return p;
}

ActorEntry ParseActor(const std::string& id, const json& j)
{
    ActorEntry a;
    ReadIfPresent(j, "DisplayName", a.displayName);

    std::string type = "Villager";
    ReadIfPresent(j, "Type", type);
    if (const auto parsed = ParseActorType(type))
    {
        a.type = *parsed;
    }
    else
    {
        spdlog::warn("World: actor '{}' has unknown type '{}', using Other.", id, type);
        a.type = ActorType::Other;
    }

    ReadIfPresent(j, "PetType", a.petType);
    ReadIfPresent(j, "IsSpouse", a.isSpouse);
    ReadIfPresent(j, "IsDateable", a.isDateable);
    ReadIfPresent(j, "Distance", a.distance);
    if (const auto it = j.find("Spouse"); it != j.end() && it->is_string())
        a.spouse = it->get<std::string>();
    ReadIfPresent(j, "Friendship", a.friendship);
    return a;
}

} // namespace

bool ConsoleWorld::LoadFromFile(const std::filesystem::path& path, std::string* outError)
{
    std::string text;
    std::string err;
    if (!io::read_all(path, text, &err))
    {
        if (outError)
            *outError = err;
        return false;
    }

    const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (doc.is_discarded() || !doc.is_object())
    {
        if (outError)
            *outError = path.string() + " is not a JSON object";
        return false;
    }

    try
    {
        ReadIfPresent(doc, "Season", m_season);
        ReadIfPresent(doc, "Weather", m_weather);

        m_initiators.clear();
        if (const auto it = doc.find("Initiators"); it != doc.end() && it->is_object())
            for (const auto& [id, value] : it->items())
                m_initiators[id] = ParseInitiator(value);

        m_actors.clear();
        if (const auto it = doc.find("Actors"); it != doc.end() && it->is_object())
            for (const auto& [id, value] : it->items())
                m_actors[id] = ParseActor(id, value);
    }
    catch (const json::exception& e)
    {
        if (outError)
            *outError = path.string() + ": " + e.what();
        return false;
    }

    spdlog::info("World: {} initiator(s), {} actor(s), {} / {}.",
                 m_initiators.size(), m_actors.size(), m_season, m_weather);
    return true;
}

std::optional<FactSnapshot> ConsoleWorld::Snapshot(const ActorId& initiator, const ActorId& target)
{
    const auto actor = m_actors.find(target);
    if (actor == m_actors.end())
        return std::nullopt;

    const ActorEntry& a = actor->second;

    FactSnapshot f;
    f.initiatorId       = initiator;
    f.targetId          = target;
    f.targetDisplayName = a.displayName;
    f.actorType         = a.type;
    f.petType           = a.type == ActorType::Pet ? a.petType : std::string(kNotAPet);
    f.isCharacter       = a.type == ActorType::Villager || a.type == ActorType::Pet || a.type == ActorType::Baby;
    f.isSpouse          = a.isSpouse;
    f.isDateable        = a.isDateable;
    f.relationship      = Get(initiator, target);
    f.season            = m_season;
    f.weather           = m_weather;
    f.distanceTiles     = a.distance;
    f.speakerSpouseName = a.spouse;

    if (const auto who = m_initiators.find(initiator); who != m_initiators.end())
        f.initiator = who->second;
    else
        f.initiator.name = initiator;

    return f;
}

bool ConsoleWorld::HasRecord(const ActorId& initiator, const ActorId& target)
{
    const auto it = m_actors.find(target);
    return it != m_actors.end() && it->second.friendship.count(initiator) != 0;
}

int ConsoleWorld::Get(const ActorId& initiator, const ActorId& target)
{
    const auto it = m_actors.find(target);
    if (it == m_actors.end())
        return 0;
    const auto points = it->second.friendship.find(initiator);
    return points == it->second.friendship.end() ? 0 : points->second;
}

void ConsoleWorld::Grant(const ActorId& initiator, const ActorId& target, int amount)
{
    const auto it = m_actors.find(target);
    if (it == m_actors.end())
        return;
    it->second.friendship[initiator] += amount;
    spdlog::info("[friendship] {} <-> {}: {}", initiator, target, it->second.friendship[initiator]);
}

std::vector<ActorId> ConsoleWorld::ActorIds() const
{
    std::vector<ActorId> ids;
    ids.reserve(m_actors.size());
    for (const auto& [id, actor] : m_actors)
        ids.push_back(id);
    return ids;
}

// ---------- LoggingPorts ----------
bool LoggingPorts::Perform(const ActorId& target, const SignalId& signal)
{
    spdlog::info("[emote] {}: {}", target, signal);
    return true;
}

bool LoggingPorts::PerformNamed(const ActorId& target, const std::string& animation)
{
    spdlog::info("[animation] {}: {}", target, animation);
    return true;
}

void LoggingPorts::Show(const ActorId& target, const std::string& text)
{
    spdlog::info("[text] {}: \"{}\"", target, text);
}

void LoggingPorts::Play(const std::string& effectId)
{
    spdlog::info("[sound] {}", effectId);
}

void LoggingPorts::Notify(const ActorId& initiator, const std::string& message)
{
    spdlog::info("[hud:{}] {}", initiator, message);
}

} // namespace reactions::console
