#pragma once
//
// Recording fakes for the engine ports. Every call is appended to a vector so
// tests can assert on exact order and arguments.
//
#include "reactions/exec/Ports.hpp"

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace reactions::testing {

struct Emission {
    ActorId     target;
    std::string value;

    bool operator==(const Emission& o) const { return target == o.target && value == o.value; }
};

class FakeFacts final : public FactProvider {
public:
    // Registers `facts` for (facts.initiatorId, facts.targetId).
    void Put(const FactSnapshot& facts) { m_facts[{facts.initiatorId, facts.targetId}] = facts; }

    std::optional<FactSnapshot> Snapshot(const ActorId& initiator, const ActorId& target) override
    {
        ++calls;
        const auto it = m_facts.find({initiator, target});
        if (it == m_facts.end())
            return std::nullopt;
        return it->second;
    }

    int calls = 0;

private:
    std::map<std::pair<ActorId, ActorId>, FactSnapshot> m_facts;
};

class FakeSignals final : public SignalPort {
public:
    bool Perform(const ActorId& target, const SignalId& signal) override
    {
        if (throwOnPerform)
            throw std::runtime_error("signal port exploded");
        if (unknown.count(signal) != 0)
            return false;
        performed.push_back({target, signal});
        return true;
    }

    std::set<SignalId>    unknown;
    bool                  throwOnPerform = false;
    std::vector<Emission> performed;
};

class FakeAnimations final : public AnimationPort {
public:
    bool PerformNamed(const ActorId& target, const std::string& animation) override
    {
        played.push_back({target, animation});
        return true;
    }

    std::vector<Emission> played;
};

class FakeText final : public TextPort {
public:
    void Show(const ActorId& target, const std::string& text) override { shown.push_back({target, text}); }

    std::vector<Emission> shown;
};

// Returns the key itself unless a translation was registered.
class FakeLocalization final : public Localization {
public:
    std::string Resolve(const TextKey& key) override
    {
        if (throwOnResolve)
            throw std::runtime_error("no i18n backend");
        const auto it = strings.find(key);
        return it == strings.end() ? key : it->second;
    }

    std::map<TextKey, std::string> strings;
    bool                           throwOnResolve = false;
};

class FakeRelationships final : public RelationshipPort {
public:
    void Meet(const ActorId& initiator, const ActorId& target, int points = 0)
    {
        m_points[{initiator, target}] = points;
    }

    bool HasRecord(const ActorId& initiator, const ActorId& target) override
    {
        return m_points.count({initiator, target}) != 0;
    }

    int Get(const ActorId& initiator, const ActorId& target) override
    {
        const auto it = m_points.find({initiator, target});
        return it == m_points.end() ? 0 : it->second;
    }

    void Grant(const ActorId& initiator, const ActorId& target, int amount) override
    {
        if (throwOnGrant)
            throw std::runtime_error("relationship store offline");
        m_points[{initiator, target}] += amount;
        ++grants;
    }

    bool throwOnGrant = false;
    int  grants       = 0;

private:
    std::map<std::pair<ActorId, ActorId>, int> m_points;
};

class FakeSound final : public SoundPort {
public:
    void Play(const std::string& effectId) override { played.push_back(effectId); }

    std::vector<std::string> played;
};

class FakeNotifications final : public NotificationPort {
public:
    void Notify(const ActorId& initiator, const std::string& message) override
    {
        messages.push_back({initiator, message});
    }

    std::vector<Emission> messages;
};

// All fakes wired together.
struct FakeWorld {
    FakeFacts         facts;
    FakeSignals       signals;
    FakeAnimations    animations;
    FakeText          text;
    FakeLocalization  localization;
    FakeRelationships relationships;
    FakeSound         sound;
    FakeNotifications notifications;

    EffectPorts Ports()
    {
        EffectPorts p;
        p.signal        = &signals;
        p.animation     = &animations;
        p.text          = &text;
        p.localization  = &localization;
        p.relationships = &relationships;
        p.sound         = &sound;
        p.notifications = &notifications;
        return p;
    }
};

// A villager the initiator has already met, standing one tile away.
inline FactSnapshot Villager(const ActorId& initiator, const ActorId& target, int relationship = 0)
{
    FactSnapshot f;
    f.initiatorId   = initiator;
    f.targetId      = target;
    f.actorType     = ActorType::Villager;
    f.isCharacter   = true;
    f.relationship  = relationship;
    f.season        = "spring";
    f.weather       = "sunny";
    f.distanceTiles = 1.0f;
    f.initiator.name          = "Alex";
    f.initiator.farmName      = "Sunny";
    f.initiator.favoriteThing = "Tea";
    return f;
}

inline FactSnapshot PetFacts(const ActorId& initiator, const ActorId& target, const std::string& petType)
{
    FactSnapshot f = Villager(initiator, target);
    f.actorType = ActorType::Pet;
    f.petType   = petType;
    return f;
}

} // namespace reactions::testing
