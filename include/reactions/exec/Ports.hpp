#pragma once
// include/reactions/exec/Ports.hpp
//
// Narrow interfaces to the host. The engine never renders, plays audio or
// touches relationship data itself; it only issues requests through these.
// Implementations may throw; the engine catches at step granularity.

#include "reactions/rules/Facts.hpp"

#include <optional>
#include <string>

namespace reactions {

class FactProvider {
public:
    virtual ~FactProvider() = default;

    // nullopt when the target is unknown or not observable right now.
    virtual std::optional<FactSnapshot> Snapshot(const ActorId& initiator, const ActorId& target) = 0;
};

class SignalPort {
public:
    virtual ~SignalPort() = default;

    // Renders a reaction bubble. Returns false for signals the host does not know.
    virtual bool Perform(const ActorId& target, const SignalId& signal) = 0;
};

class AnimationPort {
public:
    virtual ~AnimationPort() = default;

    // Plays a named full-body animation. Returns false for unknown names.
    virtual bool PerformNamed(const ActorId& target, const std::string& animation) = 0;
};

class TextPort {
public:
    virtual ~TextPort() = default;
    virtual void Show(const ActorId& target, const std::string& text) = 0;
};

class RelationshipPort {
public:
    virtual ~RelationshipPort() = default;

    virtual bool HasRecord(const ActorId& initiator, const ActorId& target) = 0;
    virtual int  Get(const ActorId& initiator, const ActorId& target) = 0;
    virtual void Grant(const ActorId& initiator, const ActorId& target, int amount) = 0;
};

class SoundPort {
public:
    virtual ~SoundPort() = default;
    virtual void Play(const std::string& effectId) = 0;
};

// Local-only HUD message (e.g. "+10 Abigail").
class NotificationPort {
public:
    virtual ~NotificationPort() = default;
    virtual void Notify(const ActorId& initiator, const std::string& message) = 0;
};

class Localization {
public:
    virtual ~Localization() = default;

    // Raw localized text for `key`, before token substitution.
    virtual std::string Resolve(const TextKey& key) = 0;
};

// Everything the action pipeline talks to. Optional ports may be null.
struct EffectPorts {
    SignalPort*       signal        = nullptr;
    AnimationPort*    animation     = nullptr;
    TextPort*         text          = nullptr;
    Localization*     localization  = nullptr;
    RelationshipPort* relationships = nullptr;
    SoundPort*        sound         = nullptr;  // optional
    NotificationPort* notifications = nullptr;  // optional
};

} // namespace reactions
