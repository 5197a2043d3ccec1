#pragma once
// include/reactions/reward/RewardGate.hpp
//
// Once-per-day relationship reward for a reacting target.

#include "reactions/exec/Ports.hpp"
#include "reactions/rules/Facts.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace reactions {

// initiator -> targets rewarded today. Cleared at day start, append-only in between.
class RewardLedger {
public:
    [[nodiscard]] bool Contains(const ActorId& initiator, const ActorId& target) const;

    // Checks and records the pair under one lock. Returns false if the pair
    // was already recorded (or reserved) today.
    bool TryReserve(const ActorId& initiator, const ActorId& target);

    // Drops a reservation whose grant did not go through.
    void Release(const ActorId& initiator, const ActorId& target);

    void Clear();

    [[nodiscard]] std::size_t CountFor(const ActorId& initiator) const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<ActorId, std::unordered_set<ActorId>> m_rewarded;
};

struct RewardRequest {
    ActorId     initiator;
    ActorId     target;
    std::string targetDisplayName;
    int         amount = 0;

    // Companions may be rewarded without an existing relationship record.
    bool companion      = false;
    bool initiatorLocal = true;

    [[nodiscard]] static RewardRequest From(const FactSnapshot& facts, int amount);
};

class RewardGate {
public:
    explicit RewardGate(RelationshipPort* relationships, NotificationPort* notifications = nullptr)
        : m_relationships(relationships), m_notifications(notifications) {}

    void SetShowNotification(bool show) noexcept { m_showNotification = show; }

    // Grants `amount` at most once per (initiator, target) per day.
    // Exceptions from the relationship port propagate; the pair stays
    // recorded only if the port call succeeded. Concurrent calls for the
    // same pair grant at most once.
    bool TryGrant(const RewardRequest& request);
    bool TryGrant(const ActorId& initiator, const ActorId& target, int amount);

    // Day boundary.
    void ResetDay();

    [[nodiscard]] const RewardLedger& Ledger() const noexcept { return m_ledger; }

private:
    RelationshipPort* m_relationships;
    NotificationPort* m_notifications;
    bool              m_showNotification = true;
    RewardLedger      m_ledger;
};

} // namespace reactions
