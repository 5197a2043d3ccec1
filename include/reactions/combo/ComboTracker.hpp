#pragma once
// include/reactions/combo/ComboTracker.hpp
//
// Per-(initiator, target) streak state for combo reactions.
//
//   Idle ──signal──▶ Streaking ──count >= threshold──▶ Triggered ──▶ Idle (count 0)
//
// A streak continues only while the same signal repeats within the timeout.
// Timeouts are evaluated lazily when the next signal arrives; there is no
// background expiry. Entries are created on first contact and never erased.

#include "reactions/core/Config.hpp"
#include "reactions/rules/Facts.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace reactions {

struct ComboKey {
    ActorId initiator;
    ActorId target;

    bool operator==(const ComboKey& o) const noexcept
    {
        return initiator == o.initiator && target == o.target;
    }
};

struct ComboKeyHash {
    std::size_t operator()(const ComboKey& k) const noexcept
    {
        const std::size_t a = std::hash<std::string>{}(k.initiator);
        const std::size_t b = std::hash<std::string>{}(k.target);
        return a ^ (b + 0x9E3779B97F4A7C15ull + (a << 6) + (a >> 2));
    }
};

struct ComboState {
    SignalId lastSignal;
    int      streakCount = 0;
    TimeMs   lastTimestamp{0};
};

// Threshold a streak must reach for `rule` under the configured mode.
[[nodiscard]] int EffectiveTriggerTarget(const std::optional<int>& ruleTriggerCount,
                                         ComboCountMode mode,
                                         int globalTarget) noexcept;

class ComboTracker {
public:
    explicit ComboTracker(TimeMs timeout = TimeMs{2100}) : m_timeout(timeout) {}

    void SetTimeout(TimeMs timeout);
    [[nodiscard]] TimeMs Timeout() const;

    // Applies `signal` at `now` and returns the resulting streak count.
    int Observe(const ActorId& initiator, const ActorId& target, const SignalId& signal, TimeMs now);

    // If the streak has reached `threshold`, zeroes it and returns true.
    bool TryTrigger(const ActorId& initiator, const ActorId& target, int threshold);

    [[nodiscard]] std::optional<ComboState> Peek(const ActorId& initiator, const ActorId& target) const;
    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::mutex m_mutex;
    TimeMs             m_timeout;
    std::unordered_map<ComboKey, ComboState, ComboKeyHash> m_states;
};

} // namespace reactions
