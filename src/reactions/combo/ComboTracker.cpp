// src/reactions/combo/ComboTracker.cpp
#include "reactions/combo/ComboTracker.hpp"

#include <spdlog/spdlog.h>

namespace reactions {

int EffectiveTriggerTarget(const std::optional<int>& ruleTriggerCount,
                           ComboCountMode mode,
                           int globalTarget) noexcept
{
    if (mode == ComboCountMode::Fixed)
        return globalTarget;
    return ruleTriggerCount.value_or(globalTarget);
}

void ComboTracker::SetTimeout(TimeMs timeout)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timeout = timeout;
}

TimeMs ComboTracker::Timeout() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timeout;
}

int ComboTracker::Observe(const ActorId& initiator, const ActorId& target, const SignalId& signal, TimeMs now)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto [it, inserted] = m_states.try_emplace(ComboKey{initiator, target});
    ComboState& s = it->second;

    if (inserted || s.lastSignal != signal || now - s.lastTimestamp > m_timeout)
    {
        if (!inserted && s.streakCount > 0)
            spdlog::trace("Combo streak {}->{} broken ('{}' x{} -> '{}').",
                          initiator, target, s.lastSignal, s.streakCount, signal);
        s.lastSignal  = signal;
        s.streakCount = 1;
    }
    else
    {
        ++s.streakCount;
    }

    s.lastTimestamp = now;
    return s.streakCount;
}

bool ComboTracker::TryTrigger(const ActorId& initiator, const ActorId& target, int threshold)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto it = m_states.find(ComboKey{initiator, target});
    if (it == m_states.end() || it->second.streakCount < threshold)
        return false;

    it->second.streakCount = 0;
    return true;
}

std::optional<ComboState> ComboTracker::Peek(const ActorId& initiator, const ActorId& target) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto it = m_states.find(ComboKey{initiator, target});
    if (it == m_states.end())
        return std::nullopt;
    return it->second;
}

std::size_t ComboTracker::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_states.size();
}

} // namespace reactions
