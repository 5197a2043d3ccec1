// src/reactions/reward/RewardGate.cpp
#include "reactions/reward/RewardGate.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace reactions {

// ---------- RewardLedger ----------
bool RewardLedger::Contains(const ActorId& initiator, const ActorId& target) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_rewarded.find(initiator);
    return it != m_rewarded.end() && it->second.count(target) != 0;
}

bool RewardLedger::TryReserve(const ActorId& initiator, const ActorId& target)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rewarded[initiator].insert(target).second;
}

void RewardLedger::Release(const ActorId& initiator, const ActorId& target)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_rewarded.find(initiator);
    if (it == m_rewarded.end())
        return;
    it->second.erase(target);
    if (it->second.empty())
        m_rewarded.erase(it);
}

void RewardLedger::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rewarded.clear();
}

std::size_t RewardLedger::CountFor(const ActorId& initiator) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_rewarded.find(initiator);
    return it == m_rewarded.end() ? 0 : it->second.size();
}

// ---------- RewardRequest ----------
RewardRequest RewardRequest::From(const FactSnapshot& facts, int amount)
{
    RewardRequest r;
    r.initiator         = facts.initiatorId;
    r.target            = facts.targetId;
    r.targetDisplayName = facts.DisplayName();
    r.amount            = amount;
    r.companion         = facts.IsCompanion();
    r.initiatorLocal    = facts.initiator.isLocal;
    return r;
}

// ---------- RewardGate ----------
bool RewardGate::TryGrant(const RewardRequest& req)
{
    if (req.amount <= 0 || !m_relationships)
        return false;

    // No reward for someone the initiator has never met, companions excepted.
    if (!req.companion && !m_relationships->HasRecord(req.initiator, req.target))
        return false;

    if (!m_ledger.TryReserve(req.initiator, req.target))
        return false;

    try
    {
        m_relationships->Grant(req.initiator, req.target, req.amount);
    }
    catch (...)
    {
        m_ledger.Release(req.initiator, req.target);
        throw;
    }

    if (m_showNotification && req.initiatorLocal && m_notifications)
    {
        const std::string& who = req.targetDisplayName.empty() ? req.target : req.targetDisplayName;
        try
        {
            m_notifications->Notify(req.initiator, "+" + std::to_string(req.amount) + " " + who);
        }
        catch (const std::exception& e)
        {
            spdlog::warn("Reward notification for '{}' failed: {}", req.target, e.what());
        }
    }

    return true;
}

bool RewardGate::TryGrant(const ActorId& initiator, const ActorId& target, int amount)
{
    RewardRequest req;
    req.initiator = initiator;
    req.target    = target;
    req.amount    = amount;
    return TryGrant(req);
}

void RewardGate::ResetDay()
{
    m_ledger.Clear();
    spdlog::debug("Daily reward ledger cleared.");
}

} // namespace reactions
