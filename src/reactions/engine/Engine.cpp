// src/reactions/engine/Engine.cpp
#include "reactions/engine/Engine.hpp"

#include "reactions/rules/RuleMatcher.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <sstream>

namespace reactions {

namespace {

rng::Pcg32 MakeRng(const std::optional<rng::Seed>& seed)
{
    return seed ? rng::Pcg32(*seed) : rng::Pcg32::FromEntropy();
}

void DescribeAction(std::ostringstream& os, const Action& a)
{
    os << "emote=" << json(a.emote).dump() << " text=" << json(a.displayText).dump();
}

} // namespace

// ---------- InspectReport ----------
std::string InspectReport::Describe() const
{
    std::ostringstream os;
    os << "Inspect '" << signal << "' from '" << initiator << "' at '" << target << "'\n";

    if (!facts)
    {
        os << "  no facts available for target\n";
        return os.str();
    }

    const FactSnapshot& f = *facts;
    os << "  type=" << ActorTypeName(f.actorType)
       << " pet=" << f.petType
       << " character=" << (f.isCharacter ? "yes" : "no")
       << " spouse=" << (f.isSpouse ? "yes" : "no")
       << " dateable=" << (f.isDateable ? "yes" : "no")
       << " baby=" << (f.IsBaby() ? "yes" : "no") << '\n';
    os << "  relationship=" << f.relationship
       << " season=" << f.season
       << " weather=" << f.weather
       << " distance=" << f.distanceTiles
       << (inRange ? " (in range)" : " (out of range)") << '\n';

    if (!hasRules)
    {
        os << "  no rules for this signal\n";
        return os.str();
    }

    if (reaction && reactionIndex)
    {
        os << "  reaction: rule #" << *reactionIndex << ' ';
        DescribeAction(os, *reaction);
        os << '\n';
    }
    else
    {
        os << "  reaction: none\n";
    }

    if (combo && comboIndex)
    {
        os << "  combo: rule #" << *comboIndex << " trigger=" << comboTriggerCount
           << " streak=" << currentStreak << ' ';
        DescribeAction(os, *combo);
        os << '\n';
    }
    else
    {
        os << "  combo: none\n";
    }

    os << "  busy=" << (busy ? "yes" : "no") << " rewarded_today=" << (rewardedToday ? "yes" : "no") << '\n';
    return os.str();
}

// ---------- Engine ----------
Engine::Engine(const Config& config,
               RuleStore& rules,
               FactProvider& facts,
               const EffectPorts& ports,
               std::optional<rng::Seed> seed)
    : m_config(config)
    , m_rules(rules)
    , m_facts(facts)
    , m_reward(ports.relationships, ports.notifications)
    , m_executor(m_scheduler, m_busy, m_reward, ports, MakeRng(seed))
{
    SetConfig(config);
}

void Engine::SetConfig(const Config& config)
{
    m_config = config;
    m_config.Clamp();

    m_combos.SetTimeout(TimeMs{m_config.comboTimeoutMs});
    m_reward.SetShowNotification(m_config.showFriendshipGainMessage);
    m_executor.Configure(ExecutionSettings::From(m_config));
}

bool Engine::InRange(const FactSnapshot& facts) const noexcept
{
    return facts.distanceTiles <= static_cast<float>(m_config.eventDistance);
}

std::size_t Engine::OnSignal(const ActorId& initiator,
                             const SignalId& signal,
                             const std::vector<ActorId>& nearbyTargets,
                             TimeMs now)
{
    const std::shared_ptr<const RuleSet> rules = m_rules.Snapshot();
    const SignalRules* signalRules = rules ? rules->Find(signal) : nullptr;
    if (!signalRules)
    {
        spdlog::trace("Signal '{}': no rules.", signal);
        return 0;
    }

    std::size_t interactions = 0;
    for (const ActorId& target : nearbyTargets)
    {
        if (target == initiator)
            continue;

        try
        {
            if (ReactTarget(initiator, target, signal, *signalRules, now))
                ++interactions;
        }
        catch (const std::exception& e)
        {
            spdlog::error("Signal '{}' for target '{}' failed: {}", signal, target, e.what());
        }
    }

    if (interactions == 0)
        spdlog::trace("Signal '{}': no one in range or no matching reaction.", signal);

    return interactions;
}

bool Engine::ReactTarget(const ActorId& initiator,
                         const ActorId& target,
                         const SignalId& signal,
                         const SignalRules& signalRules,
                         TimeMs now)
{
    const std::optional<FactSnapshot> facts = m_facts.Snapshot(initiator, target);
    if (!facts || !InRange(*facts))
        return false;

    const ConditionToggles toggles = m_config.Toggles();

    if (m_config.emoteCombo && !signalRules.comboReactions.empty())
    {
        m_combos.Observe(initiator, target, signal, now);

        if (const ComboRule* combo = FindFirstMatch(signalRules.comboReactions, *facts, toggles))
        {
            const int threshold =
                EffectiveTriggerTarget(combo->triggerCount, m_config.comboCountMode, m_config.globalComboTarget);

            if (m_combos.TryTrigger(initiator, target, threshold))
            {
                spdlog::debug("Combo '{}' x{} triggered for '{}' (rule #{}).", signal, threshold, target,
                              RuleIndex(signalRules.comboReactions, combo));
                // The immediate path is skipped even when the target is busy.
                return m_executor.Execute(*facts, combo->action, now, "Combo");
            }
        }
    }

    const ReactionRule* rule = FindFirstMatch(signalRules.reactions, *facts, toggles);
    if (!rule)
        return false;

    return m_executor.Execute(*facts, rule->action, now, "Reaction");
}

void Engine::Tick(TimeMs now)
{
    try
    {
        m_scheduler.Tick(now);
    }
    catch (const std::exception& e)
    {
        spdlog::error("Reaction tick failed: {}", e.what());
    }
}

void Engine::OnDayStarted()
{
    m_reward.ResetDay();
}

RuleLoadResult Engine::ReloadRules()
{
    return m_rules.Reload();
}

RuleLoadResult Engine::ResetRules()
{
    return m_rules.ResetToDefaults();
}

InspectReport Engine::Inspect(const ActorId& initiator, const ActorId& target, const SignalId& signal) const
{
    InspectReport report;
    report.initiator = initiator;
    report.target    = target;
    report.signal    = signal;
    report.busy      = m_busy.IsBusy(target);
    report.rewardedToday = m_reward.Ledger().Contains(initiator, target);

    if (const auto state = m_combos.Peek(initiator, target); state && state->lastSignal == signal)
        report.currentStreak = state->streakCount;

    try
    {
        report.facts = m_facts.Snapshot(initiator, target);
    }
    catch (const std::exception& e)
    {
        spdlog::error("Inspect '{}' for target '{}' failed: {}", signal, target, e.what());
    }
    if (!report.facts)
        return report;

    report.inRange = InRange(*report.facts);

    const std::shared_ptr<const RuleSet> rules = m_rules.Snapshot();
    const SignalRules* signalRules = rules ? rules->Find(signal) : nullptr;
    if (!signalRules)
        return report;

    report.hasRules = true;
    const ConditionToggles toggles = m_config.Toggles();

    if (const ReactionRule* rule = FindFirstMatch(signalRules->reactions, *report.facts, toggles))
    {
        report.reactionIndex = RuleIndex(signalRules->reactions, rule);
        report.reaction      = rule->action;
    }

    if (const ComboRule* combo = FindFirstMatch(signalRules->comboReactions, *report.facts, toggles))
    {
        report.comboIndex        = RuleIndex(signalRules->comboReactions, combo);
        report.combo             = combo->action;
        report.comboTriggerCount =
            EffectiveTriggerTarget(combo->triggerCount, m_config.comboCountMode, m_config.globalComboTarget);
    }

    return report;
}

} // namespace reactions
