#pragma once
// include/reactions/engine/Engine.hpp
//
// Entry point for hosts. Owns the per-session state (combo streaks, busy
// targets, reward ledger, pending reaction tasks) and routes each signal
// through matching and execution.
//
// Typical host loop:
//
//   reactions::Engine engine(cfg, store, facts, ports);
//   ...
//   engine.OnSignal(playerId, "heart", nearbyIds, now);   // on input
//   engine.Tick(now);                                     // every frame
//   engine.OnDayStarted();                                // at day boundary

#include "reactions/combo/ComboTracker.hpp"
#include "reactions/core/Config.hpp"
#include "reactions/core/Rng.hpp"
#include "reactions/exec/ActionExecutor.hpp"
#include "reactions/exec/BusyRegistry.hpp"
#include "reactions/exec/Ports.hpp"
#include "reactions/exec/TaskScheduler.hpp"
#include "reactions/reward/RewardGate.hpp"
#include "reactions/rules/RuleStore.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace reactions {

// What a signal would do for one target right now, without doing it.
struct InspectReport {
    ActorId  initiator;
    ActorId  target;
    SignalId signal;

    std::optional<FactSnapshot> facts;   // nullopt: target unknown
    bool                        inRange = false;
    bool                        hasRules = false;

    std::optional<std::size_t> reactionIndex;  // first matching immediate rule
    std::optional<Action>      reaction;

    std::optional<std::size_t> comboIndex;     // first matching combo rule
    std::optional<Action>      combo;
    int                        comboTriggerCount = 0;
    int                        currentStreak     = 0;

    bool busy             = false;
    bool rewardedToday    = false;

    // Multi-line, human readable.
    [[nodiscard]] std::string Describe() const;
};

class Engine {
public:
    Engine(const Config& config,
           RuleStore& rules,
           FactProvider& facts,
           const EffectPorts& ports,
           std::optional<rng::Seed> seed = std::nullopt);

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    // Processes one signal from `initiator` against every nearby target and
    // returns how many reactions were scheduled. Never throws.
    std::size_t OnSignal(const ActorId& initiator,
                         const SignalId& signal,
                         const std::vector<ActorId>& nearbyTargets,
                         TimeMs now);

    // Advances pending reactions. Never throws.
    void Tick(TimeMs now);

    // Day boundary: clears the reward ledger.
    void OnDayStarted();

    // Rule maintenance. Combo streaks, busy targets and the ledger survive.
    RuleLoadResult ReloadRules();
    RuleLoadResult ResetRules();

    void SetConfig(const Config& config);
    [[nodiscard]] const Config& GetConfig() const noexcept { return m_config; }

    [[nodiscard]] InspectReport Inspect(const ActorId& initiator,
                                        const ActorId& target,
                                        const SignalId& signal) const;

    [[nodiscard]] const ComboTracker&  Combos() const noexcept { return m_combos; }
    [[nodiscard]] const RewardGate&    Rewards() const noexcept { return m_reward; }
    [[nodiscard]] const BusyRegistry&  Busy() const noexcept { return m_busy; }
    [[nodiscard]] std::size_t PendingTasks() const noexcept { return m_scheduler.Pending(); }

private:
    bool ReactTarget(const ActorId& initiator,
                     const ActorId& target,
                     const SignalId& signal,
                     const SignalRules& signalRules,
                     TimeMs now);

    [[nodiscard]] bool InRange(const FactSnapshot& facts) const noexcept;

    Config        m_config;
    RuleStore&    m_rules;
    FactProvider& m_facts;

    // Declaration order matters: pending tasks hold leases on m_busy and refer
    // to m_reward, so both must outlive m_scheduler.
    BusyRegistry   m_busy;
    RewardGate     m_reward;
    ComboTracker   m_combos;
    TaskScheduler  m_scheduler;
    ActionExecutor m_executor;
};

} // namespace reactions
