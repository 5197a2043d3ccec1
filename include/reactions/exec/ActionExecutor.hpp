#pragma once
// include/reactions/exec/ActionExecutor.hpp
//
// Runs a matched rule's action as a timed sequence on the TaskScheduler:
//
//   delay(EmoteDelay + jitter) -> signal/animation -> [pause] -> text fragments
//   (with pauses) -> reward, sound, log
//
// One reaction per target at a time; requests for a busy target are dropped.

#include "reactions/core/Config.hpp"
#include "reactions/core/Rng.hpp"
#include "reactions/exec/BusyRegistry.hpp"
#include "reactions/exec/Ports.hpp"
#include "reactions/exec/TaskScheduler.hpp"
#include "reactions/reward/RewardGate.hpp"
#include "reactions/rules/Rules.hpp"

#include <string>
#include <string_view>

namespace reactions {

// Emote values with this prefix name a full-body animation instead of a signal.
inline constexpr std::string_view kAnimationPrefix = "anim_";

struct ExecutionSettings {
    TimeMs      emoteDelay{700};
    int         jitterMs = 300;           // extra delay drawn from [0, jitterMs)
    TimeMs      signalToTextPause{1200};
    TimeMs      fragmentPause{1800};
    int         rewardAmount = 10;
    bool        playReplySound = true;
    std::string replySound = "pickUpItem";

    [[nodiscard]] static ExecutionSettings From(const Config& cfg);
};

class ActionExecutor {
public:
    ActionExecutor(TaskScheduler& scheduler,
                   BusyRegistry& busy,
                   RewardGate& reward,
                   const EffectPorts& ports,
                   rng::Pcg32 rng = rng::Pcg32::FromEntropy());

    ActionExecutor(const ActionExecutor&)            = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    void Configure(const ExecutionSettings& settings) { m_settings = settings; }
    [[nodiscard]] const ExecutionSettings& Settings() const noexcept { return m_settings; }

    // Schedules `action` for facts.targetId. Returns false when the target is
    // already reacting. `kind` only labels the log line ("Reaction", "Combo").
    bool Execute(const FactSnapshot& facts, const Action& action, TimeMs now,
                 std::string_view kind = "Reaction");

    [[nodiscard]] const BusyRegistry& Busy() const noexcept { return m_busy; }

private:
    TaskScheduler&    m_scheduler;
    BusyRegistry&     m_busy;
    RewardGate&       m_reward;
    EffectPorts       m_ports;
    rng::Pcg32        m_rng;
    ExecutionSettings m_settings;
};

} // namespace reactions
