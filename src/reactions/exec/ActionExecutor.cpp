// src/reactions/exec/ActionExecutor.cpp
#include "reactions/exec/ActionExecutor.hpp"

#include "reactions/exec/TextTokens.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace reactions {

ExecutionSettings ExecutionSettings::From(const Config& cfg)
{
    ExecutionSettings s;
    s.emoteDelay        = TimeMs{cfg.emoteDelayMs};
    s.jitterMs          = cfg.reactionJitterMs;
    s.signalToTextPause = TimeMs{cfg.signalToTextPauseMs};
    s.fragmentPause     = TimeMs{cfg.textFragmentPauseMs};
    s.rewardAmount      = cfg.friendshipGainAmount;
    s.playReplySound    = cfg.playReplySound;
    s.replySound        = cfg.replySound;
    return s;
}

namespace {

class ReactionTask final : public ScheduledTask {
public:
    ReactionTask(BusyRegistry::Lease lease,
                 FactSnapshot facts,
                 Action action,
                 std::string kind,
                 const ExecutionSettings& settings,
                 const EffectPorts& ports,
                 RewardGate& reward,
                 rng::Pcg32& rng)
        : m_lease(std::move(lease))
        , m_facts(std::move(facts))
        , m_action(std::move(action))
        , m_kind(std::move(kind))
        , m_settings(settings)
        , m_ports(ports)
        , m_reward(reward)
        , m_rng(rng)
    {}

    std::optional<TimeMs> Resume(TimeMs /*now*/) override
    {
        for (;;)
        {
            switch (m_stage)
            {
            case Stage::Start:
            {
                m_stage = Stage::Signal;
                TimeMs delay = m_settings.emoteDelay;
                if (m_settings.jitterMs > 0)
                    delay += TimeMs{m_rng.next_bounded(static_cast<std::uint32_t>(m_settings.jitterMs))};
                return delay;
            }

            case Stage::Signal:
            {
                m_stage = Stage::Text;
                PerformSignal();
                m_textKey = ResolveChoice(m_action.displayText, m_rng);
                if (m_signalPerformed && m_textKey)
                    return m_settings.signalToTextPause;
                break;
            }

            case Stage::Text:
            {
                m_stage = Stage::Fragments;
                PrepareFragments();
                break;
            }

            case Stage::Fragments:
            {
                if (m_nextFragment < m_fragments.size())
                {
                    ShowFragment(m_fragments[m_nextFragment]);
                    ++m_nextFragment;
                    if (m_nextFragment < m_fragments.size())
                        return m_settings.fragmentPause;
                }
                m_stage = Stage::Finish;
                break;
            }

            case Stage::Finish:
                Finish();
                m_lease.Release();
                return std::nullopt;
            }
        }
    }

private:
    enum class Stage { Start, Signal, Text, Fragments, Finish };

    void PerformSignal()
    {
        m_signal = ResolveChoice(m_action.emote, m_rng);
        if (!m_signal)
            return;

        const std::string_view value = *m_signal;
        try
        {
            if (value.substr(0, kAnimationPrefix.size()) == kAnimationPrefix)
            {
                if (m_ports.animation)
                    m_signalPerformed = m_ports.animation->PerformNamed(
                        m_facts.targetId, std::string(value.substr(kAnimationPrefix.size())));
            }
            else if (m_ports.signal)
            {
                m_signalPerformed = m_ports.signal->Perform(m_facts.targetId, *m_signal);
            }
        }
        catch (const std::exception& e)
        {
            spdlog::warn("{} for '{}': signal '{}' failed: {}", m_kind, m_facts.targetId, *m_signal, e.what());
            m_signalPerformed = false;
        }

        if (!m_signalPerformed)
            spdlog::debug("{} for '{}': signal '{}' was not performed.", m_kind, m_facts.targetId, *m_signal);
    }

    void PrepareFragments()
    {
        if (!m_textKey || !m_ports.text)
            return;

        std::string raw;
        try
        {
            raw = m_ports.localization ? m_ports.localization->Resolve(*m_textKey) : *m_textKey;
        }
        catch (const std::exception& e)
        {
            spdlog::warn("{} for '{}': could not localize '{}': {}", m_kind, m_facts.targetId, *m_textKey, e.what());
            return;
        }

        if (raw.empty())
            return;

        m_fragments = SplitFragments(raw);
    }

    void ShowFragment(const std::string& fragment)
    {
        const std::string text = ExpandTokens(fragment, m_facts);
        try
        {
            m_ports.text->Show(m_facts.targetId, text);
            m_textShown = true;
            if (!m_shownText.empty())
                m_shownText += '|';
            m_shownText += text;
        }
        catch (const std::exception& e)
        {
            spdlog::warn("{} for '{}': showing text failed: {}", m_kind, m_facts.targetId, e.what());
        }
    }

    void Finish()
    {
        if (!m_signalPerformed && !m_textShown)
        {
            spdlog::debug("{} for '{}' produced no output.", m_kind, m_facts.targetId);
            return;
        }

        bool granted = false;
        try
        {
            granted = m_reward.TryGrant(RewardRequest::From(m_facts, m_settings.rewardAmount));
        }
        catch (const std::exception& e)
        {
            spdlog::warn("{} for '{}': reward failed: {}", m_kind, m_facts.targetId, e.what());
        }

        if (granted && m_settings.playReplySound && m_ports.sound)
        {
            try
            {
                m_ports.sound->Play(m_settings.replySound);
            }
            catch (const std::exception& e)
            {
                spdlog::warn("{} for '{}': reply sound '{}' failed: {}", m_kind, m_facts.targetId,
                             m_settings.replySound, e.what());
            }
        }

        spdlog::debug("{} -> target: {}, signal: {}, text: \"{}\", reward: +{}",
                      m_kind,
                      m_facts.targetId,
                      m_signalPerformed ? *m_signal : std::string("-"),
                      m_shownText,
                      granted ? m_settings.rewardAmount : 0);
    }

    BusyRegistry::Lease m_lease;
    FactSnapshot        m_facts;
    Action              m_action;
    std::string         m_kind;
    ExecutionSettings   m_settings;
    EffectPorts         m_ports;
    RewardGate&         m_reward;
    rng::Pcg32&         m_rng;

    Stage                      m_stage = Stage::Start;
    std::optional<std::string> m_signal;
    std::optional<TextKey>     m_textKey;
    std::vector<std::string>   m_fragments;
    std::size_t                m_nextFragment = 0;
    bool                       m_signalPerformed = false;
    bool                       m_textShown = false;
    std::string                m_shownText;
};

} // namespace

ActionExecutor::ActionExecutor(TaskScheduler& scheduler,
                               BusyRegistry& busy,
                               RewardGate& reward,
                               const EffectPorts& ports,
                               rng::Pcg32 rng)
    : m_scheduler(scheduler)
    , m_busy(busy)
    , m_reward(reward)
    , m_ports(ports)
    , m_rng(rng)
{}

bool ActionExecutor::Execute(const FactSnapshot& facts, const Action& action, TimeMs now, std::string_view kind)
{
    auto lease = m_busy.TryAcquire(facts.targetId);
    if (!lease)
    {
        spdlog::trace("'{}' is already reacting; request dropped.", facts.targetId);
        return false;
    }

    m_scheduler.Spawn(std::make_unique<ReactionTask>(std::move(*lease), facts, action, std::string(kind),
                                                     m_settings, m_ports, m_reward, m_rng),
                      now);
    return true;
}

} // namespace reactions
