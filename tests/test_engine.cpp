// tests/test_engine.cpp
//
// End-to-end signal handling through the public Engine API.

#include <doctest/doctest.h>

#include "reactions/core/FileIo.hpp"
#include "reactions/engine/Engine.hpp"
#include "reactions/rules/RuleLoader.hpp"

#include "test_support/FakePorts.h"
#include "test_support/TempDir.h"

using namespace reactions;
using namespace reactions::testing;

namespace {

RuleSet ParseRules(const char* reactions, const char* combos)
{
    RuleLoadResult out;
    REQUIRE(ParseReactionsJson(reactions, "reactions", out));
    REQUIRE(ParseCombosJson(combos, "combos", out));
    REQUIRE(out.ok());
    return out.rules;
}

Config QuietConfig()
{
    Config cfg;
    cfg.reactionJitterMs = 0;
    return cfg;
}

struct EngineRig {
    FakeWorld world;
    RuleStore store;
    Engine    engine;

    explicit EngineRig(const Config& cfg = QuietConfig())
        : engine(cfg, store, world.facts, world.Ports(), rng::Seed{42})
    {}

    void Rules(const char* reactions, const char* combos = "{}")
    {
        store.Replace(ParseRules(reactions, combos));
    }
};

constexpr const char* kHeartRules = R"({
    "heart": { "Reactions": [
        { "Conditions": { "FriendshipGreaterThanOrEqualTo": 2000 }, "Action": "heart-back" },
        { "Action": "question" }
    ] }
})";

constexpr const char* kWaveCombos = R"({
    "wave": { "ComboReactions": [ { "TriggerCount": 3, "Action": { "Emote": "blush" } } ] }
})";

} // namespace

TEST_CASE("engine::OnSignal: close friends get the first matching reaction")
{
    EngineRig rig;
    rig.Rules(kHeartRules);
    rig.world.facts.Put(Villager("p1", "abigail", 2200));

    CHECK(rig.engine.OnSignal("p1", "heart", {"abigail"}, TimeMs{0}) == 1);
    rig.engine.Tick(TimeMs{700});

    REQUIRE(rig.world.signals.performed.size() == 1);
    CHECK(rig.world.signals.performed[0].value == "heart-back");
}

TEST_CASE("engine::OnSignal: strangers fall through to the catch-all rule")
{
    EngineRig rig;
    rig.Rules(kHeartRules);
    rig.world.facts.Put(Villager("p1", "sam", 100));

    CHECK(rig.engine.OnSignal("p1", "heart", {"sam"}, TimeMs{0}) == 1);
    rig.engine.Tick(TimeMs{700});

    REQUIRE(rig.world.signals.performed.size() == 1);
    CHECK(rig.world.signals.performed[0].value == "question");
}

TEST_CASE("engine::OnSignal: three waves trigger the combo and reset the streak")
{
    EngineRig rig;
    rig.Rules("{}", kWaveCombos);
    rig.world.facts.Put(Villager("p1", "abigail"));

    CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{0}) == 0);
    CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{500}) == 0);
    CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{1000}) == 1);

    const auto state = rig.engine.Combos().Peek("p1", "abigail");
    REQUIRE(state.has_value());
    CHECK(state->streakCount == 0);

    rig.engine.Tick(TimeMs{1700});
    REQUIRE(rig.world.signals.performed.size() == 1);
    CHECK(rig.world.signals.performed[0].value == "blush");
}

TEST_CASE("engine::OnSignal: a triggered combo suppresses the immediate reaction")
{
    EngineRig rig;
    rig.Rules(R"({ "wave": { "Reactions": [ { "Action": "wave" } ] } })", R"({
        "wave": { "ComboReactions": [ { "TriggerCount": 2, "Action": { "Emote": "blush" } } ] }
    })");
    rig.world.facts.Put(Villager("p1", "abigail"));

    CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{0}) == 1);
    rig.engine.Tick(TimeMs{700});

    CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{1000}) == 1);
    rig.engine.Tick(TimeMs{1700});

    REQUIRE(rig.world.signals.performed.size() == 2);
    CHECK(rig.world.signals.performed[0].value == "wave");
    CHECK(rig.world.signals.performed[1].value == "blush");
}

TEST_CASE("engine::OnSignal: combos are skipped when disabled")
{
    Config cfg = QuietConfig();
    cfg.emoteCombo = false;
    EngineRig rig(cfg);
    rig.Rules("{}", kWaveCombos);
    rig.world.facts.Put(Villager("p1", "abigail"));

    for (int i = 0; i < 3; ++i)
        CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{i * 100}) == 0);

    CHECK_FALSE(rig.engine.Combos().Peek("p1", "abigail").has_value());
}

TEST_CASE("engine::OnSignal: fixed count mode overrides per-rule trigger counts")
{
    Config cfg = QuietConfig();
    cfg.comboCountMode    = ComboCountMode::Fixed;
    cfg.globalComboTarget = 2;
    EngineRig rig(cfg);
    rig.Rules("{}", kWaveCombos);
    rig.world.facts.Put(Villager("p1", "abigail"));

    CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{0}) == 0);
    CHECK(rig.engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{100}) == 1);
}

TEST_CASE("engine::OnSignal: skips the initiator, unknown targets and distant targets")
{
    EngineRig rig;
    rig.Rules(kHeartRules);

    FactSnapshot far = Villager("p1", "far");
    far.distanceTiles = 10.0f;
    rig.world.facts.Put(far);
    rig.world.facts.Put(Villager("p1", "near"));

    CHECK(rig.engine.OnSignal("p1", "heart", {"p1", "ghost", "far", "near"}, TimeMs{0}) == 1);
    rig.engine.Tick(TimeMs{700});

    REQUIRE(rig.world.signals.performed.size() == 1);
    CHECK(rig.world.signals.performed[0].target == "near");
}

TEST_CASE("engine::OnSignal: signals without rules do nothing")
{
    EngineRig rig;
    rig.Rules(kHeartRules);
    rig.world.facts.Put(Villager("p1", "abigail"));

    CHECK(rig.engine.OnSignal("p1", "shrug", {"abigail"}, TimeMs{0}) == 0);
    CHECK(rig.world.facts.calls == 0);
}

TEST_CASE("engine::OnSignal: a busy target ignores new signals")
{
    EngineRig rig;
    rig.Rules(kHeartRules);
    rig.world.facts.Put(Villager("p1", "abigail"));
    rig.world.facts.Put(Villager("p2", "abigail"));

    CHECK(rig.engine.OnSignal("p1", "heart", {"abigail"}, TimeMs{0}) == 1);
    CHECK(rig.engine.OnSignal("p2", "heart", {"abigail"}, TimeMs{100}) == 0);
    CHECK(rig.engine.Busy().IsBusy("abigail"));

    rig.engine.Tick(TimeMs{700});
    CHECK_FALSE(rig.engine.Busy().IsBusy("abigail"));
    CHECK(rig.engine.PendingTasks() == 0);
}

TEST_CASE("engine::OnDayStarted allows a new reward for the same pair")
{
    EngineRig rig;
    rig.Rules(kHeartRules);
    rig.world.facts.Put(Villager("p1", "abigail"));
    rig.world.relationships.Meet("p1", "abigail");

    rig.engine.OnSignal("p1", "heart", {"abigail"}, TimeMs{0});
    rig.engine.Tick(TimeMs{700});
    rig.engine.OnSignal("p1", "heart", {"abigail"}, TimeMs{1000});
    rig.engine.Tick(TimeMs{1700});
    CHECK(rig.world.relationships.grants == 1);

    rig.engine.OnDayStarted();
    CHECK_FALSE(rig.engine.Rewards().Ledger().Contains("p1", "abigail"));

    rig.engine.OnSignal("p1", "heart", {"abigail"}, TimeMs{2000});
    rig.engine.Tick(TimeMs{2700});
    CHECK(rig.world.relationships.grants == 2);
}

TEST_CASE("engine: failing fact provider does not escape OnSignal or Inspect")
{
    class ThrowingFacts final : public FactProvider {
    public:
        std::optional<FactSnapshot> Snapshot(const ActorId&, const ActorId&) override
        {
            throw std::runtime_error("world not loaded");
        }
    };

    FakeWorld world;
    ThrowingFacts facts;
    RuleStore store;
    store.Replace(ParseRules(kHeartRules, "{}"));
    Engine engine(QuietConfig(), store, facts, world.Ports(), rng::Seed{1});

    std::size_t n = 1;
    CHECK_NOTHROW(n = engine.OnSignal("p1", "heart", {"abigail"}, TimeMs{0}));
    CHECK(n == 0);

    InspectReport report;
    CHECK_NOTHROW(report = engine.Inspect("p1", "abigail", "heart"));
    CHECK_FALSE(report.facts.has_value());
    CHECK_FALSE(report.hasRules);
    CHECK(report.Describe().find("no facts available") != std::string::npos);
}

TEST_CASE("engine::ReloadRules keeps combo streaks and busy targets")
{
    ScopedTempDir dir("engine_reload");
    REQUIRE(io::write_atomic(dir.path() / kCombosFileName, kWaveCombos));

    FakeWorld world;
    RuleStore store(dir.path());
    Engine engine(QuietConfig(), store, world.facts, world.Ports(), rng::Seed{3});
    world.facts.Put(Villager("p1", "abigail"));

    REQUIRE(engine.ReloadRules().ok());
    engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{0});
    engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{100});

    REQUIRE(engine.ReloadRules().ok());
    CHECK(engine.Combos().Peek("p1", "abigail")->streakCount == 2);

    CHECK(engine.OnSignal("p1", "wave", {"abigail"}, TimeMs{200}) == 1);

    const RuleLoadResult reset = engine.ResetRules();
    CHECK(reset.ok());
    CHECK(store.Snapshot()->SignalCount() == 0);
    CHECK(engine.Busy().IsBusy("abigail"));
}

TEST_CASE("engine::Inspect reports the rules that would fire")
{
    EngineRig rig;
    rig.Rules(kHeartRules, R"({
        "heart": { "ComboReactions": [ { "Action": { "Emote": "blush" } } ] }
    })");
    rig.world.facts.Put(Villager("p1", "abigail", 2500));

    const InspectReport report = rig.engine.Inspect("p1", "abigail", "heart");
    REQUIRE(report.facts.has_value());
    CHECK(report.inRange);
    CHECK(report.hasRules);
    CHECK(report.reactionIndex == std::size_t{0});
    CHECK(report.comboIndex == std::size_t{0});
    CHECK(report.comboTriggerCount == 3);

    const std::string text = report.Describe();
    CHECK(text.find("reaction: rule #0") != std::string::npos);
    CHECK(text.find("heart-back") != std::string::npos);
    CHECK(text.find("trigger=3") != std::string::npos);

    const InspectReport unknown = rig.engine.Inspect("p1", "ghost", "heart");
    CHECK_FALSE(unknown.facts.has_value());
    CHECK(unknown.Describe().find("no facts") != std::string::npos);
}

TEST_CASE("engine::SetConfig clamps and applies new settings")
{
    EngineRig rig;
    Config cfg = QuietConfig();
    cfg.comboTimeoutMs = 100;
    cfg.eventDistance  = 40;
    rig.engine.SetConfig(cfg);

    CHECK(rig.engine.GetConfig().comboTimeoutMs == 600);
    CHECK(rig.engine.GetConfig().eventDistance == 15);
    CHECK(rig.engine.Combos().Timeout() == TimeMs{600});
}
