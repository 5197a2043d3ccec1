#include <doctest/doctest.h>

#include "reactions/combo/ComboTracker.hpp"

using namespace reactions;

namespace {

constexpr TimeMs ms(long long v) { return TimeMs{v}; }

} // namespace

TEST_CASE("combo::ComboTracker: repeated signal within timeout builds a streak")
{
    ComboTracker t(ms(2100));

    CHECK(t.Observe("p1", "abigail", "wave", ms(0)) == 1);
    CHECK(t.Observe("p1", "abigail", "wave", ms(1000)) == 2);
    CHECK(t.Observe("p1", "abigail", "wave", ms(3100)) == 3);  // exactly at the timeout still counts

    const auto state = t.Peek("p1", "abigail");
    REQUIRE(state.has_value());
    CHECK(state->lastSignal == "wave");
    CHECK(state->lastTimestamp == ms(3100));
}

TEST_CASE("combo::ComboTracker: a different signal resets the streak to one")
{
    ComboTracker t;
    t.Observe("p1", "abigail", "wave", ms(0));
    t.Observe("p1", "abigail", "wave", ms(100));

    CHECK(t.Observe("p1", "abigail", "heart", ms(200)) == 1);
    CHECK(t.Peek("p1", "abigail")->lastSignal == "heart");
}

TEST_CASE("combo::ComboTracker: timeout resets the streak to one")
{
    ComboTracker t(ms(2100));
    t.Observe("p1", "abigail", "wave", ms(0));
    t.Observe("p1", "abigail", "wave", ms(500));

    CHECK(t.Observe("p1", "abigail", "wave", ms(2601)) == 1);
}

TEST_CASE("combo::ComboTracker: [A, A, A] triggers once and zeroes the streak")
{
    ComboTracker t;
    const int threshold = 3;

    t.Observe("p1", "abigail", "wave", ms(0));
    CHECK_FALSE(t.TryTrigger("p1", "abigail", threshold));
    t.Observe("p1", "abigail", "wave", ms(100));
    CHECK_FALSE(t.TryTrigger("p1", "abigail", threshold));
    t.Observe("p1", "abigail", "wave", ms(200));
    CHECK(t.TryTrigger("p1", "abigail", threshold));

    CHECK(t.Peek("p1", "abigail")->streakCount == 0);
    CHECK_FALSE(t.TryTrigger("p1", "abigail", threshold));

    // The next signal starts counting from scratch.
    CHECK(t.Observe("p1", "abigail", "wave", ms(300)) == 1);
}

TEST_CASE("combo::ComboTracker: streaks are keyed per initiator and target")
{
    ComboTracker t;
    t.Observe("p1", "abigail", "wave", ms(0));
    t.Observe("p1", "abigail", "wave", ms(10));

    CHECK(t.Observe("p2", "abigail", "wave", ms(20)) == 1);
    CHECK(t.Observe("p1", "sam", "wave", ms(30)) == 1);
    CHECK(t.Observe("p1", "abigail", "wave", ms(40)) == 3);
    CHECK(t.Size() == 3);
}

TEST_CASE("combo::ComboTracker: shorter timeout applies to the next observation")
{
    ComboTracker t(ms(6000));
    t.Observe("p1", "abigail", "wave", ms(0));

    t.SetTimeout(ms(600));
    CHECK(t.Timeout() == ms(600));
    CHECK(t.Observe("p1", "abigail", "wave", ms(700)) == 1);
}

TEST_CASE("combo::EffectiveTriggerTarget honours the count mode")
{
    CHECK(EffectiveTriggerTarget(5, ComboCountMode::PerCombo, 3) == 5);
    CHECK(EffectiveTriggerTarget(std::nullopt, ComboCountMode::PerCombo, 3) == 3);
    CHECK(EffectiveTriggerTarget(5, ComboCountMode::Fixed, 3) == 3);
}
