#include <doctest/doctest.h>

#include "reactions/exec/BusyRegistry.hpp"
#include "reactions/exec/TaskScheduler.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace reactions;

namespace {

// Records the time of every slice and waits `step` between `slices` slices.
class StepTask final : public ScheduledTask {
public:
    StepTask(std::vector<long long>& log, int slices, TimeMs step)
        : m_log(log), m_left(slices), m_step(step) {}

    std::optional<TimeMs> Resume(TimeMs now) override
    {
        m_log.push_back(now.count());
        if (--m_left <= 0)
            return std::nullopt;
        return m_step;
    }

private:
    std::vector<long long>& m_log;
    int                     m_left;
    TimeMs                  m_step;
};

class LeaseTask final : public ScheduledTask {
public:
    LeaseTask(BusyRegistry::Lease lease, bool fail) : m_lease(std::move(lease)), m_fail(fail) {}

    std::optional<TimeMs> Resume(TimeMs) override
    {
        if (m_first)
        {
            m_first = false;
            return TimeMs{100};
        }
        if (m_fail)
            throw std::runtime_error("port failure");
        return std::nullopt;
    }

private:
    BusyRegistry::Lease m_lease;
    bool                m_fail;
    bool                m_first = true;
};

} // namespace

TEST_CASE("exec::TaskScheduler runs the first slice at spawn and the rest on tick")
{
    std::vector<long long> log;
    TaskScheduler s;

    s.Spawn(std::make_unique<StepTask>(log, 3, TimeMs{500}), TimeMs{1000});
    REQUIRE(log.size() == 1);
    CHECK(log[0] == 1000);
    CHECK(s.Pending() == 1);
    CHECK(s.NextWake() == TimeMs{1500});

    s.Tick(TimeMs{1499});
    CHECK(log.size() == 1);

    s.Tick(TimeMs{1500});
    CHECK(log.size() == 2);

    s.Tick(TimeMs{2000});
    CHECK(log.size() == 3);
    CHECK(s.Pending() == 0);
    CHECK_FALSE(s.NextWake().has_value());
}

TEST_CASE("exec::TaskScheduler chains waits from the scheduled wake time")
{
    std::vector<long long> log;
    TaskScheduler s;

    s.Spawn(std::make_unique<StepTask>(log, 4, TimeMs{100}), TimeMs{0});
    s.Tick(TimeMs{10000});  // one coarse tick catches up every slice

    REQUIRE(log.size() == 4);
    CHECK(log[1] == 100);
    CHECK(log[2] == 200);
    CHECK(log[3] == 300);
}

TEST_CASE("exec::TaskScheduler interleaves tasks by wake time")
{
    std::vector<long long> a;
    std::vector<long long> b;
    TaskScheduler s;

    s.Spawn(std::make_unique<StepTask>(a, 2, TimeMs{300}), TimeMs{0});
    s.Spawn(std::make_unique<StepTask>(b, 2, TimeMs{100}), TimeMs{0});

    s.Tick(TimeMs{150});
    CHECK(a.size() == 1);
    CHECK(b.size() == 2);
    CHECK(s.Pending() == 1);
}

TEST_CASE("exec::TaskScheduler drops a throwing task and releases what it holds")
{
    BusyRegistry busy;
    TaskScheduler s;

    auto lease = busy.TryAcquire("abigail");
    REQUIRE(lease.has_value());
    s.Spawn(std::make_unique<LeaseTask>(std::move(*lease), /*fail=*/true), TimeMs{0});

    CHECK(busy.IsBusy("abigail"));
    CHECK_NOTHROW(s.Tick(TimeMs{100}));
    CHECK(s.Pending() == 0);
    CHECK_FALSE(busy.IsBusy("abigail"));
}

TEST_CASE("exec::BusyRegistry hands out one lease per target")
{
    BusyRegistry busy;

    auto first = busy.TryAcquire("abigail");
    REQUIRE(first.has_value());
    CHECK_FALSE(busy.TryAcquire("abigail").has_value());
    CHECK(busy.TryAcquire("sam").has_value() == true);  // released immediately
    CHECK(busy.BusyCount() == 1);

    BusyRegistry::Lease moved = std::move(*first);
    CHECK_FALSE(first->valid());
    CHECK(moved.valid());
    CHECK(busy.IsBusy("abigail"));

    moved.Release();
    CHECK_FALSE(busy.IsBusy("abigail"));
    CHECK(busy.TryAcquire("abigail").has_value());
}
