#pragma once
// include/reactions/exec/TaskScheduler.hpp
//
// Cooperative timer queue driven by the host update loop. A task runs until it
// asks to wait, and is resumed by Tick() once its wake time has passed. Nothing
// runs on other threads and nothing blocks the caller.
//
// Waits chain from the scheduled wake time, not from the Tick that happened to
// notice it, so a coarse tick rate never stretches a reaction's timeline.

#include "reactions/rules/Facts.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>

namespace reactions {

class ScheduledTask {
public:
    virtual ~ScheduledTask() = default;

    // Runs the next slice at `now`. Returns how long to wait before the next
    // slice, or nullopt when the task is finished.
    virtual std::optional<TimeMs> Resume(TimeMs now) = 0;
};

class TaskScheduler {
public:
    TaskScheduler() = default;
    TaskScheduler(const TaskScheduler&)            = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Runs the first slice immediately and queues the rest.
    void Spawn(std::unique_ptr<ScheduledTask> task, TimeMs now);

    // Resumes every task whose wake time is <= now, in wake order. A task that
    // throws is logged and dropped.
    void Tick(TimeMs now);

    // Drops every pending task without resuming it.
    void Clear();

    [[nodiscard]] std::size_t Pending() const noexcept { return m_queue.size(); }
    [[nodiscard]] std::optional<TimeMs> NextWake() const;

private:
    void RunSlice(std::unique_ptr<ScheduledTask> task, TimeMs now);

    // Equal wake times keep insertion order.
    std::multimap<TimeMs, std::unique_ptr<ScheduledTask>> m_queue;
};

} // namespace reactions
