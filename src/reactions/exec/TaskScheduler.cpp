// src/reactions/exec/TaskScheduler.cpp
#include "reactions/exec/TaskScheduler.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace reactions {

void TaskScheduler::RunSlice(std::unique_ptr<ScheduledTask> task, TimeMs now)
{
    std::optional<TimeMs> wait;
    try
    {
        wait = task->Resume(now);
    }
    catch (const std::exception& e)
    {
        spdlog::error("Scheduled task failed and was dropped: {}", e.what());
        return;
    }

    if (!wait)
        return;

    const TimeMs delay = wait->count() < 0 ? TimeMs{0} : *wait;
    m_queue.emplace(now + delay, std::move(task));
}

void TaskScheduler::Spawn(std::unique_ptr<ScheduledTask> task, TimeMs now)
{
    if (!task)
        return;
    RunSlice(std::move(task), now);
}

void TaskScheduler::Tick(TimeMs now)
{
    while (!m_queue.empty() && m_queue.begin()->first <= now)
    {
        auto node = m_queue.extract(m_queue.begin());
        RunSlice(std::move(node.mapped()), node.key());
    }
}

void TaskScheduler::Clear()
{
    m_queue.clear();
}

std::optional<TimeMs> TaskScheduler::NextWake() const
{
    if (m_queue.empty())
        return std::nullopt;
    return m_queue.begin()->first;
}

} // namespace reactions
