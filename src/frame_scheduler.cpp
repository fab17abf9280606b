#include "frame_scheduler.h"

#include <utility>

void FrameScheduler::onTick(Callback callback)
{
    if (callback)
    {
        m_tickCallbacks.push_back(std::move(callback));
    }
}

void FrameScheduler::defer(uint32_t delayMs, Callback callback)
{
    if (callback)
    {
        m_timers.push_back(Timer{m_nowMs + delayMs, std::move(callback)});
    }
}

void FrameScheduler::tick(uint32_t nowMs)
{
    m_nowMs = nowMs;

    // Timers may schedule new timers while running, so collect due ones first
    std::vector<Timer> due;
    for (auto it = m_timers.begin(); it != m_timers.end();)
    {
        if (it->dueMs <= nowMs)
        {
            due.push_back(std::move(*it));
            it = m_timers.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (auto& timer : due)
    {
        timer.callback();
    }

    for (size_t i = 0; i < m_tickCallbacks.size(); ++i)
    {
        m_tickCallbacks[i]();
    }
}
