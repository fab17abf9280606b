#ifndef FRAME_SCHEDULER_H
#define FRAME_SCHEDULER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

/**
 * @brief Per-frame callbacks and fire-once timers
 */
class Scheduler
{
public:
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    /**
     * @brief Register a callback run on every display frame
     */
    virtual void onTick(Callback callback) = 0;

    /**
     * @brief Run a callback once, no earlier than delayMs from now
     */
    virtual void defer(uint32_t delayMs, Callback callback) = 0;
};

/**
 * @brief Scheduler driven by an external clock
 *
 * The owner calls tick() once per frame with the current time in milliseconds.
 * Due timers run first, then the per-frame callbacks in registration order.
 */
class FrameScheduler : public Scheduler
{
public:
    FrameScheduler() = default;
    ~FrameScheduler() override = default;

    void onTick(Callback callback) override;
    void defer(uint32_t delayMs, Callback callback) override;

    void tick(uint32_t nowMs);

    uint32_t now() const
    {
        return m_nowMs;
    }
    size_t pendingTimers() const
    {
        return m_timers.size();
    }

private:
    struct Timer
    {
        uint32_t dueMs = 0;
        Callback callback;
    };

    std::vector<Callback> m_tickCallbacks;
    std::vector<Timer> m_timers;
    uint32_t m_nowMs = 0;
};

#endif // FRAME_SCHEDULER_H
