#pragma once

/**
 * @file scheduler.h
 * @brief One-shot timers for the connection manager
 *
 * The settings-ack grace timer and the keepalive tick are the only timers in
 * the client. They run through this interface so tests can fire them by hand.
 */

#include <cstdint>
#include <functional>
#include <memory>

namespace voxlink {

using TimerId = uint64_t;

/**
 * @brief Abstract one-shot timer service
 */
class IScheduler {
public:
    virtual ~IScheduler() = default;

    /**
     * @brief Run task once after delay_ms
     * @return Id usable with cancel(); never 0
     */
    virtual TimerId schedule_after(int delay_ms, std::function<void()> task) = 0;

    /**
     * @brief Cancel a pending task. Unknown or already-fired ids are ignored.
     */
    virtual void cancel(TimerId id) = 0;
};

/**
 * @brief Scheduler backed by a single worker thread
 *
 * Tasks run on the worker thread, outside the scheduler's lock, so a task may
 * schedule or cancel other tasks.
 */
class ThreadScheduler : public IScheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TimerId schedule_after(int delay_ms, std::function<void()> task) override;
    void cancel(TimerId id) override;

    /**
     * @brief Stop the worker; pending tasks are dropped
     *
     * Joins the worker, or detaches it when called from inside a task.
     * Later schedule_after() calls are ignored.
     */
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
