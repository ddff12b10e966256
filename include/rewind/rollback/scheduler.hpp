#pragma once

#include "rewind/core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace rewindkit::rollback {

using namespace rewindkit::core;

using TaskId = std::uint64_t;
using Task = std::function<void()>;

// Cancellable delayed-task runner
class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Run task once, delay from now
    virtual TaskId schedule(Duration delay, Task task) = 0;

    // True when the task was still pending and will now never run.
    // Once cancel() returns, the task is neither running nor will run.
    virtual bool cancel(TaskId id) = 0;

    virtual size_t pending() const = 0;
};

// Real-time scheduler with a single worker thread.
// Due tasks run in due order; a task that throws is logged.
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId schedule(Duration delay, Task task) override;

    // Blocks while the task is executing on the worker thread
    bool cancel(TaskId id) override;

    size_t pending() const override;

    // Stop the worker; tasks not yet due are dropped
    void shutdown();

private:
    using SteadyClock = std::chrono::steady_clock;
    using QueueKey = std::pair<SteadyClock::time_point, TaskId>;

    void run();

    mutable std::mutex mutex_;
    std::condition_variable condition_;   // wakes the worker
    std::condition_variable finished_;    // wakes cancel() waiting on a running task
    std::map<QueueKey, Task> queue_;
    std::map<TaskId, SteadyClock::time_point> due_;
    std::optional<TaskId> running_;
    TaskId next_id_ = 1;
    bool stop_ = false;
    std::thread worker_;
};

// Virtual-clock scheduler. Nothing runs until advance() moves the clock
// past a task's due time; tasks then run synchronously on the caller.
class ManualScheduler : public Scheduler {
public:
    ManualScheduler() = default;

    TaskId schedule(Duration delay, Task task) override;
    bool cancel(TaskId id) override;
    size_t pending() const override;

    // Time elapsed on the virtual clock
    Duration now() const;

    // Move the clock forward, running due tasks in due order.
    // Returns the number of tasks run.
    size_t advance(Duration by);

private:
    using QueueKey = std::pair<Duration, TaskId>;

    mutable std::mutex mutex_;
    std::map<QueueKey, Task> queue_;
    std::map<TaskId, Duration> due_;
    Duration now_{0};
    TaskId next_id_ = 1;
};

}  // namespace rewindkit::rollback
