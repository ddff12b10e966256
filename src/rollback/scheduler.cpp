#include "rewind/rollback/scheduler.hpp"

#include <spdlog/spdlog.h>

namespace rewindkit::rollback {

namespace {

void run_task(const Task& task, TaskId id) {
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("Scheduled task {} failed: {}", id, e.what());
    } catch (...) {
        spdlog::error("Scheduled task {} failed with a non-standard exception", id);
    }
}

}  // namespace

// ThreadScheduler
ThreadScheduler::ThreadScheduler()
    : worker_([this] { run(); })
{
}

ThreadScheduler::~ThreadScheduler() {
    shutdown();
}

void ThreadScheduler::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
        if (!queue_.empty()) {
            spdlog::debug("Scheduler stopping with {} pending tasks", queue_.size());
        }
        queue_.clear();
        due_.clear();
    }

    condition_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void ThreadScheduler::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        if (stop_) {
            return;
        }

        if (queue_.empty()) {
            condition_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            continue;
        }

        auto next = queue_.begin();
        auto due = next->first.first;
        if (SteadyClock::now() < due) {
            // Woken early by a new task, a cancel or shutdown; re-evaluate
            condition_.wait_until(lock, due);
            continue;
        }

        TaskId id = next->first.second;
        Task task = std::move(next->second);
        queue_.erase(next);
        due_.erase(id);
        running_ = id;

        lock.unlock();
        run_task(task, id);
        lock.lock();

        running_.reset();
        finished_.notify_all();
    }
}

TaskId ThreadScheduler::schedule(Duration delay, Task task) {
    TaskId id;
    {
        std::lock_guard lock(mutex_);
        id = next_id_++;
        if (stop_) {
            spdlog::warn("Task {} scheduled after shutdown, dropping", id);
            return id;
        }
        auto due = SteadyClock::now() + delay;
        queue_.emplace(QueueKey{due, id}, std::move(task));
        due_.emplace(id, due);
    }

    condition_.notify_one();
    return id;
}

bool ThreadScheduler::cancel(TaskId id) {
    std::unique_lock lock(mutex_);

    auto it = due_.find(id);
    if (it != due_.end()) {
        queue_.erase(QueueKey{it->second, id});
        due_.erase(it);
        lock.unlock();
        condition_.notify_one();
        return true;
    }

    // A task cancelling itself would wait on its own completion
    if (running_ == id && std::this_thread::get_id() != worker_.get_id()) {
        finished_.wait(lock, [this, id] { return running_ != id; });
    }
    return false;
}

size_t ThreadScheduler::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

// ManualScheduler
TaskId ManualScheduler::schedule(Duration delay, Task task) {
    std::lock_guard lock(mutex_);
    TaskId id = next_id_++;
    Duration due = now_ + delay;
    queue_.emplace(QueueKey{due, id}, std::move(task));
    due_.emplace(id, due);
    return id;
}

bool ManualScheduler::cancel(TaskId id) {
    std::lock_guard lock(mutex_);
    auto it = due_.find(id);
    if (it == due_.end()) {
        return false;
    }
    queue_.erase(QueueKey{it->second, id});
    due_.erase(it);
    return true;
}

size_t ManualScheduler::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

Duration ManualScheduler::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

size_t ManualScheduler::advance(Duration by) {
    size_t ran = 0;
    Duration target;
    {
        std::lock_guard lock(mutex_);
        target = now_ + by;
    }

    while (true) {
        TaskId id;
        Task task;
        {
            std::lock_guard lock(mutex_);
            if (queue_.empty() || queue_.begin()->first.first > target) {
                now_ = target;
                return ran;
            }
            auto next = queue_.begin();
            now_ = next->first.first;
            id = next->first.second;
            task = std::move(next->second);
            queue_.erase(next);
            due_.erase(id);
        }

        // Unlocked so the task may schedule or cancel
        run_task(task, id);
        ++ran;
    }
}

}  // namespace rewindkit::rollback
