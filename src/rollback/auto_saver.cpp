#include "rewind/rollback/auto_saver.hpp"

#include <spdlog/spdlog.h>

namespace rewindkit::rollback {

namespace {

constexpr const char* kAutoSaveDescription = "Auto-save";

}  // namespace

AutoSaver::AutoSaver(SnapshotManager& snapshots, storage::StateStore& state, Scheduler& scheduler)
    : snapshots_(snapshots)
    , state_(state)
    , scheduler_(scheduler)
{
}

AutoSaver::~AutoSaver() {
    stop();
}

void AutoSaver::start(Duration interval) {
    stop();
    if (interval <= Duration::zero()) {
        return;
    }

    std::lock_guard lock(mutex_);
    interval_ = interval;
    running_ = true;
    schedule_locked();
    spdlog::info("Auto-save every {} ms", interval.count());
}

void AutoSaver::stop() {
    TaskId task_id;
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        ++generation_;
        task_id = task_id_;
    }

    // Waits out a tick already running; that tick sees the new generation
    // and does not reschedule
    scheduler_.cancel(task_id);
    spdlog::debug("Auto-save stopped");
}

bool AutoSaver::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

Duration AutoSaver::interval() const {
    std::lock_guard lock(mutex_);
    return interval_;
}

void AutoSaver::schedule_locked() {
    std::uint64_t generation = generation_;
    task_id_ = scheduler_.schedule(interval_, [this, generation] { tick(generation); });
}

void AutoSaver::tick(std::uint64_t generation) {
    {
        std::lock_guard lock(mutex_);
        if (!running_ || generation != generation_) {
            return;
        }
    }

    auto saved = save_now();
    if (saved.is_err()) {
        spdlog::warn("Auto-save failed: {}", saved.error().full_message());
    }

    std::lock_guard lock(mutex_);
    if (running_ && generation == generation_) {
        schedule_locked();
    }
}

Result<std::optional<SnapshotId>, Error> AutoSaver::save_now() {
    using R = Result<std::optional<SnapshotId>, Error>;

    auto current = state_.load();
    if (!current) {
        return R::ok(std::nullopt);
    }

    std::optional<Json> baseline;
    {
        std::lock_guard lock(mutex_);
        baseline = last_saved_;
    }
    if (!baseline) {
        if (auto newest = snapshots_.latest()) {
            if (auto snapshot = snapshots_.get_snapshot(newest->id)) {
                baseline = std::move(snapshot->state);
            }
        }
    }

    if (baseline && *baseline == *current) {
        spdlog::debug("Auto-save skipped: state unchanged");
        return R::ok(std::nullopt);
    }

    auto created = snapshots_.create_snapshot(kAutoSaveDescription);
    if (created.is_err()) {
        return created;
    }

    if (created.value()) {
        std::lock_guard lock(mutex_);
        last_saved_ = std::move(*current);
    }
    return created;
}

}  // namespace rewindkit::rollback
