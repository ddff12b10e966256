#pragma once

#include "scheduler.hpp"
#include "snapshot_manager.hpp"
#include "rewind/core/result.hpp"
#include "rewind/storage/state_store.hpp"

#include <cstdint>
#include <mutex>
#include <optional>

namespace rewindkit::rollback {

// Periodic auto-save: every interval, snapshot the current state under the
// description "Auto-save" unless it is unchanged since the last auto-save
// (or, before the first one, since the newest snapshot).
//
// Runs on the given scheduler; stop() and the destructor return only once
// no tick is pending or running.
class AutoSaver {
public:
    AutoSaver(SnapshotManager& snapshots, storage::StateStore& state, Scheduler& scheduler);
    ~AutoSaver();

    AutoSaver(const AutoSaver&) = delete;
    AutoSaver& operator=(const AutoSaver&) = delete;

    // (Re)start with the given interval; a non-positive interval stops
    void start(Duration interval);
    void stop();

    bool running() const;
    Duration interval() const;

    // One save now. nullopt when there is no state or it is unchanged.
    Result<std::optional<SnapshotId>, Error> save_now();

private:
    SnapshotManager& snapshots_;
    storage::StateStore& state_;
    Scheduler& scheduler_;

    mutable std::mutex mutex_;
    Duration interval_{0};
    bool running_ = false;
    std::uint64_t generation_ = 0;
    TaskId task_id_ = 0;
    std::optional<Json> last_saved_;

    void schedule_locked();
    void tick(std::uint64_t generation);
};

}  // namespace rewindkit::rollback
