#pragma once

#include "auto_rollback.hpp"
#include "scheduler.hpp"
#include "snapshot.hpp"
#include "rewind/core/config.hpp"
#include "rewind/core/notifier.hpp"
#include "rewind/core/result.hpp"
#include "rewind/storage/state_store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rewindkit::rollback {

// Snapshot Manager - bounded, ordered history of state snapshots.
//
// Snapshots are kept oldest first and never exceed max_snapshots; creating
// one past the limit evicts from the head. The list is persisted through
// its own StateStore and reloaded on construction.
//
// Events (SnapshotEvicted, SnapshotCreated, StateReplaced) are posted while
// the manager lock is held and delivered after it is released, so listeners
// may call back into the manager.
class SnapshotManager {
public:
    SnapshotManager(storage::StateStore& state,
                    storage::StateStore& snapshots,
                    EventNotifier& notifier,
                    Scheduler& scheduler,
                    const SnapshotConfig& config,
                    NowFn now = [] { return Clock::now(); });

    // Cancels every watchdog still armed
    ~SnapshotManager();

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    // Capture the current state. Returns nullopt, not an error, when there
    // is no current state; the list is then untouched.
    Result<std::optional<SnapshotId>, Error> create_snapshot(const std::string& description);

    // Write a snapshot's state back as the current state
    Result<void, Error> rollback(const SnapshotId& id);

    // Oldest first
    std::vector<SnapshotInfo> list_snapshots() const;

    std::optional<Snapshot> get_snapshot(const SnapshotId& id) const;
    std::optional<SnapshotInfo> latest() const;

    // False when absent or when the shortened list could not be saved
    bool delete_snapshot(const SnapshotId& id);

    Result<void, Error> clear_snapshots();

    // Snapshot now and roll back to it unless disarmed within the deadline
    // (auto_rollback_deadline_ms when not given). Inactive guard when no
    // snapshot could be taken.
    AutoRollbackGuard prepare_auto_rollback(const std::string& operation,
                                            std::optional<Duration> deadline = std::nullopt);

    // Re-read the snapshot list from its store; returns the count
    size_t reload();

    size_t size() const;
    size_t max_snapshots() const { return max_snapshots_; }
    size_t armed_watchdogs() const;

    // Watchdogs whose deadline task may still run, armed or not
    size_t tracked_watchdogs() const;

private:
    storage::StateStore& state_;
    storage::StateStore& store_;
    EventNotifier& notifier_;
    Scheduler& scheduler_;
    size_t max_snapshots_;
    Duration default_deadline_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::vector<Snapshot> snapshots_;
    std::vector<std::shared_ptr<WatchdogToken>> watchdogs_;

    Result<void, Error> persist_locked();
    Result<void, Error> rollback_locked(const SnapshotId& id);
    std::vector<Snapshot>::const_iterator find_locked(const SnapshotId& id) const;
    SnapshotId unique_id_locked(TimePoint now) const;
    void prune_watchdogs_locked();
    void fire_watchdog(const std::shared_ptr<WatchdogToken>& token);
};

}  // namespace rewindkit::rollback
