#pragma once

#include "scheduler.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace rewindkit::rollback {

enum class GuardState {
    Inactive,  // No snapshot could be taken; nothing armed
    Armed,     // Deadline pending
    Disarmed,  // Cancelled before the deadline
    Fired      // Deadline passed, rollback ran
};

inline std::string_view guard_state_to_string(GuardState state) {
    switch (state) {
        case GuardState::Inactive: return "inactive";
        case GuardState::Armed: return "armed";
        case GuardState::Disarmed: return "disarmed";
        case GuardState::Fired: return "fired";
    }
    return "unknown";
}

// Shared between a guard, its scheduled deadline task and the manager.
// Only transitions out of Armed happen, each under mutex.
struct WatchdogToken {
    std::mutex mutex;
    GuardState state = GuardState::Armed;
    SnapshotId snapshot_id;
    TaskId task_id = 0;
    Scheduler* scheduler = nullptr;
    bool settled = false;  // Deadline task cancelled before it could run
};

// Handle on one auto-rollback watchdog.
//
// Dropping the guard does not disarm it: an operation that never reports
// success is rolled back when the deadline passes.
class AutoRollbackGuard {
public:
    // Inactive guard
    AutoRollbackGuard() = default;
    explicit AutoRollbackGuard(std::shared_ptr<WatchdogToken> token);

    // Cancel the pending rollback. No-op unless armed.
    // Returns true when this call did the disarming.
    bool disarm();

    GuardState state() const;
    bool is_active() const { return state() == GuardState::Armed; }
    std::optional<SnapshotId> snapshot_id() const;

private:
    std::shared_ptr<WatchdogToken> token_;
};

}  // namespace rewindkit::rollback
