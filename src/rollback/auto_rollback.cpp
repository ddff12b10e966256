#include "rewind/rollback/auto_rollback.hpp"

#include <spdlog/spdlog.h>

namespace rewindkit::rollback {

AutoRollbackGuard::AutoRollbackGuard(std::shared_ptr<WatchdogToken> token)
    : token_(std::move(token))
{
}

bool AutoRollbackGuard::disarm() {
    if (!token_) {
        return false;
    }

    TaskId task_id;
    Scheduler* scheduler;
    {
        std::lock_guard lock(token_->mutex);
        if (token_->state != GuardState::Armed) {
            return false;
        }
        token_->state = GuardState::Disarmed;
        task_id = token_->task_id;
        scheduler = token_->scheduler;
    }

    // Outside the token lock: cancel() may wait for a deadline task that is
    // about to observe Disarmed
    if (scheduler && scheduler->cancel(task_id)) {
        std::lock_guard lock(token_->mutex);
        token_->settled = true;
    }

    spdlog::info("Auto-rollback disarmed for snapshot {}", token_->snapshot_id);
    return true;
}

GuardState AutoRollbackGuard::state() const {
    if (!token_) {
        return GuardState::Inactive;
    }
    std::lock_guard lock(token_->mutex);
    return token_->state;
}

std::optional<SnapshotId> AutoRollbackGuard::snapshot_id() const {
    if (!token_) {
        return std::nullopt;
    }
    return token_->snapshot_id;
}

}  // namespace rewindkit::rollback
