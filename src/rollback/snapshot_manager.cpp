#include "rewind/rollback/snapshot_manager.hpp"
#include "rewind/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rewindkit::rollback {

SnapshotManager::SnapshotManager(storage::StateStore& state,
                                 storage::StateStore& snapshots,
                                 EventNotifier& notifier,
                                 Scheduler& scheduler,
                                 const SnapshotConfig& config,
                                 NowFn now)
    : state_(state)
    , store_(snapshots)
    , notifier_(notifier)
    , scheduler_(scheduler)
    , max_snapshots_(static_cast<size_t>(std::max(config.max_snapshots, 1)))
    , default_deadline_(config.auto_rollback_deadline())
    , now_(std::move(now))
{
    reload();
}

SnapshotManager::~SnapshotManager() {
    std::vector<std::shared_ptr<WatchdogToken>> tokens;
    {
        std::lock_guard lock(mutex_);
        tokens.swap(watchdogs_);
    }

    for (const auto& token : tokens) {
        TaskId task_id;
        {
            std::lock_guard token_lock(token->mutex);
            if (token->state == GuardState::Armed) {
                token->state = GuardState::Disarmed;
                spdlog::debug("Cancelled auto-rollback for snapshot {} on shutdown", token->snapshot_id);
            }
            task_id = token->task_id;
        }
        // Also waits out a deadline task still running, whatever its state.
        // That task needs mutex_, so it must not be held here.
        scheduler_.cancel(task_id);
    }
}

size_t SnapshotManager::reload() {
    std::lock_guard lock(mutex_);
    snapshots_.clear();

    auto stored = store_.load();
    if (!stored || !stored->is_object() || !stored->contains("snapshots") ||
        !(*stored)["snapshots"].is_array()) {
        return 0;
    }

    try {
        for (const auto& item : (*stored)["snapshots"]) {
            Snapshot snapshot = Snapshot::from_json(item);
            if (!snapshot.id.empty()) {
                snapshots_.push_back(std::move(snapshot));
            }
        }
    } catch (const Json::exception& e) {
        spdlog::warn("Discarding malformed snapshot list '{}': {}", store_.key(), e.what());
        snapshots_.clear();
        return 0;
    }

    // A list saved under a larger limit is trimmed in memory only; the next
    // successful create or delete persists the trimmed list
    while (snapshots_.size() > max_snapshots_) {
        snapshots_.erase(snapshots_.begin());
    }

    spdlog::debug("Loaded {} snapshots from '{}'", snapshots_.size(), store_.key());
    return snapshots_.size();
}

Result<void, Error> SnapshotManager::persist_locked() {
    Json list = Json::array();
    for (const auto& snapshot : snapshots_) {
        list.push_back(snapshot.to_json());
    }
    return store_.save(Json{{"snapshots", list}});
}

std::vector<Snapshot>::const_iterator SnapshotManager::find_locked(const SnapshotId& id) const {
    return std::find_if(snapshots_.begin(), snapshots_.end(),
        [&id](const Snapshot& s) { return s.id == id; });
}

SnapshotId SnapshotManager::unique_id_locked(TimePoint now) const {
    SnapshotId id = generate_snapshot_id(now);
    while (find_locked(id) != snapshots_.end()) {
        id = generate_snapshot_id(now);
    }
    return id;
}

Result<std::optional<SnapshotId>, Error> SnapshotManager::create_snapshot(const std::string& description) {
    using R = Result<std::optional<SnapshotId>, Error>;
    SnapshotId id;
    {
        std::lock_guard lock(mutex_);

        auto current = state_.load();
        if (!current) {
            spdlog::debug("No current state, skipping snapshot '{}'", description);
            return R::ok(std::nullopt);
        }

        TimePoint now = now_();
        Snapshot snapshot{
            .id = unique_id_locked(now),
            .timestamp = now,
            .description = description,
            .state = std::move(*current)
        };
        id = snapshot.id;

        std::vector<Snapshot> previous = snapshots_;
        snapshots_.push_back(std::move(snapshot));

        std::vector<SnapshotId> evicted;
        while (snapshots_.size() > max_snapshots_) {
            evicted.push_back(snapshots_.front().id);
            snapshots_.erase(snapshots_.begin());
        }

        auto saved = persist_locked();
        if (saved.is_err()) {
            snapshots_ = std::move(previous);
            spdlog::error("Snapshot '{}' not created: {}", description, saved.error().full_message());
            return R::err(std::move(saved).error());
        }

        for (const auto& old_id : evicted) {
            spdlog::info("Evicted snapshot {}", old_id);
            notifier_.post(Event::snapshot_evicted(old_id));
        }
        spdlog::info("Created snapshot {} ({})", id, description);
        notifier_.post(Event::snapshot_created(id));
    }

    notifier_.flush();
    return R::ok(std::make_optional(id));
}

Result<void, Error> SnapshotManager::rollback_locked(const SnapshotId& id) {
    auto it = find_locked(id);
    if (it == snapshots_.end()) {
        return Result<void, Error>::err(ErrorCode::SnapshotNotFound, "Snapshot not found", id);
    }

    auto written = state_.save(it->state);
    if (written.is_err()) {
        return Result<void, Error>::err(
            ErrorCode::RollbackWriteFailed,
            "Failed to write snapshot state: " + written.error().full_message(),
            id
        );
    }

    spdlog::info("Rolled back to snapshot {} ({})", id, it->description);
    notifier_.post(Event::state_replaced(id, it->state));
    return Result<void, Error>::ok();
}

Result<void, Error> SnapshotManager::rollback(const SnapshotId& id) {
    Result<void, Error> result;
    {
        std::lock_guard lock(mutex_);
        result = rollback_locked(id);
    }

    if (result.is_ok()) {
        notifier_.flush();
    }
    return result;
}

std::vector<SnapshotInfo> SnapshotManager::list_snapshots() const {
    std::lock_guard lock(mutex_);
    std::vector<SnapshotInfo> infos;
    infos.reserve(snapshots_.size());
    for (const auto& snapshot : snapshots_) {
        infos.push_back(snapshot.info());
    }
    return infos;
}

std::optional<Snapshot> SnapshotManager::get_snapshot(const SnapshotId& id) const {
    std::lock_guard lock(mutex_);
    auto it = find_locked(id);
    if (it == snapshots_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<SnapshotInfo> SnapshotManager::latest() const {
    std::lock_guard lock(mutex_);
    if (snapshots_.empty()) {
        return std::nullopt;
    }
    return snapshots_.back().info();
}

bool SnapshotManager::delete_snapshot(const SnapshotId& id) {
    std::lock_guard lock(mutex_);
    auto it = find_locked(id);
    if (it == snapshots_.end()) {
        return false;
    }

    std::vector<Snapshot> previous = snapshots_;
    snapshots_.erase(it);

    auto saved = persist_locked();
    if (saved.is_err()) {
        snapshots_ = std::move(previous);
        spdlog::error("Snapshot {} not deleted: {}", id, saved.error().full_message());
        return false;
    }

    spdlog::info("Deleted snapshot {}", id);
    return true;
}

Result<void, Error> SnapshotManager::clear_snapshots() {
    std::lock_guard lock(mutex_);
    std::vector<Snapshot> previous;
    previous.swap(snapshots_);

    auto saved = persist_locked();
    if (saved.is_err()) {
        snapshots_ = std::move(previous);
        return saved;
    }

    spdlog::info("Cleared {} snapshots", previous.size());
    return Result<void, Error>::ok();
}

AutoRollbackGuard SnapshotManager::prepare_auto_rollback(const std::string& operation,
                                                         std::optional<Duration> deadline) {
    auto created = create_snapshot("Auto-snapshot before: " + operation);
    if (created.is_err()) {
        spdlog::warn("Auto-rollback for '{}' not armed: {}", operation, created.error().full_message());
        return AutoRollbackGuard{};
    }
    if (!created.value()) {
        spdlog::warn("Auto-rollback for '{}' not armed: no current state", operation);
        return AutoRollbackGuard{};
    }

    auto token = std::make_shared<WatchdogToken>();
    token->snapshot_id = *created.value();
    token->scheduler = &scheduler_;

    // Tracked before scheduling so a deadline that fires at once finds it
    {
        std::lock_guard lock(mutex_);
        prune_watchdogs_locked();
        watchdogs_.push_back(token);
    }

    Duration wait = deadline.value_or(default_deadline_);
    {
        // Held across schedule() so a deadline that fires at once still
        // sees its task id recorded
        std::lock_guard token_lock(token->mutex);
        token->task_id = scheduler_.schedule(wait, [this, token] { fire_watchdog(token); });
    }

    spdlog::info("Auto-rollback armed for '{}': snapshot {}, deadline {} ms",
                 operation, token->snapshot_id, wait.count());
    return AutoRollbackGuard{token};
}

void SnapshotManager::prune_watchdogs_locked() {
    std::erase_if(watchdogs_, [](const std::shared_ptr<WatchdogToken>& t) {
        std::lock_guard token_lock(t->mutex);
        return t->settled;
    });
}

void SnapshotManager::fire_watchdog(const std::shared_ptr<WatchdogToken>& token) {
    bool fired = false;
    Result<void, Error> result;
    {
        std::lock_guard lock(mutex_);
        {
            std::lock_guard token_lock(token->mutex);
            if (token->state == GuardState::Armed) {
                token->state = GuardState::Fired;
                fired = true;
            } else {
                spdlog::debug("Superseded auto-rollback for snapshot {} ignored", token->snapshot_id);
            }
        }

        if (fired) {
            spdlog::warn("Auto-rollback deadline passed, restoring snapshot {}", token->snapshot_id);
            result = rollback_locked(token->snapshot_id);
        }
    }

    if (fired) {
        if (result.is_err()) {
            spdlog::error("Auto-rollback to {} failed: {}", token->snapshot_id, result.error().full_message());
        } else {
            notifier_.flush();
        }
    }

    // Last use of the manager: until the token is gone the destructor waits
    // for this task
    std::lock_guard lock(mutex_);
    std::erase(watchdogs_, token);
}

size_t SnapshotManager::size() const {
    std::lock_guard lock(mutex_);
    return snapshots_.size();
}

size_t SnapshotManager::armed_watchdogs() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(watchdogs_.begin(), watchdogs_.end(),
        [](const std::shared_ptr<WatchdogToken>& t) {
            std::lock_guard token_lock(t->mutex);
            return t->state == GuardState::Armed;
        }));
}

size_t SnapshotManager::tracked_watchdogs() const {
    std::lock_guard lock(mutex_);
    return watchdogs_.size();
}

}  // namespace rewindkit::rollback
