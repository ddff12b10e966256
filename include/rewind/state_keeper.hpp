#pragma once

#include "rewind/core/config.hpp"
#include "rewind/core/notifier.hpp"
#include "rewind/core/result.hpp"
#include "rewind/core/types.hpp"
#include "rewind/documents/document_store.hpp"
#include "rewind/rollback/auto_saver.hpp"
#include "rewind/rollback/scheduler.hpp"
#include "rewind/rollback/snapshot_manager.hpp"
#include "rewind/storage/medium.hpp"
#include "rewind/storage/state_store.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace rewindkit {

using core::Config;
using core::Error;
using core::ErrorCode;
using core::Json;
using core::Result;

// State Keeper - wires the medium, stores and managers from a Config.
//
// Nothing is touched until open(). Component accessors throw
// std::runtime_error while closed.
class StateKeeper {
public:
    // Watchdogs run on an internal ThreadScheduler unless a scheduler is
    // supplied; a supplied scheduler must outlive the keeper
    explicit StateKeeper(Config config,
                         rollback::Scheduler* scheduler = nullptr,
                         core::NowFn now = [] { return core::Clock::now(); });
    ~StateKeeper();

    StateKeeper(const StateKeeper&) = delete;
    StateKeeper& operator=(const StateKeeper&) = delete;

    // Validate the config, create the configured medium and open everything
    Result<void, Error> open();

    // Open on a caller-provided medium instead of the configured backend
    Result<void, Error> open(std::unique_ptr<storage::StorageMedium> medium);

    // Stops auto-save, cancels armed watchdogs and releases the medium.
    // Safe to call twice.
    void close();
    bool is_open() const { return medium_ != nullptr; }

    // Current state document
    std::optional<Json> current_state() const;
    Result<void, Error> replace_state(const Json& state);
    Result<Json, Error> modify_state(const std::function<void(Json&)>& mutate);
    Result<void, Error> clear_state();

    // Components
    storage::StorageMedium& medium();
    storage::StateStore& state_store();
    rollback::SnapshotManager& snapshots();
    rollback::AutoSaver& auto_saver();
    documents::DocumentStore& documents();
    rollback::Scheduler& scheduler();
    core::EventNotifier& notifier() { return notifier_; }

    core::SubscriptionId subscribe(core::Listener listener);
    bool unsubscribe(core::SubscriptionId id);

    const Config& config() const { return config_; }

private:
    Config config_;
    core::NowFn now_;
    core::EventNotifier notifier_;

    rollback::Scheduler* external_scheduler_;
    std::unique_ptr<rollback::ThreadScheduler> owned_scheduler_;

    std::unique_ptr<storage::StorageMedium> medium_;
    std::unique_ptr<storage::StateStore> state_store_;
    std::unique_ptr<storage::StateStore> snapshot_store_;
    std::unique_ptr<storage::StateStore> document_store_;
    std::unique_ptr<rollback::SnapshotManager> snapshots_;
    std::unique_ptr<rollback::AutoSaver> auto_saver_;
    std::unique_ptr<documents::DocumentStore> documents_;

    Result<std::unique_ptr<storage::StorageMedium>, Error> create_medium() const;
    void require_open() const;
};

}  // namespace rewindkit
