#include "rewind/state_keeper.hpp"
#include "rewind/storage/file_medium.hpp"
#include "rewind/storage/memory_medium.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace rewindkit {

StateKeeper::StateKeeper(Config config, rollback::Scheduler* scheduler, core::NowFn now)
    : config_(std::move(config))
    , now_(std::move(now))
    , external_scheduler_(scheduler)
{
}

StateKeeper::~StateKeeper() {
    close();
}

Result<std::unique_ptr<storage::StorageMedium>, Error> StateKeeper::create_medium() const {
    using R = Result<std::unique_ptr<storage::StorageMedium>, Error>;
    const auto& storage_config = config_.storage;

    if (storage_config.backend == "memory") {
        return R::ok(std::make_unique<storage::MemoryMedium>(storage_config.capacity_bytes));
    }

    auto file = storage::FileMedium::open(core::expand_path(storage_config.path), storage_config.capacity_bytes);
    if (file.is_err()) {
        return R::err(std::move(file).error());
    }
    return R::ok(std::move(file).value());
}

Result<void, Error> StateKeeper::open() {
    auto valid = config_.validate();
    if (valid.is_err()) {
        return valid;
    }

    auto medium = create_medium();
    if (medium.is_err()) {
        return Result<void, Error>::err(std::move(medium).error());
    }
    return open(std::move(medium).value());
}

Result<void, Error> StateKeeper::open(std::unique_ptr<storage::StorageMedium> medium) {
    if (is_open()) {
        return Result<void, Error>::err(ErrorCode::InvalidState, "State keeper is already open");
    }
    if (!medium) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "No storage medium");
    }

    const auto& storage_config = config_.storage;
    auto state = std::make_unique<storage::StateStore>(*medium, storage_config.state_key());
    auto snapshot_store = std::make_unique<storage::StateStore>(*medium, storage_config.snapshots_key());
    auto document_store = std::make_unique<storage::StateStore>(*medium, storage_config.documents_key());

    for (auto* store : {state.get(), snapshot_store.get(), document_store.get()}) {
        auto opened = store->open();
        if (opened.is_err()) {
            spdlog::error("Could not open '{}': {}", store->key(), opened.error().full_message());
            return opened;
        }
    }

    if (!external_scheduler_ && !owned_scheduler_) {
        owned_scheduler_ = std::make_unique<rollback::ThreadScheduler>();
    }
    rollback::Scheduler& watchdog_scheduler =
        external_scheduler_ ? *external_scheduler_ : *owned_scheduler_;

    snapshots_ = std::make_unique<rollback::SnapshotManager>(
        *state, *snapshot_store, notifier_, watchdog_scheduler, config_.snapshots, now_);
    documents_ = std::make_unique<documents::DocumentStore>(
        *document_store, config_.documents, now_);
    auto_saver_ = std::make_unique<rollback::AutoSaver>(*snapshots_, *state, watchdog_scheduler);
    auto_saver_->start(config_.snapshots.auto_save_interval());

    spdlog::info("State keeper open on {} ({} snapshots, {} documents)",
                 medium->describe(), snapshots_->size(), documents_->size());

    medium_ = std::move(medium);
    state_store_ = std::move(state);
    snapshot_store_ = std::move(snapshot_store);
    document_store_ = std::move(document_store);
    return Result<void, Error>::ok();
}

void StateKeeper::close() {
    if (!is_open()) {
        return;
    }

    // Managers first: their destructors still use the stores and scheduler.
    // Auto-save goes before the snapshot manager it writes through.
    auto_saver_.reset();
    snapshots_.reset();
    documents_.reset();

    for (auto* store : {state_store_.get(), snapshot_store_.get(), document_store_.get()}) {
        store->close();
    }
    state_store_.reset();
    snapshot_store_.reset();
    document_store_.reset();
    medium_.reset();

    if (owned_scheduler_) {
        owned_scheduler_->shutdown();
        owned_scheduler_.reset();
    }

    spdlog::debug("State keeper closed");
}

void StateKeeper::require_open() const {
    if (!is_open()) {
        throw std::runtime_error("State keeper is not open");
    }
}

std::optional<Json> StateKeeper::current_state() const {
    if (!is_open()) {
        return std::nullopt;
    }
    return state_store_->load();
}

Result<void, Error> StateKeeper::replace_state(const Json& state) {
    if (!is_open()) {
        return Result<void, Error>::err(ErrorCode::StoreNotOpen, "State keeper is not open");
    }
    return state_store_->save(state);
}

Result<Json, Error> StateKeeper::modify_state(const std::function<void(Json&)>& mutate) {
    if (!is_open()) {
        return Result<Json, Error>::err(ErrorCode::StoreNotOpen, "State keeper is not open");
    }
    return state_store_->modify(mutate);
}

Result<void, Error> StateKeeper::clear_state() {
    if (!is_open()) {
        return Result<void, Error>::err(ErrorCode::StoreNotOpen, "State keeper is not open");
    }
    return state_store_->clear();
}

storage::StorageMedium& StateKeeper::medium() {
    require_open();
    return *medium_;
}

storage::StateStore& StateKeeper::state_store() {
    require_open();
    return *state_store_;
}

rollback::SnapshotManager& StateKeeper::snapshots() {
    require_open();
    return *snapshots_;
}

rollback::AutoSaver& StateKeeper::auto_saver() {
    require_open();
    return *auto_saver_;
}

documents::DocumentStore& StateKeeper::documents() {
    require_open();
    return *documents_;
}

rollback::Scheduler& StateKeeper::scheduler() {
    require_open();
    return external_scheduler_ ? *external_scheduler_ : *owned_scheduler_;
}

core::SubscriptionId StateKeeper::subscribe(core::Listener listener) {
    return notifier_.subscribe(std::move(listener));
}

bool StateKeeper::unsubscribe(core::SubscriptionId id) {
    return notifier_.unsubscribe(id);
}

}  // namespace rewindkit
