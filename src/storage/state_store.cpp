#include "rewind/storage/state_store.hpp"

#include <spdlog/spdlog.h>

namespace rewindkit::storage {

StateStore::StateStore(StorageMedium& medium, std::string key)
    : medium_(medium)
    , key_(std::move(key))
{
}

Result<void, Error> StateStore::open() {
    std::lock_guard lock(mutex_);

    // Read once so an unusable backend fails here rather than on first save
    auto existing = medium_.get(key_);
    if (existing.is_err()) {
        return Result<void, Error>::err(std::move(existing).error());
    }

    open_ = true;
    spdlog::debug("Opened state store '{}' on {}", key_, medium_.describe());
    return Result<void, Error>::ok();
}

void StateStore::close() {
    std::lock_guard lock(mutex_);
    open_ = false;
}

bool StateStore::is_open() const {
    std::lock_guard lock(mutex_);
    return open_;
}

Result<void, Error> StateStore::not_open() const {
    return Result<void, Error>::err(ErrorCode::StoreNotOpen, "State store is not open", key_);
}

Result<void, Error> StateStore::save(const Json& document) {
    std::lock_guard lock(mutex_);
    if (!open_) {
        return not_open();
    }
    return save_locked(document);
}

Result<void, Error> StateStore::save_locked(const Json& document) {
    std::string payload;
    try {
        Json envelope{
            {"format", kFormatVersion},
            {"saved_at", to_epoch_ms(Clock::now())},
            {"data", document}
        };
        payload = envelope.dump();
    } catch (const Json::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::SerializationFailed,
            std::string("JSON serialization error: ") + e.what(),
            key_
        );
    }

    auto result = medium_.set(key_, payload);
    if (result.is_err()) {
        auto& error = result.error();
        if (error.is_quota_exceeded()) {
            spdlog::warn("Quota exceeded saving '{}' ({} bytes)", key_, payload.size());
        } else {
            spdlog::error("Failed to save '{}': {}", key_, error.full_message());
        }
        return result;
    }

    return Result<void, Error>::ok();
}

std::optional<Json> StateStore::load() const {
    std::lock_guard lock(mutex_);
    if (!open_) {
        return std::nullopt;
    }

    auto envelope = load_envelope_locked();
    if (!envelope) {
        return std::nullopt;
    }
    return (*envelope)["data"];
}

std::optional<Json> StateStore::load_envelope_locked() const {
    auto raw = medium_.get(key_);
    if (raw.is_err()) {
        spdlog::warn("Could not read '{}': {}", key_, raw.error().full_message());
        return std::nullopt;
    }
    if (!raw.value()) {
        return std::nullopt;
    }

    Json envelope = Json::parse(*raw.value(), nullptr, false);
    if (envelope.is_discarded()) {
        spdlog::warn("Discarding corrupt payload stored under '{}'", key_);
        return std::nullopt;
    }

    if (!envelope.is_object() ||
        !envelope.contains("data") ||
        !envelope.contains("format") ||
        !envelope["format"].is_number_integer() ||
        envelope["format"].get<int>() != kFormatVersion) {
        spdlog::warn("Discarding payload with unknown envelope under '{}'", key_);
        return std::nullopt;
    }

    return envelope;
}

Result<void, Error> StateStore::clear() {
    std::lock_guard lock(mutex_);
    if (!open_) {
        return not_open();
    }
    return medium_.remove(key_);
}

Result<Json, Error> StateStore::modify(const std::function<void(Json&)>& mutate) {
    std::lock_guard lock(mutex_);
    if (!open_) {
        return Result<Json, Error>::err(not_open().error());
    }

    auto envelope = load_envelope_locked();
    Json document = envelope ? (*envelope)["data"] : Json::object();

    try {
        mutate(document);
    } catch (const Json::exception& e) {
        return Result<Json, Error>::err(
            ErrorCode::InvalidArgument,
            std::string("State update rejected: ") + e.what(),
            key_
        );
    }

    auto saved = save_locked(document);
    if (saved.is_err()) {
        return Result<Json, Error>::err(std::move(saved).error());
    }
    return Result<Json, Error>::ok(std::move(document));
}

std::optional<TimePoint> StateStore::last_saved() const {
    std::lock_guard lock(mutex_);
    if (!open_) {
        return std::nullopt;
    }

    auto envelope = load_envelope_locked();
    if (!envelope || !(*envelope).contains("saved_at") || !(*envelope)["saved_at"].is_number_integer()) {
        return std::nullopt;
    }
    return from_epoch_ms((*envelope)["saved_at"].get<std::int64_t>());
}

}  // namespace rewindkit::storage
