#pragma once

#include "medium.hpp"
#include "rewind/core/types.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace rewindkit::storage {

// Durable home of one JSON document under one medium key.
//
// The document is always written whole, wrapped in an envelope
// {"format": 1, "saved_at": <ms>, "data": <document>}. Anything on the
// medium that does not parse as such an envelope loads as absent.
class StateStore {
public:
    static constexpr int kFormatVersion = 1;

    StateStore(StorageMedium& medium, std::string key);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Lifecycle. Operations on a closed store fail with StoreNotOpen and
    // load() returns absent.
    Result<void, Error> open();
    void close();
    bool is_open() const;

    // Replace the stored document
    Result<void, Error> save(const Json& document);

    // Last saved document; absent when nothing was saved, the medium cannot
    // be read, or the stored value is corrupt
    std::optional<Json> load() const;

    // Remove the stored document
    Result<void, Error> clear();

    // Load, mutate a copy, save, as one critical section. Starts from an empty
    // object when nothing is stored. Returns the document that was saved.
    Result<Json, Error> modify(const std::function<void(Json&)>& mutate);

    // saved_at of the stored envelope
    std::optional<TimePoint> last_saved() const;

    const std::string& key() const { return key_; }

private:
    StorageMedium& medium_;
    std::string key_;
    mutable std::mutex mutex_;
    bool open_ = false;

    Result<void, Error> save_locked(const Json& document);
    std::optional<Json> load_envelope_locked() const;
    Result<void, Error> not_open() const;
};

}  // namespace rewindkit::storage
