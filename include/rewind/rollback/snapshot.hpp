#pragma once

#include "rewind/core/types.hpp"

#include <string>

namespace rewindkit::rollback {

using namespace rewindkit::core;

// Snapshot metadata, without the state payload
struct SnapshotInfo {
    SnapshotId id;
    TimePoint timestamp;
    std::string description;

    Json to_json() const;
    static SnapshotInfo from_json(const Json& j);
};

// Deep copy of the state document at creation time. Immutable once created.
struct Snapshot {
    SnapshotId id;
    TimePoint timestamp;
    std::string description;
    Json state;

    SnapshotInfo info() const {
        return SnapshotInfo{id, timestamp, description};
    }

    Json to_json() const;
    static Snapshot from_json(const Json& j);
};

}  // namespace rewindkit::rollback
