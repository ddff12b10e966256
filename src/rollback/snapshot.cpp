#include "rewind/rollback/snapshot.hpp"

namespace rewindkit::rollback {

// SnapshotInfo
Json SnapshotInfo::to_json() const {
    return Json{
        {"id", id},
        {"timestamp", to_epoch_ms(timestamp)},
        {"description", description}
    };
}

SnapshotInfo SnapshotInfo::from_json(const Json& j) {
    SnapshotInfo info;
    info.id = j.value("id", "");
    info.description = j.value("description", "");
    if (j.contains("timestamp")) {
        info.timestamp = from_epoch_ms(j["timestamp"].get<std::int64_t>());
    }
    return info;
}

// Snapshot
Json Snapshot::to_json() const {
    Json j = info().to_json();
    j["state"] = state;
    return j;
}

Snapshot Snapshot::from_json(const Json& j) {
    SnapshotInfo info = SnapshotInfo::from_json(j);

    Snapshot snapshot;
    snapshot.id = std::move(info.id);
    snapshot.timestamp = info.timestamp;
    snapshot.description = std::move(info.description);
    if (j.contains("state")) {
        snapshot.state = j["state"];
    }
    return snapshot;
}

}  // namespace rewindkit::rollback
