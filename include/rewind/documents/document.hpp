#pragma once

#include "rewind/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rewindkit::documents {

using namespace rewindkit::core;

// One entry in the collection: a chat session, a notebook page, any
// application record the host wants kept with bounded retention
struct Document {
    DocumentId id;
    std::string title;
    Json payload = Json::object();
    std::vector<Json> entries;  // Appended records, e.g. {"role", "content", "timestamp"}
    TimePoint created_at;
    TimePoint updated_at;
    bool pinned = false;         // Exempt from eviction
    std::vector<std::string> tags;
    std::optional<std::string> model_name;
    std::uint64_t sequence = 0;  // Insertion order, breaks updated_at ties

    Json to_json() const;
    static Document from_json(const Json& j);
};

// Aggregate numbers over the collection
struct DocumentStats {
    size_t total_documents = 0;
    size_t total_entries = 0;
    std::optional<TimePoint> oldest_created;
    std::optional<TimePoint> newest_created;

    Json to_json() const;
};

}  // namespace rewindkit::documents
