#include "rewind/documents/document.hpp"

namespace rewindkit::documents {

Json Document::to_json() const {
    Json j{
        {"id", id},
        {"title", title},
        {"payload", payload},
        {"entries", entries},
        {"created_at", to_epoch_ms(created_at)},
        {"updated_at", to_epoch_ms(updated_at)},
        {"pinned", pinned},
        {"tags", tags},
        {"sequence", sequence}
    };

    if (model_name) {
        j["model_name"] = *model_name;
    }

    return j;
}

Document Document::from_json(const Json& j) {
    Document doc;
    doc.id = j.value("id", "");
    doc.title = j.value("title", "");
    doc.payload = j.value("payload", Json::object());
    doc.pinned = j.value("pinned", false);
    doc.sequence = j.value("sequence", std::uint64_t{0});

    if (j.contains("entries") && j["entries"].is_array()) {
        for (const auto& entry : j["entries"]) {
            doc.entries.push_back(entry);
        }
    }
    if (j.contains("created_at")) {
        doc.created_at = from_epoch_ms(j["created_at"].get<std::int64_t>());
    }
    if (j.contains("updated_at")) {
        doc.updated_at = from_epoch_ms(j["updated_at"].get<std::int64_t>());
    }
    if (j.contains("tags")) {
        doc.tags = j["tags"].get<std::vector<std::string>>();
    }
    if (j.contains("model_name")) {
        doc.model_name = j["model_name"].get<std::string>();
    }

    return doc;
}

Json DocumentStats::to_json() const {
    Json j{
        {"total_documents", total_documents},
        {"total_entries", total_entries},
        {"oldest_created", nullptr},
        {"newest_created", nullptr}
    };
    if (oldest_created) {
        j["oldest_created"] = to_epoch_ms(*oldest_created);
    }
    if (newest_created) {
        j["newest_created"] = to_epoch_ms(*newest_created);
    }
    return j;
}

}  // namespace rewindkit::documents
