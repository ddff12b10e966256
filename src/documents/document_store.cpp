#include "rewind/documents/document_store.hpp"
#include "rewind/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rewindkit::documents {

namespace {

constexpr const char* kDefaultTitlePrefix = "Document ";
constexpr size_t kTitleLength = 30;

std::string format_utc(TimePoint tp, const char* pattern) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, pattern);
    return ss.str();
}

std::string role_label(const std::string& role) {
    if (role == "user") return "User";
    if (role == "assistant") return "Assistant";
    if (role == "system") return "System";
    if (role.empty()) return "Entry";
    std::string label = role;
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    return label;
}

// Entries are opaque: a role or content of any other type reads as absent
std::string string_field(const Json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string render(const Json& value) {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// Ascending by (updated_at, sequence): the head is the eviction candidate
bool older_than(const Document* a, const Document* b) {
    if (a->updated_at != b->updated_at) {
        return a->updated_at < b->updated_at;
    }
    return a->sequence < b->sequence;
}

}  // namespace

DocumentStore::DocumentStore(storage::StateStore& store, const DocumentConfig& config, NowFn now)
    : store_(store)
    , max_documents_(static_cast<size_t>(std::max(config.max_documents, 2)))
    , now_(std::move(now))
{
    reload();
}

size_t DocumentStore::reload() {
    std::lock_guard lock(mutex_);
    collection_ = Collection{};

    auto stored = store_.load();
    if (!stored || !stored->is_object()) {
        return 0;
    }

    try {
        const Json& j = *stored;
        if (j.contains("documents") && j["documents"].is_array()) {
            for (const auto& item : j["documents"]) {
                Document doc = Document::from_json(item);
                if (doc.id.empty()) {
                    continue;
                }
                collection_.next_sequence = std::max(collection_.next_sequence, doc.sequence + 1);
                collection_.documents.emplace(doc.id, std::move(doc));
            }
        }
        if (j.contains("current") && j["current"].is_string()) {
            auto id = j["current"].get<std::string>();
            if (collection_.documents.count(id)) {
                collection_.current = id;
            }
        }
        collection_.next_sequence = std::max(collection_.next_sequence,
                                             j.value("next_sequence", std::uint64_t{1}));
    } catch (const Json::exception& e) {
        spdlog::warn("Discarding malformed document collection '{}': {}", store_.key(), e.what());
        collection_ = Collection{};
        return 0;
    }

    spdlog::debug("Loaded {} documents from '{}'", collection_.documents.size(), store_.key());
    return collection_.documents.size();
}

Json DocumentStore::to_json_locked() const {
    Json docs = Json::array();
    for (const auto& [id, doc] : collection_.documents) {
        docs.push_back(doc.to_json());
    }

    Json j{
        {"documents", docs},
        {"current", nullptr},
        {"next_sequence", collection_.next_sequence}
    };
    if (collection_.current) {
        j["current"] = *collection_.current;
    }
    return j;
}

size_t DocumentStore::evict_locked() {
    const size_t target = max_documents_ / 2;
    auto& documents = collection_.documents;
    if (documents.size() <= target) {
        return 0;
    }

    std::vector<const Document*> order;
    order.reserve(documents.size());
    for (const auto& [id, doc] : documents) {
        order.push_back(&doc);
    }
    std::sort(order.begin(), order.end(), older_than);

    std::vector<DocumentId> victims;
    size_t remaining = documents.size();
    for (const Document* doc : order) {
        if (remaining <= target) {
            break;
        }
        if (doc->pinned) {
            continue;
        }
        victims.push_back(doc->id);
        --remaining;
    }

    for (const auto& id : victims) {
        if (collection_.current == id) {
            collection_.current.reset();
        }
        documents.erase(id);
    }

    if (remaining > target) {
        spdlog::warn("Pinned documents keep the collection at {} (target {})", remaining, target);
    }
    return victims.size();
}

Result<void, Error> DocumentStore::persist_locked() {
    auto result = store_.save(to_json_locked());
    if (result.is_ok() || !result.error().is_quota_exceeded()) {
        return result;
    }

    size_t evicted = evict_locked();
    spdlog::warn("Storage quota reached for '{}': evicted {} documents, {} remain",
                 store_.key(), evicted, collection_.documents.size());

    auto retry = store_.save(to_json_locked());
    if (retry.is_err()) {
        spdlog::error("Saving documents failed even after eviction: {}",
                      retry.error().full_message());
    }
    return retry;
}

Result<void, Error> DocumentStore::commit_locked(Collection previous) {
    auto result = persist_locked();
    if (result.is_err()) {
        collection_ = std::move(previous);
    }
    return result;
}

Document* DocumentStore::find_locked(const DocumentId& id) {
    auto it = collection_.documents.find(id);
    return it == collection_.documents.end() ? nullptr : &it->second;
}

Result<void, Error> DocumentStore::not_found(const DocumentId& id) const {
    return Result<void, Error>::err(ErrorCode::DocumentNotFound, "Document not found", id);
}

Result<DocumentId, Error> DocumentStore::create(Json initial_payload,
                                                std::optional<std::string> title,
                                                std::optional<std::string> model_name) {
    std::lock_guard lock(mutex_);
    Collection previous = collection_;

    DocumentId id = generate_document_id();
    while (collection_.documents.count(id)) {
        id = generate_document_id();
    }

    TimePoint now = now_();
    Document doc;
    doc.id = id;
    doc.title = title && !title->empty()
        ? *title
        : kDefaultTitlePrefix + std::to_string(collection_.documents.size() + 1);
    doc.payload = std::move(initial_payload);
    doc.created_at = now;
    doc.updated_at = now;
    doc.model_name = std::move(model_name);
    doc.sequence = collection_.next_sequence++;

    collection_.documents.emplace(id, std::move(doc));
    collection_.current = id;

    if (collection_.documents.size() > max_documents_) {
        size_t evicted = evict_locked();
        spdlog::info("Document limit {} exceeded: evicted {} documents", max_documents_, evicted);
    }

    auto result = commit_locked(std::move(previous));
    if (result.is_err()) {
        return Result<DocumentId, Error>::err(std::move(result).error());
    }

    // Every older document pinned: the newcomer was the only candidate
    if (!collection_.documents.count(id)) {
        spdlog::warn("Document {} was evicted on creation; all other documents are pinned", id);
    }
    return Result<DocumentId, Error>::ok(id);
}

Result<void, Error> DocumentStore::update(const DocumentId& id, Json payload) {
    std::lock_guard lock(mutex_);
    if (!find_locked(id)) {
        return not_found(id);
    }

    Collection previous = collection_;
    Document* doc = find_locked(id);
    doc->payload = std::move(payload);
    doc->updated_at = now_();
    return commit_locked(std::move(previous));
}

Result<void, Error> DocumentStore::append(const DocumentId& id, Json entry) {
    std::lock_guard lock(mutex_);
    if (!find_locked(id)) {
        return not_found(id);
    }

    Collection previous = collection_;
    Document* doc = find_locked(id);
    TimePoint now = now_();

    if (entry.is_object() && !entry.contains("timestamp")) {
        entry["timestamp"] = to_epoch_ms(now);
    }

    // A default title gives way to the opening of the first user entry
    if (doc->title.starts_with(kDefaultTitlePrefix) && entry.is_object() &&
        string_field(entry, "role") == "user") {
        std::string text = string_field(entry, "content");
        if (!text.empty()) {
            doc->title = text.substr(0, kTitleLength);
            if (text.size() > kTitleLength) {
                doc->title += "...";
            }
        }
    }

    doc->entries.push_back(std::move(entry));
    doc->updated_at = now;
    return commit_locked(std::move(previous));
}

Result<void, Error> DocumentStore::remove(const DocumentId& id) {
    std::lock_guard lock(mutex_);
    if (!find_locked(id)) {
        return not_found(id);
    }

    Collection previous = collection_;
    collection_.documents.erase(id);
    if (collection_.current == id) {
        collection_.current.reset();
    }
    return commit_locked(std::move(previous));
}

Result<void, Error> DocumentStore::set_pinned(const DocumentId& id, bool pinned) {
    std::lock_guard lock(mutex_);
    Document* doc = find_locked(id);
    if (!doc) {
        return not_found(id);
    }
    if (doc->pinned == pinned) {
        return Result<void, Error>::ok();
    }

    Collection previous = collection_;
    find_locked(id)->pinned = pinned;
    return commit_locked(std::move(previous));
}

Result<bool, Error> DocumentStore::toggle_pinned(const DocumentId& id) {
    std::lock_guard lock(mutex_);
    if (!find_locked(id)) {
        return Result<bool, Error>::err(not_found(id).error());
    }

    Collection previous = collection_;
    Document* doc = find_locked(id);
    doc->pinned = !doc->pinned;
    bool pinned = doc->pinned;

    auto result = commit_locked(std::move(previous));
    if (result.is_err()) {
        return Result<bool, Error>::err(std::move(result).error());
    }
    return Result<bool, Error>::ok(pinned);
}

Result<void, Error> DocumentStore::set_tags(const DocumentId& id, std::vector<std::string> tags) {
    std::lock_guard lock(mutex_);
    if (!find_locked(id)) {
        return not_found(id);
    }

    Collection previous = collection_;
    find_locked(id)->tags = std::move(tags);
    return commit_locked(std::move(previous));
}

Result<void, Error> DocumentStore::rename(const DocumentId& id, std::string title) {
    if (title.empty()) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "Title must not be empty", id);
    }

    std::lock_guard lock(mutex_);
    if (!find_locked(id)) {
        return not_found(id);
    }

    Collection previous = collection_;
    Document* doc = find_locked(id);
    doc->title = std::move(title);
    doc->updated_at = now_();
    return commit_locked(std::move(previous));
}

Result<void, Error> DocumentStore::set_current(const std::optional<DocumentId>& id) {
    std::lock_guard lock(mutex_);
    if (id && !find_locked(*id)) {
        return not_found(*id);
    }

    Collection previous = collection_;
    collection_.current = id;
    return commit_locked(std::move(previous));
}

Result<void, Error> DocumentStore::clear() {
    std::lock_guard lock(mutex_);
    Collection previous = collection_;
    collection_.documents.clear();
    collection_.current.reset();
    return commit_locked(std::move(previous));
}

std::optional<Document> DocumentStore::get(const DocumentId& id) const {
    std::lock_guard lock(mutex_);
    auto it = collection_.documents.find(id);
    if (it == collection_.documents.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Document> DocumentStore::current() const {
    std::lock_guard lock(mutex_);
    if (!collection_.current) {
        return std::nullopt;
    }
    auto it = collection_.documents.find(*collection_.current);
    if (it == collection_.documents.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DocumentId> DocumentStore::current_id() const {
    std::lock_guard lock(mutex_);
    return collection_.current;
}

std::vector<Document> DocumentStore::list() const {
    std::vector<Document> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(collection_.documents.size());
        for (const auto& [id, doc] : collection_.documents) {
            result.push_back(doc);
        }
    }

    std::sort(result.begin(), result.end(), [](const Document& a, const Document& b) {
        if (a.pinned != b.pinned) {
            return a.pinned;
        }
        if (a.updated_at != b.updated_at) {
            return a.updated_at > b.updated_at;
        }
        return a.sequence < b.sequence;
    });

    return result;
}

size_t DocumentStore::size() const {
    std::lock_guard lock(mutex_);
    return collection_.documents.size();
}

DocumentStats DocumentStore::stats() const {
    std::lock_guard lock(mutex_);
    DocumentStats stats;
    stats.total_documents = collection_.documents.size();

    for (const auto& [id, doc] : collection_.documents) {
        stats.total_entries += doc.entries.size();
        if (!stats.oldest_created || doc.created_at < *stats.oldest_created) {
            stats.oldest_created = doc.created_at;
        }
        if (!stats.newest_created || doc.created_at > *stats.newest_created) {
            stats.newest_created = doc.created_at;
        }
    }

    return stats;
}

Result<std::string, Error> DocumentStore::export_as_text(const DocumentId& id) const {
    auto doc = get(id);
    if (!doc) {
        return Result<std::string, Error>::err(ErrorCode::DocumentNotFound, "Document not found", id);
    }

    std::ostringstream out;
    out << "# " << doc->title << "\n";
    out << "Date: " << format_utc(doc->created_at, "%Y-%m-%d %H:%M:%S UTC") << "\n";
    if (doc->model_name) {
        out << "Model: " << *doc->model_name << "\n";
    }
    out << "\n";

    for (const auto& entry : doc->entries) {
        if (!entry.is_object() || !entry.contains("content")) {
            out << render(entry) << "\n\n";
            continue;
        }

        std::string role = string_field(entry, "role");
        const Json& content = entry["content"];
        std::string text = content.is_string() ? content.get<std::string>() : render(content);

        if (entry.contains("timestamp") && entry["timestamp"].is_number_integer()) {
            auto at = from_epoch_ms(entry["timestamp"].get<std::int64_t>());
            out << "[" << format_utc(at, "%H:%M:%S") << "] ";
        }
        out << role_label(role) << ":\n" << text << "\n\n";
    }

    return Result<std::string, Error>::ok(out.str());
}

}  // namespace rewindkit::documents
