#pragma once

#include "document.hpp"
#include "rewind/core/config.hpp"
#include "rewind/core/result.hpp"
#include "rewind/storage/state_store.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rewindkit::documents {

// Keyed collection of documents persisted as one state document.
//
// The collection is soft-bounded by max_documents. Eviction removes the
// least recently updated unpinned documents until at most max_documents / 2
// remain; it runs when a create pushes the count past max_documents and
// when a save is refused with QuotaExceeded, in which case the save is
// retried exactly once. Pinned documents are never evicted.
//
// Every mutating call either persists its change or leaves the collection
// exactly as it was.
class DocumentStore {
public:
    DocumentStore(storage::StateStore& store, const DocumentConfig& config,
                  NowFn now = [] { return Clock::now(); });

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // Re-read the collection from the store; returns the number of documents.
    // A missing or corrupt collection loads as empty.
    size_t reload();

    // Create a document and make it current
    Result<DocumentId, Error> create(Json initial_payload = Json::object(),
                                     std::optional<std::string> title = std::nullopt,
                                     std::optional<std::string> model_name = std::nullopt);

    // Replace the payload
    Result<void, Error> update(const DocumentId& id, Json payload);

    // Append an entry. Object entries get a "timestamp" when they lack one.
    Result<void, Error> append(const DocumentId& id, Json entry);

    Result<void, Error> remove(const DocumentId& id);

    Result<void, Error> set_pinned(const DocumentId& id, bool pinned);
    Result<bool, Error> toggle_pinned(const DocumentId& id);
    Result<void, Error> set_tags(const DocumentId& id, std::vector<std::string> tags);
    Result<void, Error> rename(const DocumentId& id, std::string title);

    // nullopt clears the current pointer
    Result<void, Error> set_current(const std::optional<DocumentId>& id);

    // Remove every document
    Result<void, Error> clear();

    std::optional<Document> get(const DocumentId& id) const;
    std::optional<Document> current() const;
    std::optional<DocumentId> current_id() const;

    // Pinned first, then most recently updated, then insertion order
    std::vector<Document> list() const;

    size_t size() const;
    DocumentStats stats() const;

    // Plain-text transcript of a document's entries
    Result<std::string, Error> export_as_text(const DocumentId& id) const;

    size_t max_documents() const { return max_documents_; }

private:
    struct Collection {
        std::map<DocumentId, Document> documents;
        std::optional<DocumentId> current;
        std::uint64_t next_sequence = 1;
    };

    storage::StateStore& store_;
    size_t max_documents_;
    NowFn now_;

    mutable std::mutex mutex_;
    Collection collection_;

    Json to_json_locked() const;
    Result<void, Error> persist_locked();
    Result<void, Error> commit_locked(Collection previous);
    size_t evict_locked();
    Document* find_locked(const DocumentId& id);
    Result<void, Error> not_found(const DocumentId& id) const;
};

}  // namespace rewindkit::documents
