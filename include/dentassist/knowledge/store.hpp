#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <SQLiteCpp/SQLiteCpp.h>

#include "dentassist/core/error.hpp"
#include "dentassist/knowledge/entry.hpp"
#include "dentassist/knowledge/events.hpp"

namespace dentassist::knowledge {

using boost::asio::awaitable;

struct ListFilter {
    std::optional<std::string> category;
    std::optional<std::string> source;
    bool include_inactive = false;
    size_t limit = 100;
    size_t offset = 0;
};

struct KnowledgeStats {
    size_t total = 0;
    size_t active = 0;
    size_t inactive = 0;
    size_t unembedded = 0;  // active entries lacking an embedding
    std::map<std::string, size_t> by_category;
    std::map<std::string, size_t> by_source;
};

void to_json(json& j, const KnowledgeStats& s);

/// A new entry together with its (possibly missing) embedding.
struct NewEntry {
    EntryDraft draft;
    std::optional<Embedding> embedding;
    std::optional<std::string> embedding_model;
};

/// A regenerated embedding and the entry text it was computed from.
struct EmbeddingUpdate {
    EntryId id = 0;
    std::string question;
    std::string answer;
    std::string category;
    Embedding vector;
};

/// Durable collection of QA entries; the source of truth for content and
/// the active flag. Mutations are reported to registered listeners.
class KnowledgeStore {
public:
    virtual ~KnowledgeStore() = default;

    virtual auto create(NewEntry entry) -> awaitable<Result<QAEntry>> = 0;

    /// Inserts all entries in one transaction and emits a single bulk event.
    virtual auto create_many(std::vector<NewEntry> entries)
        -> awaitable<Result<std::vector<QAEntry>>> = 0;

    virtual auto get(EntryId id) -> awaitable<Result<QAEntry>> = 0;

    /// Fetches the entries that still exist; unknown ids are skipped.
    virtual auto get_many(const std::vector<EntryId>& ids)
        -> awaitable<Result<std::vector<QAEntry>>> = 0;

    /// Newest first.
    virtual auto list(const ListFilter& filter) -> awaitable<Result<std::vector<QAEntry>>> = 0;

    /// Replaces every mutable field of an existing entry and bumps updated_at.
    virtual auto update(const QAEntry& entry) -> awaitable<Result<QAEntry>> = 0;

    /// Stores regenerated embeddings and emits a single bulk event. An update
    /// whose entry text changed since it was read is skipped; the count
    /// returned excludes it.
    virtual auto set_embeddings(std::vector<EmbeddingUpdate> updates,
                                std::string model) -> awaitable<Result<size_t>> = 0;

    virtual auto remove(EntryId id) -> awaitable<Result<void>> = 0;

    /// Active entries that carry an embedding.
    virtual auto searchable() -> awaitable<Result<std::vector<QAEntry>>> = 0;

    /// Active entries lacking an embedding.
    virtual auto unembedded() -> awaitable<Result<std::vector<QAEntry>>> = 0;

    /// Sends the current searchable set to listeners as one bulk event,
    /// ordered with other mutations, and returns it.
    virtual auto republish() -> awaitable<Result<std::vector<QAEntry>>> = 0;

    virtual auto categories() -> awaitable<Result<std::vector<std::string>>> = 0;
    virtual auto sources() -> awaitable<Result<std::vector<std::string>>> = 0;
    virtual auto stats() -> awaitable<Result<KnowledgeStats>> = 0;

    void add_listener(std::shared_ptr<KnowledgeListener> listener);

protected:
    void notify_upserted(const QAEntry& entry);
    void notify_removed(EntryId id);
    void notify_bulk(const std::vector<QAEntry>& searchable);

private:
    auto snapshot_listeners() -> std::vector<std::shared_ptr<KnowledgeListener>>;

    std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<KnowledgeListener>> listeners_;
};

/// KnowledgeStore backed by a SQLite database file.
/// A single connection is shared; every statement runs under one mutex.
/// Mutations also hold a publish lock from commit until their listeners
/// return, so change events never overtake one another.
class SqliteKnowledgeStore : public KnowledgeStore {
public:
    explicit SqliteKnowledgeStore(const std::string& db_path);
    ~SqliteKnowledgeStore() override;

    SqliteKnowledgeStore(const SqliteKnowledgeStore&) = delete;
    SqliteKnowledgeStore& operator=(const SqliteKnowledgeStore&) = delete;

    auto create(NewEntry entry) -> awaitable<Result<QAEntry>> override;
    auto create_many(std::vector<NewEntry> entries)
        -> awaitable<Result<std::vector<QAEntry>>> override;
    auto get(EntryId id) -> awaitable<Result<QAEntry>> override;
    auto get_many(const std::vector<EntryId>& ids)
        -> awaitable<Result<std::vector<QAEntry>>> override;
    auto list(const ListFilter& filter) -> awaitable<Result<std::vector<QAEntry>>> override;
    auto update(const QAEntry& entry) -> awaitable<Result<QAEntry>> override;
    auto set_embeddings(std::vector<EmbeddingUpdate> updates,
                        std::string model) -> awaitable<Result<size_t>> override;
    auto remove(EntryId id) -> awaitable<Result<void>> override;
    auto searchable() -> awaitable<Result<std::vector<QAEntry>>> override;
    auto unembedded() -> awaitable<Result<std::vector<QAEntry>>> override;
    auto republish() -> awaitable<Result<std::vector<QAEntry>>> override;
    auto categories() -> awaitable<Result<std::vector<std::string>>> override;
    auto sources() -> awaitable<Result<std::vector<std::string>>> override;
    auto stats() -> awaitable<Result<KnowledgeStats>> override;

private:
    void init_schema();
    auto insert_locked(const NewEntry& entry, Timestamp now) -> QAEntry;
    auto get_locked(EntryId id) -> std::optional<QAEntry>;
    auto searchable_locked() -> std::vector<QAEntry>;
    auto distinct_locked(const char* column) -> std::vector<std::string>;

    std::unique_ptr<SQLite::Database> db_;
    std::mutex publish_mutex_;  // taken before mutex_
    std::mutex mutex_;
};

} // namespace dentassist::knowledge
