#include "dentassist/knowledge/store.hpp"

#include <cstring>
#include <filesystem>

#include "dentassist/core/logger.hpp"

namespace dentassist::knowledge {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, question, answer, category, source, source_url, is_active, "
    "embedding, embedding_model, created_at, updated_at FROM knowledge_base ";

auto serialize_embedding(const Embedding& vec) -> std::string {
    std::string blob(vec.size() * sizeof(float), '\0');
    std::memcpy(blob.data(), vec.data(), blob.size());
    return blob;
}

auto deserialize_embedding(const void* blob, size_t bytes) -> Embedding {
    size_t count = bytes / sizeof(float);
    Embedding vec(count);
    std::memcpy(vec.data(), blob, count * sizeof(float));
    return vec;
}

auto read_entry(SQLite::Statement& stmt) -> QAEntry {
    QAEntry e;
    e.id = stmt.getColumn(0).getInt64();
    e.question = stmt.getColumn(1).getString();
    e.answer = stmt.getColumn(2).getString();
    e.category = stmt.getColumn(3).getString();
    e.source = stmt.getColumn(4).getString();
    if (!stmt.getColumn(5).isNull()) {
        e.source_url = stmt.getColumn(5).getString();
    }
    e.active = stmt.getColumn(6).getInt() != 0;
    auto blob = stmt.getColumn(7);
    if (!blob.isNull() && blob.getBytes() > 0) {
        e.embedding = deserialize_embedding(blob.getBlob(),
                                            static_cast<size_t>(blob.getBytes()));
    }
    if (!stmt.getColumn(8).isNull()) {
        e.embedding_model = stmt.getColumn(8).getString();
    }
    e.created_at = from_epoch_ms(stmt.getColumn(9).getInt64());
    e.updated_at = from_epoch_ms(stmt.getColumn(10).getInt64());
    return e;
}

void bind_optional(SQLite::Statement& stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        stmt.bind(index, *value);
    } else {
        stmt.bind(index);
    }
}

void bind_embedding(SQLite::Statement& stmt, int index, const std::optional<Embedding>& value) {
    if (value && !value->empty()) {
        auto blob = serialize_embedding(*value);
        stmt.bind(index, blob.data(), static_cast<int>(blob.size()));
    } else {
        stmt.bind(index);
    }
}

auto db_error(std::string message, const SQLite::Exception& e) -> Error {
    LOG_ERROR("{}: {}", message, e.what());
    return make_error(ErrorCode::DatabaseError, std::move(message), e.what());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// KnowledgeStats JSON
// ---------------------------------------------------------------------------

void to_json(json& j, const KnowledgeStats& s) {
    j = json{
        {"total_entries", s.total},
        {"active_entries", s.active},
        {"inactive_entries", s.inactive},
        {"unembedded_entries", s.unembedded},
        {"by_category", s.by_category},
        {"by_source", s.by_source},
    };
}

// ---------------------------------------------------------------------------
// KnowledgeStore listener plumbing
// ---------------------------------------------------------------------------

void KnowledgeStore::add_listener(std::shared_ptr<KnowledgeListener> listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

auto KnowledgeStore::snapshot_listeners() -> std::vector<std::shared_ptr<KnowledgeListener>> {
    std::lock_guard lock(listeners_mutex_);
    return listeners_;
}

void KnowledgeStore::notify_upserted(const QAEntry& entry) {
    for (auto& l : snapshot_listeners()) l->on_entry_upserted(entry);
}

void KnowledgeStore::notify_removed(EntryId id) {
    for (auto& l : snapshot_listeners()) l->on_entry_removed(id);
}

void KnowledgeStore::notify_bulk(const std::vector<QAEntry>& searchable) {
    for (auto& l : snapshot_listeners()) l->on_bulk_change(searchable);
}

// ---------------------------------------------------------------------------
// SqliteKnowledgeStore
// ---------------------------------------------------------------------------

SqliteKnowledgeStore::SqliteKnowledgeStore(const std::string& db_path) {
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    try {
        db_ = std::make_unique<SQLite::Database>(
            db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        db_->setBusyTimeout(5000);
        db_->exec("PRAGMA journal_mode=WAL");
        db_->exec("PRAGMA synchronous=NORMAL");
        init_schema();
        LOG_INFO("Knowledge store opened: {}", db_path);
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to open knowledge store: {}", e.what());
        throw;
    }
}

SqliteKnowledgeStore::~SqliteKnowledgeStore() = default;

void SqliteKnowledgeStore::init_schema() {
    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS knowledge_base (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            question        TEXT NOT NULL,
            answer          TEXT NOT NULL,
            category        TEXT NOT NULL DEFAULT 'general',
            source          TEXT NOT NULL DEFAULT 'user_defined',
            source_url      TEXT,
            is_active       INTEGER NOT NULL DEFAULT 1,
            embedding       BLOB,
            embedding_model TEXT,
            created_at      INTEGER NOT NULL,
            updated_at      INTEGER NOT NULL
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_kb_category ON knowledge_base(category)
    )SQL");

    db_->exec(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_kb_active ON knowledge_base(is_active)
    )SQL");
}

auto SqliteKnowledgeStore::insert_locked(const NewEntry& entry, Timestamp now) -> QAEntry {
    SQLite::Statement stmt(*db_,
        "INSERT INTO knowledge_base (question, answer, category, source, source_url, "
        "is_active, embedding, embedding_model, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, 1, ?, ?, ?, ?)");
    stmt.bind(1, entry.draft.question);
    stmt.bind(2, entry.draft.answer);
    stmt.bind(3, entry.draft.category);
    stmt.bind(4, entry.draft.source);
    bind_optional(stmt, 5, entry.draft.source_url);
    bind_embedding(stmt, 6, entry.embedding);
    bind_optional(stmt, 7, entry.embedding ? entry.embedding_model : std::nullopt);
    stmt.bind(8, to_epoch_ms(now));
    stmt.bind(9, to_epoch_ms(now));
    stmt.exec();

    QAEntry created;
    created.id = db_->getLastInsertRowid();
    created.question = entry.draft.question;
    created.answer = entry.draft.answer;
    created.category = entry.draft.category;
    created.source = entry.draft.source;
    created.source_url = entry.draft.source_url;
    created.active = true;
    created.embedding = entry.embedding;
    if (entry.embedding) created.embedding_model = entry.embedding_model;
    // Round-trip through milliseconds so the value matches a later read.
    created.created_at = from_epoch_ms(to_epoch_ms(now));
    created.updated_at = created.created_at;
    return created;
}

auto SqliteKnowledgeStore::get_locked(EntryId id) -> std::optional<QAEntry> {
    SQLite::Statement stmt(*db_, std::string(kSelectColumns) + "WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.executeStep()) return std::nullopt;
    return read_entry(stmt);
}

auto SqliteKnowledgeStore::searchable_locked() -> std::vector<QAEntry> {
    SQLite::Statement stmt(*db_, std::string(kSelectColumns) +
        "WHERE is_active = 1 AND embedding IS NOT NULL ORDER BY id");
    std::vector<QAEntry> out;
    while (stmt.executeStep()) {
        auto e = read_entry(stmt);
        if (e.is_searchable()) out.push_back(std::move(e));
    }
    return out;
}

auto SqliteKnowledgeStore::distinct_locked(const char* column) -> std::vector<std::string> {
    SQLite::Statement stmt(*db_, std::string("SELECT DISTINCT ") + column +
        " FROM knowledge_base WHERE is_active = 1 ORDER BY " + column);
    std::vector<std::string> out;
    while (stmt.executeStep()) {
        out.push_back(stmt.getColumn(0).getString());
    }
    return out;
}

auto SqliteKnowledgeStore::create(NewEntry entry) -> awaitable<Result<QAEntry>> {
    std::lock_guard publish(publish_mutex_);
    QAEntry created;
    try {
        std::lock_guard lock(mutex_);
        created = insert_locked(entry, Clock::now());
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to create entry", e));
    }

    LOG_DEBUG("Created knowledge entry {} (embedded={})", created.id,
              created.embedding.has_value());
    notify_upserted(created);
    co_return created;
}

auto SqliteKnowledgeStore::create_many(std::vector<NewEntry> entries)
    -> awaitable<Result<std::vector<QAEntry>>> {
    std::lock_guard publish(publish_mutex_);
    std::vector<QAEntry> created;
    std::vector<QAEntry> searchable_now;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Transaction txn(*db_);
        auto now = Clock::now();
        created.reserve(entries.size());
        for (const auto& entry : entries) {
            created.push_back(insert_locked(entry, now));
        }
        txn.commit();
        searchable_now = searchable_locked();
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to create entries", e));
    }

    LOG_INFO("Created {} knowledge entries in batch", created.size());
    notify_bulk(searchable_now);
    co_return created;
}

auto SqliteKnowledgeStore::get(EntryId id) -> awaitable<Result<QAEntry>> {
    std::optional<QAEntry> found;
    try {
        std::lock_guard lock(mutex_);
        found = get_locked(id);
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to get entry", e));
    }
    if (!found) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Entry not found",
                                       std::to_string(id)));
    }
    co_return std::move(*found);
}

auto SqliteKnowledgeStore::get_many(const std::vector<EntryId>& ids)
    -> awaitable<Result<std::vector<QAEntry>>> {
    std::vector<QAEntry> out;
    if (ids.empty()) co_return out;

    std::string placeholders;
    for (size_t i = 0; i < ids.size(); ++i) {
        placeholders += (i == 0) ? "?" : ",?";
    }

    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_, std::string(kSelectColumns) +
            "WHERE id IN (" + placeholders + ")");
        for (size_t i = 0; i < ids.size(); ++i) {
            stmt.bind(static_cast<int>(i + 1), ids[i]);
        }
        while (stmt.executeStep()) {
            out.push_back(read_entry(stmt));
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to hydrate entries", e));
    }
    co_return out;
}

auto SqliteKnowledgeStore::list(const ListFilter& filter)
    -> awaitable<Result<std::vector<QAEntry>>> {
    std::string sql = std::string(kSelectColumns) + "WHERE 1 = 1";
    if (!filter.include_inactive) sql += " AND is_active = 1";
    if (filter.category) sql += " AND category = ?";
    if (filter.source) sql += " AND source = ?";
    sql += " ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?";

    std::vector<QAEntry> out;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_, sql);
        int idx = 1;
        if (filter.category) stmt.bind(idx++, *filter.category);
        if (filter.source) stmt.bind(idx++, *filter.source);
        stmt.bind(idx++, static_cast<int64_t>(filter.limit));
        stmt.bind(idx++, static_cast<int64_t>(filter.offset));
        while (stmt.executeStep()) {
            out.push_back(read_entry(stmt));
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to list entries", e));
    }
    co_return out;
}

auto SqliteKnowledgeStore::update(const QAEntry& entry) -> awaitable<Result<QAEntry>> {
    std::lock_guard publish(publish_mutex_);
    std::optional<QAEntry> updated;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "UPDATE knowledge_base SET question = ?, answer = ?, category = ?, source = ?, "
            "source_url = ?, is_active = ?, embedding = ?, embedding_model = ?, "
            "updated_at = MAX(updated_at, ?) WHERE id = ?");
        stmt.bind(1, entry.question);
        stmt.bind(2, entry.answer);
        stmt.bind(3, entry.category);
        stmt.bind(4, entry.source);
        bind_optional(stmt, 5, entry.source_url);
        stmt.bind(6, entry.active ? 1 : 0);
        bind_embedding(stmt, 7, entry.embedding);
        bind_optional(stmt, 8, entry.embedding ? entry.embedding_model : std::nullopt);
        stmt.bind(9, to_epoch_ms(Clock::now()));
        stmt.bind(10, entry.id);
        if (stmt.exec() > 0) {
            updated = get_locked(entry.id);
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to update entry", e));
    }

    if (!updated) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Entry not found",
                                       std::to_string(entry.id)));
    }
    LOG_DEBUG("Updated knowledge entry {} (active={}, embedded={})", updated->id,
              updated->active, updated->embedding.has_value());
    notify_upserted(*updated);
    co_return std::move(*updated);
}

auto SqliteKnowledgeStore::set_embeddings(std::vector<EmbeddingUpdate> updates,
                                          std::string model) -> awaitable<Result<size_t>> {
    std::lock_guard publish(publish_mutex_);
    size_t written = 0;
    std::vector<QAEntry> searchable_now;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Transaction txn(*db_);
        SQLite::Statement stmt(*db_,
            "UPDATE knowledge_base SET embedding = ?, embedding_model = ?, "
            "updated_at = MAX(updated_at, ?) "
            "WHERE id = ? AND question = ? AND answer = ? AND category = ?");
        auto now_ms = to_epoch_ms(Clock::now());
        for (const auto& u : updates) {
            bind_embedding(stmt, 1, u.vector);
            stmt.bind(2, model);
            stmt.bind(3, now_ms);
            stmt.bind(4, u.id);
            stmt.bind(5, u.question);
            stmt.bind(6, u.answer);
            stmt.bind(7, u.category);
            written += static_cast<size_t>(stmt.exec());
            stmt.reset();
        }
        txn.commit();
        searchable_now = searchable_locked();
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to store embeddings", e));
    }

    if (written < updates.size()) {
        LOG_INFO("Skipped {} embeddings for entries edited or deleted since they were read",
                 updates.size() - written);
    }
    LOG_INFO("Stored {} regenerated embeddings ({})", written, model);
    notify_bulk(searchable_now);
    co_return written;
}

auto SqliteKnowledgeStore::remove(EntryId id) -> awaitable<Result<void>> {
    std::lock_guard publish(publish_mutex_);
    int rows = 0;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_, "DELETE FROM knowledge_base WHERE id = ?");
        stmt.bind(1, id);
        rows = stmt.exec();
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to delete entry", e));
    }

    if (rows == 0) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Entry not found",
                                       std::to_string(id)));
    }
    LOG_DEBUG("Deleted knowledge entry {}", id);
    notify_removed(id);
    co_return ok_result();
}

auto SqliteKnowledgeStore::searchable() -> awaitable<Result<std::vector<QAEntry>>> {
    try {
        std::lock_guard lock(mutex_);
        co_return searchable_locked();
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to load searchable entries", e));
    }
}

auto SqliteKnowledgeStore::unembedded() -> awaitable<Result<std::vector<QAEntry>>> {
    std::vector<QAEntry> out;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_, std::string(kSelectColumns) +
            "WHERE is_active = 1 AND (embedding IS NULL OR length(embedding) = 0) ORDER BY id");
        while (stmt.executeStep()) {
            out.push_back(read_entry(stmt));
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to load unembedded entries", e));
    }
    co_return out;
}

auto SqliteKnowledgeStore::republish() -> awaitable<Result<std::vector<QAEntry>>> {
    std::lock_guard publish(publish_mutex_);
    std::vector<QAEntry> searchable_now;
    try {
        std::lock_guard lock(mutex_);
        searchable_now = searchable_locked();
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to load searchable entries", e));
    }
    notify_bulk(searchable_now);
    co_return searchable_now;
}

auto SqliteKnowledgeStore::categories() -> awaitable<Result<std::vector<std::string>>> {
    try {
        std::lock_guard lock(mutex_);
        co_return distinct_locked("category");
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to list categories", e));
    }
}

auto SqliteKnowledgeStore::sources() -> awaitable<Result<std::vector<std::string>>> {
    try {
        std::lock_guard lock(mutex_);
        co_return distinct_locked("source");
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to list sources", e));
    }
}

auto SqliteKnowledgeStore::stats() -> awaitable<Result<KnowledgeStats>> {
    KnowledgeStats s;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement totals(*db_,
            "SELECT COUNT(*), "
            "COALESCE(SUM(is_active), 0), "
            "COALESCE(SUM(CASE WHEN is_active = 1 AND (embedding IS NULL OR length(embedding) = 0) "
            "THEN 1 ELSE 0 END), 0) FROM knowledge_base");
        if (totals.executeStep()) {
            s.total = static_cast<size_t>(totals.getColumn(0).getInt64());
            s.active = static_cast<size_t>(totals.getColumn(1).getInt64());
            s.unembedded = static_cast<size_t>(totals.getColumn(2).getInt64());
            s.inactive = s.total - s.active;
        }

        SQLite::Statement cats(*db_,
            "SELECT category, COUNT(*) FROM knowledge_base WHERE is_active = 1 GROUP BY category");
        while (cats.executeStep()) {
            s.by_category[cats.getColumn(0).getString()] =
                static_cast<size_t>(cats.getColumn(1).getInt64());
        }

        SQLite::Statement srcs(*db_,
            "SELECT source, COUNT(*) FROM knowledge_base WHERE is_active = 1 GROUP BY source");
        while (srcs.executeStep()) {
            s.by_source[srcs.getColumn(0).getString()] =
                static_cast<size_t>(srcs.getColumn(1).getInt64());
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to compute knowledge stats", e));
    }
    co_return s;
}

} // namespace dentassist::knowledge
