#include "dentassist/retrieval/search_log.hpp"

#include <filesystem>

#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"

namespace dentassist::retrieval {

void to_json(json& j, const SearchLogRecord& r) {
    j = json{
        {"id", r.id},
        {"session_id", r.session_id ? json(*r.session_id) : json(nullptr)},
        {"query", r.query},
        {"top_k", r.top_k},
        {"similarity_scores", r.scores},
        {"matched_kb_ids", r.matched_ids},
        {"search_time_ms", r.search_time_ms},
        {"created_at", utils::to_iso(r.created_at)},
    };
}

SearchLog::SearchLog(const std::string& db_path) {
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    try {
        db_ = std::make_unique<SQLite::Database>(
            db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        db_->setBusyTimeout(5000);
        db_->exec("PRAGMA journal_mode=WAL");
        db_->exec(R"SQL(
            CREATE TABLE IF NOT EXISTS vector_search_logs (
                id                INTEGER PRIMARY KEY AUTOINCREMENT,
                session_id        TEXT,
                query             TEXT NOT NULL,
                top_k             INTEGER NOT NULL,
                similarity_scores TEXT NOT NULL,
                matched_kb_ids    TEXT NOT NULL,
                search_time_ms    INTEGER NOT NULL,
                created_at        INTEGER NOT NULL
            )
        )SQL");
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to open search log: {}", e.what());
        throw;
    }
}

SearchLog::~SearchLog() = default;

auto SearchLog::record(const SearchLogRecord& record) -> Result<void> {
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "INSERT INTO vector_search_logs (session_id, query, top_k, similarity_scores, "
            "matched_kb_ids, search_time_ms, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (record.session_id) {
            stmt.bind(1, *record.session_id);
        } else {
            stmt.bind(1);
        }
        stmt.bind(2, record.query);
        stmt.bind(3, static_cast<int64_t>(record.top_k));
        stmt.bind(4, json(record.scores).dump());
        stmt.bind(5, json(record.matched_ids).dump());
        stmt.bind(6, record.search_time_ms);
        stmt.bind(7, to_epoch_ms(record.created_at));
        stmt.exec();
    } catch (const SQLite::Exception& e) {
        return std::unexpected(make_error(ErrorCode::DatabaseError,
            "Failed to record search", e.what()));
    }
    return {};
}

auto SearchLog::recent(size_t limit) -> Result<std::vector<SearchLogRecord>> {
    std::vector<SearchLogRecord> out;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "SELECT id, session_id, query, top_k, similarity_scores, matched_kb_ids, "
            "search_time_ms, created_at FROM vector_search_logs "
            "ORDER BY id DESC LIMIT ?");
        stmt.bind(1, static_cast<int64_t>(limit));
        while (stmt.executeStep()) {
            SearchLogRecord r;
            r.id = stmt.getColumn(0).getInt64();
            if (!stmt.getColumn(1).isNull()) {
                r.session_id = stmt.getColumn(1).getString();
            }
            r.query = stmt.getColumn(2).getString();
            r.top_k = static_cast<size_t>(stmt.getColumn(3).getInt64());
            r.scores = json::parse(stmt.getColumn(4).getString()).get<std::vector<double>>();
            r.matched_ids = json::parse(stmt.getColumn(5).getString()).get<std::vector<EntryId>>();
            r.search_time_ms = stmt.getColumn(6).getInt64();
            r.created_at = from_epoch_ms(stmt.getColumn(7).getInt64());
            out.push_back(std::move(r));
        }
    } catch (const SQLite::Exception& e) {
        return std::unexpected(make_error(ErrorCode::DatabaseError,
            "Failed to read search log", e.what()));
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Corrupt search log row", e.what()));
    }
    return out;
}

auto SearchLog::count() -> Result<size_t> {
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_, "SELECT COUNT(*) FROM vector_search_logs");
        stmt.executeStep();
        return static_cast<size_t>(stmt.getColumn(0).getInt64());
    } catch (const SQLite::Exception& e) {
        return std::unexpected(make_error(ErrorCode::DatabaseError,
            "Failed to count search log", e.what()));
    }
}

} // namespace dentassist::retrieval
