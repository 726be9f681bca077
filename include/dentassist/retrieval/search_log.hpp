#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <SQLiteCpp/SQLiteCpp.h>

#include "dentassist/core/error.hpp"
#include "dentassist/core/types.hpp"

namespace dentassist::retrieval {

/// One executed search, kept for relevance tuning.
struct SearchLogRecord {
    int64_t id = 0;
    std::optional<std::string> session_id;
    std::string query;
    size_t top_k = 0;
    std::vector<double> scores;
    std::vector<EntryId> matched_ids;
    int64_t search_time_ms = 0;
    Timestamp created_at;
};

void to_json(json& j, const SearchLogRecord& r);

/// Append-only SQLite table of executed searches (`vector_search_logs`).
class SearchLog {
public:
    explicit SearchLog(const std::string& db_path);
    ~SearchLog();

    SearchLog(const SearchLog&) = delete;
    SearchLog& operator=(const SearchLog&) = delete;

    auto record(const SearchLogRecord& record) -> Result<void>;

    /// Newest first.
    [[nodiscard]] auto recent(size_t limit) -> Result<std::vector<SearchLogRecord>>;

    [[nodiscard]] auto count() -> Result<size_t>;

private:
    std::unique_ptr<SQLite::Database> db_;
    std::mutex mutex_;
};

} // namespace dentassist::retrieval
