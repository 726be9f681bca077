#include "dentassist/retrieval/retriever.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <unordered_set>

#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"

namespace dentassist::retrieval {

void to_json(json& j, const SearchResult& r) {
    j = json{
        {"id", r.id},
        {"question", r.question},
        {"answer", r.answer},
        {"category", r.category},
        {"source", r.source},
        {"source_url", r.source_url ? json(*r.source_url) : json(nullptr)},
        {"similarity_score", r.similarity},
        {"rank", r.rank},
    };
}

auto RetrieveOptions::from_config(const RetrievalConfig& config) -> RetrieveOptions {
    RetrieveOptions opts;
    opts.k = config.top_k;
    opts.threshold = config.similarity_threshold;
    opts.deduplicate = config.deduplicate;
    return opts;
}

Retriever::Retriever(std::shared_ptr<EmbeddingProvider> embedder,
                     std::shared_ptr<VectorIndex> index,
                     std::shared_ptr<knowledge::KnowledgeStore> store,
                     std::shared_ptr<SearchLog> log)
    : embedder_(std::move(embedder))
    , index_(std::move(index))
    , store_(std::move(store))
    , log_(std::move(log)) {}

auto Retriever::retrieve(std::string query, RetrieveOptions options)
    -> awaitable<Result<std::vector<SearchResult>>> {
    auto started = std::chrono::steady_clock::now();

    auto text = utils::collapse_whitespace(query);
    if (text.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Query is empty"));
    }
    if (options.threshold < 0.0 || options.threshold > 1.0) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Threshold must be within [0, 1]", std::to_string(options.threshold)));
    }

    std::vector<SearchResult> results;
    if (options.k == 0) co_return results;

    auto vec = co_await embedder_->embed(text);
    if (!vec) {
        LOG_WARN("Query embedding failed: {}", vec.error().what());
        co_return make_fail(make_error(ErrorCode::EmbeddingUnavailable,
            "Query could not be embedded", vec.error().what()));
    }

    // Post-hydration filters can discard hits, so widen the candidate set.
    bool filtered = options.category.has_value() || options.deduplicate;
    auto fetch = filtered ? std::max(options.k, index_->size()) : options.k;

    auto hits = index_->search(*vec, fetch, options.threshold);
    if (!hits) {
        co_return make_fail(hits.error());
    }

    std::vector<EntryId> ids;
    ids.reserve(hits->size());
    for (const auto& h : *hits) ids.push_back(h.id);

    auto hydrated = co_await store_->get_many(ids);
    if (!hydrated) {
        co_return make_fail(hydrated.error());
    }
    std::unordered_map<EntryId, knowledge::QAEntry> by_id;
    for (auto& e : *hydrated) {
        auto id = e.id;
        by_id.emplace(id, std::move(e));
    }

    std::unordered_set<std::string> seen;
    for (const auto& hit : *hits) {
        if (results.size() >= options.k) break;

        auto it = by_id.find(hit.id);
        if (it == by_id.end() || !it->second.is_searchable()) {
            LOG_DEBUG("Dropping stale index hit {}", hit.id);
            continue;
        }
        const auto& entry = it->second;
        if (options.category && entry.category != *options.category) continue;
        if (options.deduplicate &&
            !seen.insert(knowledge::content_fingerprint(entry.question, entry.answer)).second) {
            continue;
        }

        results.push_back(SearchResult{
            .id = entry.id,
            .question = entry.question,
            .answer = entry.answer,
            .category = entry.category,
            .source = entry.source,
            .source_url = entry.source_url,
            .similarity = hit.score,
            .rank = results.size() + 1,
        });
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    LOG_DEBUG("Search '{}' (k={}, threshold={}) -> {} results in {}ms",
              text, options.k, options.threshold, results.size(), elapsed);

    if (log_) {
        SearchLogRecord record;
        record.session_id = options.session_id;
        record.query = text;
        record.top_k = options.k;
        record.search_time_ms = elapsed;
        record.created_at = Clock::now();
        for (const auto& r : results) {
            record.scores.push_back(r.similarity);
            record.matched_ids.push_back(r.id);
        }
        if (auto logged = log_->record(record); !logged) {
            LOG_WARN("Search not logged: {}", logged.error().what());
        }
    }

    co_return results;
}

} // namespace dentassist::retrieval
