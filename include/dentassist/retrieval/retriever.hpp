#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "dentassist/core/config.hpp"
#include "dentassist/core/error.hpp"
#include "dentassist/knowledge/store.hpp"
#include "dentassist/retrieval/embeddings.hpp"
#include "dentassist/retrieval/search_log.hpp"
#include "dentassist/retrieval/vector_index.hpp"

namespace dentassist::retrieval {

using boost::asio::awaitable;

/// A ranked, hydrated match. Not persisted.
struct SearchResult {
    EntryId id = 0;
    std::string question;
    std::string answer;
    std::string category;
    std::string source;
    std::optional<std::string> source_url;
    double similarity = 0.0;
    size_t rank = 0;  // 1-based
};

void to_json(json& j, const SearchResult& r);

struct RetrieveOptions {
    size_t k = 5;
    double threshold = 0.7;
    std::optional<std::string> category;
    bool deduplicate = false;
    std::optional<std::string> session_id;  // attributed in the search log

    [[nodiscard]] static auto from_config(const RetrievalConfig& config) -> RetrieveOptions;
};

/// Query text to ranked SearchResults: embed, search the index, hydrate from
/// the store. Ids the store no longer has, or no longer considers
/// searchable, are dropped silently. Nothing clearing the threshold is an
/// empty result, not an error.
class Retriever {
public:
    /// `log` may be null to disable search logging.
    Retriever(std::shared_ptr<EmbeddingProvider> embedder,
              std::shared_ptr<VectorIndex> index,
              std::shared_ptr<knowledge::KnowledgeStore> store,
              std::shared_ptr<SearchLog> log = nullptr);

    /// Fails with InvalidArgument for a blank query or a threshold outside
    /// [0, 1], and EmbeddingUnavailable when the query cannot be embedded.
    auto retrieve(std::string query, RetrieveOptions options)
        -> awaitable<Result<std::vector<SearchResult>>>;

private:
    std::shared_ptr<EmbeddingProvider> embedder_;
    std::shared_ptr<VectorIndex> index_;
    std::shared_ptr<knowledge::KnowledgeStore> store_;
    std::shared_ptr<SearchLog> log_;
};

} // namespace dentassist::retrieval
