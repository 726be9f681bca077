#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "dentassist/assistant/responder.hpp"
#include "dentassist/chat/manager.hpp"
#include "dentassist/core/async.hpp"
#include "dentassist/core/config.hpp"
#include "dentassist/core/error.hpp"
#include "dentassist/knowledge/authoring.hpp"
#include "dentassist/knowledge/store.hpp"
#include "dentassist/providers/provider.hpp"
#include "dentassist/retrieval/embeddings.hpp"
#include "dentassist/retrieval/index_sync.hpp"
#include "dentassist/retrieval/retriever.hpp"
#include "dentassist/retrieval/search_log.hpp"
#include "dentassist/retrieval/vector_index.hpp"

namespace dentassist::assistant {

using boost::asio::awaitable;

struct RebuildReport {
    size_t indexed = 0;
    size_t embedded = 0;   // entries (re)embedded during this rebuild
    size_t unsearchable = 0;  // active entries left out of the index
    int64_t elapsed_ms = 0;
    bool coalesced = false;  // another rebuild was already running
};

void to_json(json& j, const RebuildReport& r);

/// The externally provided collaborators of an Assistant.
struct Components {
    std::shared_ptr<knowledge::KnowledgeStore> knowledge;
    std::shared_ptr<retrieval::EmbeddingProvider> embedder;
    std::shared_ptr<providers::Provider> generator;
    std::unique_ptr<chat::ChatStore> chat_store;
    std::shared_ptr<retrieval::SearchLog> search_log;  // optional
};

/// Owns and wires the retrieval engine: store, index, synchronizer,
/// retriever, authoring, sessions and response assembly.
///
/// Instances are independent; nothing here is process-global.
class Assistant {
public:
    Assistant(Config config, Components components);
    ~Assistant();

    Assistant(const Assistant&) = delete;
    Assistant& operator=(const Assistant&) = delete;

    /// Builds SQLite-backed components under the configured data directory.
    /// Throws on a database that cannot be opened.
    [[nodiscard]] static auto create(boost::asio::io_context& ioc, Config config)
        -> std::unique_ptr<Assistant>;

    /// Loads the persisted index if it matches the store, otherwise rebuilds.
    auto initialize() -> awaitable<Result<void>>;

    /// Ranked matches for `query`, bypassing sessions and generation.
    auto search(std::string query, retrieval::RetrieveOptions options)
        -> awaitable<Result<std::vector<retrieval::SearchResult>>>;

    /// One chat turn. An empty session id starts a new session.
    auto chat(std::string session_id, std::string query, CancelToken cancel = {})
        -> awaitable<Result<ChatReply>>;

    /// Embeds entries lacking a usable vector (all entries when
    /// `reembed_all`) and swaps in a freshly built index. Safe to call while
    /// queries run; a call overlapping a running rebuild returns at once
    /// with `coalesced` set.
    auto rebuild_index(bool reembed_all = false) -> awaitable<Result<RebuildReport>>;

    /// Writes the index snapshot when persistence is enabled.
    auto save_index() -> Result<void>;

    auto expire_idle_sessions() -> awaitable<Result<size_t>>;

    auto status() -> awaitable<Result<json>>;

    [[nodiscard]] auto config() const -> const Config& { return config_; }
    [[nodiscard]] auto author() -> knowledge::KnowledgeAuthor& { return *author_; }
    [[nodiscard]] auto sessions() -> chat::SessionManager& { return *sessions_; }
    [[nodiscard]] auto knowledge() -> knowledge::KnowledgeStore& { return *knowledge_; }
    [[nodiscard]] auto index() -> retrieval::VectorIndex& { return *index_; }

    /// Where the index snapshot lives, if persistence is enabled.
    [[nodiscard]] auto snapshot_path() const -> std::optional<std::filesystem::path>;

private:
    auto index_matches_store() -> awaitable<Result<bool>>;

    Config config_;
    std::shared_ptr<knowledge::KnowledgeStore> knowledge_;
    std::shared_ptr<retrieval::EmbeddingProvider> embedder_;
    std::shared_ptr<retrieval::VectorIndex> index_;
    std::shared_ptr<retrieval::IndexSynchronizer> synchronizer_;
    std::shared_ptr<retrieval::SearchLog> search_log_;
    std::shared_ptr<retrieval::Retriever> retriever_;
    std::unique_ptr<knowledge::KnowledgeAuthor> author_;
    std::shared_ptr<chat::SessionManager> sessions_;
    std::unique_ptr<ResponseAssembler> responder_;
    std::atomic<bool> rebuilding_{false};
};

} // namespace dentassist::assistant
