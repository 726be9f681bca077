#include "dentassist/assistant/assistant.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "dentassist/chat/store.hpp"
#include "dentassist/core/logger.hpp"
#include "dentassist/providers/openai.hpp"

namespace dentassist::assistant {

namespace {

/// Clears the rebuild flag when a rebuild finishes, however it finishes.
struct RebuildGuard {
    std::atomic<bool>& flag;
    ~RebuildGuard() { flag.store(false, std::memory_order_release); }
};

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

} // anonymous namespace

void to_json(json& j, const RebuildReport& r) {
    j = json{
        {"success", true},
        {"indexed_entries", r.indexed},
        {"embedded_entries", r.embedded},
        {"unsearchable_entries", r.unsearchable},
        {"elapsed_ms", r.elapsed_ms},
        {"coalesced", r.coalesced},
    };
}

Assistant::Assistant(Config config, Components components)
    : config_(std::move(config))
    , knowledge_(std::move(components.knowledge))
    , embedder_(std::move(components.embedder))
    , search_log_(std::move(components.search_log)) {
    if (!knowledge_ || !embedder_ || !components.generator || !components.chat_store) {
        throw std::invalid_argument("Assistant requires knowledge, embedder, generator "
                                    "and chat store components");
    }

    index_ = std::make_shared<retrieval::VectorIndex>(embedder_->dimensions());
    synchronizer_ = std::make_shared<retrieval::IndexSynchronizer>(index_);
    knowledge_->add_listener(synchronizer_);

    retriever_ = std::make_shared<retrieval::Retriever>(
        embedder_, index_, knowledge_, search_log_);
    author_ = std::make_unique<knowledge::KnowledgeAuthor>(
        knowledge_, embedder_, config_.embedding.embed_text);
    sessions_ = std::make_shared<chat::SessionManager>(
        std::move(components.chat_store), config_.sessions.history_limit);
    responder_ = std::make_unique<ResponseAssembler>(
        retriever_, sessions_, std::move(components.generator),
        config_.generation, config_.retrieval, config_.clinic);

    LOG_INFO("Assistant ready (embedder: {}, {}D)", embedder_->name(), embedder_->dimensions());
}

Assistant::~Assistant() = default;

auto Assistant::create(boost::asio::io_context& ioc, Config config)
    -> std::unique_ptr<Assistant> {
    auto data_dir = resolve_data_dir(config);
    auto kb_path = config.knowledge.db_path.value_or((data_dir / "knowledge.db").string());
    auto chat_path = config.sessions.db_path.value_or((data_dir / "chat.db").string());

    Components components;
    components.knowledge = std::make_shared<knowledge::SqliteKnowledgeStore>(kb_path);
    components.embedder = retrieval::make_embedding_provider(ioc, config.embedding);
    components.generator = std::make_shared<providers::OpenAICompatibleProvider>(
        ioc, config.generation);
    components.chat_store = std::make_unique<chat::SqliteChatStore>(chat_path);
    if (config.retrieval.log_searches) {
        components.search_log = std::make_shared<retrieval::SearchLog>(kb_path);
    }
    return std::make_unique<Assistant>(std::move(config), std::move(components));
}

auto Assistant::snapshot_path() const -> std::optional<std::filesystem::path> {
    if (!config_.knowledge.persist_index) return std::nullopt;
    if (config_.knowledge.index_snapshot_path) {
        return std::filesystem::path(*config_.knowledge.index_snapshot_path);
    }
    return resolve_data_dir(config_) / "index.bin";
}

// ---------------------------------------------------------------------------
// Index lifecycle
// ---------------------------------------------------------------------------

auto Assistant::index_matches_store() -> awaitable<Result<bool>> {
    auto entries = co_await knowledge_->searchable();
    if (!entries) {
        co_return make_fail(entries.error());
    }

    std::vector<EntryId> expected;
    for (const auto& e : *entries) {
        if (e.embedding->size() == index_->dimensions()) expected.push_back(e.id);
    }
    std::sort(expected.begin(), expected.end());
    co_return expected == index_->ids();
}

auto Assistant::initialize() -> awaitable<Result<void>> {
    bool loaded = false;
    auto path = snapshot_path();
    if (path && std::filesystem::exists(*path)) {
        auto info = index_->load(*path);
        if (!info) {
            LOG_WARN("Index snapshot unusable, rebuilding: {}", info.error().what());
        } else {
            auto entries = co_await knowledge_->searchable();
            if (!entries) {
                co_return make_fail(entries.error());
            }
            auto newest = Timestamp{};
            for (const auto& e : *entries) newest = std::max(newest, e.updated_at);

            auto matches = co_await index_matches_store();
            if (!matches) {
                co_return make_fail(matches.error());
            }
            loaded = *matches && newest < info->saved_at;
            if (!loaded) {
                LOG_INFO("Index snapshot is stale, rebuilding");
            }
        }
    }

    if (loaded) {
        auto report = co_await author_->integrity_report();
        if (report && !report->healthy()) {
            LOG_INFO("{} entries need embeddings, rebuilding",
                     report->unembedded.size() + report->dimension_mismatch.size());
            loaded = false;
        }
    }

    if (loaded) {
        LOG_INFO("Loaded vector index snapshot ({} entries)", index_->size());
        co_return ok_result();
    }

    auto rebuilt = co_await rebuild_index(false);
    if (!rebuilt) {
        co_return make_fail(rebuilt.error());
    }

    auto report = co_await author_->integrity_report();
    if (report && !report->healthy()) {
        LOG_WARN("{} active entries are not searchable (unembedded: {}, stale dimensions: {})",
                 report->unembedded.size() + report->dimension_mismatch.size(),
                 report->unembedded.size(), report->dimension_mismatch.size());
    }
    co_return ok_result();
}

auto Assistant::rebuild_index(bool reembed_all) -> awaitable<Result<RebuildReport>> {
    bool expected = false;
    if (!rebuilding_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        LOG_INFO("Index rebuild already running; request coalesced");
        co_return RebuildReport{.indexed = index_->size(), .coalesced = true};
    }
    RebuildGuard guard{rebuilding_};

    auto started = std::chrono::steady_clock::now();
    RebuildReport report;

    auto embedded = reembed_all ? co_await author_->reembed_all()
                                : co_await author_->reembed_missing();
    if (embedded) {
        report.embedded = *embedded;
    } else if (reembed_all) {
        co_return make_fail(embedded.error());
    } else {
        LOG_WARN("Could not embed pending entries: {}", embedded.error().what());
    }

    // The synchronizer rebuilds the index from the republished set.
    auto entries = co_await knowledge_->republish();
    if (!entries) {
        co_return make_fail(entries.error());
    }
    for (const auto& e : *entries) {
        if (index_->contains(e.id)) {
            ++report.indexed;
        } else {
            ++report.unsearchable;
        }
    }
    if (auto kb = co_await knowledge_->stats(); kb) {
        report.unsearchable += kb->unembedded;
    }

    if (auto saved = save_index(); !saved) {
        LOG_WARN("Index snapshot not saved: {}", saved.error().what());
    }

    report.elapsed_ms = elapsed_ms(started);
    LOG_INFO("Index rebuild complete: {} indexed, {} embedded, {} skipped in {}ms",
             report.indexed, report.embedded, report.unsearchable, report.elapsed_ms);
    co_return report;
}

auto Assistant::save_index() -> Result<void> {
    auto path = snapshot_path();
    if (!path) return {};
    return index_->save(*path);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

auto Assistant::search(std::string query, retrieval::RetrieveOptions options)
    -> awaitable<Result<std::vector<retrieval::SearchResult>>> {
    co_return co_await retriever_->retrieve(std::move(query), std::move(options));
}

auto Assistant::chat(std::string session_id, std::string query, CancelToken cancel)
    -> awaitable<Result<ChatReply>> {
    co_return co_await responder_->respond(std::move(session_id), std::move(query),
                                           std::move(cancel));
}

auto Assistant::expire_idle_sessions() -> awaitable<Result<size_t>> {
    co_return co_await sessions_->expire_idle(
        std::chrono::seconds(config_.sessions.idle_timeout_seconds));
}

auto Assistant::status() -> awaitable<Result<json>> {
    auto kb = co_await knowledge_->stats();
    if (!kb) {
        co_return make_fail(kb.error());
    }
    auto chats = co_await sessions_->session_stats();
    if (!chats) {
        co_return make_fail(chats.error());
    }

    json out = {
        {"status", "ok"},
        {"index", index_->stats()},
        {"knowledge_base", *kb},
        {"sessions", *chats},
        {"embedding", {
            {"model", embedder_->name()},
            {"dimensions", embedder_->dimensions()},
        }},
        {"generation", {
            {"model", config_.generation.model},
            {"base_url", config_.generation.base_url},
        }},
        {"rebuild_in_progress", rebuilding_.load(std::memory_order_acquire)},
    };
    if (search_log_) {
        if (auto logged = search_log_->count(); logged) {
            out["logged_searches"] = *logged;
        }
    }
    co_return out;
}

} // namespace dentassist::assistant
