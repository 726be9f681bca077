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

namespace dentassist::knowledge {

using boost::asio::awaitable;

/// Entries that are active but cannot be searched.
struct IntegrityReport {
    size_t active = 0;
    size_t searchable = 0;
    std::vector<EntryId> unembedded;
    std::vector<EntryId> dimension_mismatch;

    [[nodiscard]] auto healthy() const noexcept -> bool {
        return unembedded.empty() && dimension_mismatch.empty();
    }
};

void to_json(json& j, const IntegrityReport& r);

/// Authoring operations over the knowledge base.
///
/// Embeddings are generated synchronously on create and on edits that
/// invalidate them. When the embedding service fails the entry is still
/// stored, unembedded, and stays out of search until reembed_missing() or
/// reembed_all() succeeds. The index learns of every change through the
/// store's listeners.
class KnowledgeAuthor {
public:
    KnowledgeAuthor(std::shared_ptr<KnowledgeStore> store,
                    std::shared_ptr<retrieval::EmbeddingProvider> embedder,
                    EmbedText embed_text = EmbedText::Question);

    auto create(EntryDraft draft) -> awaitable<Result<QAEntry>>;

    /// Applies the patch. Question, answer or category changes regenerate the embedding.
    auto update(EntryId id, EntryPatch patch) -> awaitable<Result<QAEntry>>;

    auto deactivate(EntryId id) -> awaitable<Result<QAEntry>>;

    /// Re-activates and embeds the entry if its vector is missing or stale.
    auto reactivate(EntryId id) -> awaitable<Result<QAEntry>>;

    /// Hard delete from store and index.
    auto remove(EntryId id) -> awaitable<Result<void>>;

    /// Copies an entry; the question defaults to "Copy of: <original>".
    auto duplicate(EntryId id, std::optional<std::string> new_question = std::nullopt)
        -> awaitable<Result<QAEntry>>;

    /// Validates every draft first; nothing is stored if one is invalid.
    /// Embeds in one batch call and emits a single bulk change.
    auto batch_create(std::vector<EntryDraft> drafts) -> awaitable<Result<std::vector<QAEntry>>>;

    /// Regenerates the embedding of every entry, active or not.
    auto reembed_all() -> awaitable<Result<size_t>>;

    /// Embeds active entries that lack a usable embedding.
    auto reembed_missing() -> awaitable<Result<size_t>>;

    auto integrity_report() -> awaitable<Result<IntegrityReport>>;

    /// Fails with InvalidEntryState when any active entry is not searchable.
    auto verify_integrity() -> awaitable<Result<void>>;

    [[nodiscard]] auto store() const -> const std::shared_ptr<KnowledgeStore>& { return store_; }

private:
    auto text_for(const QAEntry& entry) const -> std::string;
    auto has_usable_embedding(const QAEntry& entry) const -> bool;
    auto embed_entry(const QAEntry& entry) -> awaitable<std::optional<Embedding>>;
    auto reembed(std::vector<QAEntry> entries) -> awaitable<Result<size_t>>;
    auto set_active(EntryId id, bool active) -> awaitable<Result<QAEntry>>;
    auto all_entries() -> awaitable<Result<std::vector<QAEntry>>>;

    std::shared_ptr<KnowledgeStore> store_;
    std::shared_ptr<retrieval::EmbeddingProvider> embedder_;
    EmbedText embed_text_;
};

} // namespace dentassist::knowledge
