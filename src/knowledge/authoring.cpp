#include "dentassist/knowledge/authoring.hpp"

#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"

namespace dentassist::knowledge {

namespace {

constexpr size_t kPageSize = 500;

auto entry_from_draft(const EntryDraft& d) -> QAEntry {
    QAEntry e;
    e.question = d.question;
    e.answer = d.answer;
    e.category = d.category;
    e.source = d.source;
    e.source_url = d.source_url;
    return e;
}

} // anonymous namespace

void to_json(json& j, const IntegrityReport& r) {
    j = json{
        {"healthy", r.healthy()},
        {"active_entries", r.active},
        {"searchable_entries", r.searchable},
        {"unembedded_ids", r.unembedded},
        {"dimension_mismatch_ids", r.dimension_mismatch},
    };
}

KnowledgeAuthor::KnowledgeAuthor(std::shared_ptr<KnowledgeStore> store,
                                 std::shared_ptr<retrieval::EmbeddingProvider> embedder,
                                 EmbedText embed_text)
    : store_(std::move(store))
    , embedder_(std::move(embedder))
    , embed_text_(embed_text) {}

auto KnowledgeAuthor::text_for(const QAEntry& entry) const -> std::string {
    return embedding_text(entry, embed_text_ == EmbedText::QuestionAnswer);
}

auto KnowledgeAuthor::has_usable_embedding(const QAEntry& entry) const -> bool {
    return entry.embedding.has_value() && entry.embedding->size() == embedder_->dimensions();
}

auto KnowledgeAuthor::embed_entry(const QAEntry& entry) -> awaitable<std::optional<Embedding>> {
    auto text = text_for(entry);
    auto vec = co_await embedder_->embed(text);
    if (!vec) {
        LOG_WARN("Entry {} stored without embedding: {}", entry.id, vec.error().what());
        co_return std::nullopt;
    }
    co_return std::move(*vec);
}

// ---------------------------------------------------------------------------
// Single-entry operations
// ---------------------------------------------------------------------------

auto KnowledgeAuthor::create(EntryDraft draft) -> awaitable<Result<QAEntry>> {
    auto valid = validate_draft(std::move(draft));
    if (!valid) {
        co_return make_fail(valid.error());
    }

    NewEntry entry{.draft = std::move(*valid)};
    entry.embedding = co_await embed_entry(entry_from_draft(entry.draft));
    if (entry.embedding) entry.embedding_model = embedder_->name();

    auto created = co_await store_->create(std::move(entry));
    if (created) {
        LOG_INFO("Created QA entry {} [{}]", created->id, created->category);
    }
    co_return created;
}

auto KnowledgeAuthor::update(EntryId id, EntryPatch patch) -> awaitable<Result<QAEntry>> {
    auto current = co_await store_->get(id);
    if (!current) {
        co_return make_fail(current.error());
    }

    auto entry = std::move(*current);
    EntryDraft draft{
        .question = patch.question.value_or(entry.question),
        .answer = patch.answer.value_or(entry.answer),
        .category = patch.category.value_or(entry.category),
        .source = patch.source.value_or(entry.source),
        .source_url = patch.source_url ? patch.source_url : entry.source_url,
    };
    auto valid = validate_draft(std::move(draft));
    if (!valid) {
        co_return make_fail(valid.error());
    }

    bool changed_text = patch.invalidates_embedding() &&
                        (valid->question != entry.question ||
                         valid->answer != entry.answer ||
                         valid->category != entry.category);
    entry.question = valid->question;
    entry.answer = valid->answer;
    entry.category = valid->category;
    entry.source = valid->source;
    entry.source_url = valid->source_url;
    if (patch.active) entry.active = *patch.active;

    if (changed_text || !has_usable_embedding(entry)) {
        entry.embedding.reset();
        entry.embedding_model.reset();
        entry.embedding = co_await embed_entry(entry);
        if (entry.embedding) entry.embedding_model = embedder_->name();
    }

    auto updated = co_await store_->update(entry);
    if (updated) {
        LOG_INFO("Updated QA entry {} (re-embedded={})", id, changed_text);
    }
    co_return updated;
}

auto KnowledgeAuthor::set_active(EntryId id, bool active) -> awaitable<Result<QAEntry>> {
    auto current = co_await store_->get(id);
    if (!current) {
        co_return make_fail(current.error());
    }
    auto entry = std::move(*current);
    entry.active = active;

    if (active && !has_usable_embedding(entry)) {
        entry.embedding = co_await embed_entry(entry);
        entry.embedding_model = entry.embedding
            ? std::optional<std::string>(embedder_->name()) : std::nullopt;
    }
    co_return co_await store_->update(entry);
}

auto KnowledgeAuthor::deactivate(EntryId id) -> awaitable<Result<QAEntry>> {
    auto r = co_await set_active(id, false);
    if (r) LOG_INFO("Deactivated QA entry {}", id);
    co_return r;
}

auto KnowledgeAuthor::reactivate(EntryId id) -> awaitable<Result<QAEntry>> {
    auto r = co_await set_active(id, true);
    if (r) LOG_INFO("Reactivated QA entry {}", id);
    co_return r;
}

auto KnowledgeAuthor::remove(EntryId id) -> awaitable<Result<void>> {
    auto r = co_await store_->remove(id);
    if (r) LOG_INFO("Deleted QA entry {}", id);
    co_return r;
}

auto KnowledgeAuthor::duplicate(EntryId id, std::optional<std::string> new_question)
    -> awaitable<Result<QAEntry>> {
    auto original = co_await store_->get(id);
    if (!original) {
        co_return make_fail(original.error());
    }

    EntryDraft draft{
        .question = new_question.value_or("Copy of: " + original->question),
        .answer = original->answer,
        .category = original->category,
        .source = original->source,
        .source_url = original->source_url,
    };
    co_return co_await create(std::move(draft));
}

// ---------------------------------------------------------------------------
// Bulk operations
// ---------------------------------------------------------------------------

auto KnowledgeAuthor::batch_create(std::vector<EntryDraft> drafts)
    -> awaitable<Result<std::vector<QAEntry>>> {
    std::vector<NewEntry> entries;
    entries.reserve(drafts.size());
    for (size_t i = 0; i < drafts.size(); ++i) {
        auto valid = validate_draft(std::move(drafts[i]));
        if (!valid) {
            co_return make_fail(make_error(valid.error().code(),
                std::string(valid.error().message()), "entry " + std::to_string(i)));
        }
        entries.push_back(NewEntry{.draft = std::move(*valid)});
    }
    if (entries.empty()) {
        co_return std::vector<QAEntry>{};
    }

    std::vector<std::string> texts;
    texts.reserve(entries.size());
    for (const auto& e : entries) texts.push_back(text_for(entry_from_draft(e.draft)));

    auto vectors = co_await embedder_->embed_batch(std::move(texts));
    if (vectors) {
        auto model = embedder_->name();
        for (size_t i = 0; i < entries.size(); ++i) {
            entries[i].embedding = std::move((*vectors)[i]);
            entries[i].embedding_model = model;
        }
    } else {
        LOG_WARN("Batch embedding failed, {} entries stored unembedded: {}",
                 entries.size(), vectors.error().what());
    }

    co_return co_await store_->create_many(std::move(entries));
}

auto KnowledgeAuthor::all_entries() -> awaitable<Result<std::vector<QAEntry>>> {
    std::vector<QAEntry> all;
    ListFilter filter;
    filter.include_inactive = true;
    filter.limit = kPageSize;
    for (;;) {
        auto page = co_await store_->list(filter);
        if (!page) {
            co_return make_fail(page.error());
        }
        auto n = page->size();
        for (auto& e : *page) all.push_back(std::move(e));
        if (n < kPageSize) break;
        filter.offset += kPageSize;
    }
    co_return all;
}

auto KnowledgeAuthor::reembed(std::vector<QAEntry> entries) -> awaitable<Result<size_t>> {
    if (entries.empty()) co_return size_t{0};

    std::vector<std::string> texts;
    texts.reserve(entries.size());
    for (const auto& e : entries) texts.push_back(text_for(e));

    auto vectors = co_await embedder_->embed_batch(std::move(texts));
    if (!vectors) {
        co_return make_fail(vectors.error());
    }

    // The text travels with each vector so an entry edited during the
    // embedding call keeps the vector its edit stored.
    std::vector<EmbeddingUpdate> updates;
    updates.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        updates.push_back(EmbeddingUpdate{
            .id = entries[i].id,
            .question = std::move(entries[i].question),
            .answer = std::move(entries[i].answer),
            .category = std::move(entries[i].category),
            .vector = std::move((*vectors)[i]),
        });
    }
    co_return co_await store_->set_embeddings(std::move(updates), embedder_->name());
}

auto KnowledgeAuthor::reembed_all() -> awaitable<Result<size_t>> {
    auto all = co_await all_entries();
    if (!all) {
        co_return make_fail(all.error());
    }
    LOG_INFO("Regenerating embeddings for {} entries with {}", all->size(), embedder_->name());
    co_return co_await reembed(std::move(*all));
}

auto KnowledgeAuthor::reembed_missing() -> awaitable<Result<size_t>> {
    auto all = co_await all_entries();
    if (!all) {
        co_return make_fail(all.error());
    }
    std::vector<QAEntry> pending;
    for (auto& e : *all) {
        if (e.active && !has_usable_embedding(e)) pending.push_back(std::move(e));
    }
    if (pending.empty()) co_return size_t{0};

    LOG_INFO("Embedding {} active entries lacking a usable vector", pending.size());
    co_return co_await reembed(std::move(pending));
}

// ---------------------------------------------------------------------------
// Integrity
// ---------------------------------------------------------------------------

auto KnowledgeAuthor::integrity_report() -> awaitable<Result<IntegrityReport>> {
    auto all = co_await all_entries();
    if (!all) {
        co_return make_fail(all.error());
    }

    IntegrityReport report;
    for (const auto& e : *all) {
        if (!e.active) continue;
        ++report.active;
        if (e.needs_embedding()) {
            report.unembedded.push_back(e.id);
        } else if (!has_usable_embedding(e)) {
            report.dimension_mismatch.push_back(e.id);
        } else {
            ++report.searchable;
        }
    }
    co_return report;
}

auto KnowledgeAuthor::verify_integrity() -> awaitable<Result<void>> {
    auto report = co_await integrity_report();
    if (!report) {
        co_return make_fail(report.error());
    }
    if (!report->healthy()) {
        co_return make_fail(make_error(ErrorCode::InvalidEntryState,
            "Active entries are not searchable",
            std::to_string(report->unembedded.size()) + " unembedded, " +
            std::to_string(report->dimension_mismatch.size()) + " with stale dimensions"));
    }
    co_return ok_result();
}

} // namespace dentassist::knowledge
