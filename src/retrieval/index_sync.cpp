#include "dentassist/retrieval/index_sync.hpp"

#include "dentassist/core/logger.hpp"

namespace dentassist::retrieval {

IndexSynchronizer::IndexSynchronizer(std::shared_ptr<VectorIndex> index)
    : index_(std::move(index)) {}

void IndexSynchronizer::on_entry_upserted(const knowledge::QAEntry& entry) {
    if (!entry.is_searchable()) {
        if (index_->remove(entry.id)) {
            LOG_DEBUG("Entry {} no longer searchable, dropped from index", entry.id);
        }
        return;
    }

    auto added = index_->add(entry.id, *entry.embedding);
    if (!added) {
        // A vector the index cannot hold must not leave the old one behind.
        index_->remove(entry.id);
        LOG_WARN("Entry {} not indexed: {}", entry.id, added.error().what());
    }
}

void IndexSynchronizer::on_entry_removed(EntryId id) {
    index_->remove(id);
}

void IndexSynchronizer::on_bulk_change(const std::vector<knowledge::QAEntry>& searchable) {
    index_->rebuild(to_index_entries(searchable));
}

auto IndexSynchronizer::to_index_entries(const std::vector<knowledge::QAEntry>& entries)
    -> std::vector<std::pair<EntryId, Embedding>> {
    std::vector<std::pair<EntryId, Embedding>> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        if (e.is_searchable()) {
            out.emplace_back(e.id, *e.embedding);
        }
    }
    return out;
}

} // namespace dentassist::retrieval
