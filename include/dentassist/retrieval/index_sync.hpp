#pragma once

#include <memory>
#include <vector>

#include "dentassist/knowledge/events.hpp"
#include "dentassist/retrieval/vector_index.hpp"

namespace dentassist::retrieval {

/// Keeps a VectorIndex in step with knowledge-base mutations.
///
/// Searchable entries are upserted, everything else is removed, and bulk
/// changes trigger a full rebuild from the set the store hands over.
class IndexSynchronizer : public knowledge::KnowledgeListener {
public:
    explicit IndexSynchronizer(std::shared_ptr<VectorIndex> index);

    void on_entry_upserted(const knowledge::QAEntry& entry) override;
    void on_entry_removed(EntryId id) override;
    void on_bulk_change(const std::vector<knowledge::QAEntry>& searchable) override;

    /// Projects searchable entries onto (id, vector) pairs for VectorIndex::rebuild.
    [[nodiscard]] static auto to_index_entries(const std::vector<knowledge::QAEntry>& entries)
        -> std::vector<std::pair<EntryId, Embedding>>;

private:
    std::shared_ptr<VectorIndex> index_;
};

} // namespace dentassist::retrieval
