#pragma once

#include <vector>

#include "dentassist/core/types.hpp"
#include "dentassist/knowledge/entry.hpp"

namespace dentassist::knowledge {

/// Observer of knowledge-base mutations.
///
/// Callbacks run synchronously on the mutating thread after the change is
/// committed. Events are delivered one mutation at a time in commit order;
/// the next mutation waits until every listener has returned. Implementations
/// must be cheap, must not throw, and may read from the store but must not
/// mutate it.
class KnowledgeListener {
public:
    virtual ~KnowledgeListener() = default;

    /// An entry was created or modified. It may have become unsearchable.
    virtual void on_entry_upserted(const QAEntry& entry) = 0;

    /// An entry was hard-deleted.
    virtual void on_entry_removed(EntryId id) = 0;

    /// Many entries changed at once; `searchable` is the complete set of
    /// active, embedded entries after the change.
    virtual void on_bulk_change(const std::vector<QAEntry>& searchable) = 0;
};

} // namespace dentassist::knowledge
