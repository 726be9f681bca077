#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "dentassist/core/error.hpp"
#include "dentassist/core/types.hpp"

namespace dentassist::retrieval {

using json = nlohmann::json;

/// One match from VectorIndex::search.
struct IndexHit {
    EntryId id = 0;
    double score = 0.0;  // cosine similarity clamped to [0, 1]
};

struct IndexStats {
    size_t entries = 0;
    size_t dimensions = 0;
    uint64_t generation = 0;  // bumped by every successful mutation
};

void to_json(json& j, const IndexStats& s);

/// Header facts of a snapshot file read by VectorIndex::load.
struct SnapshotInfo {
    size_t entries = 0;
    Timestamp saved_at;
};

/// Exact nearest-neighbour index over L2-normalised vectors.
///
/// Readers take an immutable snapshot and never block writers; every
/// mutation builds a new snapshot and swaps it in, so a search sees either
/// the state before or after a write, never a mixture. Writers are serialised
/// among themselves.
class VectorIndex {
public:
    explicit VectorIndex(size_t dimensions);

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /// Inserts or replaces the vector for `id`.
    auto add(EntryId id, const Embedding& vector) -> Result<void>;

    /// Removes `id`; returns false if it was not present.
    auto remove(EntryId id) -> bool;

    /// Up to `k` hits with score >= threshold, by descending score then
    /// ascending id.
    [[nodiscard]] auto search(const Embedding& query, size_t k, double threshold) const
        -> Result<std::vector<IndexHit>>;

    /// Atomically replaces the whole contents. Vectors of the wrong
    /// dimensionality or with zero norm are skipped with a warning.
    /// Returns the number of vectors indexed.
    auto rebuild(const std::vector<std::pair<EntryId, Embedding>>& entries) -> size_t;

    [[nodiscard]] auto contains(EntryId id) const -> bool;
    [[nodiscard]] auto ids() const -> std::vector<EntryId>;
    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto dimensions() const noexcept -> size_t { return dimensions_; }
    [[nodiscard]] auto stats() const -> IndexStats;

    /// Writes the current snapshot to `path` (via a temp file and rename).
    auto save(const std::filesystem::path& path) const -> Result<void>;

    /// Replaces the contents with a file written by save().
    /// Fails with DimensionMismatch if the file was built for another size.
    auto load(const std::filesystem::path& path) -> Result<SnapshotInfo>;

private:
    struct Snapshot {
        std::vector<EntryId> ids;
        std::vector<float> data;  // ids.size() rows of dimensions_ floats
        std::unordered_map<EntryId, size_t> slots;
        uint64_t generation = 0;
    };

    [[nodiscard]] auto current() const -> std::shared_ptr<const Snapshot>;
    void publish(std::shared_ptr<const Snapshot> next);
    auto normalized(const Embedding& v) const -> Result<Embedding>;

    size_t dimensions_;
    mutable std::mutex snapshot_mutex_;
    std::mutex write_mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace dentassist::retrieval
