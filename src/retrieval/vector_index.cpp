#include "dentassist/retrieval/vector_index.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

#include "dentassist/core/logger.hpp"

namespace dentassist::retrieval {

namespace {

constexpr char kMagic[4] = {'D', 'A', 'V', 'X'};
constexpr uint32_t kFormatVersion = 1;

template <typename T>
void write_pod(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
auto read_pod(std::ifstream& in, T& value) -> bool {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    return static_cast<bool>(in);
}

auto ranks_before(const IndexHit& a, const IndexHit& b) -> bool {
    if (a.score != b.score) return a.score > b.score;
    return a.id < b.id;
}

} // anonymous namespace

void to_json(json& j, const IndexStats& s) {
    j = json{
        {"status", s.entries > 0 ? "ready" : "empty"},
        {"total_entries", s.entries},
        {"dimension", s.dimensions},
        {"index_type", "flat_inner_product"},
        {"generation", s.generation},
    };
}

VectorIndex::VectorIndex(size_t dimensions)
    : dimensions_(dimensions), snapshot_(std::make_shared<const Snapshot>()) {}

auto VectorIndex::current() const -> std::shared_ptr<const Snapshot> {
    std::lock_guard lock(snapshot_mutex_);
    return snapshot_;
}

void VectorIndex::publish(std::shared_ptr<const Snapshot> next) {
    std::lock_guard lock(snapshot_mutex_);
    snapshot_ = std::move(next);
}

auto VectorIndex::normalized(const Embedding& v) const -> Result<Embedding> {
    if (v.size() != dimensions_) {
        return std::unexpected(make_error(ErrorCode::DimensionMismatch,
            "Vector dimensionality does not match index",
            std::to_string(v.size()) + " != " + std::to_string(dimensions_)));
    }
    double norm = 0.0;
    for (float f : v) norm += static_cast<double>(f) * f;
    norm = std::sqrt(norm);
    if (norm == 0.0 || !std::isfinite(norm)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Vector has zero or non-finite norm"));
    }
    Embedding out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = static_cast<float>(v[i] / norm);
    }
    return out;
}

auto VectorIndex::add(EntryId id, const Embedding& vector) -> Result<void> {
    auto unit = normalized(vector);
    if (!unit) {
        return std::unexpected(unit.error());
    }

    std::lock_guard write_lock(write_mutex_);
    auto base = current();
    auto next = std::make_shared<Snapshot>(*base);

    if (auto it = next->slots.find(id); it != next->slots.end()) {
        std::copy(unit->begin(), unit->end(),
                  next->data.begin() + static_cast<std::ptrdiff_t>(it->second * dimensions_));
    } else {
        next->slots.emplace(id, next->ids.size());
        next->ids.push_back(id);
        next->data.insert(next->data.end(), unit->begin(), unit->end());
    }
    next->generation = base->generation + 1;
    publish(std::move(next));

    LOG_DEBUG("Index add: entry {}", id);
    return {};
}

auto VectorIndex::remove(EntryId id) -> bool {
    std::lock_guard write_lock(write_mutex_);
    auto base = current();
    auto it = base->slots.find(id);
    if (it == base->slots.end()) {
        return false;
    }

    auto next = std::make_shared<Snapshot>(*base);
    auto slot = it->second;
    auto last = next->ids.size() - 1;

    // Move the last row into the vacated slot.
    if (slot != last) {
        auto moved_id = next->ids[last];
        std::memcpy(next->data.data() + slot * dimensions_,
                    next->data.data() + last * dimensions_,
                    dimensions_ * sizeof(float));
        next->ids[slot] = moved_id;
        next->slots[moved_id] = slot;
    }
    next->ids.pop_back();
    next->data.resize(next->ids.size() * dimensions_);
    next->slots.erase(id);
    next->generation = base->generation + 1;
    publish(std::move(next));

    LOG_DEBUG("Index remove: entry {}", id);
    return true;
}

auto VectorIndex::search(const Embedding& query, size_t k, double threshold) const
    -> Result<std::vector<IndexHit>> {
    auto unit = normalized(query);
    if (!unit) {
        return std::unexpected(unit.error());
    }

    std::vector<IndexHit> hits;
    if (k == 0) return hits;

    auto snap = current();
    for (size_t row = 0; row < snap->ids.size(); ++row) {
        const float* v = snap->data.data() + row * dimensions_;
        double dot = 0.0;
        for (size_t i = 0; i < dimensions_; ++i) {
            dot += static_cast<double>((*unit)[i]) * v[i];
        }
        auto score = std::clamp(dot, 0.0, 1.0);
        if (score >= threshold) {
            hits.push_back(IndexHit{snap->ids[row], score});
        }
    }

    if (hits.size() > k) {
        std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k),
                          hits.end(), ranks_before);
        hits.resize(k);
    } else {
        std::sort(hits.begin(), hits.end(), ranks_before);
    }
    return hits;
}

auto VectorIndex::rebuild(const std::vector<std::pair<EntryId, Embedding>>& entries) -> size_t {
    auto next = std::make_shared<Snapshot>();
    next->ids.reserve(entries.size());
    next->data.reserve(entries.size() * dimensions_);

    for (const auto& [id, vec] : entries) {
        auto unit = normalized(vec);
        if (!unit) {
            LOG_WARN("Index rebuild: skipping entry {}: {}", id, unit.error().what());
            continue;
        }
        if (auto it = next->slots.find(id); it != next->slots.end()) {
            std::copy(unit->begin(), unit->end(),
                      next->data.begin() + static_cast<std::ptrdiff_t>(it->second * dimensions_));
            continue;
        }
        next->slots.emplace(id, next->ids.size());
        next->ids.push_back(id);
        next->data.insert(next->data.end(), unit->begin(), unit->end());
    }

    auto count = next->ids.size();
    std::lock_guard write_lock(write_mutex_);
    next->generation = current()->generation + 1;
    publish(std::move(next));

    LOG_INFO("Vector index rebuilt with {} entries ({}D)", count, dimensions_);
    return count;
}

auto VectorIndex::contains(EntryId id) const -> bool {
    return current()->slots.contains(id);
}

auto VectorIndex::ids() const -> std::vector<EntryId> {
    auto out = current()->ids;
    std::sort(out.begin(), out.end());
    return out;
}

auto VectorIndex::size() const -> size_t {
    return current()->ids.size();
}

auto VectorIndex::stats() const -> IndexStats {
    auto snap = current();
    return IndexStats{
        .entries = snap->ids.size(),
        .dimensions = dimensions_,
        .generation = snap->generation,
    };
}

auto VectorIndex::save(const std::filesystem::path& path) const -> Result<void> {
    auto snap = current();
    auto tmp = path;
    tmp += ".tmp";

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return std::unexpected(make_error(ErrorCode::IoError,
                    "Cannot open index snapshot for writing", tmp.string()));
            }
            out.write(kMagic, sizeof(kMagic));
            write_pod(out, kFormatVersion);
            write_pod(out, static_cast<uint64_t>(dimensions_));
            write_pod(out, static_cast<uint64_t>(snap->ids.size()));
            write_pod(out, to_epoch_ms(Clock::now()));
            for (size_t row = 0; row < snap->ids.size(); ++row) {
                write_pod(out, static_cast<int64_t>(snap->ids[row]));
                out.write(reinterpret_cast<const char*>(snap->data.data() + row * dimensions_),
                          static_cast<std::streamsize>(dimensions_ * sizeof(float)));
            }
            if (!out) {
                return std::unexpected(make_error(ErrorCode::IoError,
                    "Failed writing index snapshot", tmp.string()));
            }
        }
        std::filesystem::rename(tmp, path);
    } catch (const std::filesystem::filesystem_error& e) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to persist index snapshot", e.what()));
    }

    LOG_DEBUG("Saved index snapshot ({} entries) to {}", snap->ids.size(), path.string());
    return {};
}

auto VectorIndex::load(const std::filesystem::path& path) -> Result<SnapshotInfo> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Index snapshot not found", path.string()));
    }

    char magic[4] = {};
    uint32_t version = 0;
    uint64_t dims = 0;
    uint64_t count = 0;
    int64_t saved_at_ms = 0;
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0 ||
        !read_pod(in, version) || version != kFormatVersion ||
        !read_pod(in, dims) || !read_pod(in, count) || !read_pod(in, saved_at_ms)) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Index snapshot header is invalid", path.string()));
    }
    if (dims != dimensions_) {
        return std::unexpected(make_error(ErrorCode::DimensionMismatch,
            "Index snapshot was built for another dimensionality",
            std::to_string(dims) + " != " + std::to_string(dimensions_)));
    }

    std::vector<std::pair<EntryId, Embedding>> entries;
    entries.reserve(static_cast<size_t>(std::min<uint64_t>(count, 1u << 16)));
    for (uint64_t i = 0; i < count; ++i) {
        int64_t id = 0;
        Embedding vec(dimensions_);
        if (!read_pod(in, id) ||
            !in.read(reinterpret_cast<char*>(vec.data()),
                     static_cast<std::streamsize>(dimensions_ * sizeof(float)))) {
            return std::unexpected(make_error(ErrorCode::SerializationError,
                "Index snapshot is truncated", path.string()));
        }
        entries.emplace_back(id, std::move(vec));
    }

    return SnapshotInfo{
        .entries = rebuild(entries),
        .saved_at = from_epoch_ms(saved_at_ms),
    };
}

} // namespace dentassist::retrieval
