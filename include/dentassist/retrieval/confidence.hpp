#pragma once

#include <vector>

#include "dentassist/retrieval/retriever.hpp"

namespace dentassist::retrieval {

/// Collapses per-match similarities into one confidence in [0, 1].
///
///     confidence = (1 - w) * top + w * min(scores)
///
/// where w is the floor weight. No matches gives 0. An extra match scored
/// below the top can only keep or lower the minimum, and a higher top score
/// never lowers either term.
class ConfidenceScorer {
public:
    explicit ConfidenceScorer(double floor_weight = 0.3);

    [[nodiscard]] auto score(const std::vector<double>& similarities) const -> double;
    [[nodiscard]] auto score(const std::vector<SearchResult>& results) const -> double;

    [[nodiscard]] auto floor_weight() const noexcept -> double { return floor_weight_; }

private:
    double floor_weight_;
};

} // namespace dentassist::retrieval
