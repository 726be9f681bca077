#include "dentassist/retrieval/confidence.hpp"

#include <algorithm>

namespace dentassist::retrieval {

ConfidenceScorer::ConfidenceScorer(double floor_weight)
    : floor_weight_(std::clamp(floor_weight, 0.0, 1.0)) {}

auto ConfidenceScorer::score(const std::vector<double>& similarities) const -> double {
    if (similarities.empty()) return 0.0;

    auto [lo, hi] = std::minmax_element(similarities.begin(), similarities.end());
    return std::clamp((1.0 - floor_weight_) * *hi + floor_weight_ * *lo, 0.0, 1.0);
}

auto ConfidenceScorer::score(const std::vector<SearchResult>& results) const -> double {
    std::vector<double> similarities;
    similarities.reserve(results.size());
    for (const auto& r : results) similarities.push_back(r.similarity);
    return score(similarities);
}

} // namespace dentassist::retrieval
