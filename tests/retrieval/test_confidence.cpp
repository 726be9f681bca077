#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "dentassist/retrieval/confidence.hpp"

using namespace dentassist::retrieval;
using Catch::Matchers::WithinAbs;

TEST_CASE("ConfidenceScorer blends top and weakest match", "[retrieval][confidence]") {
    ConfidenceScorer scorer;
    CHECK_THAT(scorer.floor_weight(), WithinAbs(0.3, 1e-12));

    SECTION("no matches") {
        CHECK(scorer.score(std::vector<double>{}) == 0.0);
    }

    SECTION("single match equals its similarity") {
        CHECK_THAT(scorer.score(std::vector<double>{0.82}), WithinAbs(0.82, 1e-9));
    }

    SECTION("several matches") {
        // 0.7 * 0.9 + 0.3 * 0.5
        CHECK_THAT(scorer.score(std::vector<double>{0.9, 0.7, 0.5}), WithinAbs(0.78, 1e-9));
    }

    SECTION("weaker extra match lowers confidence") {
        auto base = scorer.score(std::vector<double>{0.9, 0.8});
        auto diluted = scorer.score(std::vector<double>{0.9, 0.8, 0.71});
        CHECK(diluted < base);
    }

    SECTION("extra match ranked between existing ones never raises confidence") {
        auto base = scorer.score(std::vector<double>{0.9, 0.5});
        auto widened = scorer.score(std::vector<double>{0.9, 0.8, 0.5});
        CHECK(widened <= base);
        CHECK_THAT(widened, WithinAbs(base, 1e-12));
    }

    SECTION("any sub-top insertion keeps confidence non-increasing") {
        std::vector<double> scores{0.95};
        auto previous = scorer.score(scores);
        for (double extra : {0.6, 0.9, 0.75, 0.4, 0.94, 0.41}) {
            scores.push_back(extra);
            auto next = scorer.score(scores);
            CHECK(next <= previous + 1e-12);
            previous = next;
        }
    }

    SECTION("stronger top match raises confidence") {
        auto base = scorer.score(std::vector<double>{0.8, 0.75});
        auto better = scorer.score(std::vector<double>{0.95, 0.75});
        CHECK(better > base);
    }

    SECTION("raising a lone top match raises both terms") {
        CHECK(scorer.score(std::vector<double>{0.85}) > scorer.score(std::vector<double>{0.8}));
    }
}

TEST_CASE("ConfidenceScorer weight is clamped", "[retrieval][confidence]") {
    CHECK(ConfidenceScorer(-1.0).floor_weight() == 0.0);
    CHECK(ConfidenceScorer(2.0).floor_weight() == 1.0);

    ConfidenceScorer top_only(0.0);
    CHECK_THAT(top_only.score(std::vector<double>{0.9, 0.1}), WithinAbs(0.9, 1e-9));
}

TEST_CASE("ConfidenceScorer reads SearchResult similarities", "[retrieval][confidence]") {
    std::vector<SearchResult> results(2);
    results[0].similarity = 0.9;
    results[1].similarity = 0.7;

    ConfidenceScorer scorer;
    CHECK_THAT(scorer.score(results), WithinAbs(0.7 * 0.9 + 0.3 * 0.7, 1e-9));
}
