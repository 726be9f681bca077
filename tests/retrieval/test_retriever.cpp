#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <memory>

#include "dentassist/knowledge/authoring.hpp"
#include "dentassist/retrieval/index_sync.hpp"
#include "dentassist/retrieval/retriever.hpp"
#include "test_helpers.hpp"

using namespace dentassist;
using namespace dentassist::knowledge;
using namespace dentassist::retrieval;
using namespace dentassist::testing;
using Catch::Matchers::WithinAbs;

namespace {

struct Fixture {
    explicit Fixture(const char* name)
        : dir(name)
        , store(std::make_shared<SqliteKnowledgeStore>((dir.path / "kb.db").string()))
        , embedder(std::make_shared<ScriptedEmbeddings>())
        , index(std::make_shared<VectorIndex>(embedder->dimensions()))
        , log(std::make_shared<SearchLog>((dir.path / "logs.db").string()))
        , author(store, embedder)
        , retriever(embedder, index, store, log) {
        store->add_listener(std::make_shared<IndexSynchronizer>(index));
    }

    auto add(std::string q, std::string a, std::string category = "general") -> QAEntry {
        auto created = run_sync(author.create(EntryDraft{
            .question = std::move(q), .answer = std::move(a), .category = std::move(category)}));
        REQUIRE(created.has_value());
        return *created;
    }

    auto options(double threshold = 0.3, size_t k = 5) -> RetrieveOptions {
        RetrieveOptions o;
        o.k = k;
        o.threshold = threshold;
        return o;
    }

    TmpDir dir;
    std::shared_ptr<SqliteKnowledgeStore> store;
    std::shared_ptr<ScriptedEmbeddings> embedder;
    std::shared_ptr<VectorIndex> index;
    std::shared_ptr<SearchLog> log;
    KnowledgeAuthor author;
    Retriever retriever;
};

} // namespace

TEST_CASE("Retriever finds the office hours entry", "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_hours");
    auto hours = f.add("What are your office hours?",
                       "We are open Monday to Friday, 8am to 5pm.", "hours");
    f.add("Do you accept dental insurance?", "We accept most PPO plans.", "billing");
    f.add("Is parking available?", "Free parking behind the building.", "visit");

    auto results = run_sync(f.retriever.retrieve("What are your office hours?", f.options()));
    REQUIRE(results.has_value());
    REQUIRE_FALSE(results->empty());

    const auto& top = (*results)[0];
    CHECK(top.id == hours.id);
    CHECK(top.rank == 1);
    CHECK(top.answer == "We are open Monday to Friday, 8am to 5pm.");
    CHECK_THAT(top.similarity, WithinAbs(1.0, 1e-5));

    for (size_t i = 1; i < results->size(); ++i) {
        CHECK((*results)[i].similarity <= (*results)[i - 1].similarity);
        CHECK((*results)[i].rank == i + 1);
        CHECK((*results)[i].similarity >= 0.3);
    }

    json j = top;
    CHECK(j["similarity_score"].get<double>() > 0.99);
    CHECK(j["category"] == "hours");
}

TEST_CASE("Retriever matches a short query against a one-entry knowledge base",
          "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_single");
    auto hours = f.add("What are your office hours?", "9am-5pm Mon-Fri");

    auto results = run_sync(f.retriever.retrieve("office hours", f.options(0.7, 5)));
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 1);
    CHECK((*results)[0].id == hours.id);
    CHECK((*results)[0].answer == "9am-5pm Mon-Fri");
    CHECK((*results)[0].similarity >= 0.7);
}

TEST_CASE("Retriever returns nothing below the threshold", "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_threshold");
    f.add("What are your office hours?", "8am to 5pm.");

    auto results = run_sync(f.retriever.retrieve("root canal recovery time", f.options(0.9)));
    REQUIRE(results.has_value());
    CHECK(results->empty());

    SECTION("empty knowledge base is not an error") {
        Fixture empty("dentassist_retriever_empty");
        auto none = run_sync(empty.retriever.retrieve("office hours", empty.options()));
        REQUIRE(none.has_value());
        CHECK(none->empty());
    }
}

TEST_CASE("Retriever keeps duplicates unless asked to merge", "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_dups");
    f.add("What are your office hours?", "8am to 5pm.");
    f.add("what are your  office hours?", "8AM to 5PM.");

    auto all = run_sync(f.retriever.retrieve("office hours", f.options()));
    REQUIRE(all.has_value());
    CHECK(all->size() == 2);

    auto opts = f.options();
    opts.deduplicate = true;
    auto merged = run_sync(f.retriever.retrieve("office hours", opts));
    REQUIRE(merged.has_value());
    CHECK(merged->size() == 1);
}

TEST_CASE("Retriever honours k and category", "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_filters");
    f.add("What are your office hours?", "8am to 5pm.", "hours");
    f.add("What are your weekend office hours?", "Saturday 9am to noon.", "hours");
    auto billing = f.add("Do office hours include billing help?", "Yes.", "billing");

    auto one = run_sync(f.retriever.retrieve("office hours", f.options(0.3, 1)));
    REQUIRE(one.has_value());
    CHECK(one->size() == 1);

    auto opts = f.options(0.1);
    opts.category = "billing";
    auto filtered = run_sync(f.retriever.retrieve("office hours", opts));
    REQUIRE(filtered.has_value());
    REQUIRE(filtered->size() == 1);
    CHECK((*filtered)[0].id == billing.id);
    CHECK((*filtered)[0].rank == 1);

    auto zero = run_sync(f.retriever.retrieve("office hours", f.options(0.3, 0)));
    REQUIRE(zero.has_value());
    CHECK(zero->empty());
}

TEST_CASE("Retriever excludes entries that stop being searchable", "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_stale");
    auto hours = f.add("What are your office hours?", "8am to 5pm.");

    SECTION("deactivated") {
        REQUIRE(run_sync(f.author.deactivate(hours.id)).has_value());
        auto results = run_sync(f.retriever.retrieve("office hours", f.options()));
        REQUIRE(results.has_value());
        CHECK(results->empty());
    }

    SECTION("deleted") {
        REQUIRE(run_sync(f.author.remove(hours.id)).has_value());
        auto results = run_sync(f.retriever.retrieve("office hours", f.options()));
        REQUIRE(results.has_value());
        CHECK(results->empty());
    }

    SECTION("index holds an id the store no longer has") {
        REQUIRE(f.index->add(424242, LocalEmbeddings(256).embed_now("office hours")).has_value());
        auto results = run_sync(f.retriever.retrieve("office hours", f.options()));
        REQUIRE(results.has_value());
        REQUIRE(results->size() == 1);
        CHECK((*results)[0].id == hours.id);
    }
}

TEST_CASE("Retriever validates input", "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_input");
    f.add("What are your office hours?", "8am to 5pm.");

    SECTION("blank query") {
        auto r = run_sync(f.retriever.retrieve("   \n ", f.options()));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("threshold out of range") {
        auto r = run_sync(f.retriever.retrieve("office hours", f.options(1.5)));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("embedding outage") {
        f.embedder->failing = true;
        auto r = run_sync(f.retriever.retrieve("office hours", f.options()));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::EmbeddingUnavailable);
    }
}

TEST_CASE("Retriever logs each search", "[retrieval][retriever]") {
    Fixture f("dentassist_retriever_log");
    auto hours = f.add("What are your office hours?", "8am to 5pm.");

    auto opts = f.options();
    opts.session_id = "sess-42";
    REQUIRE(run_sync(f.retriever.retrieve("  What are your   office hours? ", opts)).has_value());

    auto recent = f.log->recent(1);
    REQUIRE(recent.has_value());
    REQUIRE(recent->size() == 1);
    const auto& rec = (*recent)[0];
    CHECK(rec.query == "What are your office hours?");
    CHECK(rec.session_id == std::optional<std::string>("sess-42"));
    CHECK(rec.top_k == 5);
    CHECK(rec.matched_ids == std::vector<EntryId>{hours.id});
}
