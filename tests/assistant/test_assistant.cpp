#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>

#include "dentassist/assistant/assistant.hpp"
#include "test_helpers.hpp"

using namespace dentassist;
using namespace dentassist::assistant;
using namespace dentassist::testing;

namespace {

struct Harness {
    std::shared_ptr<ScriptedEmbeddings> embedder = std::make_shared<ScriptedEmbeddings>();
    std::shared_ptr<ScriptedGenerator> generator = std::make_shared<ScriptedGenerator>();
    std::unique_ptr<Assistant> assistant;
};

auto make_assistant(const TmpDir& dir, Config config) -> Harness {
    Harness h;

    Components components;
    components.knowledge = std::make_shared<knowledge::SqliteKnowledgeStore>(
        (dir.path / "knowledge.db").string());
    components.embedder = h.embedder;
    components.generator = h.generator;
    components.chat_store = std::make_unique<chat::SqliteChatStore>(
        (dir.path / "chat.db").string());
    components.search_log = std::make_shared<retrieval::SearchLog>(
        (dir.path / "knowledge.db").string());
    h.assistant = std::make_unique<Assistant>(std::move(config), std::move(components));
    return h;
}

auto make_assistant(const TmpDir& dir) -> Harness {
    return make_assistant(dir, make_test_config(dir.path));
}

void seed(Assistant& assistant) {
    auto created = run_sync(assistant.author().batch_create({
        {.question = "What are your office hours?",
         .answer = "We are open Monday to Friday, 8am to 5pm.", .category = "hours"},
        {.question = "Do you accept dental insurance?",
         .answer = "We accept most PPO plans.", .category = "billing"},
        {.question = "Is parking available?",
         .answer = "Free parking behind the building.", .category = "visit"},
    }));
    REQUIRE(created.has_value());
}

auto search_options() -> retrieval::RetrieveOptions {
    retrieval::RetrieveOptions o;
    o.threshold = 0.3;
    return o;
}

} // namespace

TEST_CASE("Assistant requires its collaborators", "[assistant]") {
    TmpDir dir("dentassist_assistant_components");
    Components components;
    CHECK_THROWS_AS(Assistant(make_test_config(dir.path), std::move(components)),
                    std::invalid_argument);
}

TEST_CASE("Assistant initialize on an empty knowledge base", "[assistant]") {
    TmpDir dir("dentassist_assistant_empty");
    auto h = make_assistant(dir);

    REQUIRE(run_sync(h.assistant->initialize()).has_value());
    CHECK(h.assistant->index().size() == 0);

    auto snapshot = h.assistant->snapshot_path();
    REQUIRE(snapshot.has_value());
    CHECK(std::filesystem::exists(*snapshot));

    auto results = run_sync(h.assistant->search("office hours", search_options()));
    REQUIRE(results.has_value());
    CHECK(results->empty());
}

TEST_CASE("Assistant search and chat over seeded entries", "[assistant]") {
    TmpDir dir("dentassist_assistant_seeded");
    auto h = make_assistant(dir);
    REQUIRE(run_sync(h.assistant->initialize()).has_value());
    seed(*h.assistant);
    CHECK(h.assistant->index().size() == 3);

    auto results = run_sync(h.assistant->search("What are your office hours?", search_options()));
    REQUIRE(results.has_value());
    REQUIRE_FALSE(results->empty());
    CHECK((*results)[0].category == "hours");

    auto reply = run_sync(h.assistant->chat("", "What are your office hours?"));
    REQUIRE(reply.has_value());
    CHECK_FALSE(reply->degraded);
    CHECK_FALSE(reply->sources.empty());

    auto status = run_sync(h.assistant->status());
    REQUIRE(status.has_value());
    CHECK((*status)["status"] == "ok");
    CHECK((*status)["index"]["total_entries"] == 3);
    CHECK((*status)["knowledge_base"]["total_entries"].is_number());
    CHECK((*status)["embedding"]["model"] == "scripted-local");
    CHECK((*status)["rebuild_in_progress"] == false);
    CHECK((*status)["logged_searches"].get<size_t>() >= 2);
}

TEST_CASE("Assistant answers from a single office hours entry", "[assistant]") {
    TmpDir dir("dentassist_assistant_single");
    auto config = make_test_config(dir.path);
    config.retrieval.top_k = 5;
    config.retrieval.similarity_threshold = 0.7;
    auto h = make_assistant(dir, std::move(config));
    REQUIRE(run_sync(h.assistant->initialize()).has_value());

    auto created = run_sync(h.assistant->author().create(
        {.question = "What are your office hours?", .answer = "9am-5pm Mon-Fri"}));
    REQUIRE(created.has_value());

    retrieval::RetrieveOptions options;
    options.k = 5;
    options.threshold = 0.7;
    auto results = run_sync(h.assistant->search("office hours", options));
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 1);
    CHECK((*results)[0].id == created->id);
    CHECK((*results)[0].similarity >= 0.7);

    auto reply = run_sync(h.assistant->chat("", "office hours"));
    REQUIRE(reply.has_value());
    CHECK_FALSE(reply->degraded);
    CHECK_FALSE(reply->answer.empty());
    REQUIRE(reply->sources.size() == 1);
    CHECK(reply->sources[0].id == created->id);
    CHECK(reply->sources[0].similarity >= 0.7);
    CHECK(reply->confidence >= 0.7);
}

TEST_CASE("Assistant search stays whole while the index is rebuilt", "[assistant]") {
    TmpDir dir("dentassist_assistant_rebuild_search");
    auto h = make_assistant(dir);
    REQUIRE(run_sync(h.assistant->initialize()).has_value());
    seed(*h.assistant);

    auto listed = run_sync(h.assistant->knowledge().list({}));
    REQUIRE(listed.has_value());
    std::set<EntryId> stored;
    for (const auto& e : *listed) stored.insert(e.id);
    REQUIRE(stored.size() == 3);

    // Every entry is embedded, so rebuilds never call the embedder and the
    // search thread is its only user.
    std::atomic<bool> done{false};
    std::atomic<int> rebuild_failures{0};
    std::thread rebuilder([&] {
        for (int i = 0; i < 25; ++i) {
            auto report = run_sync(h.assistant->rebuild_index());
            if (!report || report->indexed != 3) ++rebuild_failures;
        }
        done = true;
    });

    int searches = 0;
    int misses = 0;
    int unknown = 0;
    while (!done.load() || searches < 50) {
        auto results = run_sync(h.assistant->search("What are your office hours?",
                                                    search_options()));
        ++searches;
        if (!results || results->empty() || (*results)[0].category != "hours") {
            ++misses;
            continue;
        }
        for (const auto& r : *results) {
            if (!stored.contains(r.id)) ++unknown;
        }
    }
    rebuilder.join();

    CHECK(rebuild_failures.load() == 0);
    CHECK(misses == 0);
    CHECK(unknown == 0);
    CHECK(h.assistant->index().size() == 3);
}

TEST_CASE("Assistant rebuild_index", "[assistant]") {
    TmpDir dir("dentassist_assistant_rebuild");
    auto h = make_assistant(dir);
    REQUIRE(run_sync(h.assistant->initialize()).has_value());
    seed(*h.assistant);

    SECTION("idempotent") {
        auto first = run_sync(h.assistant->rebuild_index());
        auto second = run_sync(h.assistant->rebuild_index());
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(first->indexed == 3);
        CHECK(second->indexed == 3);
        CHECK(second->embedded == 0);
        CHECK(second->unsearchable == 0);
        CHECK_FALSE(second->coalesced);

        json j = *second;
        CHECK(j["success"] == true);
        CHECK(j["indexed_entries"] == 3);
    }

    SECTION("repairs entries stored during an outage") {
        h.embedder->failing = true;
        auto created = run_sync(h.assistant->author().create(
            {.question = "Do you see children?", .answer = "Yes, from age two."}));
        REQUIRE(created.has_value());
        CHECK_FALSE(h.assistant->index().contains(created->id));

        auto still_down = run_sync(h.assistant->rebuild_index());
        REQUIRE(still_down.has_value());
        CHECK(still_down->indexed == 3);
        CHECK(still_down->unsearchable == 1);

        h.embedder->failing = false;
        auto repaired = run_sync(h.assistant->rebuild_index());
        REQUIRE(repaired.has_value());
        CHECK(repaired->embedded == 1);
        CHECK(repaired->indexed == 4);
        CHECK(repaired->unsearchable == 0);
        CHECK(h.assistant->index().contains(created->id));
    }

    SECTION("full re-embed fails while the embedder is down") {
        h.embedder->failing = true;
        auto r = run_sync(h.assistant->rebuild_index(true));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::EmbeddingUnavailable);
        CHECK(h.assistant->index().size() == 3);
    }

    SECTION("full re-embed") {
        auto r = run_sync(h.assistant->rebuild_index(true));
        REQUIRE(r.has_value());
        CHECK(r->embedded == 3);
        CHECK(r->indexed == 3);
    }
}

TEST_CASE("Assistant reloads or rebuilds its index on restart", "[assistant]") {
    TmpDir dir("dentassist_assistant_restart");
    {
        auto h = make_assistant(dir);
        REQUIRE(run_sync(h.assistant->initialize()).has_value());
        seed(*h.assistant);
        REQUIRE(h.assistant->save_index().has_value());
    }

    SECTION("snapshot matches the store") {
        auto h = make_assistant(dir);
        REQUIRE(run_sync(h.assistant->initialize()).has_value());
        CHECK(h.assistant->index().size() == 3);
    }

    SECTION("store changed after the snapshot was written") {
        {
            auto h = make_assistant(dir);
            REQUIRE(run_sync(h.assistant->initialize()).has_value());
            auto created = run_sync(h.assistant->author().create(
                {.question = "Do you offer whitening?", .answer = "Yes, in-office and take-home."}));
            REQUIRE(created.has_value());
            // Exit without saving the snapshot.
        }
        auto h = make_assistant(dir);
        REQUIRE(run_sync(h.assistant->initialize()).has_value());
        CHECK(h.assistant->index().size() == 4);
    }

    SECTION("corrupt snapshot") {
        auto path = dir.path / "index.bin";
        REQUIRE(std::filesystem::exists(path));
        std::filesystem::resize_file(path, 3);

        auto h = make_assistant(dir);
        REQUIRE(run_sync(h.assistant->initialize()).has_value());
        CHECK(h.assistant->index().size() == 3);
    }
}

TEST_CASE("Assistant expires idle sessions", "[assistant]") {
    TmpDir dir("dentassist_assistant_idle");
    auto h = make_assistant(dir);
    REQUIRE(run_sync(h.assistant->initialize()).has_value());

    auto session = run_sync(h.assistant->sessions().create_session("patient"));
    REQUIRE(session.has_value());

    auto expired = run_sync(h.assistant->expire_idle_sessions());
    REQUIRE(expired.has_value());
    CHECK(*expired == 0);
}
