#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <memory>

#include "dentassist/assistant/responder.hpp"
#include "dentassist/knowledge/authoring.hpp"
#include "dentassist/retrieval/index_sync.hpp"
#include "test_helpers.hpp"

using namespace dentassist;
using namespace dentassist::assistant;
using namespace dentassist::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

struct Fixture {
    explicit Fixture(const char* name, int generation_timeout_ms = 2000)
        : dir(name)
        , config(make_test_config(dir.path))
        , store(std::make_shared<knowledge::SqliteKnowledgeStore>((dir.path / "kb.db").string()))
        , embedder(std::make_shared<ScriptedEmbeddings>())
        , index(std::make_shared<retrieval::VectorIndex>(embedder->dimensions()))
        , author(store, embedder)
        , retriever(std::make_shared<retrieval::Retriever>(embedder, index, store))
        , sessions(std::make_shared<chat::SessionManager>(
              std::make_unique<chat::SqliteChatStore>((dir.path / "chat.db").string())))
        , generator(std::make_shared<ScriptedGenerator>()) {
        store->add_listener(std::make_shared<retrieval::IndexSynchronizer>(index));
        auto generation = config.generation;
        generation.timeout_ms = generation_timeout_ms;
        responder = std::make_unique<ResponseAssembler>(retriever, sessions, generator,
            generation, config.retrieval, config.clinic);
    }

    void seed() {
        auto created = run_sync(author.batch_create({
            {.question = "What are your office hours?",
             .answer = "We are open Monday to Friday, 8am to 5pm.", .category = "hours"},
            {.question = "Do you accept dental insurance?",
             .answer = "We accept most PPO plans.", .category = "billing"},
        }));
        REQUIRE(created.has_value());
    }

    TmpDir dir;
    Config config;
    std::shared_ptr<knowledge::SqliteKnowledgeStore> store;
    std::shared_ptr<ScriptedEmbeddings> embedder;
    std::shared_ptr<retrieval::VectorIndex> index;
    knowledge::KnowledgeAuthor author;
    std::shared_ptr<retrieval::Retriever> retriever;
    std::shared_ptr<chat::SessionManager> sessions;
    std::shared_ptr<ScriptedGenerator> generator;
    std::unique_ptr<ResponseAssembler> responder;
};

} // namespace

TEST_CASE("ResponseAssembler answers from the knowledge base", "[assistant][responder]") {
    Fixture f("dentassist_responder_sources");
    f.seed();

    auto reply = run_sync(f.responder->respond("", "What are your office hours?"));
    REQUIRE(reply.has_value());
    CHECK_FALSE(reply->session_id.empty());
    CHECK(reply->answer == "We are open Monday to Friday, 8am to 5pm.");
    CHECK_FALSE(reply->degraded);
    REQUIRE_FALSE(reply->sources.empty());
    CHECK(reply->sources[0].question == "What are your office hours?");
    CHECK(reply->search_results_count == reply->sources.size());
    CHECK(reply->confidence > 0.5);
    CHECK(reply->confidence <= 1.0);

    REQUIRE(f.generator->last_request.has_value());
    const auto& req = *f.generator->last_request;
    REQUIRE(req.system_prompt.has_value());
    CHECK_THAT(*req.system_prompt, ContainsSubstring("Bright Smile Dental"));
    REQUIRE_FALSE(req.messages.empty());
    CHECK_THAT(req.messages.back().content, ContainsSubstring("INFORMATION:"));

    auto history = run_sync(f.sessions->get_history(reply->session_id));
    REQUIRE(history.has_value());
    REQUIRE(history->size() == 2);
    CHECK((*history)[0].role == Role::User);
    CHECK((*history)[1].role == Role::Assistant);
    CHECK((*history)[1].sources.size() == reply->sources.size());

    json j = *reply;
    CHECK(j["response"] == reply->answer);
    CHECK(j["degraded"] == false);
    CHECK(j.contains("confidence_score"));

    SECTION("follow-up turns carry the conversation") {
        auto next = run_sync(f.responder->respond(reply->session_id, "And on Saturdays?"));
        REQUIRE(next.has_value());
        CHECK(next->session_id == reply->session_id);
        const auto& follow = *f.generator->last_request;
        REQUIRE(follow.messages.size() == 3);
        CHECK(follow.messages[0].content == "What are your office hours?");
        CHECK(follow.messages[1].role == Role::Assistant);
    }
}

TEST_CASE("ResponseAssembler without matches uses general guidance", "[assistant][responder]") {
    Fixture f("dentassist_responder_empty");

    auto reply = run_sync(f.responder->respond("walk-in-1", "Is flossing important?"));
    REQUIRE(reply.has_value());
    CHECK(reply->session_id == "walk-in-1");
    CHECK_FALSE(reply->degraded);
    CHECK(reply->sources.empty());
    CHECK(reply->confidence == 0.0);
    CHECK_THAT(f.generator->last_request->messages.back().content,
               ContainsSubstring("no clinic-specific information"));
}

TEST_CASE("ResponseAssembler degrades when generation fails", "[assistant][responder]") {
    SECTION("provider error") {
        Fixture f("dentassist_responder_fail");
        f.seed();
        f.generator->failing = true;

        auto reply = run_sync(f.responder->respond("", "What are your office hours?"));
        REQUIRE(reply.has_value());
        CHECK(reply->degraded);
        CHECK(reply->confidence == 0.0);
        CHECK(reply->sources.empty());
        CHECK(reply->search_results_count > 0);
        CHECK_THAT(reply->answer, ContainsSubstring("555-0100"));

        auto history = run_sync(f.sessions->get_history(reply->session_id));
        REQUIRE(history.has_value());
        REQUIRE(history->size() == 2);
        CHECK((*history)[1].degraded);
    }

    SECTION("deadline exceeded") {
        Fixture f("dentassist_responder_timeout", 30);
        f.generator->delay = std::chrono::milliseconds(300);

        auto reply = run_sync(f.responder->respond("", "What are your office hours?"));
        REQUIRE(reply.has_value());
        CHECK(reply->degraded);
        CHECK(reply->response_time_ms < 300);
    }

    SECTION("blank answer") {
        Fixture f("dentassist_responder_blank");
        f.generator->answer = "   ";
        auto reply = run_sync(f.responder->respond("", "Hello"));
        REQUIRE(reply.has_value());
        CHECK(reply->degraded);
    }
}

TEST_CASE("ResponseAssembler answers through an embedding outage", "[assistant][responder]") {
    Fixture f("dentassist_responder_no_embed");
    f.seed();
    f.embedder->failing = true;

    auto reply = run_sync(f.responder->respond("", "What are your office hours?"));
    REQUIRE(reply.has_value());
    CHECK_FALSE(reply->degraded);
    CHECK(reply->sources.empty());
    CHECK(reply->search_results_count == 0);
    CHECK(f.generator->calls == 1);
}

TEST_CASE("ResponseAssembler stops when the caller goes away", "[assistant][responder]") {
    Fixture f("dentassist_responder_cancel");
    f.seed();

    SECTION("cancelled during generation") {
        CancelToken cancel;
        f.generator->cancel_during = cancel;
        auto reply = run_sync(f.responder->respond("visit-9", "What are your office hours?", cancel));
        REQUIRE_FALSE(reply.has_value());
        CHECK(reply.error().code() == ErrorCode::Cancelled);

        auto history = run_sync(f.sessions->get_history("visit-9"));
        REQUIRE(history.has_value());
        REQUIRE(history->size() == 1);
        CHECK((*history)[0].role == Role::User);
    }

    SECTION("cancelled before generation") {
        CancelToken cancel;
        cancel.cancel();
        auto reply = run_sync(f.responder->respond("visit-10", "Hours?", cancel));
        REQUIRE_FALSE(reply.has_value());
        CHECK(reply.error().code() == ErrorCode::Cancelled);
        CHECK(f.generator->calls == 0);
    }
}

TEST_CASE("ResponseAssembler rejects bad requests", "[assistant][responder]") {
    Fixture f("dentassist_responder_bad");

    auto blank = run_sync(f.responder->respond("", "   "));
    REQUIRE_FALSE(blank.has_value());
    CHECK(blank.error().code() == ErrorCode::InvalidArgument);

    auto session = run_sync(f.sessions->create_session("patient"));
    REQUIRE(session.has_value());
    REQUIRE(run_sync(f.sessions->end_session(session->id)).has_value());
    auto ended = run_sync(f.responder->respond(session->id, "Hello?"));
    REQUIRE_FALSE(ended.has_value());
    CHECK(ended.error().code() == ErrorCode::SessionError);
}
