#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

#include "dentassist/assistant/assistant.hpp"
#include "dentassist/gateway/chat_handler.hpp"
#include "dentassist/gateway/knowledge_handler.hpp"
#include "dentassist/gateway/system_handler.hpp"
#include "test_helpers.hpp"

using namespace dentassist;
using namespace dentassist::gateway;
using namespace dentassist::testing;

namespace {

struct Gateway {
    explicit Gateway(const TmpDir& dir) {
        assistant::Components components;
        components.knowledge = std::make_shared<knowledge::SqliteKnowledgeStore>(
            (dir.path / "knowledge.db").string());
        components.embedder = embedder;
        components.generator = generator;
        components.chat_store = std::make_unique<chat::SqliteChatStore>(
            (dir.path / "chat.db").string());
        components.search_log = std::make_shared<retrieval::SearchLog>(
            (dir.path / "knowledge.db").string());
        assistant = std::make_unique<assistant::Assistant>(
            make_test_config(dir.path), std::move(components));
        REQUIRE(run_sync(assistant->initialize()).has_value());

        register_chat_handlers(protocol, *assistant);
        register_knowledge_handlers(protocol, *assistant);
        register_system_handlers(protocol, *assistant);
    }

    auto call(std::string method, json params = json::object()) -> Result<json> {
        RequestFrame req{.id = std::to_string(++next_id),
                         .method = std::move(method),
                         .params = std::move(params)};
        return run_sync(protocol.dispatch(req, RequestContext{.connection_id = "test"}));
    }

    auto create(std::string question, std::string answer, std::string category) -> int64_t {
        auto r = call("kb.create", {{"question", question},
                                    {"answer", answer},
                                    {"category", category}});
        REQUIRE(r.has_value());
        return (*r)["id"].get<int64_t>();
    }

    std::shared_ptr<ScriptedEmbeddings> embedder = std::make_shared<ScriptedEmbeddings>();
    std::shared_ptr<ScriptedGenerator> generator = std::make_shared<ScriptedGenerator>();
    std::unique_ptr<assistant::Assistant> assistant;
    Protocol protocol;
    int next_id = 0;
};

} // namespace

TEST_CASE("Every gateway method is registered", "[gateway][handlers]") {
    TmpDir dir("dentassist_gw_methods");
    Gateway gw(dir);

    for (const char* name : {
             "kb.search", "kb.create", "kb.import", "kb.get", "kb.list", "kb.update",
             "kb.deactivate", "kb.reactivate", "kb.duplicate", "kb.delete",
             "kb.categories", "kb.sources", "kb.stats",
             "chat.send", "chat.session.create", "chat.session.get",
             "chat.session.end", "chat.history", "chat.stats",
             "system.rebuild_index", "system.status", "system.methods"}) {
        CHECK(gw.protocol.has_method(name));
    }

    auto listed = gw.call("system.methods", {{"group", "chat"}});
    REQUIRE(listed.has_value());
    CHECK((*listed)["methods"].size() == 6);
    CHECK((*listed)["methods"][0]["name"] == "chat.history");
}

TEST_CASE("Knowledge methods", "[gateway][handlers]") {
    TmpDir dir("dentassist_gw_kb");
    Gateway gw(dir);

    auto hours = gw.create("What are your office hours?",
                           "We are open Monday to Friday, 8am to 5pm.", "hours");
    auto insurance = gw.create("Do you accept dental insurance?",
                               "We accept most PPO plans.", "billing");

    SECTION("create returns the stored entry") {
        auto got = gw.call("kb.get", {{"id", hours}});
        REQUIRE(got.has_value());
        CHECK((*got)["question"] == "What are your office hours?");
        CHECK((*got)["category"] == "hours");
        CHECK((*got)["source"] == "user_defined");
        CHECK((*got)["is_active"] == true);
        CHECK((*got)["has_embedding"] == true);
        CHECK((*got)["source_url"].is_null());
        CHECK_FALSE(got->contains("embedding"));
    }

    SECTION("create rejects a blank question") {
        auto r = gw.call("kb.create", {{"question", "  "}, {"answer", "x"}});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("search ranks the matching entry first") {
        auto r = gw.call("kb.search", {{"query", "office hours"}, {"top_k", 3}});
        REQUIRE(r.has_value());
        CHECK((*r)["query"] == "office hours");
        REQUIRE((*r)["total_results"].get<size_t>() >= 1);
        CHECK((*r)["results"][0]["id"] == hours);
        CHECK((*r)["results"][0].contains("similarity_score"));
        CHECK((*r).contains("search_time_ms"));
    }

    SECTION("search validates its input") {
        auto blank = gw.call("kb.search", {{"query", ""}});
        REQUIRE_FALSE(blank.has_value());
        CHECK(blank.error().code() == ErrorCode::InvalidArgument);

        auto threshold = gw.call("kb.search", {{"query", "hours"}, {"threshold", 1.5}});
        REQUIRE_FALSE(threshold.has_value());
        CHECK(threshold.error().code() == ErrorCode::InvalidArgument);

        auto wrong_type = gw.call("kb.search", {{"query", "hours"}, {"top_k", "many"}});
        REQUIRE_FALSE(wrong_type.has_value());
        CHECK(wrong_type.error().code() == ErrorCode::InvalidArgument);

        for (int bad_k : {-1, 0}) {
            auto r = gw.call("kb.search", {{"query", "hours"}, {"top_k", bad_k}});
            REQUIRE_FALSE(r.has_value());
            CHECK(r.error().code() == ErrorCode::InvalidArgument);
        }

        auto negative_limit = gw.call("kb.list", {{"limit", -5}});
        REQUIRE_FALSE(negative_limit.has_value());
        CHECK(negative_limit.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("search honours the category filter") {
        auto r = gw.call("kb.search", {{"query", "office hours insurance"},
                                       {"threshold", 0.0},
                                       {"category", "billing"}});
        REQUIRE(r.has_value());
        for (const auto& hit : (*r)["results"]) CHECK(hit["category"] == "billing");
    }

    SECTION("list, categories and sources") {
        auto listed = gw.call("kb.list");
        REQUIRE(listed.has_value());
        CHECK((*listed)["count"] == 2);
        CHECK((*listed)["entries"][0]["id"] == insurance);

        auto billing = gw.call("kb.list", {{"category", "billing"}});
        REQUIRE(billing.has_value());
        CHECK((*billing)["count"] == 1);

        auto categories = gw.call("kb.categories");
        REQUIRE(categories.has_value());
        CHECK((*categories)["categories"].size() == 2);

        auto sources = gw.call("kb.sources");
        REQUIRE(sources.has_value());
        CHECK((*sources)["sources"] == json::array({"user_defined"}));
    }

    SECTION("update edits fields") {
        auto r = gw.call("kb.update", {{"id", hours}, {"answer", "Open 9am to 6pm."}});
        REQUIRE(r.has_value());
        CHECK((*r)["answer"] == "Open 9am to 6pm.");
        CHECK((*r)["question"] == "What are your office hours?");

        auto missing = gw.call("kb.update", {{"id", 9999}, {"answer", "x"}});
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == ErrorCode::NotFound);
    }

    SECTION("deactivate hides an entry until reactivated") {
        auto off = gw.call("kb.deactivate", {{"id", hours}});
        REQUIRE(off.has_value());
        CHECK((*off)["is_active"] == false);

        auto search = gw.call("kb.search", {{"query", "office hours"}});
        REQUIRE(search.has_value());
        for (const auto& hit : (*search)["results"]) CHECK(hit["id"] != hours);

        auto listed = gw.call("kb.list", {{"include_inactive", true}});
        REQUIRE(listed.has_value());
        CHECK((*listed)["count"] == 2);

        auto on = gw.call("kb.reactivate", {{"id", hours}});
        REQUIRE(on.has_value());
        auto again = gw.call("kb.search", {{"query", "office hours"}});
        REQUIRE(again.has_value());
        CHECK((*again)["results"][0]["id"] == hours);
    }

    SECTION("duplicate copies an entry") {
        auto copy = gw.call("kb.duplicate", {{"id", insurance}});
        REQUIRE(copy.has_value());
        CHECK((*copy)["question"] == "Copy of: Do you accept dental insurance?");
        CHECK((*copy)["answer"] == "We accept most PPO plans.");
        CHECK((*copy)["id"] != insurance);
    }

    SECTION("delete removes an entry") {
        auto r = gw.call("kb.delete", {{"id", hours}});
        REQUIRE(r.has_value());
        CHECK((*r)["deleted"] == true);

        auto got = gw.call("kb.get", {{"id", hours}});
        REQUIRE_FALSE(got.has_value());
        CHECK(got.error().code() == ErrorCode::NotFound);
        CHECK(gw.assistant->index().size() == 1);
    }

    SECTION("id must be an integer") {
        auto r = gw.call("kb.get", {{"id", "seven"}});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("stats include integrity and index") {
        auto r = gw.call("kb.stats");
        REQUIRE(r.has_value());
        CHECK((*r)["total_entries"] == 2);
        CHECK((*r)["active_entries"] == 2);
        CHECK((*r)["by_category"]["hours"] == 1);
        CHECK((*r)["integrity"]["healthy"] == true);
        CHECK((*r)["index"]["total_entries"] == 2);
    }
}

TEST_CASE("kb.import creates all entries or none", "[gateway][handlers]") {
    TmpDir dir("dentassist_gw_import");
    Gateway gw(dir);

    auto ok = gw.call("kb.import", {{"entries", json::array({
        {{"question", "Do you see children?"}, {"answer", "Yes, from age 3."}},
        {{"question", "Is parking available?"}, {"answer", "Behind the building."}},
    })}});
    REQUIRE(ok.has_value());
    CHECK((*ok)["created"] == 2);
    CHECK(gw.assistant->index().size() == 2);

    auto bad = gw.call("kb.import", {{"entries", json::array({
        {{"question", "Valid?"}, {"answer", "Yes."}},
        {{"question", ""}, {"answer", "No question."}},
    })}});
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::InvalidArgument);
    CHECK(bad.error().detail() == "entry 1");
    CHECK(gw.assistant->index().size() == 2);

    auto not_array = gw.call("kb.import", {{"entries", "nope"}});
    REQUIRE_FALSE(not_array.has_value());
    CHECK(not_array.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("Chat methods", "[gateway][handlers]") {
    TmpDir dir("dentassist_gw_chat");
    Gateway gw(dir);
    gw.create("What are your office hours?",
              "We are open Monday to Friday, 8am to 5pm.", "hours");

    auto session = gw.call("chat.session.create", {{"user_id", "patient-7"}});
    REQUIRE(session.has_value());
    auto session_id = (*session)["session_id"].get<std::string>();
    CHECK(session_id.size() == 36);
    CHECK((*session)["user_id"] == "patient-7");
    CHECK((*session)["state"] == "active");

    SECTION("send answers with sources and records history") {
        auto reply = gw.call("chat.send", {{"session_id", session_id},
                                           {"message", "What are your office hours?"}});
        REQUIRE(reply.has_value());
        CHECK((*reply)["session_id"] == session_id);
        CHECK((*reply)["response"] == gw.generator->answer);
        CHECK((*reply)["degraded"] == false);
        CHECK_FALSE((*reply)["sources"].empty());
        CHECK((*reply)["confidence_score"].get<double>() > 0.0);

        auto history = gw.call("chat.history", {{"session_id", session_id}});
        REQUIRE(history.has_value());
        REQUIRE((*history)["messages"].size() == 2);
        CHECK((*history)["messages"][0]["role"] == "user");
        CHECK((*history)["messages"][1]["role"] == "assistant");

        auto stats = gw.call("chat.stats");
        REQUIRE(stats.has_value());
        CHECK((*stats)["total_messages"] == 2);
    }

    SECTION("send without a session starts one") {
        auto reply = gw.call("chat.send", {{"message", "Where do I park?"}});
        REQUIRE(reply.has_value());
        CHECK((*reply)["session_id"].get<std::string>().size() == 36);
        CHECK((*reply)["session_id"] != session_id);
    }

    SECTION("send requires a message") {
        auto r = gw.call("chat.send", {{"session_id", session_id}});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("ended sessions refuse new turns") {
        auto ended = gw.call("chat.session.end", {{"session_id", session_id}});
        REQUIRE(ended.has_value());
        CHECK((*ended)["ended"] == true);

        auto got = gw.call("chat.session.get", {{"session_id", session_id}});
        REQUIRE(got.has_value());
        CHECK((*got)["state"] == "closed");
        CHECK((*got)["is_active"] == false);

        auto r = gw.call("chat.send", {{"session_id", session_id}, {"message", "Hello?"}});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::SessionError);
    }

    SECTION("unknown sessions") {
        auto r = gw.call("chat.session.get", {{"session_id", "no-such-session"}});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("System methods", "[gateway][handlers]") {
    TmpDir dir("dentassist_gw_system");
    Gateway gw(dir);
    gw.create("What are your office hours?",
              "We are open Monday to Friday, 8am to 5pm.", "hours");

    SECTION("status") {
        auto r = gw.call("system.status");
        REQUIRE(r.has_value());
        CHECK((*r)["status"] == "ok");
        CHECK((*r)["index"]["total_entries"] == 1);
        CHECK((*r)["knowledge_base"]["active_entries"] == 1);
        CHECK((*r)["embedding"]["model"] == "scripted-local");
        CHECK((*r)["embedding"]["dimensions"] == 256);
        CHECK((*r)["rebuild_in_progress"] == false);
    }

    SECTION("rebuild_index") {
        auto r = gw.call("system.rebuild_index");
        REQUIRE(r.has_value());
        CHECK((*r)["success"] == true);
        CHECK((*r)["indexed_entries"] == 1);
        CHECK((*r)["unsearchable_entries"] == 0);

        auto reembed = gw.call("system.rebuild_index", {{"reembed", true}});
        REQUIRE(reembed.has_value());
        CHECK((*reembed)["embedded_entries"] == 1);
    }

    SECTION("rebuild_index reports an embedding outage on full re-embed") {
        gw.embedder->failing = true;
        auto r = gw.call("system.rebuild_index", {{"reembed", true}});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::EmbeddingUnavailable);
    }
}
