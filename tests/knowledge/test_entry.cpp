#include <catch2/catch_test_macros.hpp>

#include "dentassist/knowledge/entry.hpp"

using namespace dentassist;
using namespace dentassist::knowledge;

TEST_CASE("validate_draft trims and applies defaults", "[knowledge][entry]") {
    EntryDraft draft;
    draft.question = "  What are your office hours?  ";
    draft.answer = "\tMonday to Friday, 8am to 5pm.\n";
    draft.category = "   ";
    draft.source = "";

    auto valid = validate_draft(draft);
    REQUIRE(valid.has_value());
    CHECK(valid->question == "What are your office hours?");
    CHECK(valid->answer == "Monday to Friday, 8am to 5pm.");
    CHECK(valid->category == "general");
    CHECK(valid->source == "user_defined");
}

TEST_CASE("validate_draft rejects blank text", "[knowledge][entry]") {
    SECTION("blank question") {
        auto r = validate_draft(EntryDraft{.question = "   ", .answer = "Yes."});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("blank answer") {
        auto r = validate_draft(EntryDraft{.question = "Do you take walk-ins?", .answer = ""});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("QAEntry searchability", "[knowledge][entry]") {
    QAEntry e;
    e.question = "Q";
    e.answer = "A";

    CHECK_FALSE(e.is_searchable());
    CHECK(e.needs_embedding());

    e.embedding = Embedding{0.1f, 0.2f};
    CHECK(e.is_searchable());
    CHECK_FALSE(e.needs_embedding());

    e.active = false;
    CHECK_FALSE(e.is_searchable());
    CHECK_FALSE(e.needs_embedding());

    e.active = true;
    e.embedding = Embedding{};
    CHECK_FALSE(e.is_searchable());
}

TEST_CASE("QAEntry JSON omits the vector", "[knowledge][entry]") {
    QAEntry e;
    e.id = 7;
    e.question = "Do you accept insurance?";
    e.answer = "We accept most PPO plans.";
    e.category = "billing";
    e.embedding = Embedding{0.5f, 0.5f};
    e.embedding_model = "local-hash-256";
    e.created_at = from_epoch_ms(1700000000000);
    e.updated_at = e.created_at;

    json j = e;
    CHECK(j["id"] == 7);
    CHECK(j["category"] == "billing");
    CHECK(j["is_active"] == true);
    CHECK(j["has_embedding"] == true);
    CHECK(j["source_url"].is_null());
    CHECK(j["embedding_model"] == "local-hash-256");
    CHECK_FALSE(j.contains("embedding"));
    CHECK(j["created_at"] == "2023-11-14T22:13:20.000Z");
}

TEST_CASE("EntryDraft and EntryPatch from JSON", "[knowledge][entry]") {
    SECTION("draft defaults") {
        auto d = json{{"question", "Q?"}, {"answer", "A."}}.get<EntryDraft>();
        CHECK(d.category == "general");
        CHECK(d.source == "user_defined");
        CHECK_FALSE(d.source_url.has_value());
    }

    SECTION("draft with url") {
        auto d = json{{"question", "Q?"}, {"answer", "A."},
                      {"source", "website"},
                      {"source_url", "https://example.com/faq"}}.get<EntryDraft>();
        CHECK(d.source == "website");
        REQUIRE(d.source_url.has_value());
        CHECK(*d.source_url == "https://example.com/faq");
    }

    SECTION("patch only sets present fields") {
        auto p = json{{"answer", "Updated."}, {"is_active", false}}.get<EntryPatch>();
        CHECK_FALSE(p.question.has_value());
        REQUIRE(p.answer.has_value());
        CHECK(*p.answer == "Updated.");
        REQUIRE(p.active.has_value());
        CHECK_FALSE(*p.active);
        CHECK(p.invalidates_embedding());
    }

    SECTION("source-only patch keeps the embedding") {
        auto p = json{{"source", "staff"}}.get<EntryPatch>();
        CHECK_FALSE(p.invalidates_embedding());
    }
}

TEST_CASE("embedding_text", "[knowledge][entry]") {
    QAEntry e;
    e.question = "What   are your\nhours?";
    e.answer = "8am  to 5pm.";

    CHECK(embedding_text(e, false) == "What are your hours?");
    CHECK(embedding_text(e, true) == "Q: What are your hours?\nA: 8am to 5pm.");
}

TEST_CASE("content_fingerprint ignores case and whitespace", "[knowledge][entry]") {
    auto a = content_fingerprint("What are your hours?", "8am to 5pm.");
    auto b = content_fingerprint("  what ARE your   hours? ", "8AM to 5PM.");
    auto c = content_fingerprint("What are your hours?", "9am to 6pm.");

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a.size() == 64);
}
