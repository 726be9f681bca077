#include <catch2/catch_test_macros.hpp>

#include "dentassist/gateway/frame.hpp"

using namespace dentassist;
using namespace dentassist::gateway;

TEST_CASE("parse_frame reads request frames", "[gateway][frame]") {
    SECTION("explicit type") {
        auto f = parse_frame(
            R"({"type":"req","id":"1","method":"kb.search","params":{"query":"hours"}})");
        REQUIRE(f.has_value());
        REQUIRE(std::holds_alternative<RequestFrame>(*f));
        const auto& req = std::get<RequestFrame>(*f);
        CHECK(req.id == "1");
        CHECK(req.method == "kb.search");
        CHECK(req.params["query"] == "hours");
    }

    SECTION("type inferred, numeric id, params omitted") {
        auto f = parse_frame(R"({"id":42,"method":"system.status"})");
        REQUIRE(f.has_value());
        const auto& req = std::get<RequestFrame>(*f);
        CHECK(req.id == "42");
        CHECK(req.params.is_object());
        CHECK(req.params.empty());
    }

    SECTION("missing method") {
        auto f = parse_frame(R"({"type":"req","id":"1"})");
        REQUIRE_FALSE(f.has_value());
        CHECK(f.error().code() == ErrorCode::SerializationError);
    }

    SECTION("unusable id or method") {
        auto empty_method = parse_frame(R"({"id":"1","method":""})");
        REQUIRE_FALSE(empty_method.has_value());
        CHECK(empty_method.error().code() == ErrorCode::ProtocolError);

        auto empty_id = parse_frame(R"({"id":"","method":"kb.get"})");
        REQUIRE_FALSE(empty_id.has_value());
        CHECK(empty_id.error().code() == ErrorCode::ProtocolError);

        json long_id = {{"id", std::string(kMaxRequestIdLength + 1, 'x')}, {"method", "kb.get"}};
        auto too_long = parse_frame(long_id.dump());
        REQUIRE_FALSE(too_long.has_value());
        CHECK(too_long.error().code() == ErrorCode::ProtocolError);
    }
}

TEST_CASE("parse_frame reads responses and events", "[gateway][frame]") {
    auto res = parse_frame(R"({"type":"res","id":"7","ok":true,"payload":{"n":1}})");
    REQUIRE(res.has_value());
    const auto& r = std::get<ResponseFrame>(*res);
    CHECK(r.ok);
    CHECK_FALSE(r.is_error());
    CHECK((*r.result)["n"] == 1);

    auto err = parse_frame(R"({"id":"8","error":{"code":"NOT_FOUND","message":"x"}})");
    REQUIRE(err.has_value());
    const auto& e = std::get<ResponseFrame>(*err);
    CHECK_FALSE(e.ok);
    CHECK(e.is_error());

    auto ev = parse_frame(R"({"type":"event","event":"gateway.ready"})");
    REQUIRE(ev.has_value());
    const auto& event = std::get<EventFrame>(*ev);
    CHECK(event.event == "gateway.ready");
    CHECK(event.data.is_object());
}

TEST_CASE("parse_frame rejects malformed input", "[gateway][frame]") {
    auto bad_json = parse_frame("{not json");
    REQUIRE_FALSE(bad_json.has_value());
    CHECK(bad_json.error().code() == ErrorCode::SerializationError);

    auto not_object = parse_frame("[1,2,3]");
    REQUIRE_FALSE(not_object.has_value());
    CHECK(not_object.error().code() == ErrorCode::ProtocolError);

    auto shapeless = parse_frame(R"({"hello":"world"})");
    REQUIRE_FALSE(shapeless.has_value());
    CHECK(shapeless.error().code() == ErrorCode::ProtocolError);

    auto unknown = parse_frame(R"({"type":"ping"})");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code() == ErrorCode::ProtocolError);
}

TEST_CASE("serialize_frame writes the wire shape", "[gateway][frame]") {
    SECTION("success response") {
        auto j = json::parse(serialize_frame(make_response("3", {{"total_results", 2}})));
        CHECK(j["type"] == "res");
        CHECK(j["id"] == "3");
        CHECK(j["ok"] == true);
        CHECK(j["payload"]["total_results"] == 2);
        CHECK_FALSE(j.contains("error"));
    }

    SECTION("error response with detail") {
        auto err = make_error(ErrorCode::NotFound, "Entry not found", "17");
        auto j = json::parse(serialize_frame(make_error_response("4", err)));
        CHECK(j["ok"] == false);
        CHECK(j["error"]["code"] == "NOT_FOUND");
        CHECK(j["error"]["message"] == "Entry not found");
        CHECK(j["error"]["detail"] == "17");
        CHECK_FALSE(j.contains("payload"));
    }

    SECTION("error response without detail") {
        auto j = json::parse(serialize_frame(
            make_error_response("5", ErrorCode::InvalidArgument, "query is required")));
        CHECK_FALSE(j["error"].contains("detail"));
    }

    SECTION("event") {
        auto j = json::parse(serialize_frame(make_event("index.rebuilt", {{"indexed_entries", 3}})));
        CHECK(j["type"] == "event");
        CHECK(j["event"] == "index.rebuilt");
        CHECK(j["payload"]["indexed_entries"] == 3);
    }

    SECTION("invalid UTF-8 is replaced rather than thrown") {
        auto text = serialize_frame(make_response("6", {{"answer", std::string("caf\xC3")}}));
        CHECK_FALSE(text.empty());
        CHECK(json::parse(text)["ok"] == true);
    }
}
