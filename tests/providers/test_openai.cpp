#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>

#include "dentassist/providers/openai.hpp"

using namespace dentassist;
using namespace dentassist::providers;

TEST_CASE("OpenAICompatibleProvider builds chat completion bodies", "[providers][openai]") {
    boost::asio::io_context ioc;
    GenerationConfig config;
    config.api_key = "test-key";
    config.model = "llama3-8b-8192";
    OpenAICompatibleProvider provider(ioc, config);
    CHECK(provider.name() == "openai-compatible");

    CompletionRequest req;
    req.system_prompt = "You are the assistant for Bright Smile Dental.";
    req.messages.push_back(Message{.role = Role::User, .content = "Hi"});
    req.messages.push_back(Message{.role = Role::Assistant, .content = "Hello!"});
    req.messages.push_back(Message{.role = Role::User, .content = "When are you open?"});

    SECTION("system prompt leads, model defaults from config") {
        auto body = provider.build_request_body(req);
        CHECK(body["model"] == "llama3-8b-8192");
        REQUIRE(body["messages"].size() == 4);
        CHECK(body["messages"][0]["role"] == "system");
        CHECK(body["messages"][1]["role"] == "user");
        CHECK(body["messages"][2]["role"] == "assistant");
        CHECK(body["messages"][3]["content"] == "When are you open?");
        CHECK_FALSE(body.contains("temperature"));
        CHECK_FALSE(body.contains("max_tokens"));
    }

    SECTION("sampling options and explicit model") {
        req.model = "mixtral-8x7b";
        req.temperature = 0.2;
        req.max_tokens = 300;
        auto body = provider.build_request_body(req);
        CHECK(body["model"] == "mixtral-8x7b");
        CHECK(body["temperature"] == 0.2);
        CHECK(body["max_tokens"] == 300);
    }

    SECTION("empty system prompt is omitted") {
        req.system_prompt = "";
        auto body = provider.build_request_body(req);
        CHECK(body["messages"].size() == 3);
        CHECK(body["messages"][0]["role"] == "user");
    }
}

TEST_CASE("OpenAICompatibleProvider parses responses", "[providers][openai]") {
    SECTION("successful completion") {
        auto r = OpenAICompatibleProvider::parse_response(R"({
            "model": "llama3-8b-8192",
            "choices": [{
                "message": {"role": "assistant", "content": "We open at 8am."},
                "finish_reason": "stop"
            }],
            "usage": {"prompt_tokens": 120, "completion_tokens": 9}
        })");
        REQUIRE(r.has_value());
        CHECK(r->message.role == Role::Assistant);
        CHECK(r->message.content == "We open at 8am.");
        CHECK(r->model == "llama3-8b-8192");
        CHECK(r->stop_reason == "stop");
        CHECK(r->input_tokens == 120);
        CHECK(r->output_tokens == 9);
    }

    SECTION("null content") {
        auto r = OpenAICompatibleProvider::parse_response(
            R"({"choices": [{"message": {"role": "assistant", "content": null}}]})");
        REQUIRE(r.has_value());
        CHECK(r->message.content.empty());
        CHECK(r->stop_reason == "stop");
    }

    SECTION("API error object") {
        auto r = OpenAICompatibleProvider::parse_response(
            R"({"error": {"message": "Rate limit reached", "type": "rate_limit"}})");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ProviderError);
        CHECK(r.error().detail() == "Rate limit reached");
    }

    SECTION("no choices") {
        auto r = OpenAICompatibleProvider::parse_response(R"({"choices": []})");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ProviderError);
    }

    SECTION("malformed JSON") {
        auto r = OpenAICompatibleProvider::parse_response("<html>502 Bad Gateway</html>");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::SerializationError);
    }
}
