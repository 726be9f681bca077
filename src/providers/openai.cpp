#include "dentassist/providers/openai.hpp"

#include <algorithm>

#include "dentassist/core/logger.hpp"

namespace dentassist::providers {

namespace {

constexpr auto kChatPath = "/v1/chat/completions";

/// Timeouts are enforced by the caller; keep the transport limit well above them.
auto transport_timeout_seconds(const GenerationConfig& config) -> int {
    return std::max(5, config.timeout_ms / 1000 * 2);
}

} // anonymous namespace

OpenAICompatibleProvider::OpenAICompatibleProvider(boost::asio::io_context& ioc,
                                                   const GenerationConfig& config)
    : default_model_(config.model)
    , http_(ioc, infra::HttpClientConfig{
          .base_url = config.base_url,
          .timeout_seconds = transport_timeout_seconds(config),
          .verify_ssl = true,
          .default_headers = {},
      })
{
    if (!config.api_key.empty()) {
        http_.set_default_header("Authorization", "Bearer " + config.api_key);
    } else {
        LOG_WARN("Generation API key not set; requests to {} will likely be rejected",
                 config.base_url);
    }
    LOG_INFO("Generation provider initialized (model: {}, base: {})",
             default_model_, config.base_url);
}

OpenAICompatibleProvider::~OpenAICompatibleProvider() = default;

auto OpenAICompatibleProvider::name() const -> std::string_view {
    return "openai-compatible";
}

auto OpenAICompatibleProvider::build_request_body(const CompletionRequest& req) const -> json {
    json body;
    body["model"] = req.model.empty() ? default_model_ : req.model;

    json messages = json::array();
    if (req.system_prompt.has_value() && !req.system_prompt->empty()) {
        messages.push_back({{"role", "system"}, {"content", *req.system_prompt}});
    }
    for (const auto& msg : req.messages) {
        messages.push_back(msg);
    }
    body["messages"] = std::move(messages);

    if (req.temperature.has_value()) {
        body["temperature"] = *req.temperature;
    }
    if (req.max_tokens.has_value()) {
        body["max_tokens"] = *req.max_tokens;
    }
    return body;
}

auto OpenAICompatibleProvider::parse_response(const std::string& body)
    -> Result<CompletionResponse> {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Failed to parse completion response",
            e.what()));
    }

    if (j.contains("error")) {
        std::string detail = j["error"].is_object()
            ? j["error"].value("message", "Unknown error")
            : j["error"].dump();
        return std::unexpected(make_error(ErrorCode::ProviderError,
                                          "Completion API error", detail));
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return std::unexpected(make_error(ErrorCode::ProviderError,
                                          "Completion response has no choices"));
    }

    CompletionResponse response;
    response.model = j.value("model", "");

    const auto& choice = j["choices"][0];
    response.stop_reason = choice.value("finish_reason", "stop");
    response.message.role = Role::Assistant;
    if (choice.contains("message") && choice["message"].contains("content") &&
        choice["message"]["content"].is_string()) {
        response.message.content = choice["message"]["content"].get<std::string>();
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        response.input_tokens = j["usage"].value("prompt_tokens", 0);
        response.output_tokens = j["usage"].value("completion_tokens", 0);
    }
    return response;
}

auto OpenAICompatibleProvider::complete(CompletionRequest req)
    -> awaitable<Result<CompletionResponse>> {
    auto body = build_request_body(req);

    LOG_DEBUG("Completion request: model={}, messages={}",
              body["model"].get<std::string>(), body["messages"].size());

    auto response = co_await http_.post(kChatPath, body.dump());
    if (!response) {
        LOG_ERROR("Completion request failed: {}", response.error().what());
        co_return make_fail(response.error());
    }

    if (!response->is_success()) {
        LOG_ERROR("Completion API returned status {}: {}", response->status, response->body);
        co_return make_fail(make_error(ErrorCode::ProviderError,
            "Completion API error", "HTTP " + std::to_string(response->status)));
    }

    co_return parse_response(response->body);
}

} // namespace dentassist::providers
