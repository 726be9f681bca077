#pragma once

#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "dentassist/core/config.hpp"
#include "dentassist/infra/http_client.hpp"
#include "dentassist/providers/provider.hpp"

namespace dentassist::providers {

/// Chat Completions client for OpenAI-compatible services.
///
/// POSTs to `<base_url>/v1/chat/completions`. The default base URL points
/// at Groq's OpenAI-compatible endpoint; any service speaking the same
/// protocol (OpenAI, a local llama.cpp server) works by changing it.
class OpenAICompatibleProvider final : public Provider {
public:
    OpenAICompatibleProvider(boost::asio::io_context& ioc, const GenerationConfig& config);
    ~OpenAICompatibleProvider() override;

    OpenAICompatibleProvider(const OpenAICompatibleProvider&) = delete;
    OpenAICompatibleProvider& operator=(const OpenAICompatibleProvider&) = delete;

    auto complete(CompletionRequest req)
        -> awaitable<Result<CompletionResponse>> override;

    [[nodiscard]] auto name() const -> std::string_view override;

    /// Build the JSON request body for the Chat Completions API.
    [[nodiscard]] auto build_request_body(const CompletionRequest& req) const -> json;

    /// Parse a response body into a CompletionResponse.
    [[nodiscard]] static auto parse_response(const std::string& body) -> Result<CompletionResponse>;

private:
    std::string default_model_;
    infra::HttpClient http_;
};

} // namespace dentassist::providers
