#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "dentassist/core/error.hpp"
#include "dentassist/core/types.hpp"

namespace dentassist::providers {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Request to send to a text-generation service.
struct CompletionRequest {
    std::string model;
    std::vector<Message> messages;
    std::optional<std::string> system_prompt;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
};

/// Full completion response from a provider.
struct CompletionResponse {
    Message message;
    std::string model;
    int input_tokens = 0;
    int output_tokens = 0;
    std::string stop_reason;
};

/// Abstract base class for text-generation services.
///
/// Implementations translate CompletionRequest into the service's wire
/// format. Transport and API failures surface as ProviderError or
/// ConnectionFailed; callers decide how to degrade.
class Provider {
public:
    virtual ~Provider() = default;

    virtual auto complete(CompletionRequest req)
        -> awaitable<Result<CompletionResponse>> = 0;

    /// Return the provider name (e.g. "openai-compatible").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace dentassist::providers
