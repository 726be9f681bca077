#include "dentassist/retrieval/embeddings.hpp"
#include "dentassist/core/async.hpp"
#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"
#include "dentassist/infra/http_client.hpp"

#include <algorithm>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <nlohmann/json.hpp>

namespace dentassist::retrieval {

using json = nlohmann::json;

namespace {

// Hard-cap input to ~8000 tokens.
constexpr size_t kMaxEmbedChars = 32000;

auto unavailable(std::string message, std::string detail = {}) -> Error {
    return make_error(ErrorCode::EmbeddingUnavailable, std::move(message), std::move(detail));
}

auto parse_vector(const json& embedding_data) -> Embedding {
    Embedding embedding;
    embedding.reserve(embedding_data.size());
    for (const auto& val : embedding_data) {
        embedding.push_back(val.get<float>());
    }
    return embedding;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// OpenAIEmbeddings::Impl
// ---------------------------------------------------------------------------

struct OpenAIEmbeddings::Impl {
    infra::HttpClient http;
    std::string model;
    size_t dims = 1536;

    Impl(boost::asio::io_context& ioc, std::string key, std::string mdl,
         std::string base_url, int timeout_seconds)
        : http(ioc, infra::HttpClientConfig{
                         .base_url = std::move(base_url),
                         .timeout_seconds = timeout_seconds,
                         .verify_ssl = true,
                         .default_headers = {},
                     }),
          model(std::move(mdl)) {
        http.set_default_header("Authorization", "Bearer " + key);

        if (model == "text-embedding-3-large") {
            dims = 3072;
        } else {
            // text-embedding-3-small and text-embedding-ada-002
            dims = 1536;
        }
    }

    auto request(json input) -> awaitable<Result<json>> {
        json request_body = {
            {"model", model},
            {"input", std::move(input)},
            {"encoding_format", "float"},
        };

        auto response = co_await http.post("/v1/embeddings", request_body.dump());
        if (!response) {
            co_return make_fail(unavailable("Embedding request failed",
                                            response.error().what()));
        }

        if (!response->is_success()) {
            LOG_ERROR("Embeddings API returned status {}: {}",
                      response->status, response->body);
            co_return make_fail(unavailable("Embedding API error",
                "HTTP " + std::to_string(response->status)));
        }

        try {
            auto body = json::parse(response->body);
            if (!body.contains("data") || !body["data"].is_array()) {
                co_return make_fail(unavailable("Embedding response missing data"));
            }
            co_return body;
        } catch (const json::exception& e) {
            co_return make_fail(unavailable("Failed to parse embedding response", e.what()));
        }
    }
};

// ---------------------------------------------------------------------------
// OpenAIEmbeddings
// ---------------------------------------------------------------------------

OpenAIEmbeddings::OpenAIEmbeddings(boost::asio::io_context& ioc,
                                   std::string api_key,
                                   std::string model,
                                   std::string base_url,
                                   int timeout_seconds)
    : impl_(std::make_unique<Impl>(ioc, std::move(api_key), std::move(model),
                                   std::move(base_url), timeout_seconds)) {}

OpenAIEmbeddings::~OpenAIEmbeddings() = default;
OpenAIEmbeddings::OpenAIEmbeddings(OpenAIEmbeddings&&) noexcept = default;
OpenAIEmbeddings& OpenAIEmbeddings::operator=(OpenAIEmbeddings&&) noexcept = default;

auto OpenAIEmbeddings::embed(std::string_view text) -> awaitable<Result<Embedding>> {
    auto input = utils::truncate_utf8(utils::collapse_whitespace(text), kMaxEmbedChars);
    if (input.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Cannot embed empty text"));
    }

    auto body = co_await impl_->request(json(input));
    if (!body) {
        co_return make_fail(body.error());
    }

    try {
        auto& data = (*body)["data"];
        if (data.empty()) {
            co_return make_fail(unavailable("Embedding response missing data"));
        }
        auto embedding = parse_vector(data[0].at("embedding"));
        if (embedding.size() != impl_->dims) {
            co_return make_fail(unavailable("Embedding has unexpected dimensionality",
                std::to_string(embedding.size()) + " != " + std::to_string(impl_->dims)));
        }
        LOG_DEBUG("Generated embedding with {} dimensions", embedding.size());
        co_return embedding;
    } catch (const json::exception& e) {
        co_return make_fail(unavailable("Malformed embedding response", e.what()));
    }
}

auto OpenAIEmbeddings::embed_batch(std::vector<std::string> texts)
    -> awaitable<Result<std::vector<Embedding>>> {
    if (texts.empty()) {
        co_return std::vector<Embedding>{};
    }

    json inputs = json::array();
    for (const auto& t : texts) {
        auto cleaned = utils::truncate_utf8(utils::collapse_whitespace(t), kMaxEmbedChars);
        if (cleaned.empty()) {
            co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                           "Cannot embed empty text in batch"));
        }
        inputs.push_back(std::move(cleaned));
    }

    auto body = co_await impl_->request(std::move(inputs));
    if (!body) {
        co_return make_fail(body.error());
    }

    try {
        // Items carry an explicit index; order in the array is not relied on.
        std::vector<Embedding> results(texts.size());
        for (const auto& item : (*body)["data"]) {
            auto index = item.at("index").get<size_t>();
            if (index >= results.size()) continue;
            results[index] = parse_vector(item.at("embedding"));
        }
        for (size_t i = 0; i < results.size(); ++i) {
            if (results[i].size() != impl_->dims) {
                co_return make_fail(unavailable("Batch embedding missing or malformed",
                                                "index " + std::to_string(i)));
            }
        }
        LOG_DEBUG("Generated {} embeddings in batch", results.size());
        co_return results;
    } catch (const json::exception& e) {
        co_return make_fail(unavailable("Malformed batch embedding response", e.what()));
    }
}

auto OpenAIEmbeddings::dimensions() const -> size_t {
    return impl_->dims;
}

auto OpenAIEmbeddings::name() const -> std::string {
    return "openai:" + impl_->model;
}

// ---------------------------------------------------------------------------
// ResilientEmbeddings
// ---------------------------------------------------------------------------

namespace {

template <typename T, typename MakeOp>
auto with_retries(const RetryPolicy& policy, MakeOp make_op, std::string what)
    -> awaitable<Result<T>> {
    auto executor = co_await boost::asio::this_coro::executor;
    std::optional<Error> last_error;

    for (int attempt = 0; attempt <= policy.max_retries; ++attempt) {
        if (attempt > 0) {
            boost::asio::steady_timer backoff(executor);
            backoff.expires_after(policy.backoff * (1 << (attempt - 1)));
            boost::system::error_code ec;
            co_await backoff.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }

        auto result = co_await with_timeout<T>(make_op(), policy.timeout, what);
        if (result) {
            co_return result;
        }

        if (!result.error().retryable()) {
            co_return result;
        }

        LOG_WARN("{} failed (attempt {}/{}): {}", what, attempt + 1,
                 policy.max_retries + 1, result.error().what());
        last_error = result.error();
    }

    co_return make_fail(unavailable(what + " unavailable",
                                    last_error ? last_error->what() : std::string{}));
}

} // anonymous namespace

ResilientEmbeddings::ResilientEmbeddings(std::shared_ptr<EmbeddingProvider> inner,
                                         RetryPolicy policy)
    : inner_(std::move(inner)), policy_(policy) {}

auto ResilientEmbeddings::embed(std::string_view text) -> awaitable<Result<Embedding>> {
    auto inner = inner_;
    co_return co_await with_retries<Embedding>(policy_,
        [inner, owned = std::string(text)]() {
            return [inner, owned]() { return inner->embed(owned); };
        },
        "Embedding request");
}

auto ResilientEmbeddings::embed_batch(std::vector<std::string> texts)
    -> awaitable<Result<std::vector<Embedding>>> {
    auto inner = inner_;
    auto expected = texts.size();
    auto result = co_await with_retries<std::vector<Embedding>>(policy_,
        [inner, owned = std::move(texts)]() {
            return [inner, owned]() { return inner->embed_batch(owned); };
        },
        "Batch embedding request");

    if (result && result->size() != expected) {
        co_return make_fail(unavailable("Batch embedding returned wrong count",
            std::to_string(result->size()) + " != " + std::to_string(expected)));
    }
    co_return result;
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

auto make_embedding_provider(boost::asio::io_context& ioc, const EmbeddingConfig& config)
    -> std::shared_ptr<EmbeddingProvider> {
    std::shared_ptr<EmbeddingProvider> base;
    if (config.provider == "openai" && !config.api_key.empty()) {
        base = std::make_shared<OpenAIEmbeddings>(
            ioc, config.api_key, config.model, config.base_url,
            std::max(1, config.timeout_ms / 1000));
    } else {
        if (config.provider == "openai") {
            LOG_WARN("Embedding provider 'openai' has no API key, using local embeddings");
        }
        base = std::make_shared<LocalEmbeddings>(config.dimensions);
    }

    LOG_INFO("Embedding provider: {} ({}D)", base->name(), base->dimensions());
    return std::make_shared<ResilientEmbeddings>(base, RetryPolicy{
        .timeout = std::chrono::milliseconds(config.timeout_ms),
        .max_retries = config.max_retries,
        .backoff = std::chrono::milliseconds(config.retry_backoff_ms),
    });
}

} // namespace dentassist::retrieval
