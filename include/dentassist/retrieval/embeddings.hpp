#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "dentassist/core/config.hpp"
#include "dentassist/core/error.hpp"
#include "dentassist/core/types.hpp"

namespace dentassist::retrieval {

using boost::asio::awaitable;

/// Abstract interface for turning text into fixed-length vectors.
///
/// Failures are reported as ErrorCode::EmbeddingUnavailable (or
/// InvalidArgument for unusable input). Batch results keep input order.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /// Embed a single text string into a float vector.
    virtual auto embed(std::string_view text) -> awaitable<Result<Embedding>> = 0;

    /// Embed a batch of text strings.
    virtual auto embed_batch(std::vector<std::string> texts)
        -> awaitable<Result<std::vector<Embedding>>> = 0;

    /// Returns the dimensionality of the embedding vectors produced.
    [[nodiscard]] virtual auto dimensions() const -> size_t = 0;

    /// Identifies the model; stored alongside each embedding.
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/// OpenAI-compatible /v1/embeddings provider.
class OpenAIEmbeddings : public EmbeddingProvider {
public:
    /// model defaults to "text-embedding-3-small".
    OpenAIEmbeddings(boost::asio::io_context& ioc,
                     std::string api_key,
                     std::string model = "text-embedding-3-small",
                     std::string base_url = "https://api.openai.com",
                     int timeout_seconds = 30);

    ~OpenAIEmbeddings() override;

    OpenAIEmbeddings(const OpenAIEmbeddings&) = delete;
    OpenAIEmbeddings& operator=(const OpenAIEmbeddings&) = delete;
    OpenAIEmbeddings(OpenAIEmbeddings&&) noexcept;
    OpenAIEmbeddings& operator=(OpenAIEmbeddings&&) noexcept;

    auto embed(std::string_view text) -> awaitable<Result<Embedding>> override;

    auto embed_batch(std::vector<std::string> texts)
        -> awaitable<Result<std::vector<Embedding>>> override;

    [[nodiscard]] auto dimensions() const -> size_t override;
    [[nodiscard]] auto name() const -> std::string override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Offline embedder for when no embedding service is configured.
///
/// Lower-cases, splits on non-alphanumerics, drops stop words, strips a
/// plural "s", and feature-hashes each token (FNV-1a) into a signed bucket.
/// The result is L2-normalised. Output is deterministic across processes so
/// stored vectors stay comparable after a restart.
class LocalEmbeddings : public EmbeddingProvider {
public:
    explicit LocalEmbeddings(size_t dimensions = 384);

    auto embed(std::string_view text) -> awaitable<Result<Embedding>> override;

    auto embed_batch(std::vector<std::string> texts)
        -> awaitable<Result<std::vector<Embedding>>> override;

    [[nodiscard]] auto dimensions() const -> size_t override { return dimensions_; }
    [[nodiscard]] auto name() const -> std::string override;

    /// Synchronous core, exposed for tests.
    [[nodiscard]] auto embed_now(std::string_view text) const -> Embedding;

    /// Tokens that contribute to the embedding of `text`.
    [[nodiscard]] static auto tokenize(std::string_view text) -> std::vector<std::string>;

private:
    size_t dimensions_;
};

struct RetryPolicy {
    std::chrono::milliseconds timeout{10000};
    int max_retries = 2;
    std::chrono::milliseconds backoff{250};
};

/// Decorator that imposes a per-call deadline and bounded retries with
/// exponential backoff. Exhausted retries surface as EmbeddingUnavailable.
class ResilientEmbeddings : public EmbeddingProvider {
public:
    ResilientEmbeddings(std::shared_ptr<EmbeddingProvider> inner, RetryPolicy policy);

    auto embed(std::string_view text) -> awaitable<Result<Embedding>> override;

    auto embed_batch(std::vector<std::string> texts)
        -> awaitable<Result<std::vector<Embedding>>> override;

    [[nodiscard]] auto dimensions() const -> size_t override { return inner_->dimensions(); }
    [[nodiscard]] auto name() const -> std::string override { return inner_->name(); }

private:
    std::shared_ptr<EmbeddingProvider> inner_;
    RetryPolicy policy_;
};

/// Builds the configured provider, wrapped in ResilientEmbeddings.
auto make_embedding_provider(boost::asio::io_context& ioc, const EmbeddingConfig& config)
    -> std::shared_ptr<EmbeddingProvider>;

} // namespace dentassist::retrieval
