#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "dentassist/core/types.hpp"

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE macros
// accept optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace dentassist {

struct GatewayConfig {
    uint16_t port = 18790;
    BindMode bind = BindMode::Loopback;
    size_t max_connections = 100;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(GatewayConfig, port, bind, max_connections)

/// Which text an entry is embedded from.
enum class EmbedText {
    Question,
    QuestionAnswer,
};

NLOHMANN_JSON_SERIALIZE_ENUM(EmbedText, {
    {EmbedText::Question, "question"},
    {EmbedText::QuestionAnswer, "question_answer"},
})

struct EmbeddingConfig {
    std::string provider = "local";  // "openai" or "local"
    std::string model = "text-embedding-3-small";
    std::string base_url = "https://api.openai.com";
    std::string api_key;
    size_t dimensions = 384;
    EmbedText embed_text = EmbedText::Question;
    int timeout_ms = 10000;
    int max_retries = 2;
    int retry_backoff_ms = 250;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EmbeddingConfig, provider, model, base_url,
    api_key, dimensions, embed_text, timeout_ms, max_retries, retry_backoff_ms)

struct GenerationConfig {
    std::string base_url = "https://api.groq.com/openai";
    std::string api_key;
    std::string model = "llama3-8b-8192";
    double temperature = 0.7;
    int max_tokens = 500;
    int timeout_ms = 30000;
    size_t history_turns = 6;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(GenerationConfig, base_url, api_key, model,
    temperature, max_tokens, timeout_ms, history_turns)

struct RetrievalConfig {
    size_t top_k = 5;
    double similarity_threshold = 0.7;
    bool deduplicate = false;
    double confidence_floor_weight = 0.3;
    bool log_searches = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RetrievalConfig, top_k, similarity_threshold,
    deduplicate, confidence_floor_weight, log_searches)

struct KnowledgeConfig {
    std::optional<std::string> db_path;
    std::optional<std::string> index_snapshot_path;
    bool persist_index = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(KnowledgeConfig, db_path, index_snapshot_path,
    persist_index)

struct SessionConfig {
    std::optional<std::string> db_path;
    size_t history_limit = 50;
    int idle_timeout_seconds = 1800;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SessionConfig, db_path, history_limit,
    idle_timeout_seconds)

struct ClinicConfig {
    std::string name = "our dental office";
    std::string contact_phone;
    std::string contact_email;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClinicConfig, name, contact_phone, contact_email)

struct Config {
    GatewayConfig gateway;
    EmbeddingConfig embedding;
    GenerationConfig generation;
    RetrievalConfig retrieval;
    KnowledgeConfig knowledge;
    SessionConfig sessions;
    ClinicConfig clinic;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, gateway, embedding, generation,
    retrieval, knowledge, sessions, clinic, log_level, data_dir)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;

/// Overlays DENTASSIST_* and provider key environment variables onto config.
void apply_env_overrides(Config& config);

auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Data directory for config, falling back to default_data_dir().
auto resolve_data_dir(const Config& config) -> std::filesystem::path;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace dentassist
