#include "dentassist/core/config.hpp"
#include "dentassist/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace dentassist {

namespace {

// Secrets may be written as "${GROQ_API_KEY}" in the file.
void resolve_secret_refs(Config& config) {
    config.embedding.api_key = resolve_env_refs(config.embedding.api_key);
    config.generation.api_key = resolve_env_refs(config.generation.api_key);
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        resolve_secret_refs(config);
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("DENTASSIST_PORT")) {
        try {
            config.gateway.port = static_cast<uint16_t>(std::stoi(val));
        } catch (const std::exception& e) {
            LOG_WARN("Ignoring invalid DENTASSIST_PORT '{}': {}", val, e.what());
        }
    }
    if (auto* val = std::getenv("DENTASSIST_BIND")) {
        config.gateway.bind = (std::string(val) == "all") ? BindMode::All : BindMode::Loopback;
    }
    if (auto* val = std::getenv("DENTASSIST_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("DENTASSIST_DATA_DIR")) {
        config.data_dir = val;
    }
    if (auto* val = std::getenv("DENTASSIST_EMBEDDING_PROVIDER")) {
        config.embedding.provider = val;
    }
    if (auto* val = std::getenv("OPENAI_API_KEY")) {
        config.embedding.api_key = val;
        // An OpenAI key without an explicit provider choice switches to the remote model.
        if (!std::getenv("DENTASSIST_EMBEDDING_PROVIDER")) {
            config.embedding.provider = "openai";
            config.embedding.dimensions = 1536;
        }
    }
    if (auto* val = std::getenv("GROQ_API_KEY")) {
        config.generation.api_key = val;
    }
    if (auto* val = std::getenv("DENTASSIST_GENERATION_URL")) {
        config.generation.base_url = val;
    }
    if (auto* val = std::getenv("DENTASSIST_GENERATION_MODEL")) {
        config.generation.model = val;
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("DENTASSIST_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".dentassist";
}

auto resolve_data_dir(const Config& config) -> std::filesystem::path {
    return config.data_dir ? std::filesystem::path(*config.data_dir) : default_data_dir();
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Unresolved refs are kept verbatim.
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace dentassist
