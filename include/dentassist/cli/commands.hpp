#pragma once

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "dentassist/core/config.hpp"

namespace dentassist::cli {

/// Register the `serve` subcommand.
/// Starts the WebSocket gateway on the configured port.
void register_serve_command(CLI::App& app, Config& config);

/// Register the `search` subcommand.
void register_search_command(CLI::App& app, Config& config);

/// Register the `ask` subcommand.
/// Runs one chat turn in a new or given session and prints the reply.
void register_ask_command(CLI::App& app, Config& config);

/// Register the `import` subcommand.
/// Batch-creates QA entries from a JSON file.
void register_import_command(CLI::App& app, Config& config);

/// Register the `rebuild` subcommand.
void register_rebuild_command(CLI::App& app, Config& config);

/// Register the `stats` subcommand.
void register_stats_command(CLI::App& app, Config& config);

/// Register the `config` subcommand.
/// Prints the effective configuration with secrets redacted.
void register_config_command(CLI::App& app, Config& config);

/// Replaces non-empty api_key, token and secret values, at any depth.
void redact_secrets(nlohmann::json& j);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace dentassist::cli
