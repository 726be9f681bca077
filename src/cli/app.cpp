#include "dentassist/cli/app.hpp"
#include "dentassist/cli/commands.hpp"
#include "dentassist/core/logger.hpp"

#include <filesystem>

// Version string; injected by CMake via -DDENTASSIST_VERSION_STRING=...
#ifndef DENTASSIST_VERSION_STRING
#define DENTASSIST_VERSION_STRING "0.1.0-dev"
#endif

namespace dentassist::cli {

App::App()
    : cli_("dentassist", "Dental clinic knowledge-base assistant")
{
    cli_.set_version_flag("--version", DENTASSIST_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("DENTASSIST_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("DENTASSIST_LOG_LEVEL")
        ->check(CLI::Validator(
            [](std::string& value) -> std::string {
                return parse_log_level(value) ? "" : "unknown log level: " + value;
            },
            "LEVEL"));

    cli_.add_option("--data-dir", data_dir_,
                    "Directory for the databases and index snapshot");

    cli_.require_subcommand(1);

    // The main app's parse-complete callback runs before any subcommand
    // callback, so every command sees the loaded configuration.
    cli_.parse_complete_callback([this]() { load_configuration(); });

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }
    Logger::flush();
    return 0;
}

void App::load_configuration() {
    if (!config_path_.empty()) {
        config_ = load_config(std::filesystem::path(config_path_));
        apply_env_overrides(config_);
    } else {
        config_ = load_config_from_env();
    }

    if (!log_level_.empty()) config_.log_level = log_level_;
    if (!data_dir_.empty()) config_.data_dir = data_dir_;

    Logger::init(kLoggerName, config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_serve_command(cli_, config_);
    register_search_command(cli_, config_);
    register_ask_command(cli_, config_);
    register_import_command(cli_, config_);
    register_rebuild_command(cli_, config_);
    register_stats_command(cli_, config_);
    register_config_command(cli_, config_);
    register_version_command(cli_);
}

} // namespace dentassist::cli
