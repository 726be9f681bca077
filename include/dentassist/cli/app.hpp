#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "dentassist/core/config.hpp"

namespace dentassist::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration once
/// parsing completes, then runs the selected subcommand (serve, search,
/// ask, import, rebuild, stats, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    /// Runs after parsing, before the subcommand callback.
    void load_configuration();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    std::string data_dir_;
};

} // namespace dentassist::cli
