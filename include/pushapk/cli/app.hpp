#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "pushapk/cli/commands.hpp"
#include "pushapk/core/config.hpp"

namespace pushapk::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the trusted
/// configuration, and dispatches to the selected subcommand
/// (push-config, config, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

private:
    void setup_commands();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    PushConfigOptions push_options_;
    CLI::App* push_config_cmd_ = nullptr;
    CLI::App* config_cmd_ = nullptr;
    CLI::App* version_cmd_ = nullptr;
};

} // namespace pushapk::cli
