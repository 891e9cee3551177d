#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "pushapk/core/config.hpp"
#include "pushapk/core/error.hpp"
#include "pushapk/core/types.hpp"

namespace pushapk::cli {

struct PushConfigOptions {
    std::string task_path;
    std::vector<std::string> apks;  // "<arch>=<path>"
};

/// Register the `push-config` subcommand.
/// Resolves a task into the configuration handed to the Google Play client.
auto register_push_config_command(CLI::App& app, PushConfigOptions& options) -> CLI::App*;

/// Register the `config` subcommand.
/// Prints the loaded configuration.
auto register_config_command(CLI::App& app) -> CLI::App*;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> CLI::App*;

auto run_push_config_command(const Config& config, const PushConfigOptions& options) -> int;
auto run_config_command(const Config& config) -> int;
auto run_version_command() -> int;

/// Parse repeated `--apk <arch>=<path>` values into an artifact set.
/// Rejects entries without '=', with an empty architecture or path, and
/// architectures given twice.
auto parse_apk_arguments(const std::vector<std::string>& values) -> Result<ArtifactSet>;

/// Version string; typically injected by CMake via -DPUSHAPK_VERSION_STRING=...
auto version_string() -> std::string;

} // namespace pushapk::cli
