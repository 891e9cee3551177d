#include "pushapk/cli/commands.hpp"

#include "pushapk/core/logger.hpp"
#include "pushapk/core/utils.hpp"
#include "pushapk/googleplay/push_config.hpp"
#include "pushapk/task/task.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#ifndef PUSHAPK_VERSION_STRING
#define PUSHAPK_VERSION_STRING "0.1.0-dev"
#endif

namespace pushapk::cli {

namespace {

auto report_error(const Error& err) -> int {
    LOG_ERROR("{}: {}", error_code_to_string(err.code()), err.what());
    return 1;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// push-config command
// ---------------------------------------------------------------------------

auto register_push_config_command(CLI::App& app, PushConfigOptions& options) -> CLI::App* {
    auto* sub = app.add_subcommand(
        "push-config", "Resolve a task into a Google Play push configuration");

    sub->add_option("-t,--task", options.task_path,
                    "Path to the task definition (default: <work_dir>/task.json)")
        ->check(CLI::ExistingFile);

    sub->add_option("-a,--apk", options.apks,
                    "APK to push, as <arch>=<path> (repeatable)")
        ->required();

    return sub;
}

auto run_push_config_command(const Config& config, const PushConfigOptions& options) -> int {
    auto apks = parse_apk_arguments(options.apks);
    if (!apks) return report_error(apks.error());

    std::filesystem::path task_path = options.task_path;
    if (task_path.empty()) {
        if (!config.work_dir) {
            return report_error(make_error(
                ErrorCode::InvalidArgument,
                "No task given",
                "pass --task or set work_dir in the config"));
        }
        task_path = std::filesystem::path(*config.work_dir) / "task.json";
    }

    auto task = task::load_task(task_path);
    if (!task) return report_error(task.error());

    auto push_config = googleplay::craft_push_apk_config(config, *task, *apks);
    if (!push_config) return report_error(push_config.error());

    LOG_INFO("Resolved {} APK(s) for {} on track '{}' (commit: {})",
             push_config->apks().size(), push_config->package_name(),
             push_config->track(), push_config->commit());

    std::cout << json(*push_config).dump(2) << std::endl;
    return 0;
}

auto parse_apk_arguments(const std::vector<std::string>& values) -> Result<ArtifactSet> {
    ArtifactSet apks;
    for (const auto& value : values) {
        auto eq = value.find('=');
        if (eq == std::string::npos) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument, "APK must be given as <arch>=<path>", value));
        }

        auto arch = utils::trim(std::string_view(value).substr(0, eq));
        auto path = value.substr(eq + 1);
        if (arch.empty() || path.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument, "APK architecture and path must not be empty", value));
        }

        auto [it, inserted] = apks.emplace(std::move(arch), std::move(path));
        if (!inserted) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument, "APK architecture given more than once", it->first));
        }
    }
    return apks;
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("config", "Show the loaded configuration");
}

auto run_config_command(const Config& config) -> int {
    std::cout << json(config).dump(2) << std::endl;
    return 0;
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("version", "Print version information");
}

auto run_version_command() -> int {
    std::cout << "pushapk " << version_string() << std::endl;
    return 0;
}

auto version_string() -> std::string {
    return PUSHAPK_VERSION_STRING;
}

} // namespace pushapk::cli
