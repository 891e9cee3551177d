#include "pushapk/cli/app.hpp"
#include "pushapk/core/logger.hpp"

#include <filesystem>

namespace pushapk::cli {

App::App()
    : cli_("pushapk", "Resolve Google Play push tasks into push configurations")
{
    cli_.set_version_flag("--version", version_string(),
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("PUSHAPK_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override. Falls back to the config file.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("PUSHAPK_LOG_LEVEL");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    if (version_cmd_->parsed()) {
        return run_version_command();
    }

    if (!config_path_.empty()) {
        auto loaded = load_config(std::filesystem::path(config_path_));
        if (!loaded) {
            Logger::init("pushapk", log_level_.empty() ? "info" : log_level_);
            LOG_ERROR("{}: {}", error_code_to_string(loaded.error().code()),
                      loaded.error().what());
            return 1;
        }
        config_ = std::move(*loaded);
    } else {
        config_ = load_config_from_env();
    }

    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
    Logger::init("pushapk", config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }

    if (push_config_cmd_->parsed()) {
        return run_push_config_command(config_, push_options_);
    }
    if (config_cmd_->parsed()) {
        return run_config_command(config_);
    }
    return 0;
}

void App::setup_commands() {
    push_config_cmd_ = register_push_config_command(cli_, push_options_);
    config_cmd_ = register_config_command(cli_);
    version_cmd_ = register_version_command(cli_);
}

} // namespace pushapk::cli
