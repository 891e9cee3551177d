#include "pushapk/core/config.hpp"
#include "pushapk/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace pushapk {

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Config file not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open config file", path.string()));
    }

    Config config;
    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Config root must be a JSON object", path.string()));
        }
        config = j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Failed to parse config", e.what()));
    }

    // Credential fields may point at secrets mounted through the environment.
    if (config.google_play_accounts) {
        for (auto& [channel, account] : *config.google_play_accounts) {
            account.service_account = resolve_env_refs(account.service_account);
            account.certificate = resolve_env_refs(account.certificate);
        }
        LOG_DEBUG("Config: {} Google Play account(s) configured",
                  config.google_play_accounts->size());
    } else {
        LOG_WARN("Config: no google_play_accounts in {}", path.string());
    }

    return config;
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("PUSHAPK_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("PUSHAPK_WORK_DIR")) {
        config.work_dir = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
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
                    // Preserve unresolved refs
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

} // namespace pushapk
