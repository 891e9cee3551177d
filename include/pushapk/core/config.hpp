#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "pushapk/core/error.hpp"
#include "pushapk/core/types.hpp"

namespace pushapk {

struct Config {
    std::string log_level = "info";
    std::optional<std::string> work_dir;
    // Left unset when the file has no "google_play_accounts" key, so that a
    // missing table is reported instead of silently treated as empty.
    std::optional<CredentialsTable> google_play_accounts;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, work_dir, google_play_accounts)

/// Load the trusted configuration from a JSON file. Unlike task input, a
/// missing or malformed config file is an error: the accounts table must
/// never fall back to defaults.
auto load_config(const std::filesystem::path& path) -> Result<Config>;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace pushapk
