#include "pushapk/googleplay/push_config.hpp"

#include "pushapk/core/logger.hpp"
#include "pushapk/core/utils.hpp"
#include "pushapk/googleplay/package_names.hpp"
#include "pushapk/googleplay/scopes.hpp"

#include <cstdint>

namespace pushapk::googleplay {

namespace {

auto invalid_field(std::string_view field, std::string_view expected, const json& value) -> Error {
    return make_error(ErrorCode::InvalidPayload,
                      std::string(field) + " must be " + std::string(expected),
                      value.dump());
}

auto payload_bool(const json& payload, std::string_view field) -> Result<std::optional<bool>> {
    auto it = payload.find(std::string(field));
    if (it == payload.end()) return std::optional<bool>{};
    if (!it->is_boolean()) {
        return std::unexpected(invalid_field(field, "a boolean", *it));
    }
    return std::optional<bool>(it->get<bool>());
}

} // anonymous namespace

// -- PushConfig serialization --

void to_json(json& j, const PushConfig& c) {
    j = json{
        {"service_account", c.service_account()},
        {"credentials", c.credentials()},
        {"package_name", c.package_name()},
        {"commit", c.commit()},
        {"track", c.track()},
        {"update_gp_strings_from_l10n_store", c.update_gp_strings_from_l10n_store()},
    };
    if (c.rollout_percentage()) j["rollout_percentage"] = *c.rollout_percentage();
    if (c.do_not_contact_google_play()) j["do_not_contact_google_play"] = true;
    for (const auto& [arch, path] : c.apks()) {
        j["apk_" + arch] = path;
    }
}

// -- Credentials --

auto get_channel_credentials(const std::optional<CredentialsTable>& accounts,
                             const Channel& channel) -> Result<ChannelCredentials> {
    if (!accounts || accounts->empty()) {
        return std::unexpected(make_error(
            ErrorCode::ChannelNotConfigured,
            "No Google Play accounts are configured",
            "google_play_accounts is missing or empty"));
    }

    auto it = accounts->find(channel);
    if (it == accounts->end()) {
        return std::unexpected(make_error(
            ErrorCode::ChannelNotConfigured,
            "Channel is not part of the Google Play accounts",
            channel));
    }
    return it->second;
}

auto get_service_account(const Config& config, const Channel& channel) -> Result<std::string> {
    return get_channel_credentials(config.google_play_accounts, channel)
        .transform([](const ChannelCredentials& c) { return c.service_account; });
}

auto get_certificate_path(const Config& config, const Channel& channel) -> Result<std::string> {
    return get_channel_credentials(config.google_play_accounts, channel)
        .transform([](const ChannelCredentials& c) { return c.certificate; });
}

// -- Commit decision --

auto should_commit_transaction(const json& payload) -> Result<bool> {
    if (payload.is_null()) {
        return false;
    }
    if (!payload.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidPayload, "Task payload must be a JSON object"));
    }

    if (payload.contains("commit") && payload.contains("dry_run")) {
        return std::unexpected(make_error(
            ErrorCode::ConflictingCommitSignal,
            "commit and dry_run cannot be both given",
            "dry_run is deprecated, use commit only"));
    }

    auto dry_run = payload_bool(payload, "dry_run");
    if (!dry_run) return std::unexpected(dry_run.error());
    if (dry_run->has_value()) {
        LOG_WARN("Payload uses the deprecated dry_run flag");
        return !dry_run->value();
    }

    auto commit = payload_bool(payload, "commit");
    if (!commit) return std::unexpected(commit.error());
    return commit->value_or(false);
}

// -- Builder --

auto build_push_config(const std::optional<CredentialsTable>& accounts,
                       const json& payload,
                       const Channel& channel,
                       const ArtifactSet& apks) -> Result<PushConfig> {
    auto credentials = get_channel_credentials(accounts, channel);
    if (!credentials) return std::unexpected(credentials.error());

    auto package_name = get_package_name(channel);
    if (!package_name) return std::unexpected(package_name.error());

    const json& fields = payload.is_null() ? json::object() : payload;
    if (!fields.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidPayload, "Task payload must be a JSON object"));
    }

    auto commit = should_commit_transaction(fields);
    if (!commit) return std::unexpected(commit.error());

    PushConfig config;
    config.service_account_ = credentials->service_account;
    config.credentials_ = credentials->certificate;
    config.package_name_ = std::move(*package_name);
    config.commit_ = *commit;

    config.track_ = std::string(kDefaultTrack);
    if (auto it = fields.find("google_play_track"); it != fields.end()) {
        if (!it->is_string()) {
            return std::unexpected(invalid_field("google_play_track", "a string", *it));
        }
        config.track_ = it->get<std::string>();
    }

    if (auto it = fields.find("rollout_percentage"); it != fields.end()) {
        if (!it->is_number_integer()) {
            return std::unexpected(invalid_field("rollout_percentage", "an integer", *it));
        }
        auto percentage = it->get<int64_t>();
        if (percentage < 0 || percentage > 100) {
            return std::unexpected(invalid_field("rollout_percentage", "between 0 and 100", *it));
        }
        if (config.track_ != kRolloutTrack) {
            LOG_WARN("rollout_percentage given for track '{}', it only applies to '{}'",
                     config.track_, kRolloutTrack);
        }
        config.rollout_percentage_ = static_cast<int>(percentage);
    }

    auto update_strings = payload_bool(fields, "update_gp_strings_from_l10n_store");
    if (!update_strings) return std::unexpected(update_strings.error());
    config.update_gp_strings_from_l10n_store_ = update_strings->value_or(true);

    if (!utils::ends_with(config.credentials_, kCertificateExtension)) {
        LOG_INFO("Certificate of channel '{}' is not a {} file, Google Play will not be contacted",
                 channel, kCertificateExtension);
        config.do_not_contact_google_play_ = true;
    }

    config.apks_ = apks;

    LOG_DEBUG("Push config for {}: track={}, commit={}",
              config.package_name_, config.track_, config.commit_);
    return config;
}

auto craft_push_apk_config(const Config& config,
                           const task::TaskDescriptor& task,
                           const ArtifactSet& apks) -> Result<PushConfig> {
    auto channel = resolve_channel(task.scopes);
    if (!channel) return std::unexpected(channel.error());

    return build_push_config(config.google_play_accounts, task.payload, *channel, apks);
}

} // namespace pushapk::googleplay
