#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "pushapk/core/config.hpp"
#include "pushapk/core/error.hpp"
#include "pushapk/core/types.hpp"
#include "pushapk/task/task.hpp"

namespace pushapk::googleplay {

inline constexpr std::string_view kDefaultTrack = "production";
inline constexpr std::string_view kRolloutTrack = "rollout";
inline constexpr std::string_view kCertificateExtension = ".p12";

/// Everything the publishing client needs to push one set of APKs.
///
/// Only build_push_config() creates instances, and only after the channel
/// was authorized and found in the accounts table. There are no setters.
class PushConfig {
public:
    [[nodiscard]] auto service_account() const noexcept -> const std::string& { return service_account_; }
    [[nodiscard]] auto credentials() const noexcept -> const std::string& { return credentials_; }
    [[nodiscard]] auto package_name() const noexcept -> const std::string& { return package_name_; }
    [[nodiscard]] auto commit() const noexcept -> bool { return commit_; }
    [[nodiscard]] auto track() const noexcept -> const std::string& { return track_; }
    [[nodiscard]] auto rollout_percentage() const noexcept -> std::optional<int> { return rollout_percentage_; }

    /// True when the channel's account has no real Google Play key, i.e. its
    /// certificate path does not end in ".p12".
    [[nodiscard]] auto do_not_contact_google_play() const noexcept -> bool { return do_not_contact_google_play_; }

    [[nodiscard]] auto apks() const noexcept -> const ArtifactSet& { return apks_; }
    [[nodiscard]] auto update_gp_strings_from_l10n_store() const noexcept -> bool {
        return update_gp_strings_from_l10n_store_;
    }

private:
    friend auto build_push_config(const std::optional<CredentialsTable>&, const json&,
                                  const Channel&, const ArtifactSet&) -> Result<PushConfig>;

    PushConfig() = default;

    std::string service_account_;
    std::string credentials_;
    std::string package_name_;
    bool commit_ = false;
    std::string track_;
    std::optional<int> rollout_percentage_;
    bool do_not_contact_google_play_ = false;
    ArtifactSet apks_;
    bool update_gp_strings_from_l10n_store_ = true;
};

/// Serializes to the flat object the publishing client reads. Artifacts become
/// "apk_<arch>" keys; "rollout_percentage" and "do_not_contact_google_play"
/// are only present when set.
void to_json(json& j, const PushConfig& c);

/// Look up the Google Play account of a channel. Fails with
/// ErrorCode::ChannelNotConfigured if the table is absent, empty, or has no
/// entry for the channel.
[[nodiscard]] auto get_channel_credentials(const std::optional<CredentialsTable>& accounts,
                                           const Channel& channel) -> Result<ChannelCredentials>;

[[nodiscard]] auto get_service_account(const Config& config, const Channel& channel) -> Result<std::string>;
[[nodiscard]] auto get_certificate_path(const Config& config, const Channel& channel) -> Result<std::string>;

/// Decide whether the Google Play transaction is committed or only validated.
///
/// `dry_run` is the deprecated, inverted form of `commit`. A payload carrying
/// both is rejected with ErrorCode::ConflictingCommitSignal, even when the two
/// agree. Neither present means no commit.
[[nodiscard]] auto should_commit_transaction(const json& payload) -> Result<bool>;

/// Merge credentials, package name, commit decision, payload fields and
/// artifacts for an already resolved channel.
[[nodiscard]] auto build_push_config(const std::optional<CredentialsTable>& accounts,
                                     const json& payload,
                                     const Channel& channel,
                                     const ArtifactSet& apks) -> Result<PushConfig>;

/// Resolve the task's channel from its scopes, then build its push config.
[[nodiscard]] auto craft_push_apk_config(const Config& config,
                                         const task::TaskDescriptor& task,
                                         const ArtifactSet& apks) -> Result<PushConfig>;

} // namespace pushapk::googleplay
