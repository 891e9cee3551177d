#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>

#include "pushapk/googleplay/push_config.hpp"

using pushapk::ArtifactSet;
using pushapk::Config;
using pushapk::CredentialsTable;
using pushapk::ErrorCode;
using pushapk::json;
using pushapk::task::TaskDescriptor;
using namespace pushapk::googleplay;

namespace {

auto make_config() -> Config {
    Config config;
    config.google_play_accounts = CredentialsTable{
        {"aurora", {"aurora_account", "/path/to/aurora.p12"}},
        {"beta", {"beta_account", "/path/to/beta.p12"}},
        {"release", {"release_account", "/path/to/release.p12"}},
        {"dep", {"dummy_dep", "/path/to/dummy_non_p12_file"}},
    };
    return config;
}

auto make_task(const std::string& channel) -> TaskDescriptor {
    TaskDescriptor task;
    task.scopes = {"project:releng:googleplay:" + channel};
    task.payload = {{"google_play_track", "alpha"}};
    return task;
}

const ArtifactSet kApks = {
    {"x86", "/path/to/x86.apk"},
    {"arm_v15", "/path/to/arm_v15.apk"},
};

} // namespace

TEST_CASE("craft_push_apk_config builds the config of each channel", "[googleplay][push_config]") {
    const std::map<std::string, std::string> package_names = {
        {"aurora", "org.mozilla.fennec_aurora"},
        {"beta", "org.mozilla.firefox_beta"},
        {"release", "org.mozilla.firefox"},
    };
    auto config = make_config();

    for (const auto& [channel, package_name] : package_names) {
        CAPTURE(channel);
        auto push_config = craft_push_apk_config(config, make_task(channel), kApks);

        REQUIRE(push_config.has_value());
        CHECK(json(*push_config) == json{
            {"service_account", channel + "_account"},
            {"credentials", "/path/to/" + channel + ".p12"},
            {"commit", false},
            {"track", "alpha"},
            {"package_name", package_name},
            {"apk_x86", "/path/to/x86.apk"},
            {"apk_arm_v15", "/path/to/arm_v15.apk"},
            {"update_gp_strings_from_l10n_store", true},
        });
    }
}

TEST_CASE("craft_push_apk_config exposes typed accessors", "[googleplay][push_config]") {
    auto push_config = craft_push_apk_config(make_config(), make_task("release"), kApks);

    REQUIRE(push_config.has_value());
    CHECK(push_config->service_account() == "release_account");
    CHECK(push_config->credentials() == "/path/to/release.p12");
    CHECK(push_config->package_name() == "org.mozilla.firefox");
    CHECK_FALSE(push_config->commit());
    CHECK(push_config->track() == "alpha");
    CHECK_FALSE(push_config->rollout_percentage().has_value());
    CHECK_FALSE(push_config->do_not_contact_google_play());
    CHECK(push_config->apks() == kApks);
    CHECK(push_config->update_gp_strings_from_l10n_store());
}

TEST_CASE("craft_push_apk_config defaults the track to production", "[googleplay][push_config]") {
    auto task = make_task("beta");
    task.payload = json::object();

    auto push_config = craft_push_apk_config(make_config(), task, kApks);

    REQUIRE(push_config.has_value());
    CHECK(push_config->track() == "production");
}

TEST_CASE("craft_push_apk_config allows rollout percentage", "[googleplay][push_config]") {
    auto task = make_task("release");
    task.payload["google_play_track"] = "rollout";
    task.payload["rollout_percentage"] = 10;

    auto push_config = craft_push_apk_config(make_config(), task, kApks);

    REQUIRE(push_config.has_value());
    CHECK(json(*push_config) == json{
        {"service_account", "release_account"},
        {"credentials", "/path/to/release.p12"},
        {"commit", false},
        {"track", "rollout"},
        {"rollout_percentage", 10},
        {"package_name", "org.mozilla.firefox"},
        {"apk_x86", "/path/to/x86.apk"},
        {"apk_arm_v15", "/path/to/arm_v15.apk"},
        {"update_gp_strings_from_l10n_store", true},
    });
}

TEST_CASE("craft_push_apk_config validates rollout percentage", "[googleplay][push_config]") {
    auto task = make_task("release");
    task.payload["google_play_track"] = "rollout";

    SECTION("not an integer") {
        task.payload["rollout_percentage"] = "10";
        auto push_config = craft_push_apk_config(make_config(), task, kApks);
        REQUIRE_FALSE(push_config.has_value());
        CHECK(push_config.error().code() == ErrorCode::InvalidPayload);
    }

    SECTION("above 100") {
        task.payload["rollout_percentage"] = 101;
        auto push_config = craft_push_apk_config(make_config(), task, kApks);
        REQUIRE_FALSE(push_config.has_value());
        CHECK(push_config.error().code() == ErrorCode::InvalidPayload);
    }

    SECTION("given for another track is kept") {
        task.payload["google_play_track"] = "beta";
        task.payload["rollout_percentage"] = 50;
        auto push_config = craft_push_apk_config(make_config(), task, kApks);
        REQUIRE(push_config.has_value());
        CHECK(push_config->rollout_percentage() == 50);
    }
}

TEST_CASE("craft_push_apk_config allows to contact Google Play or not", "[googleplay][push_config]") {
    auto config = make_config();

    auto aurora = craft_push_apk_config(config, make_task("aurora"), kApks);
    REQUIRE(aurora.has_value());
    CHECK_FALSE(json(*aurora).contains("do_not_contact_google_play"));

    auto dep = craft_push_apk_config(config, make_task("dep"), kApks);
    REQUIRE(dep.has_value());
    CHECK(dep->do_not_contact_google_play());
    CHECK(json(*dep)["do_not_contact_google_play"] == true);
    CHECK(dep->service_account() == "dummy_dep");
    CHECK(dep->credentials() == "/path/to/dummy_non_p12_file");
    CHECK(dep->package_name() == "org.mozilla.fennec_aurora");
}

TEST_CASE("craft_push_apk_config rejects configured channels without a package", "[googleplay][push_config]") {
    auto config = make_config();
    (*config.google_play_accounts)["nightly"] = {"nightly_account", "/path/to/nightly.p12"};

    auto nightly = craft_push_apk_config(config, make_task("nightly"), kApks);

    REQUIRE_FALSE(nightly.has_value());
    CHECK(nightly.error().code() == ErrorCode::UnsupportedChannel);
}

TEST_CASE("build_push_config flags accounts without a p12 certificate", "[googleplay][push_config]") {
    CredentialsTable accounts = {
        {"release", {"dummy_release", "/path/to/dummy_non_p12_file"}},
    };

    auto push_config = build_push_config(accounts, json::object(), "release", kApks);

    REQUIRE(push_config.has_value());
    CHECK(push_config->do_not_contact_google_play());
    auto j = json(*push_config);
    REQUIRE(j.contains("do_not_contact_google_play"));
    CHECK(j["do_not_contact_google_play"] == true);
}

TEST_CASE("craft_push_apk_config allows committing APKs", "[googleplay][push_config]") {
    auto task = make_task("aurora");
    task.payload["commit"] = true;

    auto push_config = craft_push_apk_config(make_config(), task, kApks);

    REQUIRE(push_config.has_value());
    CHECK(push_config->commit());
}

TEST_CASE("craft_push_apk_config allows deprecated dry_run", "[googleplay][push_config]") {
    auto task = make_task("aurora");
    task.payload["dry_run"] = false;

    auto push_config = craft_push_apk_config(make_config(), task, kApks);

    REQUIRE(push_config.has_value());
    CHECK(push_config->commit());
}

TEST_CASE("craft_push_apk_config rejects commit with dry_run", "[googleplay][push_config]") {
    auto task = make_task("release");
    task.payload["dry_run"] = false;
    task.payload["commit"] = false;

    auto push_config = craft_push_apk_config(make_config(), task, kApks);

    REQUIRE_FALSE(push_config.has_value());
    CHECK(push_config.error().code() == ErrorCode::ConflictingCommitSignal);
}

TEST_CASE("craft_push_apk_config reads update_gp_strings_from_l10n_store", "[googleplay][push_config]") {
    auto task = make_task("beta");

    SECTION("disabled") {
        task.payload["update_gp_strings_from_l10n_store"] = false;
        auto push_config = craft_push_apk_config(make_config(), task, kApks);
        REQUIRE(push_config.has_value());
        CHECK_FALSE(push_config->update_gp_strings_from_l10n_store());
        CHECK(json(*push_config)["update_gp_strings_from_l10n_store"] == false);
    }

    SECTION("not a boolean") {
        task.payload["update_gp_strings_from_l10n_store"] = "no";
        auto push_config = craft_push_apk_config(make_config(), task, kApks);
        REQUIRE_FALSE(push_config.has_value());
        CHECK(push_config.error().code() == ErrorCode::InvalidPayload);
    }
}

TEST_CASE("craft_push_apk_config rejects a non-string track", "[googleplay][push_config]") {
    auto task = make_task("beta");
    task.payload["google_play_track"] = 3;

    auto push_config = craft_push_apk_config(make_config(), task, kApks);

    REQUIRE_FALSE(push_config.has_value());
    CHECK(push_config.error().code() == ErrorCode::InvalidPayload);
}

TEST_CASE("craft_push_apk_config renames every artifact and nothing else", "[googleplay][push_config]") {
    auto push_config = craft_push_apk_config(make_config(), make_task("release"), kApks);
    REQUIRE(push_config.has_value());

    std::map<std::string, std::string> apk_entries;
    for (const auto& [key, value] : json(*push_config).items()) {
        if (key.starts_with("apk_")) apk_entries[key] = value.get<std::string>();
    }

    CHECK(apk_entries == std::map<std::string, std::string>{
        {"apk_x86", "/path/to/x86.apk"},
        {"apk_arm_v15", "/path/to/arm_v15.apk"},
    });
}

TEST_CASE("craft_push_apk_config raises when the channel is not part of the config", "[googleplay][push_config]") {
    auto push_config = craft_push_apk_config(make_config(), make_task("non_exiting_channel"), kApks);

    REQUIRE_FALSE(push_config.has_value());
    CHECK(push_config.error().code() == ErrorCode::ChannelNotConfigured);
}

TEST_CASE("craft_push_apk_config raises when google_play_accounts does not exist", "[googleplay][push_config]") {
    auto push_config = craft_push_apk_config(Config{}, make_task("release"), kApks);

    REQUIRE_FALSE(push_config.has_value());
    CHECK(push_config.error().code() == ErrorCode::ChannelNotConfigured);
}

TEST_CASE("craft_push_apk_config propagates scope errors", "[googleplay][push_config]") {
    auto task = make_task("release");
    task.scopes.push_back("project:releng:googleplay:beta");

    auto push_config = craft_push_apk_config(make_config(), task, kApks);

    REQUIRE_FALSE(push_config.has_value());
    CHECK(push_config.error().code() == ErrorCode::ScopeValidation);
}

TEST_CASE("build_push_config checks credentials before anything else", "[googleplay][push_config]") {
    // Unknown channel and conflicting flags: the channel is reported first.
    json payload = {{"commit", true}, {"dry_run", true}};

    auto push_config = build_push_config(make_config().google_play_accounts, payload, "nightly", kApks);

    REQUIRE_FALSE(push_config.has_value());
    CHECK(push_config.error().code() == ErrorCode::ChannelNotConfigured);
}

TEST_CASE("build_push_config treats a null payload as empty", "[googleplay][push_config]") {
    auto push_config = build_push_config(make_config().google_play_accounts, json(nullptr), "beta", {});

    REQUIRE(push_config.has_value());
    CHECK(push_config->track() == "production");
    CHECK_FALSE(push_config->commit());
    CHECK(push_config->apks().empty());
}

TEST_CASE("build_push_config rejects a non-object payload", "[googleplay][push_config]") {
    auto push_config = build_push_config(make_config().google_play_accounts, json::array(), "beta", kApks);

    REQUIRE_FALSE(push_config.has_value());
    CHECK(push_config.error().code() == ErrorCode::InvalidPayload);
}
