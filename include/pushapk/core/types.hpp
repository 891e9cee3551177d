#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json. Lets the NLOHMANN_DEFINE macros
// leave optional members as std::nullopt when the key is missing or null.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace pushapk {

using json = nlohmann::json;

/// Release channel name, e.g. "aurora", "beta", "release" or "dep".
using Channel = std::string;

/// Google Play account used to publish one channel.
struct ChannelCredentials {
    std::string service_account;
    std::string certificate;  // path to the service account key (.p12)
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ChannelCredentials, service_account, certificate)

/// Trusted channel -> credentials table.
using CredentialsTable = std::map<Channel, ChannelCredentials>;

/// Architecture label (e.g. "x86", "arm_v15") -> local APK path.
using ArtifactSet = std::map<std::string, std::string>;

} // namespace pushapk
