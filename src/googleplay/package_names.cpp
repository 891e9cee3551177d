#include "pushapk/googleplay/package_names.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace pushapk::googleplay {

namespace {

// "dep" is the dry-fixture channel used to exercise the Aurora push path.
constexpr std::array<std::pair<std::string_view, std::string_view>, 4> kPackageNamesByChannel = {{
    {"aurora", "org.mozilla.fennec_aurora"},
    {"beta", "org.mozilla.firefox_beta"},
    {"release", "org.mozilla.firefox"},
    {"dep", "org.mozilla.fennec_aurora"},
}};

} // anonymous namespace

auto get_package_name(const Channel& channel) -> Result<std::string> {
    for (const auto& [name, package] : kPackageNamesByChannel) {
        if (name == channel) {
            return std::string(package);
        }
    }
    return std::unexpected(make_error(
        ErrorCode::UnsupportedChannel,
        "No package name known for channel",
        channel));
}

} // namespace pushapk::googleplay
