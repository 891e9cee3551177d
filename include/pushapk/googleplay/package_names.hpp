#pragma once

#include <string>

#include "pushapk/core/error.hpp"
#include "pushapk/core/types.hpp"

namespace pushapk::googleplay {

/// Map a release channel to its Android package name.
/// Only aurora, beta, release and the dep test channel (which reuses the
/// Aurora package) have a package; any other channel fails with
/// ErrorCode::UnsupportedChannel.
[[nodiscard]] auto get_package_name(const Channel& channel) -> Result<std::string>;

} // namespace pushapk::googleplay
