#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pushapk/core/error.hpp"
#include "pushapk/core/types.hpp"

namespace pushapk::googleplay {

inline constexpr std::string_view kGooglePlayScopePrefix = "project:releng:googleplay:";

/// Extract the release channel a task is authorized for.
///
/// Exactly one scope may start with `scope_prefix`; zero or several matches
/// fail with ErrorCode::ScopeValidation. The returned channel is the scope
/// with the prefix stripped. Whether the channel is actually configured is
/// checked later, against the accounts table.
[[nodiscard]] auto resolve_channel(const std::vector<std::string>& scopes,
                                   std::string_view scope_prefix = kGooglePlayScopePrefix)
    -> Result<Channel>;

} // namespace pushapk::googleplay
