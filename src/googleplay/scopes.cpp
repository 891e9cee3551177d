#include "pushapk/googleplay/scopes.hpp"

#include "pushapk/core/logger.hpp"
#include "pushapk/core/utils.hpp"

#include <algorithm>
#include <iterator>

namespace pushapk::googleplay {

auto resolve_channel(const std::vector<std::string>& scopes,
                     std::string_view scope_prefix) -> Result<Channel> {
    std::vector<std::string_view> matching;
    std::ranges::copy_if(scopes, std::back_inserter(matching),
                         [scope_prefix](std::string_view scope) {
                             return utils::starts_with(scope, scope_prefix);
                         });

    if (matching.empty()) {
        return std::unexpected(make_error(
            ErrorCode::ScopeValidation,
            "No valid scope found in task",
            "expected one scope starting with " + std::string(scope_prefix)));
    }
    if (matching.size() > 1) {
        std::string found;
        for (auto scope : matching) {
            if (!found.empty()) found += ", ";
            found += scope;
        }
        return std::unexpected(make_error(
            ErrorCode::ScopeValidation,
            "More than one valid scope given",
            found));
    }

    auto channel = matching.front().substr(scope_prefix.size());
    if (channel.empty()) {
        return std::unexpected(make_error(
            ErrorCode::ScopeValidation,
            "Scope does not name a channel",
            std::string(matching.front())));
    }

    LOG_DEBUG("Task is authorized for channel '{}'", channel);
    return Channel(channel);
}

} // namespace pushapk::googleplay
