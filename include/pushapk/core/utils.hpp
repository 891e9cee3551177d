#pragma once

#include <string>
#include <string_view>

namespace pushapk::utils {

auto trim(std::string_view s) -> std::string;
auto starts_with(std::string_view s, std::string_view prefix) -> bool;
auto ends_with(std::string_view s, std::string_view suffix) -> bool;

} // namespace pushapk::utils
