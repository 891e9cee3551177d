#include "pushapk/core/utils.hpp"

namespace pushapk::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.starts_with(prefix);
}

auto ends_with(std::string_view s, std::string_view suffix) -> bool {
    return s.ends_with(suffix);
}

} // namespace pushapk::utils
