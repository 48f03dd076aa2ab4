#pragma once
#include <fmt/format.h>

#include <string>
#include <vector>

namespace fmt {

/**
 Quote and join a list of labels for messages, e.g.: {"G", "X"} -> "'G', 'X'"
 */
inline std::string quoted_list(std::vector<std::string> const& items) {
    auto result = std::string{};
    for (auto const& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += fmt::format("'{}'", item);
    }
    return result;
}

} // namespace fmt
