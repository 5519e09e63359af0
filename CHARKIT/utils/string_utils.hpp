#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace charkit::strings {

inline std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string trim_copy(std::string_view value) {
    std::size_t start = 0;
    std::size_t end = value.size();

    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }

    return std::string(value.substr(start, end - start));
}

// "(a, b)", the way positions are shown in the demo labels.
inline std::string format_pair(int first, int second) {
    return "(" + std::to_string(first) + ", " + std::to_string(second) + ")";
}

}
