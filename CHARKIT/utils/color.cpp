#include "color.hpp"

#include <stdexcept>
#include <string>

#include "utils/string_utils.hpp"

namespace charkit::color {

namespace {

std::optional<int> hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return std::nullopt;
}

std::optional<int> parse_pair(std::string_view text, std::size_t offset) {
    if (offset + 2 > text.size()) {
        return std::nullopt;
    }
    auto hi = hex_digit(text[offset]);
    auto lo = hex_digit(text[offset + 1]);
    if (!hi || !lo) {
        return std::nullopt;
    }
    return (*hi << 4) | *lo;
}

}

std::optional<SDL_Color> parse(std::string_view text) {
    const std::string trimmed = strings::trim_copy(text);
    if (strings::to_lower_copy(trimmed) == "transparent") {
        return kTransparent;
    }
    if (trimmed.empty() || trimmed[0] != '#') {
        return std::nullopt;
    }
    if (trimmed.size() != 7 && trimmed.size() != 9) {
        return std::nullopt;
    }
    auto r = parse_pair(trimmed, 1);
    auto g = parse_pair(trimmed, 3);
    auto b = parse_pair(trimmed, 5);
    auto a = trimmed.size() == 9 ? parse_pair(trimmed, 7) : std::optional<int>{255};
    if (!r || !g || !b || !a) {
        return std::nullopt;
    }
    return SDL_Color{static_cast<Uint8>(*r), static_cast<Uint8>(*g),
                     static_cast<Uint8>(*b), static_cast<Uint8>(*a)};
}

SDL_Color hex(std::string_view text) {
    if (auto parsed = parse(text)) {
        return *parsed;
    }
    throw std::invalid_argument("Invalid colour literal '" + std::string(text) + "'.");
}

}
