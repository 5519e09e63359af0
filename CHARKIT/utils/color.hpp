#pragma once

#include <SDL.h>

#include <optional>
#include <string_view>

namespace charkit::color {

inline constexpr SDL_Color kTransparent{0, 0, 0, 0};

// "#RRGGBB", "#RRGGBBAA" or "transparent" (case-insensitive).
std::optional<SDL_Color> parse(std::string_view text);

// Same as parse(); a literal that does not parse is a programming error.
SDL_Color hex(std::string_view text);

inline bool is_transparent(SDL_Color c) { return c.a == 0; }

}
