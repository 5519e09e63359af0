#pragma once

#include <SDL.h>

#include <optional>
#include <utility>

namespace charkit::keys {

using Offset = std::pair<int, int>;

enum class Direction { Up, Down, Left, Right };

inline constexpr int kDefaultStepPixels = 15;

// Arrow keys and W/A/S/D.
std::optional<Direction> direction_for(SDL_Keycode key);

// (drow, dcol) for grid movement.
std::optional<Offset> grid_offset(SDL_Keycode key);

// (dx, dy) for free movement.
std::optional<Offset> pixel_offset(SDL_Keycode key, int step = kDefaultStepPixels);

}
