#include "movement_keys.hpp"

namespace charkit::keys {

std::optional<Direction> direction_for(SDL_Keycode key) {
    switch (key) {
        case SDLK_UP:    case SDLK_w: return Direction::Up;
        case SDLK_DOWN:  case SDLK_s: return Direction::Down;
        case SDLK_LEFT:  case SDLK_a: return Direction::Left;
        case SDLK_RIGHT: case SDLK_d: return Direction::Right;
        default:                      return std::nullopt;
    }
}

std::optional<Offset> grid_offset(SDL_Keycode key) {
    const auto dir = direction_for(key);
    if (!dir) {
        return std::nullopt;
    }
    switch (*dir) {
        case Direction::Up:    return Offset{-1, 0};
        case Direction::Down:  return Offset{1, 0};
        case Direction::Left:  return Offset{0, -1};
        case Direction::Right: return Offset{0, 1};
    }
    return std::nullopt;
}

std::optional<Offset> pixel_offset(SDL_Keycode key, int step) {
    const auto dir = direction_for(key);
    if (!dir) {
        return std::nullopt;
    }
    switch (*dir) {
        case Direction::Up:    return Offset{0, -step};
        case Direction::Down:  return Offset{0, step};
        case Direction::Left:  return Offset{-step, 0};
        case Direction::Right: return Offset{step, 0};
    }
    return std::nullopt;
}

}
