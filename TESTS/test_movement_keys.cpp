#include "doctest/doctest.h"

#include "app/movement_keys.hpp"

using charkit::keys::Offset;

TEST_CASE("arrow keys and WASD map to grid offsets") {
    CHECK(charkit::keys::grid_offset(SDLK_UP) == Offset{-1, 0});
    CHECK(charkit::keys::grid_offset(SDLK_w) == Offset{-1, 0});
    CHECK(charkit::keys::grid_offset(SDLK_DOWN) == Offset{1, 0});
    CHECK(charkit::keys::grid_offset(SDLK_s) == Offset{1, 0});
    CHECK(charkit::keys::grid_offset(SDLK_LEFT) == Offset{0, -1});
    CHECK(charkit::keys::grid_offset(SDLK_a) == Offset{0, -1});
    CHECK(charkit::keys::grid_offset(SDLK_RIGHT) == Offset{0, 1});
    CHECK(charkit::keys::grid_offset(SDLK_d) == Offset{0, 1});
    CHECK_FALSE(charkit::keys::grid_offset(SDLK_ESCAPE).has_value());
    CHECK_FALSE(charkit::keys::grid_offset(SDLK_q).has_value());
}

TEST_CASE("pixel offsets are (dx, dy) steps") {
    CHECK(charkit::keys::pixel_offset(SDLK_UP) == Offset{0, -15});
    CHECK(charkit::keys::pixel_offset(SDLK_d) == Offset{15, 0});
    CHECK(charkit::keys::pixel_offset(SDLK_a, 4) == Offset{-4, 0});
    CHECK(charkit::keys::pixel_offset(SDLK_s, 4) == Offset{0, 4});
    CHECK_FALSE(charkit::keys::pixel_offset(SDLK_SPACE).has_value());
}
