#include "doctest/doctest.h"

#include <limits>
#include <stdexcept>
#include <string>

#include "asset/texture_cache.hpp"
#include "character/character.hpp"
#include "support/manual_clock.hpp"
#include "ui/cells_grid.hpp"
#include "ui/frame.hpp"
#include "utils/log.hpp"

namespace {

std::vector<Animation> idle_only() {
    return {Animation("idle", {AnimationFrame("idle.png")})};
}

CellsGrid make_grid(int rows, int cols) {
    CellsGrid grid(0, 0);
    CellsStyle style;
    style.size = 80;
    style.spacing = 8;
    grid.load_cells(rows, cols, style);
    return grid;
}

}

TEST_CASE("character needs exactly one layout target") {
    charkit::log::set_level(charkit::log::Level::Warn);
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);
    Frame frame(SDL_Rect{0, 0, 100, 100}, FrameStyle{});
    CellsGrid grid = make_grid(2, 2);

    CharacterOptions none;
    none.animations = idle_only();
    CHECK_THROWS_AS(Character(timers, textures, none), std::invalid_argument);

    CharacterOptions both;
    both.animations = idle_only();
    both.frame = &frame;
    both.grid_cells = &grid.get_cells_grid();
    CHECK_THROWS_AS(Character(timers, textures, both), std::invalid_argument);

    CharacterOptions bad_size;
    bad_size.frame = &frame;
    bad_size.size = 0;
    CHECK_THROWS_AS(Character(timers, textures, bad_size), std::invalid_argument);
}

TEST_CASE("duplicate animation names are rejected") {
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);
    Frame frame(SDL_Rect{0, 0, 100, 100}, FrameStyle{});

    CharacterOptions options;
    options.frame = &frame;
    options.animations = {Animation("idle", {AnimationFrame("a.png")}), Animation("idle", {AnimationFrame("b.png")})};
    try {
        Character character(timers, textures, options);
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& ex) {
        CHECK(std::string(ex.what()) == "Duplicate animation 'idle'.");
    }
}

TEST_CASE("grid character is centred in its cell and stays inside the grid") {
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);
    CellsGrid grid = make_grid(3, 4);

    CharacterOptions options;
    options.animations = idle_only();
    options.grid_cells = &grid.get_cells_grid();
    options.size = 54;
    Character character(timers, textures, options);

    CHECK(character.layout_mode() == Character::LayoutMode::Grid);
    CHECK_FALSE(character.is_visible());

    REQUIRE(character.set_position({1, 0}));
    CHECK(character.is_visible());
    const SDL_Rect& cell = grid.get_cells_grid()[1][0].rect();
    CHECK(character.wrapper_rect().x == cell.x + 13);
    CHECK(character.wrapper_rect().y == cell.y + 13);
    CHECK(character.wrapper_rect().w == 54);
    CHECK(character.wrapper_rect().h == 54);

    CHECK(character.move({1, 3}));
    CHECK(character.current_position() == Character::Position{2, 3});

    const SDL_Rect before = character.wrapper_rect();
    CHECK_FALSE(character.move({1, 0}));
    CHECK_FALSE(character.move({0, 1}));
    CHECK_FALSE(character.set_position({-1, 0}));
    CHECK_FALSE(character.set_position({0, -1}));
    CHECK(character.current_position() == Character::Position{2, 3});
    CHECK(character.wrapper_rect().x == before.x);
    CHECK(character.wrapper_rect().y == before.y);
}

TEST_CASE("oversized sprite overhangs its cell evenly") {
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);
    CellsGrid grid = make_grid(1, 1);

    CharacterOptions options;
    options.animations = idle_only();
    options.grid_cells = &grid.get_cells_grid();
    options.size = 85;
    Character character(timers, textures, options);
    REQUIRE(character.set_position({0, 0}));
    const SDL_Rect& cell = grid.get_cells_grid()[0][0].rect();
    // (80 - 85) / 2 rounds down to -3.
    CHECK(character.wrapper_rect().x == cell.x - 3);
}

TEST_CASE("grid bounds use the first row for columns") {
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);

    Frame cell(SDL_Rect{0, 0, 80, 80}, FrameStyle{});
    CellsGrid::Matrix ragged{{cell, cell, cell}, {cell}};
    ragged[0][2].set_position(SDL_Point{200, 0});

    CharacterOptions options;
    options.animations = idle_only();
    options.grid_cells = &ragged;
    options.size = 40;
    Character character(timers, textures, options);

    REQUIRE(character.set_position({0, 2}));
    CHECK(character.wrapper_rect().x == 220);

    // Accepted (within the first row's width) but there is no such cell.
    CHECK(character.set_position({1, 2}));
    CHECK(character.current_position() == Character::Position{1, 2});
    CHECK(character.wrapper_rect().x == 220);
}

TEST_CASE("frame character is offset from the frame's top-left") {
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);
    Frame play_area(SDL_Rect{40, 60, 560, 500}, FrameStyle{});

    CharacterOptions options;
    options.animations = idle_only();
    options.frame = &play_area;
    options.size = 54;
    Character character(timers, textures, options);
    CHECK(character.layout_mode() == Character::LayoutMode::Frame);

    REQUIRE(character.set_position({20, 20}));
    CHECK(character.wrapper_rect().x == 60);
    CHECK(character.wrapper_rect().y == 80);

    // No bounds in frame mode.
    CHECK(character.move({-100, 1000}));
    CHECK(character.current_position() == Character::Position{-80, 1020});
    CHECK(character.wrapper_rect().x == -40);
    CHECK(character.wrapper_rect().y == 1080);
}

TEST_CASE("moves that overflow the coordinate range are rejected") {
    constexpr int kMax = std::numeric_limits<int>::max();
    constexpr int kMin = std::numeric_limits<int>::min();
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);

    SUBCASE("grid") {
        CellsGrid grid = make_grid(3, 3);
        CharacterOptions options;
        options.animations = idle_only();
        options.grid_cells = &grid.get_cells_grid();
        Character character(timers, textures, options);
        REQUIRE(character.set_position({1, 0}));
        const SDL_Rect before = character.wrapper_rect();

        CHECK_FALSE(character.move({kMax, 0}));
        CHECK_FALSE(character.move({0, kMin}));
        CHECK(character.current_position() == Character::Position{1, 0});
        CHECK(character.wrapper_rect().x == before.x);
        CHECK(character.wrapper_rect().y == before.y);
    }

    SUBCASE("frame") {
        Frame play_area(SDL_Rect{10, 10, 560, 500}, FrameStyle{});
        CharacterOptions options;
        options.animations = idle_only();
        options.frame = &play_area;
        Character character(timers, textures, options);
        REQUIRE(character.set_position({20, 20}));

        CHECK_FALSE(character.set_position({kMax - 5, 0}));
        CHECK_FALSE(character.set_position({0, kMax}));
        CHECK(character.current_position() == Character::Position{20, 20});
        CHECK(character.wrapper_rect().x == 30);

        // Fits once the frame origin is added.
        REQUIRE(character.set_position({kMax - 10, 0}));
        CHECK(character.wrapper_rect().x == kMax);
        CHECK_FALSE(character.move({1, 0}));
        CHECK_FALSE(character.move({kMax, 0}));
        CHECK(character.current_position() == Character::Position{kMax - 10, 0});
    }
}

TEST_CASE("show places the sprite at a window position") {
    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache textures(nullptr);
    Frame frame(SDL_Rect{10, 10, 100, 100}, FrameStyle{});

    CharacterOptions options;
    options.animations = idle_only();
    options.frame = &frame;
    options.size = 32;
    Character character(timers, textures, options);
    character.show(SDL_Point{5, 7});
    CHECK(character.is_visible());
    CHECK(character.wrapper_rect().x == 5);
    CHECK(character.wrapper_rect().y == 7);
    CHECK(character.current_position() == Character::Position{0, 0});
}
