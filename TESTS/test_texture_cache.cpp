#include "doctest/doctest.h"

#include <filesystem>
#include <string>
#include <system_error>

#include <SDL.h>

#include "asset/texture_cache.hpp"
#include "character/character.hpp"
#include "support/manual_clock.hpp"
#include "ui/frame.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP";
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

namespace {

// Offscreen target so textures can be created without a window.
struct SoftwareTarget {
    SDL_Surface*  surface = nullptr;
    SDL_Renderer* renderer = nullptr;

    SoftwareTarget() {
        surface = SDL_CreateRGBSurfaceWithFormat(0, 200, 200, 32, SDL_PIXELFORMAT_RGBA32);
        if (surface) {
            renderer = SDL_CreateSoftwareRenderer(surface);
        }
    }
    ~SoftwareTarget() {
        if (renderer) SDL_DestroyRenderer(renderer);
        if (surface) SDL_FreeSurface(surface);
    }

    Uint32 pixel(int x, int y) const {
        SDL_RenderFlush(renderer);
        const auto* row = static_cast<const Uint8*>(surface->pixels) + y * surface->pitch;
        return reinterpret_cast<const Uint32*>(row)[x];
    }
};

fs::path write_square_bmp(const std::string& name, Uint8 r, Uint8 g, Uint8 b) {
    std::error_code ec;
    fs::create_directories(test_root(), ec);
    const fs::path path = test_root() / name;
    SDL_Surface* img = SDL_CreateRGBSurfaceWithFormat(0, 8, 8, 32, SDL_PIXELFORMAT_RGBA32);
    REQUIRE(img != nullptr);
    SDL_FillRect(img, nullptr, SDL_MapRGBA(img->format, r, g, b, 255));
    REQUIRE(SDL_SaveBMP(img, path.string().c_str()) == 0);
    SDL_FreeSurface(img);
    return path;
}

}

TEST_CASE("texture cache without a renderer never loads") {
    TextureCache cache(nullptr);
    CHECK(cache.get("anything.png") == nullptr);
    CHECK(cache.size() == 0);
    CHECK_FALSE(cache.contains("anything.png"));
}

TEST_CASE("texture cache loads once and remembers failures") {
    charkit::log::set_level(charkit::log::Level::Error);
    SoftwareTarget target;
    REQUIRE(target.renderer != nullptr);

    const fs::path image = write_square_bmp("cache_red.bmp", 255, 0, 0);
    TextureCache cache(target.renderer);

    SDL_Texture* first = cache.get(image.string());
    REQUIRE(first != nullptr);
    CHECK(cache.get(image.string()) == first);
    CHECK(cache.size() == 1);

    const std::string missing = (test_root() / "missing.png").string();
    CHECK(cache.get(missing) == nullptr);
    CHECK(cache.contains(missing));
    CHECK(cache.get(missing) == nullptr);
    CHECK(cache.size() == 2);

    cache.clear();
    CHECK(cache.size() == 0);

    std::error_code ec;
    fs::remove(image, ec);
}

TEST_CASE("character renders background then the current frame") {
    charkit::log::set_level(charkit::log::Level::Error);
    SoftwareTarget target;
    REQUIRE(target.renderer != nullptr);
    const fs::path image = write_square_bmp("frame_green.bmp", 0, 255, 0);

    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache cache(target.renderer);
    Frame stage(SDL_Rect{0, 0, 200, 200}, FrameStyle{});

    CharacterOptions options;
    options.frame = &stage;
    options.size = 40;
    options.images_path = test_root().string();
    options.bg_color = SDL_Color{0, 0, 255, 255};
    options.animations = {Animation("idle", {AnimationFrame("frame_green.bmp", 10)}),
                          Animation("broken", {AnimationFrame("no_such_frame.png", 10)})};
    Character character(timers, cache, options);

    // Not placed yet: nothing drawn.
    SDL_SetRenderDrawColor(target.renderer, 0, 0, 0, 255);
    SDL_RenderClear(target.renderer);
    character.render(target.renderer);
    CHECK(target.pixel(10, 10) == SDL_MapRGBA(target.surface->format, 0, 0, 0, 255));

    REQUIRE(character.set_position({0, 0}));
    character.render(target.renderer);
    CHECK(target.pixel(10, 10) == SDL_MapRGBA(target.surface->format, 0, 0, 255, 255));
    CHECK(target.pixel(50, 50) == SDL_MapRGBA(target.surface->format, 0, 0, 0, 255));

    character.play_animation("idle");
    advance_and_run(clock, timers, 10);
    character.render(target.renderer);
    CHECK(target.pixel(10, 10) == SDL_MapRGBA(target.surface->format, 0, 255, 0, 255));
    CHECK(target.pixel(39, 39) == SDL_MapRGBA(target.surface->format, 0, 255, 0, 255));

    // A frame that cannot be loaded leaves only the background.
    character.play_animation("broken");
    advance_and_run(clock, timers, 10);
    REQUIRE(character.displayed_frame() != nullptr);
    CHECK(character.displayed_frame()->filename() == "no_such_frame.png");
    character.render(target.renderer);
    CHECK(target.pixel(10, 10) == SDL_MapRGBA(target.surface->format, 0, 0, 255, 255));

    std::error_code ec;
    fs::remove(image, ec);
}

TEST_CASE("a frame that fails to load does not stop the chain") {
    charkit::log::set_level(charkit::log::Level::Error);
    SoftwareTarget target;
    REQUIRE(target.renderer != nullptr);
    const fs::path first = write_square_bmp("chain_green.bmp", 0, 255, 0);
    const fs::path last = write_square_bmp("chain_red.bmp", 255, 0, 0);

    ManualClock clock;
    charkit::TimerQueue timers(clock.fn());
    TextureCache cache(target.renderer);
    Frame stage(SDL_Rect{0, 0, 200, 200}, FrameStyle{});

    CharacterOptions options;
    options.frame = &stage;
    options.size = 40;
    options.images_path = test_root().string();
    options.bg_color = SDL_Color{0, 0, 255, 255};
    options.animations = {Animation("stutter", {AnimationFrame("chain_green.bmp", 10),
                                                AnimationFrame("chain_missing.png", 20),
                                                AnimationFrame("chain_red.bmp", 30)})};
    Character character(timers, cache, options);
    REQUIRE(character.set_position({0, 0}));

    character.play_animation("stutter");
    advance_and_run(clock, timers, 10);
    CHECK(character.current_frame_index() == 0);

    advance_and_run(clock, timers, 10);
    CHECK(character.current_frame_index() == 1);
    CHECK(character.is_playing());
    SDL_SetRenderDrawColor(target.renderer, 0, 0, 0, 255);
    SDL_RenderClear(target.renderer);
    character.render(target.renderer);
    CHECK(target.pixel(10, 10) == SDL_MapRGBA(target.surface->format, 0, 0, 255, 255));

    // Frame 2 is due 20 ms after the missing frame appeared.
    advance_and_run(clock, timers, 10);
    CHECK(character.current_frame_index() == 1);
    advance_and_run(clock, timers, 10);
    CHECK(character.current_frame_index() == 2);
    CHECK_FALSE(character.is_playing());
    character.render(target.renderer);
    CHECK(target.pixel(10, 10) == SDL_MapRGBA(target.surface->format, 255, 0, 0, 255));

    std::error_code ec;
    fs::remove(first, ec);
    fs::remove(last, ec);
}
