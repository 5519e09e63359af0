#include "free_movement_character.hpp"

#include "utils/color.hpp"

namespace {

CharacterOptions free_options(const Frame& play_area, const std::string& images_path) {
    CharacterOptions options;
    options.frame = &play_area;
    options.size = FreeMovementCharacter::kDefaultSize;
    options.images_path = images_path;
    options.bg_color = charkit::color::hex("#1E2A3A");
    options.animations.emplace_back("idle", std::vector<AnimationFrame>{AnimationFrame("blue_square_blink_0001.png")});
    return options;
}

}

FreeMovementCharacter::FreeMovementCharacter(charkit::TimerQueue& timers,
                                             TextureCache& textures,
                                             const Frame& play_area,
                                             const std::string& images_path)
: Character(timers, textures, free_options(play_area, images_path)) {}
