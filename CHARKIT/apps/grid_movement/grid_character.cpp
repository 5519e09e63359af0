#include "grid_character.hpp"

#include "utils/color.hpp"

namespace {

CharacterOptions grid_options(const CellsGrid::Matrix& grid_matrix, const std::string& images_path) {
    CharacterOptions options;
    options.grid_cells = &grid_matrix;
    options.size = GridCharacter::kDefaultSize;
    options.images_path = images_path;
    options.bg_color = charkit::color::hex("#1E2A3A");
    options.animations.emplace_back("idle", std::vector<AnimationFrame>{AnimationFrame("blue_square_blink_0001.png")});
    return options;
}

}

GridCharacter::GridCharacter(charkit::TimerQueue& timers,
                             TextureCache& textures,
                             const CellsGrid::Matrix& grid_matrix,
                             const std::string& images_path)
: Character(timers, textures, grid_options(grid_matrix, images_path)) {}
