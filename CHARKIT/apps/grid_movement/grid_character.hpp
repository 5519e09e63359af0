#pragma once

#include "character/character.hpp"

// Player sprite snapped to the cells of the grid movement demo.
class GridCharacter : public Character {
public:
    static constexpr int kDefaultSize = 54;

    GridCharacter(charkit::TimerQueue& timers,
                  TextureCache& textures,
                  const CellsGrid::Matrix& grid_matrix,
                  const std::string& images_path);
};
