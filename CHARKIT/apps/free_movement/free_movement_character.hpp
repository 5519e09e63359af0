#pragma once

#include "character/character.hpp"

// Player sprite moved by pixel offsets inside the play area.
class FreeMovementCharacter : public Character {
public:
    static constexpr int kDefaultSize = 54;

    FreeMovementCharacter(charkit::TimerQueue& timers,
                          TextureCache& textures,
                          const Frame& play_area,
                          const std::string& images_path);
};
