#pragma once

#include <SDL.h>
#include <string>
#include <vector>

#include "animation_frame.hpp"

class Animation {
public:
    // Throws std::invalid_argument when frames is empty.
    Animation(std::string name, std::vector<AnimationFrame> frames);

    const std::string& name() const { return name_; }
    const std::vector<AnimationFrame>& frames() const { return frames_; }
    std::size_t size() const { return frames_.size(); }
    Uint64 total_duration_ms() const;

private:
    std::string name_;
    std::vector<AnimationFrame> frames_;
};
