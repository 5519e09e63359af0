#include "animation.hpp"

#include <stdexcept>
#include <utility>

Animation::Animation(std::string name, std::vector<AnimationFrame> frames)
: name_(std::move(name)), frames_(std::move(frames)) {
    if (frames_.empty()) {
        throw std::invalid_argument("The animation '" + name_ + "' cannot be empty.");
    }
}

Uint64 Animation::total_duration_ms() const {
    Uint64 total = 0;
    for (const AnimationFrame& frame : frames_) {
        total += frame.duration();
    }
    return total;
}
