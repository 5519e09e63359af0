#pragma once

#include <SDL.h>
#include <string>
#include <utility>

inline constexpr Uint32 kDefaultFrameDurationMs = 250;

// One image of an animation and how long it stays on screen.
class AnimationFrame {
public:
    AnimationFrame(std::string filename, Uint32 duration_ms = kDefaultFrameDurationMs)
    : filename_(std::move(filename)), duration_ms_(duration_ms) {}

    // Relative to the owning character's images directory.
    const std::string& filename() const { return filename_; }
    Uint32 duration() const { return duration_ms_; }

    bool operator==(const AnimationFrame& other) const {
        return duration_ms_ == other.duration_ms_ && filename_ == other.filename_;
    }
    bool operator!=(const AnimationFrame& other) const { return !(*this == other); }

private:
    std::string filename_;
    Uint32      duration_ms_ = kDefaultFrameDurationMs;
};
