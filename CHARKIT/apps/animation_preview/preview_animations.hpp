#pragma once

#include <string>
#include <vector>

#include "asset/animation.hpp"

namespace preview {

// blink, blink_an_eye, look_up and move_eyebrow for the blue square sprite.
std::vector<Animation> builtin_animations();

// Button caption for an animation name: known names get their fixed caption,
// others are shown with underscores as spaces and the first letter upper-cased.
std::string button_caption(const std::string& animation_name);

// Animations from the configured JSON file, or the built-in set when the path
// is empty or the file cannot be used.
std::vector<Animation> load_or_builtin(const std::string& animations_file);

}
