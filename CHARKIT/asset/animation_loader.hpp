#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "animation.hpp"

// Reads animation definitions:
//   { "animations": [ { "name": "blink",
//                       "frames": [ "a.png", { "file": "b.png", "duration": 100 } ] } ] }
// A bare array of animations is accepted too. Errors are std::runtime_error.
class AnimationLoader {
public:
    static std::vector<Animation> parse(const nlohmann::json& doc);
    static std::vector<Animation> load_file(const std::string& path);

private:
    static AnimationFrame parse_frame(const nlohmann::json& frame_json, const std::string& context);
};
