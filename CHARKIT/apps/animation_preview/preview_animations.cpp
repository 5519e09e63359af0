#include "preview_animations.hpp"

#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "asset/animation_loader.hpp"
#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("AnimationPreview");

// Every sequence opens on the neutral pose and closes on it with a long hold.
Animation make_sequence(const std::string& name,
                        const std::string& prefix,
                        Uint32 second_ms,
                        Uint32 third_ms,
                        Uint32 fourth_ms,
                        Uint32 hold_ms) {
    const std::string neutral = prefix + "_0001.png";
    return Animation(name, {
        AnimationFrame(neutral),
        AnimationFrame(prefix + "_0002.png", second_ms),
        AnimationFrame(prefix + "_0003.png", third_ms),
        AnimationFrame(prefix + "_0004.png", fourth_ms),
        AnimationFrame(neutral, hold_ms),
    });
}

}

namespace preview {

std::vector<Animation> builtin_animations() {
    std::vector<Animation> animations;
    animations.push_back(make_sequence("blink", "blue_square_blink", 100, 100, kDefaultFrameDurationMs, 3000));
    animations.push_back(make_sequence("blink_an_eye", "blue_square_blinkaneye", 100, 100, kDefaultFrameDurationMs, 2000));
    animations.push_back(make_sequence("look_up", "blue_square_lookup", 100, 2000, 100, 2000));
    animations.push_back(make_sequence("move_eyebrow", "blue_square_moveuplefteyebrow", 100, 3000, 100, 2000));
    return animations;
}

std::string button_caption(const std::string& animation_name) {
    static const std::unordered_map<std::string, std::string> kCaptions{
        {"blink", "Blink"},
        {"blink_an_eye", "Blink One Eye"},
        {"look_up", "Look Up"},
        {"move_eyebrow", "Move Eyebrow"},
    };
    auto it = kCaptions.find(animation_name);
    if (it != kCaptions.end()) {
        return it->second;
    }
    std::string caption = animation_name;
    for (char& c : caption) {
        if (c == '_') c = ' ';
    }
    if (!caption.empty()) {
        caption[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(caption[0])));
    }
    return caption;
}

std::vector<Animation> load_or_builtin(const std::string& animations_file) {
    if (animations_file.empty()) {
        return builtin_animations();
    }
    try {
        std::vector<Animation> loaded = AnimationLoader::load_file(animations_file);
        if (loaded.empty()) {
            kLog.warn("'" + animations_file + "' defines no animations; using built-in set.");
            return builtin_animations();
        }
        return loaded;
    } catch (const std::runtime_error& ex) {
        kLog.error(std::string(ex.what()) + " Using built-in set.");
        return builtin_animations();
    }
}

}
