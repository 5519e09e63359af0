#include "animation_loader.hpp"

#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace {

const charkit::log::Channel kLog("AnimationLoader");

std::string describe_entry(std::size_t index, const std::string& name) {
    std::ostringstream oss;
    oss << "animation #" << index;
    if (!name.empty()) {
        oss << " ('" << name << "')";
    }
    return oss.str();
}

const nlohmann::json* find_string_key(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) {
            return &(*it);
        }
    }
    return nullptr;
}

}

AnimationFrame AnimationLoader::parse_frame(const nlohmann::json& frame_json, const std::string& context) {
    if (frame_json.is_string()) {
        const std::string file = charkit::strings::trim_copy(frame_json.get<std::string>());
        if (file.empty()) {
            throw std::runtime_error(context + ": frame filename is empty.");
        }
        return AnimationFrame(file);
    }
    if (!frame_json.is_object()) {
        throw std::runtime_error(context + ": frame must be a filename or an object.");
    }

    const nlohmann::json* file_json = find_string_key(frame_json, {"file", "filename"});
    if (!file_json) {
        throw std::runtime_error(context + ": frame object needs a 'file' string.");
    }
    const std::string file = charkit::strings::trim_copy(file_json->get<std::string>());
    if (file.empty()) {
        throw std::runtime_error(context + ": frame filename is empty.");
    }

    Uint32 duration = kDefaultFrameDurationMs;
    auto duration_it = frame_json.find("duration");
    if (duration_it != frame_json.end()) {
        if (!duration_it->is_number_integer()) {
            throw std::runtime_error(context + ": frame duration must be an integer (ms).");
        }
        const long long value = duration_it->get<long long>();
        if (value < 0 || value > static_cast<long long>(std::numeric_limits<Uint32>::max())) {
            throw std::runtime_error(context + ": frame duration " + std::to_string(value) + " is out of range.");
        }
        duration = static_cast<Uint32>(value);
    }
    return AnimationFrame(file, duration);
}

std::vector<Animation> AnimationLoader::parse(const nlohmann::json& doc) {
    const nlohmann::json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object()) {
        auto it = doc.find("animations");
        if (it != doc.end() && it->is_array()) {
            list = &(*it);
        }
    }
    if (!list) {
        throw std::runtime_error("Animation document needs an 'animations' array.");
    }

    std::vector<Animation> animations;
    animations.reserve(list->size());
    for (std::size_t index = 0; index < list->size(); ++index) {
        const nlohmann::json& entry = (*list)[index];
        if (!entry.is_object()) {
            throw std::runtime_error(describe_entry(index, "") + " must be an object.");
        }
        std::string name;
        auto name_it = entry.find("name");
        if (name_it != entry.end() && name_it->is_string()) {
            name = charkit::strings::trim_copy(name_it->get<std::string>());
        }
        const std::string context = describe_entry(index, name);
        if (name.empty()) {
            throw std::runtime_error(context + " needs a non-empty 'name'.");
        }

        auto frames_it = entry.find("frames");
        if (frames_it == entry.end() || !frames_it->is_array()) {
            throw std::runtime_error(context + " needs a 'frames' array.");
        }
        std::vector<AnimationFrame> frames;
        frames.reserve(frames_it->size());
        for (const auto& frame_json : *frames_it) {
            frames.push_back(parse_frame(frame_json, context));
        }
        try {
            animations.emplace_back(name, std::move(frames));
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(context + ": " + ex.what());
        }
    }
    return animations;
}

std::vector<Animation> AnimationLoader::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Unable to open animation file '" + path + "'.");
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Failed to parse animation file '" + path + "': " + ex.what());
    }
    std::vector<Animation> animations;
    try {
        animations = parse(doc);
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error("'" + path + "': " + ex.what());
    }
    kLog.info("Loaded " + std::to_string(animations.size()) +
              " animation(s) from '" + path + "'.");
    return animations;
}
