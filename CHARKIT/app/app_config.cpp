#include "app_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace {

const charkit::log::Channel kLog("AppConfig");

}

namespace fs = std::filesystem;

AppConfig AppConfig::defaults() {
    return AppConfig{};
}

AppConfig AppConfig::from_json(const nlohmann::json* obj) {
    AppConfig config = defaults();
    if (!obj || !obj->is_object()) {
        return config;
    }
    auto images = obj->find("images_path");
    if (images != obj->end() && images->is_string()) {
        config.images_path = images->get<std::string>();
    }
    auto animations = obj->find("animations_file");
    if (animations != obj->end() && animations->is_string()) {
        config.animations_file = animations->get<std::string>();
    }
    auto fps = obj->find("target_fps");
    if (fps != obj->end() && fps->is_number_integer()) {
        const long long value = fps->get<long long>();
        config.target_fps = static_cast<int>(std::clamp<long long>(value, kMinFps, kMaxFps));
    }
    auto vsync = obj->find("vsync");
    if (vsync != obj->end() && vsync->is_boolean()) {
        config.vsync = vsync->get<bool>();
    }
    auto level = obj->find("log_level");
    if (level != obj->end() && level->is_string()) {
        config.log_level = charkit::log::parse_level(level->get<std::string>());
        if (!config.log_level) {
            kLog.warn("Unknown log_level '" + level->get<std::string>() + "'.");
        }
    }
    return config;
}

AppConfig AppConfig::load_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        kLog.debug("No config at '" + path + "'; using defaults.");
        return defaults();
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        kLog.warn("Unable to open '" + path + "'; using defaults.");
        return defaults();
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& ex) {
        kLog.warn("Failed to parse '" + path + "': " + ex.what() + "; using defaults.");
        return defaults();
    }
    if (!doc.is_object()) {
        kLog.warn("'" + path + "' is not a JSON object; using defaults.");
        return defaults();
    }
    kLog.info("Loaded '" + path + "'.");
    return from_json(&doc);
}

void AppConfig::apply_environment() {
    const char* images = std::getenv("CHARKIT_IMAGES_PATH");
    if (images && *images) {
        images_path = images;
    }
}

void AppConfig::apply_log_level() const {
    if (!log_level) {
        return;
    }
    const char* env = std::getenv("CHARKIT_LOG_LEVEL");
    if (env && charkit::log::parse_level(env)) {
        return;
    }
    charkit::log::set_level(*log_level);
}

AppConfig AppConfig::from_args(const std::vector<std::string>& args) {
    const CommandLineOptions options = parse_command_line(args);
    AppConfig config = load_file(options.config_path.value_or(kDefaultConfigFile));
    config.apply_environment();
    if (options.images_path) {
        config.images_path = *options.images_path;
    }
    if (options.animations_file) {
        config.animations_file = *options.animations_file;
    }
    return config;
}

AppConfig AppConfig::from_command_line(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (argv[i]) {
            args.emplace_back(argv[i]);
        }
    }
    return from_args(args);
}

CommandLineOptions parse_command_line(const std::vector<std::string>& args) {
    CommandLineOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::optional<std::string>* target = nullptr;
        if (arg == "--config") {
            target = &options.config_path;
        } else if (arg == "--images") {
            target = &options.images_path;
        } else if (arg == "--animations") {
            target = &options.animations_file;
        } else {
            kLog.warn("Ignoring unknown argument '" + arg + "'.");
            continue;
        }
        if (i + 1 >= args.size()) {
            kLog.warn(arg + " expects a value.");
            break;
        }
        *target = args[++i];
    }
    return options;
}
