#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "utils/log.hpp"

// Runtime settings shared by the demo windows.
//
// Sources, lowest priority first: built-in defaults, the JSON config file,
// CHARKIT_IMAGES_PATH, then command-line flags.
struct AppConfig {
    static constexpr int kMinFps = 1;
    static constexpr int kMaxFps = 240;
    static constexpr const char* kDefaultConfigFile = "charkit.json";

    std::string images_path = "./assets/images/";
    std::string animations_file;
    int         target_fps = 60;
    bool        vsync = true;
    std::optional<charkit::log::Level> log_level;

    static AppConfig defaults();

    // Keys with the wrong type are ignored; target_fps is clamped.
    static AppConfig from_json(const nlohmann::json* obj);

    // A missing file yields defaults. Invalid JSON logs a warning and also
    // yields defaults.
    static AppConfig load_file(const std::string& path);

    // Full resolution for an executable: --config, file, environment, flags.
    static AppConfig from_command_line(int argc, char* argv[]);
    static AppConfig from_args(const std::vector<std::string>& args);

    void apply_environment();

    // Applies log_level unless CHARKIT_LOG_LEVEL already chose one.
    void apply_log_level() const;
};

struct CommandLineOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> images_path;
    std::optional<std::string> animations_file;
};

// Unknown flags and flags missing their value are logged and skipped.
CommandLineOptions parse_command_line(const std::vector<std::string>& args);
