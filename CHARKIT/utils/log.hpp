#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace charkit::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

void set_level(Level level);
Level level();

std::optional<Level> parse_level(std::string_view name);

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

// Receives every message that passes the level filter, before the timestamp
// is added. An empty function removes it.
using Capture = std::function<void(Level, const std::string&)>;
void set_capture(Capture capture);

// Logger for one component. Messages are written as "[<component>] <message>".
class Channel {
public:
    explicit Channel(std::string component);

    const std::string& component() const { return component_; }

    void error(const std::string& message) const;
    void warn(const std::string& message) const;
    void info(const std::string& message) const;
    void debug(const std::string& message) const;

private:
    std::string tagged(const std::string& message) const;

    std::string component_;
};

}
