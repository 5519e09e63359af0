#include "doctest/doctest.h"

#include <string>
#include <utility>
#include <vector>

#include "utils/log.hpp"

namespace {

struct CapturedLines {
    std::vector<std::pair<charkit::log::Level, std::string>> lines;

    CapturedLines() {
        charkit::log::set_capture([this](charkit::log::Level level, const std::string& message) {
            lines.emplace_back(level, message);
        });
    }
    ~CapturedLines() {
        charkit::log::set_capture({});
    }
};

}

TEST_CASE("channels prefix messages with their component") {
    CapturedLines captured;
    charkit::log::set_level(charkit::log::Level::Debug);

    const charkit::log::Channel channel("Character");
    CHECK(channel.component() == "Character");
    channel.debug("Playing 'blink' (5 frame(s)).");
    channel.error("boom");
    charkit::log::info("untagged");

    REQUIRE(captured.lines.size() == 3);
    CHECK(captured.lines[0].first == charkit::log::Level::Debug);
    CHECK(captured.lines[0].second == "[Character] Playing 'blink' (5 frame(s)).");
    CHECK(captured.lines[1].first == charkit::log::Level::Error);
    CHECK(captured.lines[1].second == "[Character] boom");
    CHECK(captured.lines[2].second == "untagged");

    charkit::log::set_level(charkit::log::Level::Warn);
}

TEST_CASE("level filter applies before capture") {
    CapturedLines captured;
    charkit::log::set_level(charkit::log::Level::Warn);

    const charkit::log::Channel channel("AppConfig");
    channel.info("hidden");
    channel.debug("hidden");
    channel.warn("shown");

    REQUIRE(captured.lines.size() == 1);
    CHECK(captured.lines[0].second == "[AppConfig] shown");
}

TEST_CASE("empty component leaves the message as is") {
    CapturedLines captured;
    charkit::log::set_level(charkit::log::Level::Warn);
    charkit::log::Channel("").warn("plain");
    REQUIRE(captured.lines.size() == 1);
    CHECK(captured.lines[0].second == "plain");
}

TEST_CASE("level names parse case-insensitively") {
    CHECK(charkit::log::parse_level("DEBUG") == charkit::log::Level::Debug);
    CHECK(charkit::log::parse_level("warning") == charkit::log::Level::Warn);
    CHECK(charkit::log::parse_level("Error") == charkit::log::Level::Error);
    CHECK_FALSE(charkit::log::parse_level("loud").has_value());
}
