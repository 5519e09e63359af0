#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "asset/animation_loader.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP";
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

static std::string error_of(const nlohmann::json& doc) {
    try {
        AnimationLoader::parse(doc);
    } catch (const std::runtime_error& ex) {
        return ex.what();
    }
    return {};
}

TEST_CASE("animation loader reads strings and frame objects") {
    const auto doc = nlohmann::json::parse(R"({
        "animations": [
            { "name": "blink",
              "frames": [ "b1.png", { "file": "b2.png", "duration": 100 }, { "filename": "b3.png" } ] },
            { "name": "idle", "frames": [ "i.png" ] }
        ]
    })");
    const auto animations = AnimationLoader::parse(doc);
    REQUIRE(animations.size() == 2);
    CHECK(animations[0].name() == "blink");
    REQUIRE(animations[0].size() == 3);
    CHECK(animations[0].frames()[0].duration() == kDefaultFrameDurationMs);
    CHECK(animations[0].frames()[1].filename() == "b2.png");
    CHECK(animations[0].frames()[1].duration() == 100);
    CHECK(animations[0].frames()[2].filename() == "b3.png");
    CHECK(animations[1].name() == "idle");
}

TEST_CASE("animation loader accepts a bare array") {
    const auto doc = nlohmann::json::parse(R"([ { "name": "a", "frames": [ "x.png" ] } ])");
    const auto animations = AnimationLoader::parse(doc);
    REQUIRE(animations.size() == 1);
    CHECK(animations[0].name() == "a");
}

TEST_CASE("animation loader errors name the offending entry") {
    CHECK(error_of(nlohmann::json::object()).find("'animations' array") != std::string::npos);

    const auto unnamed = nlohmann::json::parse(R"([ { "frames": [ "x.png" ] } ])");
    CHECK(error_of(unnamed).find("animation #0") != std::string::npos);

    const auto bad_duration = nlohmann::json::parse(
        R"([ { "name": "ok", "frames": [] }, { "name": "wave", "frames": [ { "file": "w.png", "duration": "fast" } ] } ])");
    const std::string first = error_of(bad_duration);
    CHECK(first.find("animation #0 ('ok')") != std::string::npos);
    CHECK(first.find("cannot be empty") != std::string::npos);

    const auto negative = nlohmann::json::parse(
        R"([ { "name": "wave", "frames": [ { "file": "w.png", "duration": -5 } ] } ])");
    CHECK(error_of(negative).find("animation #0 ('wave')") != std::string::npos);

    const auto missing_file = nlohmann::json::parse(R"([ { "name": "wave", "frames": [ { "duration": 5 } ] } ])");
    CHECK(error_of(missing_file).find("'file'") != std::string::npos);
}

TEST_CASE("animation loader reads files and reports bad paths") {
    charkit::log::set_level(charkit::log::Level::Warn);
    const fs::path root = test_root();
    std::error_code ec;
    fs::create_directories(root, ec);

    const fs::path good = root / "animations_ok.json";
    {
        std::ofstream out(good);
        REQUIRE(out.is_open());
        out << R"({ "animations": [ { "name": "idle", "frames": [ "i.png" ] } ] })";
    }
    const auto animations = AnimationLoader::load_file(good.string());
    REQUIRE(animations.size() == 1);
    CHECK(animations[0].frames()[0].filename() == "i.png");

    const fs::path broken = root / "animations_broken.json";
    {
        std::ofstream out(broken);
        REQUIRE(out.is_open());
        out << "{ \"animations\": [";
    }
    CHECK_THROWS_AS(AnimationLoader::load_file(broken.string()), std::runtime_error);
    CHECK_THROWS_AS(AnimationLoader::load_file((root / "does_not_exist.json").string()), std::runtime_error);

    const fs::path invalid = root / "animations_invalid.json";
    {
        std::ofstream out(invalid);
        REQUIRE(out.is_open());
        out << R"({ "animations": [ { "name": "wave", "frames": [ { "duration": 5 } ] } ] })";
    }
    try {
        AnimationLoader::load_file(invalid.string());
        FAIL("expected std::runtime_error");
    } catch (const std::runtime_error& ex) {
        const std::string message = ex.what();
        CHECK(message.rfind("'" + invalid.string() + "': ", 0) == 0);
        CHECK(message.find("animation #0 ('wave')") != std::string::npos);
    }

    fs::remove(good, ec);
    fs::remove(broken, ec);
    fs::remove(invalid, ec);
}

TEST_CASE("shipped sample animations load") {
#ifdef SOURCE_ROOT
    const fs::path sample = fs::path(SOURCE_ROOT) / "assets" / "animations.json";
#else
    const fs::path sample = fs::current_path() / "assets" / "animations.json";
#endif
    charkit::log::set_level(charkit::log::Level::Warn);
    const auto animations = AnimationLoader::load_file(sample.string());
    REQUIRE(animations.size() == 3);
    CHECK(animations[0].name() == "blink");
    CHECK(animations[1].name() == "look_up");
    CHECK(animations[2].name() == "wink");
    CHECK(animations[0].size() == 5);
    CHECK(animations[0].frames()[4].duration() == 3000);
    CHECK(animations[2].frames()[1].filename() == "blue_square_blinkaneye_0003.png");
}
