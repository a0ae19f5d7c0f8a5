#include <Settings.hpp>
#include <array>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

using namespace motionlib;

namespace {

// Restores MOTIONLIB_DATA_DIR when the test case ends
class DataDirEnvironment {
public:
    explicit DataDirEnvironment(const char* value) {
        if (const char* current = std::getenv(kDataDirEnvironment)) {
            saved_ = current;
        }
        if (value) {
            ::setenv(kDataDirEnvironment, value, 1);
        }
        else {
            ::unsetenv(kDataDirEnvironment);
        }
    }

    ~DataDirEnvironment() {
        if (saved_) {
            ::setenv(kDataDirEnvironment, saved_->c_str(), 1);
        }
        else {
            ::unsetenv(kDataDirEnvironment);
        }
    }

private:
    std::optional<std::string> saved_;
};

} // namespace

TEST_CASE("Defaults without any configuration", "[settings]") {
    ScratchDirectory scratch;
    DataDirEnvironment environment(nullptr);

    const auto settings = ResolveSettings({}, scratch.path());
    REQUIRE(settings);
    REQUIRE(settings->library.dataRoot == scratch.path() / "data");
    REQUIRE(settings->library.thumbnailsRoot == scratch.path() / "data" / "thumbnails");
    REQUIRE(settings->render.thumbnailSize == 320);
    REQUIRE(settings->render.animationFormat == thumb::AnimationFormat::Webp);
    REQUIRE(settings->render.poseFields == kDefaultPoseFields);
    REQUIRE_FALSE(settings->camera.cameraName);
    REQUIRE_FALSE(settings->settingsFile);
}

TEST_CASE("Data directory precedence", "[settings]") {
    ScratchDirectory scratch;
    const auto fromEnvironment = (scratch.path() / "env-data").string();
    DataDirEnvironment environment(fromEnvironment.c_str());

    SECTION("environment beats the default") {
        REQUIRE(ResolveSettings({}, scratch.path())->library.dataRoot == scratch.path() / "env-data");
    }

    SECTION("settings file beats the environment") {
        WriteFile(scratch.path() / "motionlib.json", R"({"dataDir": "file-data"})");
        const auto settings = ResolveSettings({}, scratch.path());
        REQUIRE(settings);
        REQUIRE(settings->library.dataRoot == scratch.path() / "file-data");
        REQUIRE(settings->settingsFile == scratch.path() / "motionlib.json");
    }

    SECTION("command line beats everything") {
        WriteFile(scratch.path() / "motionlib.json", R"({"dataDir": "file-data"})");
        const auto settings = ResolveSettings({.dataDir = std::filesystem::path("flag-data")}, scratch.path());
        REQUIRE(settings->library.dataRoot == scratch.path() / "flag-data");
    }
}

TEST_CASE("Settings file inside the data directory", "[settings]") {
    ScratchDirectory scratch;
    DataDirEnvironment environment(nullptr);
    WriteFile(scratch.path() / "data" / "motionlib.json", R"({
        "thumbnailSize": 160,
        "animationFormat": "gif",
        "poseField": "joint_positions",
        "camera": {"distance": 5.0, "azimuth": 90.0, "lookat": [0.0, 0.0, 0.8]}
    })");

    const auto settings = ResolveSettings({.camera = {.azimuth = 30.0f}}, scratch.path());
    REQUIRE(settings);
    REQUIRE(settings->render.thumbnailSize == 160);
    REQUIRE(settings->render.animationFormat == thumb::AnimationFormat::Gif);
    REQUIRE(settings->render.poseFields == std::vector<std::string>{"joint_positions"});
    REQUIRE(settings->camera.distance == 5.0f);
    REQUIRE(settings->camera.azimuth == 30.0f);
    REQUIRE(settings->camera.lookat == std::array{0.0f, 0.0f, 0.8f});
    REQUIRE_FALSE(settings->camera.elevation);
}

TEST_CASE("Invalid settings are rejected", "[settings]") {
    ScratchDirectory scratch;
    DataDirEnvironment environment(nullptr);

    SECTION("unsupported thumbnail size") {
        const auto settings = ResolveSettings({.thumbnailSize = 512u}, scratch.path());
        REQUIRE_FALSE(settings);
        REQUIRE(settings.error().kind == ErrorKind::InvalidInput);
    }

    SECTION("malformed file") {
        WriteFile(scratch.path() / "motionlib.json", "{ not json");
        const auto settings = ResolveSettings({}, scratch.path());
        REQUIRE_FALSE(settings);
        REQUIRE(settings.error().kind == ErrorKind::InvalidInput);
    }

    SECTION("explicit file that does not exist") {
        const auto settings = ResolveSettings({.settingsFile = scratch.path() / "missing.json"}, scratch.path());
        REQUIRE_FALSE(settings);
    }

    SECTION("unknown animation format") {
        WriteFile(scratch.path() / "motionlib.json", R"({"animationFormat": "apng"})");
        const auto settings = ResolveSettings({}, scratch.path());
        REQUIRE_FALSE(settings);
        REQUIRE(settings.error().kind == ErrorKind::InvalidInput);
    }

    SECTION("frame count is fixed") {
        WriteFile(scratch.path() / "motionlib.json", R"({"frameCount": 12})");
        const auto settings = ResolveSettings({}, scratch.path());
        REQUIRE_FALSE(settings);
        REQUIRE(settings.error().kind == ErrorKind::InvalidInput);
    }

    SECTION("frame duration is fixed") {
        WriteFile(scratch.path() / "motionlib.json", R"({"frameDurationMs": 40})");
        const auto settings = ResolveSettings({}, scratch.path());
        REQUIRE_FALSE(settings);
        REQUIRE(settings.error().kind == ErrorKind::InvalidInput);
    }
}
