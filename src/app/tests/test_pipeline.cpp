#include <AssetId.hpp>
#include <ThumbnailPipeline.hpp>
#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <variant>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

using namespace motionlib;
using namespace motionlib::thumb;

namespace {

struct FakeHandle final : ModelHandle {
    std::vector<double> pose;
    bool throwsOnRender = false;
};

// Draws nothing; records what the pipeline asked for
class FakeRenderer final : public Renderer {
public:
    auto loadModel(const std::filesystem::path& document) -> Expected<std::unique_ptr<ModelHandle>> override {
        ++loads;
        if (document.stem() == "broken") {
            return Fail(ErrorKind::RenderFailure, "malformed model document");
        }
        auto handle = std::make_unique<FakeHandle>();
        handle->throwsOnRender = document.stem() == "exploding";
        return handle;
    }

    auto setPose(ModelHandle& handle, std::span<const double> pose) -> void override {
        static_cast<FakeHandle&>(handle).pose.assign(pose.begin(), pose.end());
    }

    auto settle(ModelHandle&) -> void override { ++settles; }

    [[nodiscard]] auto hasCamera(const ModelHandle&, std::string_view name) const -> bool override {
        return name == "track";
    }

    auto render(const ModelHandle& handle, const CameraConfig& camera, uint32_t width, uint32_t height)
        -> Expected<RenderedImage> override {
        const auto& fake = static_cast<const FakeHandle&>(handle);
        if (fake.throwsOnRender) {
            throw std::runtime_error("render context lost");
        }
        const auto& pose = fake.pose;
        renderedPoses.push_back(pose.empty() ? -1.0 : pose.front());
        cameras.push_back(camera);
        return RenderedImage{.pixels = std::vector<std::byte>(size_t{width} * height * 4, std::byte{0x80}),
                             .width = width,
                             .height = height};
    }

    int loads = 0;
    int settles = 0;
    std::vector<double> renderedPoses;
    std::vector<CameraConfig> cameras;
};

struct PipelineFixture {
    PipelineFixture() : library(LibraryConfiguration::FromDataRoot(scratch.path())) {
        REQUIRE(library.ensureLayout());
        WriteFile(library.configuration().modelsRoot / "humanoid" / "humanoid.xml", "<mujoco/>");
    }

    ScratchDirectory scratch;
    MotionLibrary library;
    FakeRenderer renderer;
};

bool StartsWith(const std::filesystem::path& path, const std::string_view magic) {
    return ReadText(path).starts_with(magic);
}

} // namespace

TEST_CASE_METHOD(PipelineFixture, "Model thumbnails are stills next to the bundle name", "[pipeline][models]") {
    ThumbnailPipeline pipeline(library, renderer, {.thumbnailSize = 160});

    const auto stored = pipeline.renderModel("humanoid/humanoid.xml");
    REQUIRE(stored);
    const auto id = AssetId("humanoid/humanoid.xml");
    REQUIRE(*stored == library.configuration().thumbnailsRoot / "models" / "humanoid" / (id + ".webp"));
    REQUIRE(StartsWith(*stored, "RIFF"));
    REQUIRE(library.thumbnails().Get(AssetCategory::Models, id) == *stored);

    REQUIRE(renderer.cameras.size() == 1);
    const auto& orbit = std::get<OrbitCamera>(renderer.cameras.front());
    REQUIRE(orbit.distance == kDefaultCameraDistance);
    REQUIRE(orbit.azimuth == kDefaultCameraAzimuth);
    REQUIRE(orbit.elevation == kDefaultCameraElevation);
    REQUIRE(orbit.lookat == kDefaultCameraLookat);

    SECTION("by identifier") {
        REQUIRE(pipeline.renderModelById(id) == *stored);
        const auto unknown = pipeline.renderModelById("ffffffffffffffff");
        REQUIRE_FALSE(unknown);
        REQUIRE(unknown.error().kind == ErrorKind::NotFound);
    }
}

TEST_CASE_METHOD(PipelineFixture, "Trajectory thumbnails sample thirty frames", "[pipeline][trajectories]") {
    WriteFile(library.configuration().trajectoriesRoot / "locomotion" / "walk.npy", MakeNpy(1000, 3));
    ThumbnailPipeline pipeline(library, renderer);

    const auto stored = pipeline.renderTrajectory("locomotion/walk.npy", "humanoid/humanoid.xml");
    REQUIRE(stored);
    REQUIRE(*stored == library.configuration().thumbnailsRoot / "trajectories" / "locomotion" / "8dd65a9be6716014.webp");
    REQUIRE(StartsWith(*stored, "RIFF"));

    // Poses are frame * 100 + column, so the first coordinate identifies the sampled frame
    REQUIRE(renderer.renderedPoses.size() == 30);
    REQUIRE(renderer.renderedPoses.front() == 0.0);
    REQUIRE(renderer.renderedPoses.back() == 99900.0);
    REQUIRE(renderer.settles == 30);
    REQUIRE(renderer.loads == 1);

    SECTION("by identifier") {
        REQUIRE(pipeline.renderTrajectoryById("8dd65a9be6716014", "humanoid/humanoid.xml") == *stored);
    }

    SECTION("GIF fallback replaces the WebP animation") {
        ThumbnailPipeline gifPipeline(library, renderer, {.animationFormat = AnimationFormat::Gif});
        const auto gif = gifPipeline.renderTrajectory("locomotion/walk.npy", "humanoid/humanoid.xml");
        REQUIRE(gif);
        REQUIRE(gif->extension() == ".gif");
        REQUIRE(StartsWith(*gif, "GIF89a"));
        REQUIRE_FALSE(std::filesystem::exists(*stored));
        REQUIRE(renderer.renderedPoses.size() == 60);
    }
}

TEST_CASE_METHOD(PipelineFixture, "Exceptions while rendering fail only that asset", "[pipeline][batch]") {
    WriteFile(library.configuration().modelsRoot / "exploding" / "exploding.xml", "<mujoco/>");
    ThumbnailPipeline pipeline(library, renderer);

    const auto single = pipeline.renderModel("exploding/exploding.xml");
    REQUIRE_FALSE(single);
    REQUIRE(single.error().kind == ErrorKind::RenderFailure);

    const auto report = pipeline.renderAllModels();
    REQUIRE(report.total == 2);
    REQUIRE(report.succeeded == 1);
    REQUIRE(library.thumbnails().Get(AssetCategory::Models, AssetId("humanoid/humanoid.xml")));
}

TEST_CASE_METHOD(PipelineFixture, "Forged array shapes fail one trajectory of a batch", "[pipeline][batch]") {
    const auto root = library.configuration().trajectoriesRoot / "forged";
    WriteFile(root / "a.npy", MakeNpy(20, 3));
    WriteFile(root / "b.npy", MakeNpyHeader("(4611686018427387904, 4)"));
    WriteFile(root / "c.npy", MakeNpyHeader("(2305843009213693952,)"));

    ThumbnailPipeline pipeline(library, renderer);
    const auto report = pipeline.renderTrajectoryFolder("forged", "humanoid/humanoid.xml");
    REQUIRE(report.total == 3);
    REQUIRE(report.succeeded == 1);
}

TEST_CASE_METHOD(PipelineFixture, "Camera selection", "[pipeline][camera]") {
    ThumbnailPipeline pipeline(library, renderer);

    SECTION("named camera present in the model") {
        REQUIRE(pipeline.renderModel("humanoid/humanoid.xml", {.cameraName = "track"}));
        REQUIRE(std::get<NamedCamera>(renderer.cameras.back()).name == "track");
    }

    SECTION("unknown camera falls back to the orbit camera with the given framing") {
        REQUIRE(pipeline.renderModel("humanoid/humanoid.xml",
                                     {.cameraName = "overhead", .distance = 6.0f, .lookat = std::array{0.0f, 0.0f, 0.5f}}));
        const auto& orbit = std::get<OrbitCamera>(renderer.cameras.back());
        REQUIRE(orbit.distance == 6.0f);
        REQUIRE(orbit.azimuth == kDefaultCameraAzimuth);
        REQUIRE(orbit.lookat == std::array{0.0f, 0.0f, 0.5f});
    }
}

TEST_CASE_METHOD(PipelineFixture, "Folder batches count failures and continue", "[pipeline][batch]") {
    const auto root = library.configuration().trajectoriesRoot / "dance";
    for (const auto* name : {"a.npy", "b.npy", "c.npy", "d.npy"}) {
        WriteFile(root / name, MakeNpy(40, 3));
    }
    WriteFile(root / "e.npy", "corrupt");
    WriteFile(root / "nested" / "f.npy", MakeNpy(40, 3));

    ThumbnailPipeline pipeline(library, renderer);
    const auto report = pipeline.renderTrajectoryFolder("dance", "humanoid/humanoid.xml");
    REQUIRE(report.total == 5);
    REQUIRE(report.succeeded == 4);
    REQUIRE(report.failed() == 1);

    REQUIRE(library.thumbnails().Get(AssetCategory::Trajectories, AssetId("dance/a.npy")));
    REQUIRE_FALSE(library.thumbnails().Get(AssetCategory::Trajectories, AssetId("dance/e.npy")));
    REQUIRE_FALSE(library.thumbnails().Get(AssetCategory::Trajectories, AssetId("dance/nested/f.npy")));

    SECTION("folders outside the root are refused") {
        const auto refused = pipeline.renderTrajectoryFolder("../models", "humanoid/humanoid.xml");
        REQUIRE(refused.total == 0);
    }
}

TEST_CASE_METHOD(PipelineFixture, "Render everything with the first model", "[pipeline][batch]") {
    WriteFile(library.configuration().modelsRoot / "broken" / "broken.xml", "<mujoco>");
    WriteFile(library.configuration().trajectoriesRoot / "walk.npy", MakeNpy(10, 3));

    ThumbnailPipeline pipeline(library, renderer);
    const auto models = pipeline.renderAllModels();
    REQUIRE(models.total == 2);
    REQUIRE(models.succeeded == 1);

    // "broken/broken.xml" sorts first and cannot be loaded
    const auto withDefault = pipeline.renderAllTrajectories(std::nullopt);
    REQUIRE(withDefault);
    REQUIRE(withDefault->total == 1);
    REQUIRE(withDefault->succeeded == 0);

    const auto withModel = pipeline.renderAllTrajectories(std::filesystem::path("humanoid/humanoid.xml"));
    REQUIRE(withModel);
    REQUIRE(withModel->succeeded == 1);
}

TEST_CASE("Rendering trajectories needs a model", "[pipeline][batch]") {
    ScratchDirectory scratch;
    MotionLibrary library(LibraryConfiguration::FromDataRoot(scratch.path()));
    REQUIRE(library.ensureLayout());
    FakeRenderer renderer;
    ThumbnailPipeline pipeline(library, renderer);

    const auto report = pipeline.renderAllTrajectories(std::nullopt);
    REQUIRE_FALSE(report);
    REQUIRE(report.error().kind == ErrorKind::NotFound);
}

TEST_CASE_METHOD(PipelineFixture, "Pipeline input validation", "[pipeline][errors]") {
    WriteFile(library.configuration().trajectoriesRoot / "walk.npy", MakeNpy(10, 3));
    ThumbnailPipeline pipeline(library, renderer);

    SECTION("paths must stay inside their root") {
        const auto escaped = pipeline.renderModel("../trajectories/walk.npy");
        REQUIRE_FALSE(escaped);
        REQUIRE(escaped.error().kind == ErrorKind::InvalidInput);
        REQUIRE(renderer.loads == 0);
    }

    SECTION("wrong extension") {
        const auto wrong = pipeline.renderTrajectory("walk.csv", "humanoid/humanoid.xml");
        REQUIRE_FALSE(wrong);
        REQUIRE(wrong.error().kind == ErrorKind::InvalidInput);
    }

    SECTION("missing files") {
        const auto missing = pipeline.renderTrajectory("run.npy", "humanoid/humanoid.xml");
        REQUIRE_FALSE(missing);
        REQUIRE(missing.error().kind == ErrorKind::NotFound);

        const auto noModel = pipeline.renderTrajectory("walk.npy", "robot/robot.xml");
        REQUIRE_FALSE(noModel);
        REQUIRE(noModel.error().kind == ErrorKind::NotFound);
    }

    SECTION("unloadable model") {
        WriteFile(library.configuration().modelsRoot / "broken.xml", "<mujoco>");
        const auto failed = pipeline.renderModel("broken.xml");
        REQUIRE_FALSE(failed);
        REQUIRE(failed.error().kind == ErrorKind::RenderFailure);
        REQUIRE_FALSE(library.thumbnails().Get(AssetCategory::Models, AssetId("broken.xml")));
    }
}
