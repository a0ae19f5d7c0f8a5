#include <AssetId.hpp>
#include <Utils.hpp>
#include <services/MotionLibrary.hpp>
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

using namespace motionlib;

namespace {

std::vector<std::string> RelativePaths(const std::vector<AssetSummary>& assets) {
    std::vector<std::string> paths;
    for (const auto& asset : assets) {
        paths.push_back(asset.relativePath);
    }
    return paths;
}

} // namespace

TEST_CASE("Trajectory store lists files recursively with tags", "[store][trajectories]") {
    ScratchDirectory scratch;
    MotionLibrary library(LibraryConfiguration::FromDataRoot(scratch.path()));
    REQUIRE(library.ensureLayout());

    const auto root = library.configuration().trajectoriesRoot;
    WriteFile(root / "locomotion" / "walk.npy", MakeNpy(3, 2));
    WriteFile(root / "locomotion" / "deep" / "run.npz", "zip");
    WriteFile(root / "idle.npy", MakeNpy(1, 2));
    WriteFile(root / "notes.txt", "ignored");

    auto& store = library.trajectories();
    const auto assets = store.list();
    REQUIRE(RelativePaths(assets) == std::vector<std::string>{"idle.npy", "locomotion/deep/run.npz", "locomotion/walk.npy"});

    const auto walk = std::ranges::find(assets, std::string("locomotion/walk.npy"), &AssetSummary::relativePath);
    REQUIRE(walk->id == "8dd65a9be6716014");
    REQUIRE(walk->name == "walk.npy");
    REQUIRE(walk->category == "locomotion");
    REQUIRE(walk->sizeBytes == MakeNpy(3, 2).size());
    REQUIRE_FALSE(assets.front().category);

    SECTION("category filter") {
        REQUIRE(RelativePaths(store.list(std::string("locomotion"))) == std::vector<std::string>{"locomotion/walk.npy"});
        REQUIRE(store.list(std::string("dance")).empty());
    }

    SECTION("identifiers resolve back to files") {
        REQUIRE(store.resolve("8dd65a9be6716014") == root / "locomotion" / "walk.npy");
        REQUIRE_FALSE(store.resolve("0000000000000000"));
        REQUIRE_FALSE(store.resolve("8dd65a9b"));
        REQUIRE(store.summary(AssetId("idle.npy"))->name == "idle.npy");
    }
}

TEST_CASE("Saving validates names and extensions", "[store][save]") {
    ScratchDirectory scratch;
    MotionLibrary library(LibraryConfiguration::FromDataRoot(scratch.path()));
    REQUIRE(library.ensureLayout());
    auto& store = library.trajectories();
    const auto content = MakeNpy(2, 2);

    SECTION("plain trajectory") {
        const auto saved = store.save("walk.npy", content);
        REQUIRE(saved);
        REQUIRE(saved->relativePath == "walk.npy");
        REQUIRE(saved->id == AssetId("walk.npy"));
        REQUIRE(ReadText(library.configuration().trajectoriesRoot / "walk.npy").size() == content.size());
    }

    SECTION("tagged trajectory lands in its folder") {
        const auto saved = store.save("walk.npy", content, {.group = "locomotion"});
        REQUIRE(saved);
        REQUIRE(saved->id == "8dd65a9be6716014");
        REQUIRE(saved->category == "locomotion");
    }

    SECTION("bad input") {
        for (const auto* name : {"walk.txt", "", "../walk.npy", "a/walk.npy", ".."}) {
            const auto saved = store.save(name, content);
            REQUIRE_FALSE(saved);
            REQUIRE(saved.error().kind == ErrorKind::InvalidInput);
        }
        const auto escaping = store.save("walk.npy", content, {.group = "../outside"});
        REQUIRE_FALSE(escaping);
        REQUIRE(escaping.error().kind == ErrorKind::InvalidInput);
        REQUIRE(store.list().empty());
    }

    SECTION("models only accept documents") {
        const auto saved = library.models().save("robot.npy", content);
        REQUIRE_FALSE(saved);
        REQUIRE(saved.error().kind == ErrorKind::InvalidInput);
    }
}

TEST_CASE("Overwriting an asset drops its stale thumbnail", "[store][save][thumbnails]") {
    ScratchDirectory scratch;
    MotionLibrary library(LibraryConfiguration::FromDataRoot(scratch.path()));
    REQUIRE(library.ensureLayout());
    auto& store = library.trajectories();

    const auto first = store.save("walk.npy", MakeNpy(2, 2));
    REQUIRE(first);
    REQUIRE(library.thumbnails().Put(AssetCategory::Trajectories, first->id, "", ToBytes("GIF89a"),
                                     ThumbnailFormat::Gif));

    const auto second = store.save("walk.npy", MakeNpy(4, 2));
    REQUIRE(second);
    REQUIRE(second->id == first->id);
    REQUIRE_FALSE(library.thumbnails().Get(AssetCategory::Trajectories, first->id));
}

TEST_CASE("Deleting assets removes files and thumbnails", "[store][remove]") {
    ScratchDirectory scratch;
    MotionLibrary library(LibraryConfiguration::FromDataRoot(scratch.path()));
    REQUIRE(library.ensureLayout());

    SECTION("trajectory") {
        auto& store = library.trajectories();
        const auto saved = store.save("walk.npy", MakeNpy(2, 2), {.group = "locomotion"});
        REQUIRE(saved);
        REQUIRE(library.thumbnails().Put(AssetCategory::Trajectories, saved->id, "locomotion", ToBytes("GIF89a"),
                                         ThumbnailFormat::Gif));

        REQUIRE(store.remove(saved->id) == true);
        REQUIRE(store.list().empty());
        REQUIRE_FALSE(library.thumbnails().Get(AssetCategory::Trajectories, saved->id));
        REQUIRE(store.remove(saved->id) == false);
    }

    SECTION("model bundle goes with its last document") {
        const auto root = library.configuration().modelsRoot;
        WriteFile(root / "humanoid" / "humanoid.xml", "<mujoco/>");
        WriteFile(root / "humanoid" / "humanoid_mjx.xml", "<mujoco/>");
        WriteFile(root / "humanoid" / "meshes" / "torso.stl", "solid torso\nendsolid torso\n");
        auto& store = library.models();

        REQUIRE(store.remove(AssetId("humanoid/humanoid.xml")) == true);
        REQUIRE(std::filesystem::exists(root / "humanoid" / "meshes" / "torso.stl"));
        REQUIRE(RelativePaths(store.list()) == std::vector<std::string>{"humanoid/humanoid_mjx.xml"});

        REQUIRE(store.remove(AssetId("humanoid/humanoid_mjx.xml")) == true);
        REQUIRE_FALSE(std::filesystem::exists(root / "humanoid"));
    }
}

TEST_CASE("Model store lists entry documents and bundle files", "[store][models]") {
    ScratchDirectory scratch;
    MotionLibrary library(LibraryConfiguration::FromDataRoot(scratch.path()));
    REQUIRE(library.ensureLayout());

    const auto root = library.configuration().modelsRoot;
    WriteFile(root / "MS-Human-700" / "MS-Human-700-MJX.xml", "<mujoco/>");
    WriteFile(root / "MS-Human-700" / "assets" / "bones.xml", "<mujoco/>");
    WriteFile(root / "MS-Human-700" / "meshes" / "femur.stl", "solid femur\nendsolid femur\n");
    WriteFile(root / "cartpole.xml", "<mujoco/>");

    auto& store = library.models();
    const auto assets = store.list();
    REQUIRE(RelativePaths(assets) == std::vector<std::string>{"MS-Human-700/MS-Human-700-MJX.xml", "cartpole.xml"});
    REQUIRE(assets.front().id == "a38ce9076c8205a1");
    REQUIRE(assets.front().category == "MS-Human-700");

    const auto files = store.listDirectoryFiles("a38ce9076c8205a1");
    REQUIRE(files);
    REQUIRE(*files == std::vector<std::string>{"MS-Human-700-MJX.xml", "assets/bones.xml", "meshes/femur.stl"});
    REQUIRE(store.listDirectoryFiles(AssetId("cartpole.xml")) == std::vector<std::string>{"cartpole.xml"});
    REQUIRE_FALSE(store.listDirectoryFiles("ffffffffffffffff"));

    SECTION("bundle files resolve inside the directory only") {
        const auto femur = store.resolveDirectoryFile("a38ce9076c8205a1", "meshes/femur.stl");
        REQUIRE(femur);
        REQUIRE(femur->filename() == "femur.stl");
        REQUIRE(ContentTypeFor(*femur) == "model/stl");

        for (const auto* path : {"../cartpole.xml", "/etc/passwd", "meshes/../../cartpole.xml", ""}) {
            const auto rejected = store.resolveDirectoryFile("a38ce9076c8205a1", path);
            REQUIRE_FALSE(rejected);
            REQUIRE(rejected.error().kind == ErrorKind::InvalidInput);
        }

        const auto missing = store.resolveDirectoryFile("a38ce9076c8205a1", "meshes/tibia.stl");
        REQUIRE_FALSE(missing);
        REQUIRE(missing.error().kind == ErrorKind::NotFound);

        const auto unknownModel = store.resolveDirectoryFile("ffffffffffffffff", "meshes/femur.stl");
        REQUIRE_FALSE(unknownModel);
        REQUIRE(unknownModel.error().kind == ErrorKind::NotFound);
    }

    SECTION("symbolic links leaving the bundle are rejected") {
        const auto bundle = root / "MS-Human-700";
        WriteFile(library.configuration().trajectoriesRoot / "walk.npy", MakeNpy(2, 2));
        std::filesystem::create_symlink(root / "cartpole.xml", bundle / "meshes" / "pelvis.stl");
        std::filesystem::create_directory_symlink(library.configuration().trajectoriesRoot, bundle / "textures");
        std::filesystem::create_symlink(bundle / "meshes" / "femur.stl", bundle / "meshes" / "thigh.stl");

        for (const auto* path : {"meshes/pelvis.stl", "textures/walk.npy"}) {
            const auto escaped = store.resolveDirectoryFile("a38ce9076c8205a1", path);
            REQUIRE_FALSE(escaped);
            REQUIRE(escaped.error().kind == ErrorKind::InvalidInput);
        }

        const auto inside = store.resolveDirectoryFile("a38ce9076c8205a1", "meshes/thigh.stl");
        REQUIRE(inside);
        REQUIRE(inside->filename() == "femur.stl");
    }

    SECTION("saving a model creates its bundle directory") {
        const auto saved = store.save("walker.xml", ToBytes("<mujoco/>"));
        REQUIRE(saved);
        REQUIRE(saved->relativePath == "walker/walker.xml");
        REQUIRE(saved->category == "walker");
    }
}

TEST_CASE("Identifiers never cross categories", "[store][isolation]") {
    ScratchDirectory scratch;
    MotionLibrary library(LibraryConfiguration::FromDataRoot(scratch.path()));
    REQUIRE(library.ensureLayout());

    // Same relative path in both roots, hence the same identifier
    WriteFile(library.configuration().trajectoriesRoot / "shared" / "shared.npy", MakeNpy(2, 2));
    WriteFile(library.configuration().modelsRoot / "humanoid" / "humanoid.xml", "<mujoco/>");
    const auto trajectoryId = AssetId("shared/shared.npy");
    const auto modelId = AssetId("humanoid/humanoid.xml");

    REQUIRE(library.trajectories().resolve(trajectoryId));
    REQUIRE_FALSE(library.models().resolve(trajectoryId));
    REQUIRE_FALSE(library.models().summary(trajectoryId));
    REQUIRE(library.models().resolve(modelId));
    REQUIRE_FALSE(library.trajectories().resolve(modelId));
    REQUIRE_FALSE(library.trajectories().listDirectoryFiles(modelId));

    const auto wrongStore = library.models().remove(trajectoryId);
    REQUIRE(wrongStore);
    REQUIRE_FALSE(*wrongStore);
    REQUIRE(std::filesystem::exists(library.configuration().trajectoriesRoot / "shared" / "shared.npy"));

    const auto otherWay = library.trajectories().remove(modelId);
    REQUIRE(otherWay);
    REQUIRE_FALSE(*otherWay);
    REQUIRE(std::filesystem::exists(library.configuration().modelsRoot / "humanoid" / "humanoid.xml"));
}

TEST_CASE("Saving refuses an identifier owned by another file", "[store][save][collision]") {
    ScratchDirectory scratch;
    ThumbnailCache thumbnails(scratch.path() / "thumbnails");
    const auto root = scratch.path() / "trajectories";
    // Every path maps to one identifier
    AssetStore store(AssetCategory::Trajectories, root, thumbnails,
                     +[](std::string_view) { return std::string("0123456789abcdef"); });

    WriteFile(root / "idle.npy", MakeNpy(1, 2));

    const auto collided = store.save("walk.npy", MakeNpy(3, 2), {.group = "locomotion"});
    REQUIRE_FALSE(collided);
    REQUIRE(collided.error().kind == ErrorKind::IdentifierCollision);
    REQUIRE_FALSE(std::filesystem::exists(root / "locomotion" / "walk.npy"));

    SECTION("the owner itself can still be overwritten") {
        const auto replaced = store.save("idle.npy", MakeNpy(4, 2));
        REQUIRE(replaced);
        REQUIRE(replaced->id == "0123456789abcdef");
        REQUIRE(replaced->relativePath == "idle.npy");
    }
}
