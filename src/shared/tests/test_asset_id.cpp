#include <AssetId.hpp>
#include <string>

#include <catch2/catch_test_macros.hpp>

using motionlib::AssetId;
using motionlib::CanonicalRelativePath;

TEST_CASE("AssetId is the truncated MD5 of the relative path", "[asset-id]") {
    REQUIRE(AssetId("a/b.npy") == "427bf610f427f262");
    REQUIRE(AssetId("locomotion/walk.npy") == "8dd65a9be6716014");
    REQUIRE(AssetId("MS-Human-700/MS-Human-700-MJX.xml") == "a38ce9076c8205a1");
    REQUIRE(AssetId("") == "d41d8cd98f00b204");
}

TEST_CASE("AssetId is deterministic and lowercase hex", "[asset-id]") {
    const auto id = AssetId("dance/spin.npz");
    REQUIRE(id.size() == motionlib::kAssetIdLength);
    REQUIRE(id == AssetId("dance/spin.npz"));
    REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(id != AssetId("dance/spin.npy"));
}

TEST_CASE("CanonicalRelativePath uses forward slashes relative to the root", "[asset-id][path]") {
    REQUIRE(CanonicalRelativePath("/data/trajectories", "/data/trajectories/a/b.npy") == "a/b.npy");
    REQUIRE(CanonicalRelativePath("/data/trajectories/", "/data/trajectories/./a/../a/b.npy") == "a/b.npy");
    REQUIRE(CanonicalRelativePath("/data/trajectories", "/data/trajectories/walk.npy") == "walk.npy");

    SECTION("paths outside the root are rejected") {
        REQUIRE(CanonicalRelativePath("/data/trajectories", "/data/models/a.xml").empty());
        REQUIRE(CanonicalRelativePath("/data/trajectories", "/data/trajectories").empty());
    }
}
