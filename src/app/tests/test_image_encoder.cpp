#include <ImageEncoder.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace motionlib;
using namespace motionlib::thumb;

namespace {

struct RiffChunk {
    std::string fourcc;
    std::vector<std::byte> payload;
};

uint32_t ReadLe(const std::vector<std::byte>& bytes, const size_t offset, const size_t width) {
    uint32_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= std::to_integer<uint32_t>(bytes[offset + i]) << (8 * i);
    }
    return value;
}

std::string FourCC(const std::vector<std::byte>& bytes, const size_t offset) {
    return {reinterpret_cast<const char*>(bytes.data() + offset), 4};
}

// Top-level chunks of a RIFF/WEBP file
std::vector<RiffChunk> WebpChunks(const std::vector<std::byte>& file) {
    REQUIRE(file.size() >= 12);
    REQUIRE(FourCC(file, 0) == "RIFF");
    REQUIRE(FourCC(file, 8) == "WEBP");
    REQUIRE(ReadLe(file, 4, 4) + 8 == file.size());

    std::vector<RiffChunk> chunks;
    size_t offset = 12;
    while (offset + 8 <= file.size()) {
        const auto size = ReadLe(file, offset + 4, 4);
        REQUIRE(offset + 8 + size <= file.size());
        const auto begin = file.begin() + static_cast<std::ptrdiff_t>(offset + 8);
        chunks.push_back({FourCC(file, offset), {begin, begin + size}});
        offset += 8 + size + (size & 1u);
    }
    return chunks;
}

RenderedImage Solid(const uint32_t size, const uint8_t r, const uint8_t g, const uint8_t b) {
    RenderedImage image{.width = size, .height = size};
    for (uint32_t i = 0; i < size * size; ++i) {
        image.pixels.insert(image.pixels.end(), {std::byte{r}, std::byte{g}, std::byte{b}, std::byte{255}});
    }
    return image;
}

} // namespace

TEST_CASE("Stills are lossy WebP", "[webp][encoder]") {
    const auto encoded = EncodeStill(Solid(32, 200, 80, 40));
    REQUIRE(encoded);

    const auto chunks = WebpChunks(*encoded);
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].fourcc == "VP8 ");
}

TEST_CASE("Empty or truncated stills are rejected", "[webp][encoder]") {
    REQUIRE(EncodeStill({}).error().kind == ErrorKind::RenderFailure);

    auto image = Solid(16, 0, 0, 0);
    image.pixels.resize(image.pixels.size() - 4);
    REQUIRE_FALSE(EncodeStill(image));
}

TEST_CASE("Animations loop forever with 100 ms frames", "[webp][encoder]") {
    const std::vector frames{Solid(16, 255, 0, 0), Solid(16, 0, 255, 0), Solid(16, 0, 0, 255)};

    const auto encoded = EncodeAnimation(frames);
    REQUIRE(encoded);
    const auto chunks = WebpChunks(*encoded);

    REQUIRE(chunks.front().fourcc == "VP8X");
    REQUIRE((std::to_integer<uint8_t>(chunks.front().payload[0]) & 0x02u) != 0);

    uint32_t totalDuration = 0;
    size_t animationFrames = 0;
    bool sawLoopCount = false;
    for (const auto& chunk : chunks) {
        if (chunk.fourcc == "ANIM") {
            REQUIRE(ReadLe(chunk.payload, 4, 2) == 0);
            sawLoopCount = true;
        }
        if (chunk.fourcc == "ANMF") {
            ++animationFrames;
            totalDuration += ReadLe(chunk.payload, 12, 3);
            REQUIRE(FourCC(chunk.payload, 16) != "VP8L");
        }
    }
    REQUIRE(sawLoopCount);
    REQUIRE(animationFrames == 3);
    REQUIRE(totalDuration == 3 * kFrameDurationMs);
}

TEST_CASE("Animations need matching frames", "[webp][encoder]") {
    REQUIRE_FALSE(EncodeAnimation({}));

    const std::vector frames{Solid(16, 255, 0, 0), Solid(8, 0, 255, 0)};
    const auto encoded = EncodeAnimation(frames);
    REQUIRE_FALSE(encoded);
    REQUIRE(encoded.error().kind == ErrorKind::RenderFailure);
}
