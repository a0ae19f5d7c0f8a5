#include <GifWriter.hpp>
#include <ImageEncoder.hpp>
#include <array>
#include <cstring>
#include <string_view>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace motionlib;
using motionlib::thumb::GifWriter;

namespace {

std::vector<std::byte> SolidFrame(const size_t width, const size_t height, const uint8_t r, const uint8_t g,
                                  const uint8_t b) {
    std::vector<std::byte> pixels;
    pixels.reserve(width * height * 4);
    for (size_t i = 0; i < width * height; ++i) {
        pixels.push_back(std::byte{r});
        pixels.push_back(std::byte{g});
        pixels.push_back(std::byte{b});
        pixels.push_back(std::byte{255});
    }
    return pixels;
}

size_t CountImageDescriptors(const std::vector<std::byte>& gif) {
    // Graphic control extension immediately followed by its descriptor: 21 F9 04 .. .. .. .. 00 2C
    size_t count = 0;
    for (size_t i = 0; i + 8 < gif.size(); ++i) {
        if (gif[i] == std::byte{0x21} && gif[i + 1] == std::byte{0xF9} && gif[i + 2] == std::byte{0x04} &&
            gif[i + 7] == std::byte{0x00} && gif[i + 8] == std::byte{0x2C}) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST_CASE("GifWriter produces a looping animation", "[gif]") {
    GifWriter writer(16, 8, 10);
    REQUIRE(writer.addFrame(SolidFrame(16, 8, 255, 0, 0)));
    REQUIRE(writer.addFrame(SolidFrame(16, 8, 0, 0, 255)));
    REQUIRE(writer.frameCount() == 2);

    const auto gif = writer.finish();
    REQUIRE(gif.size() > 13 + 768);
    REQUIRE(std::memcmp(gif.data(), "GIF89a", 6) == 0);
    REQUIRE(gif[6] == std::byte{16});
    REQUIRE(gif[8] == std::byte{8});
    REQUIRE(gif.back() == std::byte{0x3B});
    REQUIRE(CountImageDescriptors(gif) == 2);

    const auto netscape = std::string_view(reinterpret_cast<const char*>(gif.data()), gif.size()).find("NETSCAPE2.0");
    REQUIRE(netscape != std::string_view::npos);
}

TEST_CASE("GifWriter rejects frames of the wrong size", "[gif]") {
    GifWriter writer(4, 4, 10);
    const auto frame = writer.addFrame(SolidFrame(4, 3, 0, 0, 0));
    REQUIRE_FALSE(frame);
    REQUIRE(frame.error().kind == ErrorKind::RenderFailure);

    SECTION("and frames after finishing") {
        REQUIRE(writer.addFrame(SolidFrame(4, 4, 0, 0, 0)));
        writer.finish();
        REQUIRE_FALSE(writer.addFrame(SolidFrame(4, 4, 0, 0, 0)));
    }
}

TEST_CASE("Palette maps primaries and greys exactly", "[gif][palette]") {
    for (const auto& [r, g, b] : std::vector<std::array<uint8_t, 3>>{{0, 0, 0}, {255, 255, 255}, {255, 0, 0},
                                                                      {0, 255, 0}, {0, 0, 255}, {51, 102, 153}}) {
        REQUIRE(GifWriter::PaletteColor(GifWriter::PaletteIndex(r, g, b)) == std::array{r, g, b});
    }

    const auto grey = GifWriter::PaletteColor(GifWriter::PaletteIndex(120, 120, 120));
    REQUIRE(grey[0] == grey[1]);
    REQUIRE(grey[1] == grey[2]);
    REQUIRE(grey[0] >= 115);
    REQUIRE(grey[0] <= 125);
}

TEST_CASE("GIF animations use 100 ms frames", "[gif][encoder]") {
    std::vector<thumb::RenderedImage> frames(3);
    for (auto& frame : frames) {
        frame.width = 8;
        frame.height = 8;
        frame.pixels = SolidFrame(8, 8, 20, 40, 60);
    }

    const auto gif = thumb::EncodeAnimation(frames, thumb::AnimationFormat::Gif);
    REQUIRE(gif);
    REQUIRE(CountImageDescriptors(*gif) == 3);

    // First graphic control extension: delay in centiseconds at offset 4
    const auto text = std::string_view(reinterpret_cast<const char*>(gif->data()), gif->size());
    const auto gce = text.find("\x21\xF9\x04");
    REQUIRE(gce != std::string_view::npos);
    REQUIRE(std::to_integer<int>((*gif)[gce + 4]) == 10);

    SECTION("mismatched frame sizes fail") {
        frames[1].width = 4;
        frames[1].pixels.resize(4 * 8 * 4);
        REQUIRE_FALSE(thumb::EncodeAnimation(frames, thumb::AnimationFormat::Gif));
    }
}
