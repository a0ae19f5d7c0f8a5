#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../shared/Error.hpp"
#include "Renderer.hpp"

namespace motionlib::thumb {
    constexpr auto kFrameDurationMs = 100u;
    constexpr auto kWebpQuality = 85.0f;
    constexpr auto kWebpMethod = 6;  // slowest, smallest output

    enum class AnimationFormat {
        Webp,
        Gif
    };

    // Single frame as lossy WebP
    Expected<std::vector<std::byte>> EncodeStill(const RenderedImage& image);

    // Frames as an infinitely looping animation with kFrameDurationMs per frame; every frame
    // must share the first frame's size
    Expected<std::vector<std::byte>> EncodeAnimation(std::span<const RenderedImage> frames,
                                                     AnimationFormat format = AnimationFormat::Webp);
} // namespace motionlib::thumb
