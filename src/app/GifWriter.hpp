#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../shared/Error.hpp"

namespace motionlib::thumb {
    // Animated GIF89a encoder with a fixed 256-colour palette (6x6x6 cube plus 40 greys)
    // shared by every frame, so successive renders of one model do not flicker.
    class GifWriter {
    public:
        GifWriter(uint16_t width, uint16_t height, uint16_t delayCentiseconds, uint16_t loopCount = 0);

        // rgba: width * height * 4 bytes, top row first; alpha is ignored
        Expected<void> addFrame(std::span<const std::byte> rgba);
        [[nodiscard]] size_t frameCount() const { return frameCount_; }
        std::vector<std::byte> finish();

        [[nodiscard]] static uint8_t PaletteIndex(uint8_t r, uint8_t g, uint8_t b);
        [[nodiscard]] static std::array<uint8_t, 3> PaletteColor(uint8_t index);

    private:
        void writeHeader_();
        void writeByte_(uint8_t value) { out_.push_back(static_cast<std::byte>(value)); }
        void writeWord_(uint16_t value);
        void writeImageData_(const std::vector<uint8_t>& indices);

        uint16_t width_;
        uint16_t height_;
        uint16_t delay_;
        uint16_t loopCount_;
        size_t frameCount_ = 0;
        bool finished_ = false;
        std::vector<std::byte> out_;
    };
} // namespace motionlib::thumb
