#include "GifWriter.hpp"

#include <algorithm>
#include <format>
#include <string_view>
#include <unordered_map>

namespace motionlib::thumb {
    namespace {
        constexpr auto kCubeLevels = 6u;
        constexpr auto kCubeSize = kCubeLevels * kCubeLevels * kCubeLevels;
        constexpr auto kGreyCount = 40u;
        constexpr auto kMinCodeSize = 8u;
        constexpr auto kMaxCode = 4095u;

        uint8_t CubeLevel(const uint8_t value) {
            return static_cast<uint8_t>((value * (kCubeLevels - 1) + 127) / 255);
        }

        uint8_t GreyValue(const uint32_t index) {
            return static_cast<uint8_t>((index + 1) * 255 / (kGreyCount + 1));
        }

        uint32_t DistanceSquared(const std::array<uint8_t, 3>& a, const uint8_t r, const uint8_t g, const uint8_t b) {
            const auto dr = static_cast<int>(a[0]) - r;
            const auto dg = static_cast<int>(a[1]) - g;
            const auto db = static_cast<int>(a[2]) - b;
            return static_cast<uint32_t>(dr * dr + dg * dg + db * db);
        }

        // Packs variable-width codes LSB first into 255-byte data sub-blocks
        class CodePacker {
        public:
            explicit CodePacker(std::vector<std::byte>& out) : out_(out) {}

            void write(const uint32_t code, const uint32_t size) {
                bits_ |= code << bitCount_;
                bitCount_ += size;
                while (bitCount_ >= 8) {
                    push_(static_cast<uint8_t>(bits_ & 0xFF));
                    bits_ >>= 8;
                    bitCount_ -= 8;
                }
            }

            void flush() {
                if (bitCount_ > 0) {
                    push_(static_cast<uint8_t>(bits_ & 0xFF));
                    bits_ = 0;
                    bitCount_ = 0;
                }
                if (!block_.empty()) {
                    emitBlock_();
                }
                out_.push_back(std::byte{0});
            }

        private:
            void push_(const uint8_t value) {
                block_.push_back(value);
                if (block_.size() == 255) {
                    emitBlock_();
                }
            }

            void emitBlock_() {
                out_.push_back(static_cast<std::byte>(block_.size()));
                for (const auto value : block_) {
                    out_.push_back(static_cast<std::byte>(value));
                }
                block_.clear();
            }

            std::vector<std::byte>& out_;
            std::vector<uint8_t> block_;
            uint32_t bits_ = 0;
            uint32_t bitCount_ = 0;
        };
    }

    GifWriter::GifWriter(const uint16_t width, const uint16_t height, const uint16_t delayCentiseconds,
                         const uint16_t loopCount)
        : width_(width), height_(height), delay_(delayCentiseconds), loopCount_(loopCount) {
        writeHeader_();
    }

    uint8_t GifWriter::PaletteIndex(const uint8_t r, const uint8_t g, const uint8_t b) {
        const auto cube = static_cast<uint8_t>(CubeLevel(r) * 36 + CubeLevel(g) * 6 + CubeLevel(b));
        const auto luminance = (static_cast<uint32_t>(r) + g + b) / 3;
        const auto greyStep = static_cast<int>((luminance * (kGreyCount + 1) + 127) / 255) - 1;
        const auto grey = static_cast<uint8_t>(kCubeSize + std::clamp(greyStep, 0, static_cast<int>(kGreyCount) - 1));

        return DistanceSquared(PaletteColor(grey), r, g, b) < DistanceSquared(PaletteColor(cube), r, g, b) ? grey : cube;
    }

    std::array<uint8_t, 3> GifWriter::PaletteColor(const uint8_t index) {
        if (index < kCubeSize) {
            const auto step = 255 / (kCubeLevels - 1);
            return {static_cast<uint8_t>(index / 36 * step),
                    static_cast<uint8_t>(index / 6 % 6 * step),
                    static_cast<uint8_t>(index % 6 * step)};
        }
        const auto grey = GreyValue(index - kCubeSize);
        return {grey, grey, grey};
    }

    Expected<void> GifWriter::addFrame(const std::span<const std::byte> rgba) {
        if (finished_) {
            return Fail(ErrorKind::RenderFailure, "animation already finished");
        }
        const size_t pixelCount = static_cast<size_t>(width_) * height_;
        if (rgba.size() != pixelCount * 4) {
            return Fail(ErrorKind::RenderFailure,
                        std::format("frame has {} bytes, expected {}", rgba.size(), pixelCount * 4));
        }

        std::vector<uint8_t> indices(pixelCount);
        for (size_t i = 0; i < pixelCount; ++i) {
            indices[i] = PaletteIndex(std::to_integer<uint8_t>(rgba[i * 4]),
                                      std::to_integer<uint8_t>(rgba[i * 4 + 1]),
                                      std::to_integer<uint8_t>(rgba[i * 4 + 2]));
        }

        // Graphic control extension: no disposal, no transparency
        writeByte_(0x21);
        writeByte_(0xF9);
        writeByte_(0x04);
        writeByte_(0x04);
        writeWord_(delay_);
        writeByte_(0x00);
        writeByte_(0x00);

        // Image descriptor covering the whole canvas, global palette
        writeByte_(0x2C);
        writeWord_(0);
        writeWord_(0);
        writeWord_(width_);
        writeWord_(height_);
        writeByte_(0x00);

        writeImageData_(indices);
        ++frameCount_;
        return {};
    }

    std::vector<std::byte> GifWriter::finish() {
        if (!finished_) {
            writeByte_(0x3B);
            finished_ = true;
        }
        return std::move(out_);
    }

    void GifWriter::writeHeader_() {
        constexpr auto kSignature = std::string_view{"GIF89a"};
        for (const auto c : kSignature) {
            writeByte_(static_cast<uint8_t>(c));
        }
        writeWord_(width_);
        writeWord_(height_);
        writeByte_(0xF7);  // global colour table, 8 bits per primary, 256 entries
        writeByte_(0x00);
        writeByte_(0x00);

        for (uint32_t index = 0; index < 256; ++index) {
            for (const auto component : PaletteColor(static_cast<uint8_t>(index))) {
                writeByte_(component);
            }
        }

        // NETSCAPE2.0 application extension: loop count, 0 loops forever
        constexpr auto kNetscape = std::string_view{"NETSCAPE2.0"};
        writeByte_(0x21);
        writeByte_(0xFF);
        writeByte_(static_cast<uint8_t>(kNetscape.size()));
        for (const auto c : kNetscape) {
            writeByte_(static_cast<uint8_t>(c));
        }
        writeByte_(0x03);
        writeByte_(0x01);
        writeWord_(loopCount_);
        writeByte_(0x00);
    }

    void GifWriter::writeWord_(const uint16_t value) {
        writeByte_(static_cast<uint8_t>(value & 0xFF));
        writeByte_(static_cast<uint8_t>(value >> 8));
    }

    void GifWriter::writeImageData_(const std::vector<uint8_t>& indices) {
        constexpr uint32_t clearCode = 1u << kMinCodeSize;
        constexpr uint32_t endCode = clearCode + 1;

        writeByte_(kMinCodeSize);
        CodePacker packer(out_);

        std::unordered_map<uint32_t, uint32_t> dictionary;
        uint32_t codeSize = kMinCodeSize + 1;
        uint32_t lastCode = endCode;
        packer.write(clearCode, codeSize);

        if (indices.empty()) {
            packer.write(endCode, codeSize);
            packer.flush();
            return;
        }

        uint32_t current = indices.front();
        for (size_t i = 1; i < indices.size(); ++i) {
            const uint32_t next = indices[i];
            const uint32_t key = current << 8 | next;
            if (const auto it = dictionary.find(key); it != dictionary.end()) {
                current = it->second;
                continue;
            }

            packer.write(current, codeSize);
            dictionary.emplace(key, ++lastCode);
            if (lastCode >= (1u << codeSize)) {
                ++codeSize;
            }
            if (lastCode == kMaxCode) {
                packer.write(clearCode, codeSize);
                dictionary.clear();
                codeSize = kMinCodeSize + 1;
                lastCode = endCode;
            }
            current = next;
        }

        packer.write(current, codeSize);
        packer.write(endCode, codeSize);
        packer.flush();
    }
} // namespace motionlib::thumb
