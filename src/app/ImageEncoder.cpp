#include "ImageEncoder.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <limits>
#include <memory>

#include <webp/encode.h>
#include <webp/mux.h>

#include "GifWriter.hpp"

namespace motionlib::thumb {
    namespace {
        struct PictureDeleter {
            void operator()(WebPPicture* picture) const { WebPPictureFree(picture); }
        };
        using PicturePtr = std::unique_ptr<WebPPicture, PictureDeleter>;

        struct AnimEncoderDeleter {
            void operator()(WebPAnimEncoder* encoder) const { WebPAnimEncoderDelete(encoder); }
        };
        using AnimEncoderPtr = std::unique_ptr<WebPAnimEncoder, AnimEncoderDeleter>;

        bool HasPixels(const RenderedImage& image) {
            constexpr auto maxDimension = static_cast<uint32_t>(WEBP_MAX_DIMENSION);
            return image.width > 0 && image.height > 0 &&
                image.width <= maxDimension && image.height <= maxDimension &&
                image.pixels.size() == static_cast<size_t>(image.width) * image.height * 4;
        }

        Expected<WebPConfig> LossyConfig() {
            WebPConfig config;
            if (!WebPConfigInit(&config)) {
                return Fail(ErrorKind::RenderFailure, "libwebp version mismatch");
            }
            config.quality = kWebpQuality;
            config.method = kWebpMethod;
            if (!WebPValidateConfig(&config)) {
                return Fail(ErrorKind::RenderFailure, "invalid WebP encoder configuration");
            }
            return config;
        }

        // Imports into caller-owned storage; the returned handle frees the pixel planes
        Expected<PicturePtr> ImportPicture(WebPPicture& storage, const RenderedImage& image) {
            if (!WebPPictureInit(&storage)) {
                return Fail(ErrorKind::RenderFailure, "libwebp version mismatch");
            }
            storage.use_argb = 1;
            storage.width = static_cast<int>(image.width);
            storage.height = static_cast<int>(image.height);
            PicturePtr picture(&storage);
            if (!WebPPictureImportRGBA(picture.get(), reinterpret_cast<const uint8_t*>(image.pixels.data()),
                                       static_cast<int>(image.width * 4))) {
                return Fail(ErrorKind::RenderFailure,
                            std::format("cannot import a {}x{} frame", image.width, image.height));
            }
            return picture;
        }

        std::vector<std::byte> CopyBytes(const uint8_t* data, const size_t size) {
            std::vector<std::byte> bytes(size);
            std::memcpy(bytes.data(), data, size);
            return bytes;
        }

        Expected<std::vector<std::byte>> EncodeWebpAnimation(const std::span<const RenderedImage> frames) {
            const auto config = LossyConfig();
            if (!config) {
                return std::unexpected(config.error());
            }

            WebPAnimEncoderOptions options;
            if (!WebPAnimEncoderOptionsInit(&options)) {
                return Fail(ErrorKind::RenderFailure, "libwebp version mismatch");
            }
            options.anim_params.loop_count = 0;

            const auto& first = frames.front();
            AnimEncoderPtr encoder(WebPAnimEncoderNew(static_cast<int>(first.width), static_cast<int>(first.height),
                                                      &options));
            if (!encoder) {
                return Fail(ErrorKind::RenderFailure, "cannot create the WebP animation encoder");
            }

            int timestamp = 0;
            for (const auto& frame : frames) {
                WebPPicture storage;
                auto picture = ImportPicture(storage, frame);
                if (!picture) {
                    return std::unexpected(picture.error());
                }
                if (!WebPAnimEncoderAdd(encoder.get(), picture->get(), timestamp, &*config)) {
                    return Fail(ErrorKind::RenderFailure,
                                std::format("cannot add animation frame: {}", WebPAnimEncoderGetError(encoder.get())));
                }
                timestamp += static_cast<int>(kFrameDurationMs);
            }
            // A final null frame fixes the duration of the last real one
            if (!WebPAnimEncoderAdd(encoder.get(), nullptr, timestamp, nullptr)) {
                return Fail(ErrorKind::RenderFailure,
                            std::format("cannot close the animation: {}", WebPAnimEncoderGetError(encoder.get())));
            }

            WebPData assembled;
            WebPDataInit(&assembled);
            if (!WebPAnimEncoderAssemble(encoder.get(), &assembled)) {
                return Fail(ErrorKind::RenderFailure,
                            std::format("cannot assemble the animation: {}", WebPAnimEncoderGetError(encoder.get())));
            }
            auto bytes = CopyBytes(assembled.bytes, assembled.size);
            WebPDataClear(&assembled);
            return bytes;
        }

        Expected<std::vector<std::byte>> EncodeGifAnimation(const std::span<const RenderedImage> frames) {
            const auto& first = frames.front();
            if (first.width > std::numeric_limits<uint16_t>::max() || first.height > std::numeric_limits<uint16_t>::max()) {
                return Fail(ErrorKind::RenderFailure,
                            std::format("unsupported animation size {}x{}", first.width, first.height));
            }

            // GIF delays are expressed in hundredths of a second
            GifWriter writer(static_cast<uint16_t>(first.width), static_cast<uint16_t>(first.height),
                             static_cast<uint16_t>(kFrameDurationMs / 10u));
            for (const auto& frame : frames) {
                if (auto added = writer.addFrame(frame.pixels); !added) {
                    return std::unexpected(added.error());
                }
            }
            return writer.finish();
        }
    }

    Expected<std::vector<std::byte>> EncodeStill(const RenderedImage& image) {
        if (!HasPixels(image)) {
            return Fail(ErrorKind::RenderFailure, "cannot encode an empty or truncated image");
        }
        const auto config = LossyConfig();
        if (!config) {
            return std::unexpected(config.error());
        }

        WebPPicture storage;
        auto picture = ImportPicture(storage, image);
        if (!picture) {
            return std::unexpected(picture.error());
        }

        WebPMemoryWriter output;
        WebPMemoryWriterInit(&output);
        (*picture)->writer = WebPMemoryWrite;
        (*picture)->custom_ptr = &output;
        if (!WebPEncode(&*config, picture->get())) {
            const auto code = static_cast<int>((*picture)->error_code);
            WebPMemoryWriterClear(&output);
            return Fail(ErrorKind::RenderFailure, std::format("WebP encoding failed with error {}", code));
        }

        auto bytes = CopyBytes(output.mem, output.size);
        WebPMemoryWriterClear(&output);
        return bytes;
    }

    Expected<std::vector<std::byte>> EncodeAnimation(const std::span<const RenderedImage> frames,
                                                     const AnimationFormat format) {
        if (frames.empty()) {
            return Fail(ErrorKind::RenderFailure, "animation has no frames");
        }
        const auto& first = frames.front();
        for (const auto& frame : frames) {
            if (!HasPixels(frame)) {
                return Fail(ErrorKind::RenderFailure, "cannot encode an empty or truncated frame");
            }
            if (frame.width != first.width || frame.height != first.height) {
                return Fail(ErrorKind::RenderFailure, std::format("frame size {}x{} differs from {}x{}",
                                                                  frame.width, frame.height, first.width, first.height));
            }
        }

        return format == AnimationFormat::Gif ? EncodeGifAnimation(frames) : EncodeWebpAnimation(frames);
    }
} // namespace motionlib::thumb
