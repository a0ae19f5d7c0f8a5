#include "FrameSampler.hpp"

#include <cmath>

namespace motionlib::thumb {
    std::vector<size_t> SampleFrameIndices(const size_t frameCount, const size_t sampleCount) {
        if (frameCount == 0 || sampleCount == 0) {
            return {};
        }
        if (sampleCount == 1) {
            return {0};
        }

        std::vector<size_t> indices;
        indices.reserve(sampleCount);
        const auto last = static_cast<double>(frameCount - 1);
        const auto step = last / static_cast<double>(sampleCount - 1);
        for (size_t i = 0; i < sampleCount; ++i) {
            const auto position = i + 1 == sampleCount ? last : step * static_cast<double>(i);
            indices.push_back(static_cast<size_t>(std::llround(position)));
        }
        return indices;
    }
} // namespace motionlib::thumb
