#pragma once

#include <cstddef>
#include <vector>

namespace motionlib::thumb {
    constexpr auto kTrajectoryFrames = 30uz;

    // Evenly spaced frame indices over [0, frameCount - 1]; the first is always 0 and the
    // last frameCount - 1. Short trajectories repeat indices to fill sampleCount.
    std::vector<size_t> SampleFrameIndices(size_t frameCount, size_t sampleCount = kTrajectoryFrames);
} // namespace motionlib::thumb
