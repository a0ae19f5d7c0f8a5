#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "../shared/Error.hpp"

namespace motionlib {

const auto kDefaultPoseFields = std::vector<std::string>{"qpos_traj", "qpos"};

// Ordered pose vectors, frameCount x dimension, row-major
struct PoseSequence {
    size_t frameCount = 0;
    size_t dimension = 0;
    std::vector<double> values;

    [[nodiscard]] std::span<const double> frame(size_t index) const {
        return std::span<const double>(values).subspan(index * dimension, dimension);
    }
};

struct TrajectoryInfo {
    size_t frameCount = 0;
    size_t dimension = 0;
    std::string dtype;
    std::vector<std::string> arrays;  // member arrays of a multi-array container
    std::string poseField;
};

// Parses a single-array (.npy) image
Expected<PoseSequence> ParseNpy(std::span<const std::byte> bytes, std::string* dtype = nullptr);

// Reads trajectory files: .npy directly, .npz by extracting the first pose field present.
class TrajectoryReader {
public:
    explicit TrajectoryReader(std::vector<std::string> poseFields = kDefaultPoseFields);

    [[nodiscard]] Expected<PoseSequence> read(const std::filesystem::path& path) const;
    [[nodiscard]] Expected<PoseSequence> read(std::span<const std::byte> bytes, bool container) const;
    [[nodiscard]] Expected<TrajectoryInfo> inspect(const std::filesystem::path& path) const;

private:
    Expected<PoseSequence> readContainer_(std::span<const std::byte> bytes, TrajectoryInfo* info) const;

    std::vector<std::string> poseFields_;
};

} // namespace motionlib
