#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_test_macros.hpp>

// Temporary data directory removed when the test case ends
class ScratchDirectory {
public:
    ScratchDirectory() {
        static std::atomic<int> counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                std::format("motionlib-test-{}-{}", std::chrono::steady_clock::now().time_since_epoch().count(),
                            counter++);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::vector<std::byte> ToBytes(const std::string_view text) {
    const auto* data = reinterpret_cast<const std::byte*>(text.data());
    return {data, data + text.size()};
}

inline void WriteFile(const std::filesystem::path& path, std::span<const std::byte> bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    REQUIRE(file);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void WriteFile(const std::filesystem::path& path, const std::string_view text) {
    WriteFile(path, ToBytes(text));
}

inline std::string ReadText(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

// Little-endian float64 .npy image of shape (frames, dimension), values = frame * 100 + column
// Version 1 .npy header padded to 64 bytes, without any array data
inline std::vector<std::byte> MakeNpyHeader(const std::string_view shape, const std::string_view descr = "<f8") {
    auto header = std::format("{{'descr': '{}', 'fortran_order': False, 'shape': {}, }}", descr, shape);
    while ((10 + header.size() + 1) % 64 != 0) {
        header.push_back(' ');
    }
    header.push_back('\n');

    std::vector<std::byte> bytes = ToBytes("\x93NUMPY");
    bytes.push_back(std::byte{1});
    bytes.push_back(std::byte{0});
    bytes.push_back(static_cast<std::byte>(header.size() & 0xFF));
    bytes.push_back(static_cast<std::byte>(header.size() >> 8));
    const auto headerBytes = ToBytes(header);
    bytes.insert(bytes.end(), headerBytes.begin(), headerBytes.end());
    return bytes;
}

inline std::vector<std::byte> MakeNpy(const size_t frames, const size_t dimension) {
    auto bytes = MakeNpyHeader(std::format("({}, {})", frames, dimension));
    for (size_t frame = 0; frame < frames; ++frame) {
        for (size_t column = 0; column < dimension; ++column) {
            const double value = static_cast<double>(frame * 100 + column);
            const auto* raw = reinterpret_cast<const std::byte*>(&value);
            bytes.insert(bytes.end(), raw, raw + sizeof(double));
        }
    }
    return bytes;
}
