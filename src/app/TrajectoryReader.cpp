#include "TrajectoryReader.hpp"

#include <algorithm>
#include <bit>
#include <charconv>
#include <cstring>
#include <format>
#include <string_view>

#include <spdlog/spdlog.h>

#include "Utils.hpp"
#include "ZipArchive.hpp"

namespace motionlib {

namespace {
    constexpr auto kNpyMagic = std::string_view{"\x93NUMPY", 6};
    constexpr auto kNpyExtension = std::string_view{".npy"};

    struct NpyHeader {
        char byteOrder = '<';
        char kind = 'f';
        size_t itemSize = 8;
        bool fortranOrder = false;
        std::vector<size_t> shape;
        std::string descr;
    };

    // Value of `key` in the header dictionary, up to the next top-level comma
    std::string_view DictValue(std::string_view header, std::string_view key) {
        const auto quoted = std::format("'{}'", key);
        auto position = header.find(quoted);
        if (position == std::string_view::npos) {
            return {};
        }
        position = header.find(':', position + quoted.size());
        if (position == std::string_view::npos) {
            return {};
        }
        auto value = header.substr(position + 1);
        value.remove_prefix(std::min(value.find_first_not_of(' '), value.size()));
        if (!value.empty() && value.front() == '(') {
            return value.substr(0, value.find(')') + 1);
        }
        return value.substr(0, value.find_first_of(",}"));
    }

    Expected<NpyHeader> ParseHeader(std::string_view text) {
        NpyHeader header;

        auto descr = DictValue(text, "descr");
        if (descr.size() < 4 || (descr.front() != '\'' && descr.front() != '"')) {
            return Fail(ErrorKind::InvalidInput, "array header has no dtype description");
        }
        descr = descr.substr(1, descr.size() - 2);
        header.descr = std::string(descr);
        header.byteOrder = descr[0];
        header.kind = descr[1];
        if (std::from_chars(descr.data() + 2, descr.data() + descr.size(), header.itemSize).ec != std::errc{}) {
            return Fail(ErrorKind::InvalidInput, std::format("unsupported dtype '{}'", descr));
        }

        header.fortranOrder = DictValue(text, "fortran_order").starts_with("True");

        auto shape = DictValue(text, "shape");
        if (shape.size() < 2 || shape.front() != '(') {
            return Fail(ErrorKind::InvalidInput, "array header has no shape");
        }
        shape = shape.substr(1, shape.size() - 2);
        while (!shape.empty()) {
            shape.remove_prefix(std::min(shape.find_first_not_of(", "), shape.size()));
            if (shape.empty()) break;
            size_t dimension = 0;
            const auto [end, ec] = std::from_chars(shape.data(), shape.data() + shape.size(), dimension);
            if (ec != std::errc{}) {
                return Fail(ErrorKind::InvalidInput, "malformed array shape");
            }
            header.shape.push_back(dimension);
            shape.remove_prefix(static_cast<size_t>(end - shape.data()));
        }
        return header;
    }

    template<typename T>
    double LoadValue(const std::byte* source) {
        T value;
        std::memcpy(&value, source, sizeof(T));
        return static_cast<double>(value);
    }

    Expected<double (*)(const std::byte*)> ValueLoader(const NpyHeader& header) {
        const bool littleEndian = header.byteOrder == '<' || header.byteOrder == '|' ||
            (header.byteOrder == '=' && std::endian::native == std::endian::little);
        if (!littleEndian || std::endian::native != std::endian::little) {
            return Fail(ErrorKind::InvalidInput, std::format("big-endian dtype '{}' is not supported", header.descr));
        }
        if (header.kind == 'f' && header.itemSize == 4) return &LoadValue<float>;
        if (header.kind == 'f' && header.itemSize == 8) return &LoadValue<double>;
        if (header.kind == 'i' && header.itemSize == 4) return &LoadValue<int32_t>;
        if (header.kind == 'i' && header.itemSize == 8) return &LoadValue<int64_t>;
        return Fail(ErrorKind::InvalidInput, std::format("unsupported dtype '{}'", header.descr));
    }
}

Expected<PoseSequence> ParseNpy(const std::span<const std::byte> bytes, std::string* dtype) {
    if (bytes.size() < 10 || std::memcmp(bytes.data(), kNpyMagic.data(), kNpyMagic.size()) != 0) {
        return Fail(ErrorKind::InvalidInput, "not a .npy array (bad magic)");
    }

    const auto major = std::to_integer<uint8_t>(bytes[6]);
    size_t headerLength = 0;
    size_t headerOffset = 0;
    if (major == 1) {
        headerLength = std::to_integer<size_t>(bytes[8]) | std::to_integer<size_t>(bytes[9]) << 8;
        headerOffset = 10;
    }
    else if ((major == 2 || major == 3) && bytes.size() >= 12) {
        headerLength = std::to_integer<size_t>(bytes[8]) | std::to_integer<size_t>(bytes[9]) << 8 |
            std::to_integer<size_t>(bytes[10]) << 16 | std::to_integer<size_t>(bytes[11]) << 24;
        headerOffset = 12;
    }
    else {
        return Fail(ErrorKind::InvalidInput, std::format("unsupported .npy format version {}", major));
    }
    if (headerOffset + headerLength > bytes.size()) {
        return Fail(ErrorKind::InvalidInput, "truncated .npy header");
    }

    const auto header = ParseHeader(
        std::string_view(reinterpret_cast<const char*>(bytes.data() + headerOffset), headerLength));
    if (!header) {
        return std::unexpected(header.error());
    }
    const auto load = ValueLoader(*header);
    if (!load) {
        return std::unexpected(load.error());
    }
    if (dtype) {
        *dtype = header->descr;
    }

    PoseSequence sequence;
    if (header->shape.size() == 1) {
        sequence.frameCount = header->shape[0];
        sequence.dimension = 1;
    }
    else if (header->shape.size() == 2) {
        sequence.frameCount = header->shape[0];
        sequence.dimension = header->shape[1];
    }
    else {
        return Fail(ErrorKind::InvalidInput,
                    std::format("pose arrays must be 1-D or 2-D, got {} dimensions", header->shape.size()));
    }

    // Compared by division so a forged shape cannot wrap the element count
    const size_t dataOffset = headerOffset + headerLength;
    const size_t available = (bytes.size() - dataOffset) / header->itemSize;
    if (sequence.dimension != 0 && sequence.frameCount > available / sequence.dimension) {
        return Fail(ErrorKind::InvalidInput,
                    std::format("array data truncated: shape ({}, {}) needs more than the {} values present",
                                sequence.frameCount, sequence.dimension, available));
    }
    const size_t count = sequence.frameCount * sequence.dimension;

    sequence.values.resize(count);
    const auto* data = bytes.data() + dataOffset;
    for (size_t row = 0; row < sequence.frameCount; ++row) {
        for (size_t column = 0; column < sequence.dimension; ++column) {
            const size_t source = header->fortranOrder ? column * sequence.frameCount + row
                                                       : row * sequence.dimension + column;
            sequence.values[row * sequence.dimension + column] = (*load)(data + source * header->itemSize);
        }
    }
    return sequence;
}

TrajectoryReader::TrajectoryReader(std::vector<std::string> poseFields) : poseFields_(std::move(poseFields)) {}

Expected<PoseSequence> TrajectoryReader::read(const std::filesystem::path& path) const {
    const auto bytes = ReadFileBytes(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return read(*bytes, path.extension() == ".npz");
}

Expected<PoseSequence> TrajectoryReader::read(const std::span<const std::byte> bytes, const bool container) const {
    if (container) {
        return readContainer_(bytes, nullptr);
    }
    return ParseNpy(bytes);
}

Expected<TrajectoryInfo> TrajectoryReader::inspect(const std::filesystem::path& path) const {
    const auto bytes = ReadFileBytes(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    TrajectoryInfo info;
    Expected<PoseSequence> sequence = path.extension() == ".npz"
        ? readContainer_(*bytes, &info)
        : ParseNpy(*bytes, &info.dtype);
    if (!sequence) {
        return std::unexpected(sequence.error());
    }
    info.frameCount = sequence->frameCount;
    info.dimension = sequence->dimension;
    return info;
}

Expected<PoseSequence> TrajectoryReader::readContainer_(const std::span<const std::byte> bytes,
                                                        TrajectoryInfo* info) const {
    const auto archive = ZipArchive::Open(bytes);
    if (!archive) {
        return std::unexpected(archive.error());
    }

    std::vector<std::string> arrays;
    for (const auto& entry : archive->entries()) {
        std::string_view name = entry.name;
        if (name.ends_with(kNpyExtension)) {
            name.remove_suffix(kNpyExtension.size());
        }
        arrays.emplace_back(name);
    }
    if (info) {
        info->arrays = arrays;
    }

    for (const auto& field : poseFields_) {
        const auto* entry = archive->find(field + std::string(kNpyExtension));
        if (!entry) {
            continue;
        }
        const auto member = archive->extract(*entry);
        if (!member) {
            return std::unexpected(member.error());
        }
        spdlog::debug("Reading pose field '{}' ({} bytes)", field, member->size());
        if (info) {
            info->poseField = field;
        }
        return ParseNpy(*member, info ? &info->dtype : nullptr);
    }

    const auto join = [](const std::vector<std::string>& names) {
        std::string joined;
        for (const auto& name : names) {
            joined += joined.empty() ? name : ", " + name;
        }
        return joined.empty() ? std::string("nothing") : joined;
    };
    return Fail(ErrorKind::InvalidInput, std::format("no pose field found (looked for {}; container holds {})",
                                                     join(poseFields_), join(arrays)));
}

} // namespace motionlib
