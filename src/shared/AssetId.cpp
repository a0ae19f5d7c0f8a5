#include "AssetId.hpp"

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace motionlib {

namespace {
    constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
}

std::string AssetId(const std::string_view relativePath) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLength = 0;

    // EVP_Digest only fails on allocation failure inside OpenSSL
    if (EVP_Digest(relativePath.data(), relativePath.size(), digest.data(), &digestLength,
                   EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest computation failed");
    }

    std::string id;
    id.reserve(kAssetIdLength);
    for (unsigned int i = 0; i < digestLength && id.size() < kAssetIdLength; ++i) {
        id.push_back(kHexDigits[digest[i] >> 4]);
        id.push_back(kHexDigits[digest[i] & 0x0F]);
    }
    return id;
}

std::string CanonicalRelativePath(const std::filesystem::path& root, const std::filesystem::path& path) {
    const auto relative = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (relative.empty() || relative.is_absolute()) {
        return {};
    }
    if (const auto first = *relative.begin(); first == ".." || first == ".") {
        return {};
    }
    return relative.generic_string();
}

} // namespace motionlib
