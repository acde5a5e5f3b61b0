#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace fastpack::crypto {

constexpr size_t CONTENT_HASH_SIZE = 32;
using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;

// BLAKE2b-256 (libsodium generichash).
class ContentHasher {
public:
    static ContentHash hash(std::span<const std::uint8_t> data);
};

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash);

// Tag the object stores return for an uploaded part.
std::string content_tag(std::span<const std::uint8_t> data);

} // namespace hash_utils

} // namespace fastpack::crypto
