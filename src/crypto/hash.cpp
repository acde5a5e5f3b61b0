#include "fastpack/crypto/hash.hpp"
#include "fastpack/crypto/random.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fastpack::crypto {

ContentHash ContentHasher::hash(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium initialization failed");
    }
    
    ContentHash result;
    if (crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0) != 0) {
        throw std::runtime_error("Failed to hash content");
    }
    return result;
}

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::string content_tag(std::span<const std::uint8_t> data) {
    return hash_to_hex(ContentHasher::hash(data));
}

} // namespace hash_utils

} // namespace fastpack::crypto
