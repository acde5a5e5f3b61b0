#include "fastpack/crypto/random.hpp"
#include "fastpack/core/logger.hpp"
#include <sodium.h>
#include <mutex>
#include <stdexcept>

namespace fastpack::crypto {

namespace {
    constexpr char ID_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    constexpr std::uint32_t ID_ALPHABET_SIZE = sizeof(ID_ALPHABET) - 1;
    
    std::once_flag sodium_once;
    bool sodium_ready = false;
}

bool SecureRandom::initialize() {
    std::call_once(sodium_once, [] {
        if (sodium_init() < 0) {
            LOG_ERROR("Failed to initialize libsodium");
            return;
        }
        sodium_ready = true;
        LOG_DEBUG("libsodium initialized");
    });
    return sodium_ready;
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_id(size_t length) {
    std::string id;
    id.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        id.push_back(ID_ALPHABET[generate_uniform(ID_ALPHABET_SIZE)]);
    }
    return id;
}

} // namespace fastpack::crypto
