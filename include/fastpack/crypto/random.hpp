#pragma once

#include <cstdint>
#include <string>

namespace fastpack::crypto {

class SecureRandom {
public:
    // Safe to call repeatedly and from several threads.
    static bool initialize();
    
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);
    
    // Lowercase alphanumeric identifier, e.g. "k3x9q0ab".
    static std::string generate_id(size_t length = 8);
};

} // namespace fastpack::crypto
