#pragma once

#include <cstdint>
#include <string>

#include "../core/result.hpp"

namespace fastpack::storage {

// Independent-key store shared across instances. No multi-key transactions;
// plain writes are last-write-wins. The two conditional primitives act on a
// single key only.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;
    
    // NOT_FOUND when the key is absent.
    virtual core::Result get(const std::string& key, std::string& value) = 0;
    virtual core::Result put(const std::string& key, const std::string& value) = 0;
    virtual core::Result remove(const std::string& key) = 0;
    
    virtual core::Result insert_if_absent(const std::string& key, const std::string& value, bool& inserted) = 0;
    
    // Counters live in their own namespace; an absent counter reads as zero.
    virtual core::Result increment(const std::string& key, int64_t delta, int64_t& value) = 0;
    virtual core::Result read_counter(const std::string& key, int64_t& value) = 0;
    virtual core::Result remove_counter(const std::string& key) = 0;
};

} // namespace fastpack::storage
