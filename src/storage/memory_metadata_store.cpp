#include "fastpack/storage/memory_metadata_store.hpp"
#include <functional>

namespace fastpack::storage {

MemoryMetadataStore::MemoryMetadataStore(size_t shard_count) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

core::Result MemoryMetadataStore::get(const std::string& key, std::string& value) {
    ++operations_;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.values.find(key);
    if (it == shard.values.end()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Key not found: " + key);
    }
    value = it->second;
    return core::Result::ok();
}

core::Result MemoryMetadataStore::put(const std::string& key, const std::string& value) {
    ++operations_;
    ++writes_;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.values[key] = value;
    return core::Result::ok();
}

core::Result MemoryMetadataStore::remove(const std::string& key) {
    ++operations_;
    ++writes_;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.values.erase(key);
    return core::Result::ok();
}

core::Result MemoryMetadataStore::insert_if_absent(const std::string& key, const std::string& value, bool& inserted) {
    ++operations_;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    inserted = shard.values.emplace(key, value).second;
    if (inserted) {
        ++writes_;
    }
    return core::Result::ok();
}

core::Result MemoryMetadataStore::increment(const std::string& key, int64_t delta, int64_t& value) {
    ++operations_;
    ++writes_;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    value = (shard.counters[key] += delta);
    return core::Result::ok();
}

core::Result MemoryMetadataStore::read_counter(const std::string& key, int64_t& value) {
    ++operations_;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.counters.find(key);
    value = it != shard.counters.end() ? it->second : 0;
    return core::Result::ok();
}

core::Result MemoryMetadataStore::remove_counter(const std::string& key) {
    ++operations_;
    ++writes_;
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.counters.erase(key);
    return core::Result::ok();
}

size_t MemoryMetadataStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->values.size();
    }
    return total;
}

bool MemoryMetadataStore::contains(const std::string& key) const {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.values.find(key) != shard.values.end();
}

MemoryMetadataStore::Shard& MemoryMetadataStore::shard_for(const std::string& key) const {
    auto index = std::hash<std::string>{}(key) % shards_.size();
    return *shards_[index];
}

} // namespace fastpack::storage
