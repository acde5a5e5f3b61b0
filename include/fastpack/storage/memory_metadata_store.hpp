#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "metadata_store.hpp"

namespace fastpack::storage {

class MemoryMetadataStore : public MetadataStore {
public:
    explicit MemoryMetadataStore(size_t shard_count = 16);
    ~MemoryMetadataStore() override = default;
    
    core::Result get(const std::string& key, std::string& value) override;
    core::Result put(const std::string& key, const std::string& value) override;
    core::Result remove(const std::string& key) override;
    core::Result insert_if_absent(const std::string& key, const std::string& value, bool& inserted) override;
    core::Result increment(const std::string& key, int64_t delta, int64_t& value) override;
    core::Result read_counter(const std::string& key, int64_t& value) override;
    core::Result remove_counter(const std::string& key) override;
    
    size_t size() const;
    bool contains(const std::string& key) const;
    
    // Total calls served; lets tests check how many store round-trips an operation costs.
    uint64_t operation_count() const { return operations_.load(); }
    uint64_t write_count() const { return writes_.load(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::string> values;
        std::unordered_map<std::string, int64_t> counters;
    };
    
    Shard& shard_for(const std::string& key) const;
    
    std::vector<std::unique_ptr<Shard>> shards_;
    mutable std::atomic<uint64_t> operations_{0};
    std::atomic<uint64_t> writes_{0};
};

} // namespace fastpack::storage
