#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fastpack::core {
class Config;
}

namespace fastpack::storage {

constexpr uint64_t MIB = 1024ULL * 1024ULL;
constexpr uint64_t MIN_PART_SIZE = 5 * MIB;

struct StorageConfig {
    uint64_t chunk_size = 5 * MIB;
    uint32_t max_parts = 10000;
    
    uint64_t part_size = 50 * MIB;
    uint64_t read_window = 10 * MIB;
    int compression_level = 0;
    uint32_t max_pending_parts = 4;
    std::chrono::milliseconds drain_timeout{60000};
    std::string archive_name = "files.zip";
    std::string archive_extension = ".zip";
    
    uint32_t retry_max_attempts = 5;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_jitter{1000};
    
    std::chrono::hours artifact_retention{720};
    
    uint32_t background_workers = 2;
    uint32_t part_workers = 4;
    
    std::filesystem::path storage_root = "./fastpack_data";
    std::filesystem::path metadata_path = "./fastpack_data/fastpack.db";
    
    // Lifts the 5 MiB floor on part sizes; tests run with tiny parts.
    bool allow_small_parts = false;
    
    StorageConfig() = default;
    
    static StorageConfig from_config(const core::Config& config);
    
    bool validate() const;
    std::string validation_error() const;
    
    bool create_directories() const;
};

} // namespace fastpack::storage
