#include "fastpack/storage/storage_config.hpp"
#include "fastpack/core/config.hpp"
#include "fastpack/core/utils.hpp"

namespace fastpack::storage {

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig result;
    
    result.chunk_size = config.get_uint64("upload.chunk_size", result.chunk_size);
    result.max_parts = static_cast<uint32_t>(config.get_uint64("upload.max_parts", result.max_parts));
    
    result.part_size = config.get_uint64("repack.part_size", result.part_size);
    result.read_window = config.get_uint64("repack.read_window", result.read_window);
    result.compression_level = config.get_int("repack.compression_level", result.compression_level);
    result.max_pending_parts = static_cast<uint32_t>(
        config.get_uint64("repack.max_pending_parts", result.max_pending_parts));
    result.drain_timeout = std::chrono::milliseconds(
        config.get_uint64("repack.drain_timeout_ms", result.drain_timeout.count()));
    result.archive_name = config.get_string("repack.archive_name", result.archive_name);
    result.archive_extension = config.get_string("archive.extension", result.archive_extension);
    
    result.retry_max_attempts = static_cast<uint32_t>(
        config.get_uint64("retry.max_attempts", result.retry_max_attempts));
    result.retry_base_delay = std::chrono::milliseconds(
        config.get_uint64("retry.base_delay_ms", result.retry_base_delay.count()));
    result.retry_jitter = std::chrono::milliseconds(
        config.get_uint64("retry.jitter_ms", result.retry_jitter.count()));
    
    result.artifact_retention = std::chrono::hours(
        config.get_uint64("artifact.retention_hours", result.artifact_retention.count()));
    
    result.background_workers = static_cast<uint32_t>(
        config.get_uint64("workers.background", result.background_workers));
    result.part_workers = static_cast<uint32_t>(config.get_uint64("workers.parts", result.part_workers));
    
    result.storage_root = core::utils::FileUtils::expand_home(
        config.get_string("storage.root", result.storage_root.string()));
    result.metadata_path = core::utils::FileUtils::expand_home(
        config.get_string("metadata.path", result.metadata_path.string()));
    
    return result;
}

bool StorageConfig::validate() const {
    return validation_error().empty();
}

std::string StorageConfig::validation_error() const {
    if (chunk_size == 0) {
        return "upload.chunk_size must be at least 1 byte";
    }
    if (max_parts == 0) {
        return "upload.max_parts must be positive";
    }
    if (part_size == 0 || (!allow_small_parts && part_size < MIN_PART_SIZE)) {
        return "repack.part_size is below the multipart minimum";
    }
    if (read_window == 0 || read_window >= part_size) {
        return "repack.read_window must be non-zero and smaller than repack.part_size";
    }
    if (compression_level < 0 || compression_level > 9) {
        return "repack.compression_level must be in 0..9";
    }
    if (max_pending_parts == 0) {
        return "repack.max_pending_parts must be positive";
    }
    if (drain_timeout.count() <= 0) {
        return "repack.drain_timeout_ms must be positive";
    }
    if (archive_name.empty() || archive_extension.empty()) {
        return "archive name and extension must be set";
    }
    if (retry_max_attempts == 0) {
        return "retry.max_attempts must be at least 1";
    }
    if (background_workers == 0 || part_workers == 0) {
        return "worker counts must be positive";
    }
    return "";
}

bool StorageConfig::create_directories() const {
    if (!core::utils::FileUtils::create_directories(storage_root)) {
        return false;
    }
    
    auto db_dir = metadata_path.parent_path();
    if (!db_dir.empty()) {
        return core::utils::FileUtils::create_directories(db_dir);
    }
    return true;
}

} // namespace fastpack::storage
