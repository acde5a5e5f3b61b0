#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/result.hpp"
#include "../storage/metadata_store.hpp"
#include "../storage/records.hpp"

namespace fastpack::transfer {

constexpr double READING_PROGRESS_SHARE = 80.0;
constexpr double FINALIZING_PROGRESS = 90.0;

struct ProgressEntry {
    std::string upload_id;
    storage::UploadStatus status = storage::UploadStatus::REPACKAGING;
    std::string phase;
    double percent = 0.0;
    std::string current_file;
    uint32_t processed_files = 0;
    uint32_t total_files = 0;
    std::string message;
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point updated_at;
};

// Per-upload ephemeral progress, sharded so that unrelated uploads never
// contend on one lock. Milestones are mirrored to the metadata store.
class ProgressReporter {
public:
    explicit ProgressReporter(std::shared_ptr<storage::MetadataStore> store, size_t shard_count = 16);
    
    void begin(const std::string& upload_id, uint32_t total_files);
    void end(const std::string& upload_id);
    
    // Applies `mutate` atomically to the upload's entry; no-op when absent.
    bool update(const std::string& upload_id, const std::function<void(ProgressEntry&)>& mutate);
    std::optional<ProgressEntry> get(const std::string& upload_id) const;
    
    void file_started(const std::string& upload_id, const std::string& file_name, uint32_t file_index);
    void file_completed(const std::string& upload_id, const std::string& file_name, uint32_t file_index);
    void finalizing(const std::string& upload_id);
    void repackaging_completed(const std::string& upload_id);
    void failed(const std::string& upload_id, const std::string& reason);
    
    core::Result load_snapshot(const std::string& upload_id, storage::ProgressSnapshot& snapshot) const;
    
    size_t active_count() const;
    uint64_t snapshot_writes() const { return snapshot_writes_.load(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, ProgressEntry> entries;
    };
    
    Shard& shard_for(const std::string& upload_id) const;
    void record_milestone(storage::Milestone milestone, const ProgressEntry& entry);
    
    std::shared_ptr<storage::MetadataStore> store_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> snapshot_writes_{0};
};

} // namespace fastpack::transfer
