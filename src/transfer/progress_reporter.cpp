#include "fastpack/transfer/progress_reporter.hpp"
#include "fastpack/core/logger.hpp"

namespace fastpack::transfer {

ProgressReporter::ProgressReporter(std::shared_ptr<storage::MetadataStore> store, size_t shard_count)
    : store_(std::move(store)) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

void ProgressReporter::begin(const std::string& upload_id, uint32_t total_files) {
    ProgressEntry entry;
    entry.upload_id = upload_id;
    entry.status = storage::UploadStatus::REPACKAGING;
    entry.phase = "reading";
    entry.total_files = total_files;
    entry.started_at = std::chrono::steady_clock::now();
    entry.updated_at = entry.started_at;
    
    auto& shard = shard_for(upload_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.entries[upload_id] = std::move(entry);
}

void ProgressReporter::end(const std::string& upload_id) {
    auto& shard = shard_for(upload_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.entries.erase(upload_id);
}

bool ProgressReporter::update(const std::string& upload_id, const std::function<void(ProgressEntry&)>& mutate) {
    auto& shard = shard_for(upload_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(upload_id);
    if (it == shard.entries.end()) {
        return false;
    }
    mutate(it->second);
    it->second.updated_at = std::chrono::steady_clock::now();
    return true;
}

std::optional<ProgressEntry> ProgressReporter::get(const std::string& upload_id) const {
    auto& shard = shard_for(upload_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(upload_id);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ProgressReporter::file_started(const std::string& upload_id, const std::string& file_name, uint32_t file_index) {
    ProgressEntry snapshot;
    bool known = update(upload_id, [&](ProgressEntry& entry) {
        entry.phase = "reading";
        entry.current_file = file_name;
        entry.processed_files = file_index;
        snapshot = entry;
    });
    if (known) {
        record_milestone(storage::Milestone::FILE_STARTED, snapshot);
    }
}

void ProgressReporter::file_completed(const std::string& upload_id, const std::string& file_name, uint32_t file_index) {
    ProgressEntry snapshot;
    bool known = update(upload_id, [&](ProgressEntry& entry) {
        entry.current_file = file_name;
        entry.processed_files = file_index + 1;
        if (entry.total_files > 0) {
            entry.percent = static_cast<double>(entry.processed_files) / entry.total_files * READING_PROGRESS_SHARE;
        }
        snapshot = entry;
    });
    if (known) {
        record_milestone(storage::Milestone::FILE_COMPLETED, snapshot);
    }
}

void ProgressReporter::finalizing(const std::string& upload_id) {
    update(upload_id, [](ProgressEntry& entry) {
        entry.phase = "finalizing";
        entry.percent = FINALIZING_PROGRESS;
        entry.current_file.clear();
    });
}

void ProgressReporter::repackaging_completed(const std::string& upload_id) {
    ProgressEntry snapshot;
    bool known = update(upload_id, [&](ProgressEntry& entry) {
        entry.status = storage::UploadStatus::COMPLETED;
        entry.phase = "completed";
        entry.percent = 100.0;
        entry.current_file.clear();
        snapshot = entry;
    });
    if (known) {
        record_milestone(storage::Milestone::REPACKAGING_COMPLETED, snapshot);
    }
}

void ProgressReporter::failed(const std::string& upload_id, const std::string& reason) {
    ProgressEntry snapshot;
    bool known = update(upload_id, [&](ProgressEntry& entry) {
        entry.status = storage::UploadStatus::FAILED;
        entry.phase = "failed";
        entry.message = reason;
        snapshot = entry;
    });
    if (!known) {
        snapshot.upload_id = upload_id;
        snapshot.status = storage::UploadStatus::FAILED;
        snapshot.phase = "failed";
        snapshot.message = reason;
    }
    record_milestone(storage::Milestone::FAILED, snapshot);
}

core::Result ProgressReporter::load_snapshot(const std::string& upload_id, storage::ProgressSnapshot& snapshot) const {
    std::string raw;
    auto result = store_->get(storage::keys::progress(upload_id), raw);
    if (!result) {
        return result;
    }
    
    auto parsed = storage::ProgressSnapshot::deserialize(raw);
    if (!parsed) {
        return core::Result(core::ErrorCode::METADATA_ERROR, "Corrupt progress snapshot for " + upload_id);
    }
    snapshot = std::move(*parsed);
    return core::Result::ok();
}

size_t ProgressReporter::active_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

ProgressReporter::Shard& ProgressReporter::shard_for(const std::string& upload_id) const {
    auto index = std::hash<std::string>{}(upload_id) % shards_.size();
    return *shards_[index];
}

void ProgressReporter::record_milestone(storage::Milestone milestone, const ProgressEntry& entry) {
    storage::ProgressSnapshot snapshot;
    snapshot.milestone = milestone;
    snapshot.phase = entry.phase;
    snapshot.percent = entry.percent;
    snapshot.current_file = entry.current_file;
    snapshot.processed_files = entry.processed_files;
    snapshot.total_files = entry.total_files;
    snapshot.message = entry.message;
    snapshot.recorded_at = std::chrono::system_clock::now();
    
    auto result = store_->put(storage::keys::progress(entry.upload_id), snapshot.serialize());
    if (!result) {
        // Snapshots are advisory; the upload record stays authoritative.
        LOG_WARN("Could not persist {} snapshot for {}: {}", storage::milestone_name(milestone),
                 entry.upload_id, result.message);
        return;
    }
    ++snapshot_writes_;
}

} // namespace fastpack::transfer
