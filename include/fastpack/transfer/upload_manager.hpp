#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "../core/result.hpp"
#include "../storage/chunk_ledger.hpp"
#include "../storage/metadata_store.hpp"
#include "../storage/object_store.hpp"
#include "../storage/records.hpp"
#include "../storage/storage_config.hpp"
#include "progress_reporter.hpp"
#include "repackager.hpp"
#include "retry_executor.hpp"
#include "upload_session.hpp"

namespace fastpack::transfer {

struct FileDeclaration {
    std::string name;
    uint64_t size = 0;
};

struct UploadRequest {
    std::vector<FileDeclaration> files;
    std::string password_hash;
};

struct ChunkSpan {
    uint32_t index = 0;
    uint32_t part_number = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct FilePlan {
    std::string name;
    uint64_t size = 0;
    storage::MultipartHandle multipart;
    uint32_t total_chunks = 0;
    std::vector<ChunkSpan> chunks;
};

struct ChunkPlan {
    std::string upload_id;
    uint64_t chunk_size = 0;
    bool single_archive = false;
    uint64_t total_chunks = 0;
    std::vector<FilePlan> files;
};

struct ChunkConfirmation {
    std::string upload_id;
    std::string file_name;
    uint32_t index = 0;
    uint32_t part_number = 0;
    std::string content_tag;
};

struct ChunkProgress {
    int64_t uploaded = 0;
    uint64_t total = 0;
    bool is_new = false;
    double percent = 0.0;
};

struct FinalizeOutcome {
    storage::UploadStatus status = storage::UploadStatus::COLLECTING;
    std::string artifact_id;
};

struct StatusReport {
    storage::UploadStatus status = storage::UploadStatus::COLLECTING;
    double percent = 0.0;
    std::string phase;
    std::string current_file;
    std::string artifact_id;
    std::string failure_reason;
    int64_t uploaded_chunks = 0;
    uint64_t total_chunks = 0;
};

// Entry point for callers: chunk planning, confirmations, finalize, status,
// artifact lookup. Repackaging runs detached on the background workers and
// reports only through query_status().
class UploadManager {
public:
    UploadManager(std::shared_ptr<storage::ObjectStore> objects,
                  std::shared_ptr<storage::MetadataStore> metadata,
                  const storage::StorageConfig& config);
    ~UploadManager();
    
    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;
    
    core::Result begin_logical_upload(const UploadRequest& request, ChunkPlan& plan);
    core::Result confirm_chunk(const ChunkConfirmation& confirmation, ChunkProgress& progress);
    core::Result missing_chunks(const std::string& upload_id, std::vector<storage::MissingChunk>& missing);
    core::Result finalize_upload(const std::string& upload_id, FinalizeOutcome& outcome);
    core::Result query_status(const std::string& upload_id, StatusReport& report);
    core::Result resolve_artifact(const std::string& artifact_id, storage::Artifact& artifact);
    core::Result abort_upload(const std::string& upload_id);
    
    // True once no finalize or repackaging job is running in this process.
    bool wait_idle(std::chrono::milliseconds timeout);
    void shutdown();
    
    RetryExecutor& retry_executor() { return *retry_; }
    ProgressReporter& progress() { return *progress_; }
    const storage::StorageConfig& config() const { return config_; }

private:
    static constexpr int ID_RESERVATION_ATTEMPTS = 8;
    
    SessionContext session_context() const;
    core::Result validate_request(const UploadRequest& request) const;
    core::Result allocate_artifact_id(std::string& artifact_id);
    
    bool claim(const std::string& upload_id);
    void release(const std::string& upload_id);
    
    core::Result finalize_claimed(UploadSession& session, FinalizeOutcome& outcome);
    void run_repackaging(storage::LogicalUpload upload);
    core::Result repackage_upload(UploadSession& session);
    void purge_ledger(const storage::LogicalUpload& upload);
    
    storage::StorageConfig config_;
    std::shared_ptr<storage::ObjectStore> objects_;
    std::shared_ptr<storage::MetadataStore> metadata_;
    std::shared_ptr<RetryExecutor> retry_;
    std::unique_ptr<storage::ChunkLedger> ledger_;
    std::unique_ptr<ProgressReporter> progress_;
    
    boost::asio::thread_pool part_workers_;
    boost::asio::thread_pool background_workers_;
    std::unique_ptr<Repackager> repackager_;
    
    mutable std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::unordered_set<std::string> active_jobs_;
    std::atomic<bool> shut_down_{false};
};

} // namespace fastpack::transfer
