#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../core/result.hpp"
#include "../storage/chunk_ledger.hpp"
#include "../storage/metadata_store.hpp"
#include "../storage/object_store.hpp"
#include "../storage/records.hpp"
#include "../storage/storage_config.hpp"
#include "retry_executor.hpp"

namespace fastpack::transfer {

struct SessionContext {
    std::shared_ptr<storage::MetadataStore> metadata;
    std::shared_ptr<storage::ObjectStore> objects;
    std::shared_ptr<RetryExecutor> retry;
    storage::StorageConfig config;
};

// One logical upload's lifecycle. Status changes are persisted immediately;
// the record is written only by whoever currently drives the upload forward.
class UploadSession {
public:
    UploadSession(storage::LogicalUpload upload, const SessionContext& context);
    
    static core::Result load(const std::string& upload_id, const SessionContext& context,
                             std::unique_ptr<UploadSession>& session);
    
    const storage::LogicalUpload& upload() const { return upload_; }
    storage::UploadStatus status() const { return upload_.status; }
    
    core::Result save();
    core::Result transition_to(storage::UploadStatus next);
    core::Result fail(const std::string& reason);
    
    // INCOMPLETE_UPLOAD, listing what is missing, unless every declared chunk is recorded.
    core::Result verify_complete(std::vector<storage::MissingChunk>& missing);
    
    // Completes the file's source multipart upload with its chunk records in
    // part-number order.
    core::Result finalize_file(const storage::FileUpload& file);
    core::Result finalize_files();
    
    // Exactly one file, already carrying the archive extension.
    bool qualifies_for_fast_path() const;
    core::Result promote_single_archive(const std::string& artifact_id, storage::Artifact& artifact);
    
    storage::Artifact make_artifact(const std::string& artifact_id, const std::string& name, uint64_t size) const;
    core::Result attach_artifact(const storage::Artifact& artifact);
    
    // Client cancel: aborts every source multipart upload.
    core::Result abort_sources();

private:
    storage::LogicalUpload upload_;
    SessionContext context_;
    storage::ChunkLedger ledger_;
};

} // namespace fastpack::transfer
