#include "fastpack/transfer/upload_session.hpp"
#include "fastpack/core/logger.hpp"
#include "fastpack/core/utils.hpp"

namespace fastpack::transfer {

namespace {
    constexpr size_t MISSING_PREVIEW = 10;
    
    std::string describe_missing(const std::vector<storage::MissingChunk>& missing) {
        std::string text = std::to_string(missing.size()) + " chunk(s) not recorded:";
        for (size_t i = 0; i < missing.size() && i < MISSING_PREVIEW; ++i) {
            text += " " + missing[i].file_name + "#" + std::to_string(missing[i].index);
        }
        if (missing.size() > MISSING_PREVIEW) {
            text += " ...";
        }
        return text;
    }
}

UploadSession::UploadSession(storage::LogicalUpload upload, const SessionContext& context)
    : upload_(std::move(upload))
    , context_(context)
    , ledger_(context.metadata) {
}

core::Result UploadSession::load(const std::string& upload_id, const SessionContext& context,
                                 std::unique_ptr<UploadSession>& session) {
    std::string raw;
    auto result = context.metadata->get(storage::keys::upload(upload_id), raw);
    if (result.error == core::ErrorCode::NOT_FOUND) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Unknown upload: " + upload_id);
    }
    if (!result) {
        return result;
    }
    
    auto upload = storage::LogicalUpload::deserialize(raw);
    if (!upload) {
        return core::Result(core::ErrorCode::METADATA_ERROR, "Corrupt upload record: " + upload_id);
    }
    
    session = std::make_unique<UploadSession>(std::move(*upload), context);
    return core::Result::ok();
}

core::Result UploadSession::save() {
    upload_.updated_at = std::chrono::system_clock::now();
    return context_.metadata->put(storage::keys::upload(upload_.upload_id), upload_.serialize());
}

core::Result UploadSession::transition_to(storage::UploadStatus next) {
    if (!storage::can_transition(upload_.status, next)) {
        return core::Result(core::ErrorCode::INVALID_STATE,
            std::string("Upload ") + upload_.upload_id + " cannot move from " +
            storage::upload_status_name(upload_.status) + " to " + storage::upload_status_name(next));
    }
    
    auto previous = upload_.status;
    upload_.status = next;
    auto result = save();
    if (!result) {
        upload_.status = previous;
        return result;
    }
    
    LOG_INFO("Upload {}: {} -> {}", upload_.upload_id, storage::upload_status_name(previous),
             storage::upload_status_name(next));
    return core::Result::ok();
}

core::Result UploadSession::fail(const std::string& reason) {
    if (storage::is_terminal(upload_.status)) {
        return core::Result(core::ErrorCode::INVALID_STATE,
            "Upload " + upload_.upload_id + " already " + storage::upload_status_name(upload_.status));
    }
    
    upload_.failure_reason = reason;
    LOG_ERROR("Upload {} failed: {}", upload_.upload_id, reason);
    return transition_to(storage::UploadStatus::FAILED);
}

core::Result UploadSession::verify_complete(std::vector<storage::MissingChunk>& missing) {
    auto result = ledger_.find_missing(upload_, missing);
    if (!result) {
        return result;
    }
    
    if (!missing.empty()) {
        return core::Result(core::ErrorCode::INCOMPLETE_UPLOAD, describe_missing(missing));
    }
    
    auto reconciled = ledger_.reconcile(upload_.upload_id, static_cast<int64_t>(upload_.total_chunks()));
    if (!reconciled) {
        LOG_WARN("Counter reconciliation for {} failed: {}", upload_.upload_id, reconciled.message);
    }
    return core::Result::ok();
}

core::Result UploadSession::finalize_file(const storage::FileUpload& file) {
    std::vector<storage::ChunkRecord> records;
    std::vector<storage::MissingChunk> missing;
    auto result = ledger_.collect_file(upload_.upload_id, file, records, missing);
    if (!result) {
        return result;
    }
    if (!missing.empty()) {
        return core::Result(core::ErrorCode::INCOMPLETE_UPLOAD, describe_missing(missing));
    }
    
    std::vector<storage::CompletedPart> parts;
    parts.reserve(records.size());
    for (const auto& record : records) {
        if (record.part_number != record.index + 1) {
            return core::Result(core::ErrorCode::METADATA_ERROR,
                "Chunk " + std::to_string(record.index) + " of " + file.name + " carries part number " +
                std::to_string(record.part_number));
        }
        parts.push_back(storage::CompletedPart{record.part_number, record.content_tag,
                                               file.chunk_length(record.index, upload_.chunk_size)});
    }
    
    auto error = context_.retry->execute("complete source upload " + file.source_key(), [&] {
        return context_.objects->complete_multipart_upload(file.multipart, parts);
    });
    
    if (error.kind == storage::StorageErrorKind::NOT_FOUND) {
        // A previous finalize may have completed this file before being interrupted.
        uint64_t size = 0;
        auto head = context_.objects->head(file.source_key(), size);
        if (head.ok() && size == file.declared_size) {
            LOG_INFO("Source {} already assembled", file.source_key());
            return core::Result::ok();
        }
    }
    if (!error.ok()) {
        return to_result(error, "Cannot complete source upload for " + file.name);
    }
    
    LOG_INFO("Finalized {} of upload {} ({} parts)", file.name, upload_.upload_id, parts.size());
    return core::Result::ok();
}

core::Result UploadSession::finalize_files() {
    for (const auto& file : upload_.files) {
        auto result = finalize_file(file);
        if (!result) {
            return result;
        }
    }
    return core::Result::ok();
}

bool UploadSession::qualifies_for_fast_path() const {
    return upload_.files.size() == 1 &&
           core::utils::StringUtils::ends_with_ignore_case(upload_.files.front().name,
                                                           context_.config.archive_extension);
}

core::Result UploadSession::promote_single_archive(const std::string& artifact_id, storage::Artifact& artifact) {
    if (!qualifies_for_fast_path()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Upload " + upload_.upload_id + " is not a single archive");
    }
    
    const auto& file = upload_.files.front();
    auto source = file.source_key();
    auto destination = storage::object_keys::artifact_object(artifact_id);
    
    auto error = context_.retry->execute("copy " + source, [&] {
        return context_.objects->copy(source, destination);
    });
    if (!error.ok()) {
        return to_result(error, "Cannot relocate " + file.name);
    }
    
    uint64_t size = 0;
    error = context_.retry->execute("head " + destination, [&] {
        return context_.objects->head(destination, size);
    });
    if (!error.ok()) {
        return to_result(error, "Cannot stat artifact " + artifact_id);
    }
    
    error = context_.retry->execute("delete source " + source, [&] {
        return context_.objects->remove(source);
    });
    if (!error.ok()) {
        LOG_WARN("Could not delete source {} after relocation: {}", source, error.describe());
    }
    
    artifact = make_artifact(artifact_id, file.name, size);
    LOG_INFO("Upload {} is a single archive, relocated to {} without repackaging", upload_.upload_id, artifact_id);
    return core::Result::ok();
}

storage::Artifact UploadSession::make_artifact(const std::string& artifact_id, const std::string& name,
                                               uint64_t size) const {
    storage::Artifact artifact;
    artifact.id = artifact_id;
    artifact.name = name;
    artifact.size = size;
    artifact.file_count = static_cast<uint32_t>(upload_.files.size());
    artifact.upload_id = upload_.upload_id;
    artifact.password_hash = upload_.password_hash;
    artifact.created_at = std::chrono::system_clock::now();
    artifact.expires_at = artifact.created_at + context_.config.artifact_retention;
    return artifact;
}

core::Result UploadSession::attach_artifact(const storage::Artifact& artifact) {
    if (!storage::can_transition(upload_.status, storage::UploadStatus::COMPLETED)) {
        return core::Result(core::ErrorCode::INVALID_STATE,
            std::string("Upload ") + upload_.upload_id + " cannot complete from " +
            storage::upload_status_name(upload_.status));
    }
    
    auto artifact_key = storage::keys::artifact(artifact.id);
    auto result = context_.metadata->put(artifact_key, artifact.serialize());
    if (!result) {
        return result;
    }
    
    upload_.artifact_id = artifact.id;
    result = transition_to(storage::UploadStatus::COMPLETED);
    if (!result) {
        upload_.artifact_id.clear();
        auto removed = context_.metadata->remove(artifact_key);
        if (!removed) {
            LOG_ERROR("Could not withdraw artifact record {}: {}", artifact.id, removed.message);
        }
        return result;
    }
    return core::Result::ok();
}

core::Result UploadSession::abort_sources() {
    core::Result outcome;
    for (const auto& file : upload_.files) {
        auto error = context_.retry->execute("abort source upload " + file.source_key(), [&] {
            return context_.objects->abort_multipart_upload(file.multipart);
        });
        if (!error.ok() && outcome) {
            outcome = to_result(error, "Cannot abort source upload for " + file.name);
        }
    }
    return outcome;
}

} // namespace fastpack::transfer
