#include "fastpack/transfer/upload_manager.hpp"
#include "fastpack/core/logger.hpp"
#include "fastpack/core/utils.hpp"
#include "fastpack/crypto/random.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/post.hpp>

namespace fastpack::transfer {

namespace {
    const storage::StorageConfig& checked(const storage::StorageConfig& config) {
        auto error = config.validation_error();
        if (!error.empty()) {
            throw std::invalid_argument("Invalid storage configuration: " + error);
        }
        return config;
    }
    
    double as_percent(int64_t done, uint64_t total) {
        if (total == 0 || done <= 0) {
            return 0.0;
        }
        return std::min(100.0, static_cast<double>(done) / static_cast<double>(total) * 100.0);
    }
}

UploadManager::UploadManager(std::shared_ptr<storage::ObjectStore> objects,
                             std::shared_ptr<storage::MetadataStore> metadata,
                             const storage::StorageConfig& config)
    : config_(checked(config))
    , objects_(std::move(objects))
    , metadata_(std::move(metadata))
    , retry_(std::make_shared<RetryExecutor>(RetryPolicy::from_config(config_)))
    , ledger_(std::make_unique<storage::ChunkLedger>(metadata_))
    , progress_(std::make_unique<ProgressReporter>(metadata_))
    , part_workers_(config_.part_workers)
    , background_workers_(config_.background_workers) {
    if (!crypto::SecureRandom::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    repackager_ = std::make_unique<Repackager>(objects_, retry_, part_workers_, config_);
    
    LOG_INFO("Upload manager ready: chunk size {}, part size {}, {} background / {} part workers",
             core::utils::StringUtils::format_bytes(config_.chunk_size),
             core::utils::StringUtils::format_bytes(config_.part_size),
             config_.background_workers, config_.part_workers);
}

UploadManager::~UploadManager() {
    shutdown();
}

SessionContext UploadManager::session_context() const {
    return SessionContext{metadata_, objects_, retry_, config_};
}

core::Result UploadManager::validate_request(const UploadRequest& request) const {
    if (request.files.empty()) {
        return core::Result(core::ErrorCode::VALIDATION_ERROR, "An upload needs at least one file");
    }
    
    std::unordered_set<std::string> names;
    for (const auto& file : request.files) {
        if (file.name.empty()) {
            return core::Result(core::ErrorCode::VALIDATION_ERROR, "File name must not be empty");
        }
        if (file.name == "." || file.name == ".." ||
            file.name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
            return core::Result(core::ErrorCode::VALIDATION_ERROR, "Invalid file name: " + file.name);
        }
        if (!names.insert(file.name).second) {
            return core::Result(core::ErrorCode::VALIDATION_ERROR, "Duplicate file name: " + file.name);
        }
        if (file.size == 0) {
            return core::Result(core::ErrorCode::VALIDATION_ERROR, "File " + file.name + " is empty");
        }
        
        uint64_t chunks = (file.size + config_.chunk_size - 1) / config_.chunk_size;
        if (chunks > config_.max_parts) {
            return core::Result(core::ErrorCode::VALIDATION_ERROR,
                "File " + file.name + " needs " + std::to_string(chunks) + " chunks, limit is " +
                std::to_string(config_.max_parts));
        }
    }
    return core::Result::ok();
}

core::Result UploadManager::begin_logical_upload(const UploadRequest& request, ChunkPlan& plan) {
    if (shut_down_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Upload manager is shut down");
    }
    
    auto result = validate_request(request);
    if (!result) {
        return result;
    }
    
    storage::LogicalUpload upload;
    upload.status = storage::UploadStatus::COLLECTING;
    upload.chunk_size = config_.chunk_size;
    upload.password_hash = request.password_hash;
    upload.created_at = std::chrono::system_clock::now();
    upload.updated_at = upload.created_at;
    for (const auto& declared : request.files) {
        storage::FileUpload file;
        file.name = declared.name;
        file.declared_size = declared.size;
        file.total_chunks = static_cast<uint32_t>((declared.size + config_.chunk_size - 1) / config_.chunk_size);
        upload.files.push_back(std::move(file));
    }
    
    bool reserved = false;
    for (int attempt = 0; attempt < ID_RESERVATION_ATTEMPTS && !reserved; ++attempt) {
        upload.upload_id = crypto::SecureRandom::generate_id();
        result = metadata_->insert_if_absent(storage::keys::upload(upload.upload_id), upload.serialize(), reserved);
        if (!result) {
            return result;
        }
    }
    if (!reserved) {
        return core::Result(core::ErrorCode::METADATA_ERROR, "Could not allocate an upload id");
    }
    
    const auto& upload_id = upload.upload_id;
    auto discard = [&]() {
        for (const auto& file : upload.files) {
            if (!file.multipart.valid()) {
                continue;
            }
            auto error = retry_->execute("abort source upload " + file.source_key(), [&] {
                return objects_->abort_multipart_upload(file.multipart);
            });
            if (!error.ok()) {
                LOG_ERROR("Could not abort source upload {}: {}", file.source_key(), error.describe());
            }
        }
        auto removed = metadata_->remove(storage::keys::upload(upload_id));
        if (!removed) {
            LOG_ERROR("Could not remove upload record {}: {}", upload_id, removed.message);
        }
    };
    
    for (auto& file : upload.files) {
        auto key = storage::object_keys::source_object(upload_id, file.name);
        auto error = retry_->execute("create source upload " + key, [&] {
            return objects_->create_multipart_upload(key, file.multipart);
        });
        if (!error.ok()) {
            discard();
            return to_result(error, "Cannot start source upload for " + file.name);
        }
    }
    
    result = metadata_->put(storage::keys::upload(upload_id), upload.serialize());
    if (!result) {
        discard();
        return result;
    }
    
    UploadSession session(upload, session_context());
    
    plan = ChunkPlan{};
    plan.upload_id = upload_id;
    plan.chunk_size = upload.chunk_size;
    plan.single_archive = session.qualifies_for_fast_path();
    plan.total_chunks = upload.total_chunks();
    for (const auto& file : upload.files) {
        FilePlan file_plan;
        file_plan.name = file.name;
        file_plan.size = file.declared_size;
        file_plan.multipart = file.multipart;
        file_plan.total_chunks = file.total_chunks;
        file_plan.chunks.reserve(file.total_chunks);
        for (uint32_t index = 0; index < file.total_chunks; ++index) {
            file_plan.chunks.push_back(ChunkSpan{index, index + 1,
                                                 static_cast<uint64_t>(index) * upload.chunk_size,
                                                 file.chunk_length(index, upload.chunk_size)});
        }
        plan.files.push_back(std::move(file_plan));
    }
    
    LOG_INFO("Upload {} started: {} file(s), {} chunk(s), {}", upload_id, upload.files.size(),
             plan.total_chunks, core::utils::StringUtils::format_bytes(upload.total_size()));
    return core::Result::ok();
}

core::Result UploadManager::confirm_chunk(const ChunkConfirmation& confirmation, ChunkProgress& progress) {
    if (confirmation.upload_id.empty() || confirmation.file_name.empty() || confirmation.content_tag.empty()) {
        return core::Result(core::ErrorCode::VALIDATION_ERROR, "Upload id, file name and content tag are required");
    }
    
    std::unique_ptr<UploadSession> session;
    auto result = UploadSession::load(confirmation.upload_id, session_context(), session);
    if (!result) {
        return result;
    }
    
    const auto& upload = session->upload();
    if (upload.status != storage::UploadStatus::COLLECTING) {
        return core::Result(core::ErrorCode::INVALID_STATE,
            "Upload " + upload.upload_id + " is " + storage::upload_status_name(upload.status));
    }
    
    const auto* file = upload.find_file(confirmation.file_name);
    if (!file) {
        return core::Result(core::ErrorCode::VALIDATION_ERROR,
            "Upload " + upload.upload_id + " has no file named " + confirmation.file_name);
    }
    if (confirmation.index >= file->total_chunks) {
        return core::Result(core::ErrorCode::VALIDATION_ERROR,
            "Chunk index " + std::to_string(confirmation.index) + " out of range for " + file->name);
    }
    if (confirmation.part_number != confirmation.index + 1) {
        return core::Result(core::ErrorCode::VALIDATION_ERROR,
            "Chunk " + std::to_string(confirmation.index) + " must use part number " +
            std::to_string(confirmation.index + 1));
    }
    
    storage::RecordOutcome outcome;
    result = ledger_->record_chunk(upload.upload_id, file->name, confirmation.index, confirmation.part_number,
                                   confirmation.content_tag, outcome);
    if (!result) {
        return result;
    }
    
    progress.uploaded = outcome.uploaded;
    progress.total = upload.total_chunks();
    progress.is_new = outcome.is_new;
    progress.percent = as_percent(outcome.uploaded, progress.total);
    
    LOG_DEBUG("Upload {}: chunk {}#{} {} ({}/{})", upload.upload_id, file->name, confirmation.index,
              outcome.is_new ? "recorded" : "repeated", progress.uploaded, progress.total);
    return core::Result::ok();
}

core::Result UploadManager::missing_chunks(const std::string& upload_id, std::vector<storage::MissingChunk>& missing) {
    std::unique_ptr<UploadSession> session;
    auto result = UploadSession::load(upload_id, session_context(), session);
    if (!result) {
        return result;
    }
    missing.clear();
    return ledger_->find_missing(session->upload(), missing);
}

core::Result UploadManager::finalize_upload(const std::string& upload_id, FinalizeOutcome& outcome) {
    if (shut_down_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Upload manager is shut down");
    }
    
    std::unique_ptr<UploadSession> session;
    auto result = UploadSession::load(upload_id, session_context(), session);
    if (!result) {
        return result;
    }
    
    auto report_current = [&](const UploadSession& current) {
        outcome.status = current.status();
        outcome.artifact_id = current.upload().artifact_id;
        return core::Result::ok();
    };
    
    auto status = session->status();
    if (status != storage::UploadStatus::COLLECTING && status != storage::UploadStatus::FINALIZING) {
        return report_current(*session);
    }
    if (!claim(upload_id)) {
        LOG_DEBUG("Upload {} is already being finalized", upload_id);
        return report_current(*session);
    }
    
    // Re-read under the claim: another caller may have finished in between.
    result = UploadSession::load(upload_id, session_context(), session);
    if (!result) {
        release(upload_id);
        return result;
    }
    status = session->status();
    if (status != storage::UploadStatus::COLLECTING && status != storage::UploadStatus::FINALIZING) {
        release(upload_id);
        return report_current(*session);
    }
    if (status == storage::UploadStatus::FINALIZING) {
        LOG_INFO("Resuming interrupted finalize of upload {}", upload_id);
    }
    
    result = finalize_claimed(*session, outcome);
    if (!result || outcome.status != storage::UploadStatus::REPACKAGING) {
        release(upload_id);
    }
    return result;
}

core::Result UploadManager::finalize_claimed(UploadSession& session, FinalizeOutcome& outcome) {
    const auto upload_id = session.upload().upload_id;
    outcome.status = session.status();
    
    auto fail_with = [&](const core::Result& cause) {
        auto failed = session.fail(cause.message);
        if (!failed) {
            LOG_ERROR("Could not mark upload {} failed: {}", upload_id, failed.message);
        }
        progress_->failed(upload_id, cause.message);
        outcome.status = session.status();
        return cause;
    };
    
    std::vector<storage::MissingChunk> missing;
    auto result = session.verify_complete(missing);
    if (!result) {
        return result;
    }
    
    if (session.status() == storage::UploadStatus::COLLECTING) {
        result = session.transition_to(storage::UploadStatus::FINALIZING);
        if (!result) {
            return result;
        }
        outcome.status = session.status();
    }
    
    result = session.finalize_files();
    if (!result) {
        auto aborted = session.abort_sources();
        if (!aborted) {
            LOG_ERROR("Upload {}: {}", upload_id, aborted.message);
        }
        for (const auto& file : session.upload().files) {
            auto error = objects_->remove(file.source_key());
            if (!error.ok()) {
                LOG_WARN("Could not delete source {}: {}", file.source_key(), error.describe());
            }
        }
        return fail_with(result);
    }
    
    if (session.qualifies_for_fast_path()) {
        std::string artifact_id;
        storage::Artifact artifact;
        result = allocate_artifact_id(artifact_id);
        if (result) {
            result = session.promote_single_archive(artifact_id, artifact);
        }
        if (result) {
            result = session.attach_artifact(artifact);
            if (!result) {
                auto error = objects_->remove(storage::object_keys::artifact_object(artifact_id));
                if (!error.ok()) {
                    LOG_WARN("Could not delete orphaned artifact object {}: {}", artifact_id, error.describe());
                }
            }
        }
        if (!result) {
            return fail_with(result);
        }
        
        purge_ledger(session.upload());
        outcome.status = storage::UploadStatus::COMPLETED;
        outcome.artifact_id = artifact.id;
        return core::Result::ok();
    }
    
    result = session.transition_to(storage::UploadStatus::REPACKAGING);
    if (!result) {
        return fail_with(result);
    }
    
    try {
        boost::asio::post(background_workers_, [this, upload = session.upload()]() mutable {
            run_repackaging(std::move(upload));
        });
    } catch (const std::exception& e) {
        return fail_with(core::Result(core::ErrorCode::REPACKAGING_FAILURE,
                                      std::string("Cannot schedule repackaging: ") + e.what()));
    }
    
    outcome.status = storage::UploadStatus::REPACKAGING;
    LOG_INFO("Upload {} handed to background repackaging", upload_id);
    return core::Result::ok();
}

void UploadManager::run_repackaging(storage::LogicalUpload upload) {
    const auto upload_id = upload.upload_id;
    UploadSession session(std::move(upload), session_context());
    progress_->begin(upload_id, static_cast<uint32_t>(session.upload().files.size()));
    
    core::Result result;
    try {
        result = repackage_upload(session);
    } catch (const std::exception& e) {
        result = core::Result(core::ErrorCode::REPACKAGING_FAILURE, std::string("Repackaging aborted: ") + e.what());
    }
    
    if (result) {
        progress_->repackaging_completed(upload_id);
        purge_ledger(session.upload());
    } else {
        auto failed = session.fail(result.message);
        if (!failed) {
            LOG_ERROR("Could not mark upload {} failed: {}", upload_id, failed.message);
        }
        progress_->failed(upload_id, result.message);
        
        for (const auto& file : session.upload().files) {
            auto error = objects_->remove(file.source_key());
            if (!error.ok()) {
                LOG_WARN("Could not delete source {}: {}", file.source_key(), error.describe());
            }
        }
    }
    
    progress_->end(upload_id);
    release(upload_id);
}

core::Result UploadManager::repackage_upload(UploadSession& session) {
    const auto& upload_id = session.upload().upload_id;
    
    std::string artifact_id;
    auto result = allocate_artifact_id(artifact_id);
    if (!result) {
        return result;
    }
    
    RepackageObserver observer;
    observer.on_file_started = [&](const storage::FileUpload& file, uint32_t index) {
        progress_->file_started(upload_id, file.name, index);
    };
    observer.on_file_completed = [&](const storage::FileUpload& file, uint32_t index) {
        progress_->file_completed(upload_id, file.name, index);
    };
    observer.on_finalizing = [&]() {
        progress_->finalizing(upload_id);
    };
    
    RepackageOutcome outcome;
    auto destination = storage::object_keys::artifact_object(artifact_id);
    result = repackager_->repackage(session.upload(), destination, outcome, observer);
    if (!result) {
        return result;
    }
    
    auto artifact = session.make_artifact(artifact_id, config_.archive_name, outcome.archive_size);
    result = session.attach_artifact(artifact);
    if (!result) {
        auto error = objects_->remove(destination);
        if (!error.ok()) {
            LOG_WARN("Could not delete orphaned artifact object {}: {}", artifact_id, error.describe());
        }
        return result;
    }
    
    LOG_INFO("Upload {} repackaged into artifact {} ({}, {} parts)", upload_id, artifact_id,
             core::utils::StringUtils::format_bytes(outcome.archive_size), outcome.parts.size());
    return core::Result::ok();
}

core::Result UploadManager::allocate_artifact_id(std::string& artifact_id) {
    for (int attempt = 0; attempt < ID_RESERVATION_ATTEMPTS; ++attempt) {
        auto candidate = crypto::SecureRandom::generate_id();
        
        std::string existing;
        auto result = metadata_->get(storage::keys::artifact(candidate), existing);
        if (result) {
            continue;
        }
        if (result.error != core::ErrorCode::NOT_FOUND) {
            return result;
        }
        
        uint64_t size = 0;
        auto error = retry_->execute("head " + candidate, [&] {
            return objects_->head(storage::object_keys::artifact_object(candidate), size);
        });
        if (error.ok()) {
            continue;
        }
        if (error.kind != storage::StorageErrorKind::NOT_FOUND) {
            return to_result(error, "Cannot probe artifact id " + candidate);
        }
        
        artifact_id = std::move(candidate);
        return core::Result::ok();
    }
    return core::Result(core::ErrorCode::METADATA_ERROR, "Could not allocate an artifact id");
}

void UploadManager::purge_ledger(const storage::LogicalUpload& upload) {
    auto result = ledger_->purge(upload);
    if (!result) {
        LOG_WARN("Could not purge chunk records of {}: {}", upload.upload_id, result.message);
    }
}

core::Result UploadManager::query_status(const std::string& upload_id, StatusReport& report) {
    report = StatusReport{};
    
    // A completed entry lingers while chunk records are purged; the upload
    // record is the one that carries the artifact id.
    auto cached = progress_->get(upload_id);
    if (cached && cached->status != storage::UploadStatus::COMPLETED) {
        report.status = cached->status;
        report.percent = cached->percent;
        report.phase = cached->phase;
        report.current_file = cached->current_file;
        if (cached->status == storage::UploadStatus::FAILED) {
            report.failure_reason = cached->message;
        }
        return core::Result::ok();
    }
    
    std::unique_ptr<UploadSession> session;
    auto result = UploadSession::load(upload_id, session_context(), session);
    if (!result) {
        return result;
    }
    
    const auto& upload = session->upload();
    report.status = upload.status;
    report.total_chunks = upload.total_chunks();
    
    switch (upload.status) {
        case storage::UploadStatus::COLLECTING:
        case storage::UploadStatus::FINALIZING: {
            result = ledger_->count_uploaded(upload_id, report.uploaded_chunks);
            if (!result) {
                return result;
            }
            report.phase = storage::upload_status_name(upload.status);
            report.percent = as_percent(report.uploaded_chunks, report.total_chunks);
            break;
        }
        case storage::UploadStatus::REPACKAGING: {
            report.uploaded_chunks = static_cast<int64_t>(report.total_chunks);
            report.phase = "repackaging";
            storage::ProgressSnapshot snapshot;
            result = progress_->load_snapshot(upload_id, snapshot);
            if (result) {
                report.phase = snapshot.phase;
                report.percent = snapshot.percent;
                report.current_file = snapshot.current_file;
            } else if (result.error != core::ErrorCode::NOT_FOUND) {
                LOG_WARN("Progress snapshot for {} unavailable: {}", upload_id, result.message);
            }
            break;
        }
        case storage::UploadStatus::COMPLETED:
            report.uploaded_chunks = static_cast<int64_t>(report.total_chunks);
            report.phase = "completed";
            report.percent = 100.0;
            report.artifact_id = upload.artifact_id;
            break;
        case storage::UploadStatus::FAILED:
            report.phase = "failed";
            report.failure_reason = upload.failure_reason;
            break;
    }
    return core::Result::ok();
}

core::Result UploadManager::resolve_artifact(const std::string& artifact_id, storage::Artifact& artifact) {
    if (artifact_id.empty()) {
        return core::Result(core::ErrorCode::VALIDATION_ERROR, "Artifact id is required");
    }
    
    std::string raw;
    auto result = metadata_->get(storage::keys::artifact(artifact_id), raw);
    if (result.error == core::ErrorCode::NOT_FOUND) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Unknown artifact: " + artifact_id);
    }
    if (!result) {
        return result;
    }
    
    auto parsed = storage::Artifact::deserialize(raw);
    if (!parsed) {
        return core::Result(core::ErrorCode::METADATA_ERROR, "Corrupt artifact record: " + artifact_id);
    }
    artifact = std::move(*parsed);
    
    if (artifact.is_expired(std::chrono::system_clock::now())) {
        return core::Result(core::ErrorCode::EXPIRED, "Artifact " + artifact_id + " has expired");
    }
    return core::Result::ok();
}

core::Result UploadManager::abort_upload(const std::string& upload_id) {
    if (!claim(upload_id)) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Upload " + upload_id + " is being finalized");
    }
    
    std::unique_ptr<UploadSession> session;
    auto result = UploadSession::load(upload_id, session_context(), session);
    if (!result) {
        release(upload_id);
        return result;
    }
    if (session->status() != storage::UploadStatus::COLLECTING) {
        release(upload_id);
        return core::Result(core::ErrorCode::INVALID_STATE,
            "Upload " + upload_id + " is " + storage::upload_status_name(session->status()));
    }
    
    auto aborted = session->abort_sources();
    result = session->fail("cancelled");
    if (result) {
        purge_ledger(session->upload());
    }
    release(upload_id);
    
    if (!result) {
        return result;
    }
    return aborted;
}

bool UploadManager::claim(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return active_jobs_.insert(upload_id).second;
}

void UploadManager::release(const std::string& upload_id) {
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        active_jobs_.erase(upload_id);
    }
    jobs_cv_.notify_all();
}

bool UploadManager::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    return jobs_cv_.wait_for(lock, timeout, [this] { return active_jobs_.empty(); });
}

void UploadManager::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    // Background jobs still post part uploads, so they drain first.
    background_workers_.join();
    part_workers_.join();
    LOG_INFO("Upload manager stopped");
}

} // namespace fastpack::transfer
