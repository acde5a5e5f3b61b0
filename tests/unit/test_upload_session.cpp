#include <gtest/gtest.h>
#include "fastpack/transfer/upload_session.hpp"
#include "fastpack/storage/memory_metadata_store.hpp"
#include "fastpack/storage/memory_object_store.hpp"
#include "fastpack/crypto/random.hpp"

using namespace fastpack::transfer;
using namespace fastpack::storage;
using fastpack::core::ErrorCode;
using StoreCall = fastpack::storage::StorageOperation;

class UploadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(fastpack::crypto::SecureRandom::initialize());
        metadata_ = std::make_shared<MemoryMetadataStore>();
        objects_ = std::make_shared<MemoryObjectStore>();
        
        context_.metadata = metadata_;
        context_.objects = objects_;
        context_.config.chunk_size = 100;
        context_.config.allow_small_parts = true;
        context_.config.artifact_retention = std::chrono::hours(24);
        
        RetryPolicy policy;
        policy.base_delay = std::chrono::milliseconds(0);
        policy.jitter_ceiling = std::chrono::milliseconds(0);
        context_.retry = std::make_shared<RetryExecutor>(policy);
        context_.retry->set_sleep_function([](std::chrono::milliseconds) {});
        
        upload_.upload_id = "sess0001";
        upload_.chunk_size = 100;
        upload_.password_hash = "secret-hash";
        upload_.created_at = std::chrono::system_clock::now();
    }
    
    // Declares a file with an open source multipart upload.
    void declare(const std::string& name, uint64_t size) {
        FileUpload file;
        file.name = name;
        file.declared_size = size;
        file.total_chunks = static_cast<uint32_t>((size + upload_.chunk_size - 1) / upload_.chunk_size);
        ASSERT_TRUE(objects_->create_multipart_upload(object_keys::source_object(upload_.upload_id, name),
                                                      file.multipart).ok());
        upload_.files.push_back(file);
    }
    
    // Uploads and records every chunk of `file_index`, returning the file's bytes.
    std::vector<uint8_t> upload_all(size_t file_index, uint8_t salt) {
        const auto& file = upload_.files[file_index];
        std::vector<uint8_t> bytes(file.declared_size);
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(i + salt);
        }
        
        ChunkLedger ledger(metadata_);
        for (uint32_t index = 0; index < file.total_chunks; ++index) {
            uint64_t offset = static_cast<uint64_t>(index) * upload_.chunk_size;
            auto length = file.chunk_length(index, upload_.chunk_size);
            std::string tag;
            EXPECT_TRUE(objects_->upload_part(file.multipart, index + 1,
                std::span<const uint8_t>(bytes.data() + offset, length), tag).ok());
            RecordOutcome outcome;
            EXPECT_TRUE(ledger.record_chunk(upload_.upload_id, file.name, index, index + 1, tag, outcome));
        }
        return bytes;
    }
    
    std::unique_ptr<UploadSession> saved_session() {
        auto session = std::make_unique<UploadSession>(upload_, context_);
        EXPECT_TRUE(session->save());
        return session;
    }
    
    std::shared_ptr<MemoryMetadataStore> metadata_;
    std::shared_ptr<MemoryObjectStore> objects_;
    SessionContext context_;
    LogicalUpload upload_;
};

TEST_F(UploadSessionTest, LoadUnknownUploadIsNotFound) {
    std::unique_ptr<UploadSession> session;
    auto result = UploadSession::load("missing1", context_, session);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(session, nullptr);
}

TEST_F(UploadSessionTest, LoadCorruptRecordIsMetadataError) {
    ASSERT_TRUE(metadata_->put(keys::upload("broken01"), "garbage"));
    std::unique_ptr<UploadSession> session;
    EXPECT_EQ(UploadSession::load("broken01", context_, session).error, ErrorCode::METADATA_ERROR);
}

TEST_F(UploadSessionTest, TransitionsArePersisted) {
    declare("a.bin", 250);
    auto session = saved_session();
    
    ASSERT_TRUE(session->transition_to(UploadStatus::FINALIZING));
    
    std::unique_ptr<UploadSession> reloaded;
    ASSERT_TRUE(UploadSession::load(upload_.upload_id, context_, reloaded));
    EXPECT_EQ(reloaded->status(), UploadStatus::FINALIZING);
    EXPECT_EQ(reloaded->upload().files.size(), 1u);
}

TEST_F(UploadSessionTest, IllegalTransitionIsRejected) {
    declare("a.bin", 250);
    auto session = saved_session();
    
    EXPECT_EQ(session->transition_to(UploadStatus::COMPLETED).error, ErrorCode::INVALID_STATE);
    EXPECT_EQ(session->transition_to(UploadStatus::REPACKAGING).error, ErrorCode::INVALID_STATE);
    EXPECT_EQ(session->status(), UploadStatus::COLLECTING);
}

TEST_F(UploadSessionTest, FailRecordsReasonAndIsFinal) {
    declare("a.bin", 250);
    auto session = saved_session();
    
    ASSERT_TRUE(session->fail("cancelled"));
    EXPECT_EQ(session->status(), UploadStatus::FAILED);
    EXPECT_EQ(session->upload().failure_reason, "cancelled");
    EXPECT_EQ(session->fail("again").error, ErrorCode::INVALID_STATE);
    
    std::unique_ptr<UploadSession> reloaded;
    ASSERT_TRUE(UploadSession::load(upload_.upload_id, context_, reloaded));
    EXPECT_EQ(reloaded->upload().failure_reason, "cancelled");
}

TEST_F(UploadSessionTest, VerifyCompleteListsMissingChunks) {
    declare("a.bin", 250);
    auto session = saved_session();
    
    ChunkLedger ledger(metadata_);
    RecordOutcome outcome;
    ASSERT_TRUE(ledger.record_chunk(upload_.upload_id, "a.bin", 0, 1, "t", outcome));
    
    std::vector<MissingChunk> missing;
    auto result = session->verify_complete(missing);
    EXPECT_EQ(result.error, ErrorCode::INCOMPLETE_UPLOAD);
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_NE(result.message.find("a.bin#1"), std::string::npos);
    EXPECT_NE(result.message.find("a.bin#2"), std::string::npos);
}

TEST_F(UploadSessionTest, VerifyCompleteReconcilesCounter) {
    declare("a.bin", 250);
    upload_all(0, 1);
    auto session = saved_session();
    
    int64_t value = 0;
    ASSERT_TRUE(metadata_->increment(keys::uploaded_counter(upload_.upload_id), 5, value));
    
    std::vector<MissingChunk> missing;
    ASSERT_TRUE(session->verify_complete(missing));
    EXPECT_TRUE(missing.empty());
    ASSERT_TRUE(metadata_->read_counter(keys::uploaded_counter(upload_.upload_id), value));
    EXPECT_EQ(value, 3);
}

TEST_F(UploadSessionTest, FinalizeFilesAssemblesSources) {
    declare("a.bin", 250);
    declare("b.bin", 100);
    auto first = upload_all(0, 1);
    auto second = upload_all(1, 2);
    auto session = saved_session();
    
    ASSERT_TRUE(session->finalize_files());
    
    EXPECT_EQ(*objects_->object("temp/sess0001/a.bin"), first);
    EXPECT_EQ(*objects_->object("temp/sess0001/b.bin"), second);
    auto layout = objects_->completed_parts("temp/sess0001/a.bin");
    ASSERT_EQ(layout.size(), 3u);
    EXPECT_EQ(layout[2].size, 50u);
}

TEST_F(UploadSessionTest, FinalizeIsResumableAfterInterruption) {
    declare("a.bin", 250);
    upload_all(0, 1);
    auto session = saved_session();
    
    ASSERT_TRUE(session->finalize_file(session->upload().files[0]));
    // The multipart upload is gone now; a second pass finds the assembled object.
    EXPECT_TRUE(session->finalize_file(session->upload().files[0]));
    EXPECT_EQ(objects_->call_count(StoreCall::COMPLETE_MULTIPART), 2u);
}

TEST_F(UploadSessionTest, FinalizeWithMissingChunkIsIncomplete) {
    declare("a.bin", 250);
    auto session = saved_session();
    
    ChunkLedger ledger(metadata_);
    RecordOutcome outcome;
    ASSERT_TRUE(ledger.record_chunk(upload_.upload_id, "a.bin", 0, 1, "t", outcome));
    
    EXPECT_EQ(session->finalize_file(session->upload().files[0]).error, ErrorCode::INCOMPLETE_UPLOAD);
    EXPECT_EQ(objects_->call_count(StoreCall::COMPLETE_MULTIPART), 0u);
}

TEST_F(UploadSessionTest, FinalizeRejectsMisnumberedPart) {
    declare("a.bin", 100);
    auto session = saved_session();
    
    ChunkLedger ledger(metadata_);
    RecordOutcome outcome;
    ASSERT_TRUE(ledger.record_chunk(upload_.upload_id, "a.bin", 0, 4, "t", outcome));
    
    EXPECT_EQ(session->finalize_file(session->upload().files[0]).error, ErrorCode::METADATA_ERROR);
}

TEST_F(UploadSessionTest, StaleTagFailsCompletion) {
    declare("a.bin", 100);
    upload_all(0, 1);
    auto session = saved_session();
    
    ChunkLedger ledger(metadata_);
    RecordOutcome outcome;
    ASSERT_TRUE(ledger.record_chunk(upload_.upload_id, "a.bin", 0, 1, "stale", outcome));
    
    EXPECT_EQ(session->finalize_file(session->upload().files[0]).error, ErrorCode::PERMANENT_STORAGE_ERROR);
}

TEST_F(UploadSessionTest, FastPathNeedsSingleArchive) {
    declare("Bundle.ZIP", 100);
    EXPECT_TRUE(UploadSession(upload_, context_).qualifies_for_fast_path());
    
    declare("other.zip", 100);
    EXPECT_FALSE(UploadSession(upload_, context_).qualifies_for_fast_path());
    
    upload_.files.erase(upload_.files.begin());
    upload_.files[0].name = "other.tar";
    EXPECT_FALSE(UploadSession(upload_, context_).qualifies_for_fast_path());
}

TEST_F(UploadSessionTest, PromoteSingleArchiveRelocatesBytes) {
    declare("bundle.zip", 250);
    auto bytes = upload_all(0, 3);
    auto session = saved_session();
    ASSERT_TRUE(session->transition_to(UploadStatus::FINALIZING));
    ASSERT_TRUE(session->finalize_files());
    
    Artifact artifact;
    ASSERT_TRUE(session->promote_single_archive("art00001", artifact));
    EXPECT_EQ(artifact.name, "bundle.zip");
    EXPECT_EQ(artifact.size, 250u);
    EXPECT_EQ(artifact.file_count, 1u);
    EXPECT_EQ(artifact.password_hash, "secret-hash");
    EXPECT_EQ(*objects_->object("art00001"), bytes);
    EXPECT_FALSE(objects_->has_object("temp/sess0001/bundle.zip"));
    EXPECT_EQ(objects_->call_count(StoreCall::UPLOAD_PART), 3u);
}

TEST_F(UploadSessionTest, AttachArtifactCompletesUpload) {
    declare("a.bin", 100);
    auto session = saved_session();
    ASSERT_TRUE(session->transition_to(UploadStatus::FINALIZING));
    ASSERT_TRUE(session->transition_to(UploadStatus::REPACKAGING));
    
    auto artifact = session->make_artifact("art00002", "files.zip", 1234);
    EXPECT_EQ(artifact.expires_at - artifact.created_at, std::chrono::hours(24));
    ASSERT_TRUE(session->attach_artifact(artifact));
    
    EXPECT_EQ(session->status(), UploadStatus::COMPLETED);
    EXPECT_EQ(session->upload().artifact_id, "art00002");
    
    std::string raw;
    ASSERT_TRUE(metadata_->get(keys::artifact("art00002"), raw));
    auto stored = Artifact::deserialize(raw);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->upload_id, "sess0001");
    EXPECT_EQ(stored->size, 1234u);
}

TEST_F(UploadSessionTest, AttachArtifactFromCollectingIsRejected) {
    declare("a.bin", 100);
    auto session = saved_session();
    
    auto artifact = session->make_artifact("art00003", "files.zip", 1);
    EXPECT_EQ(session->attach_artifact(artifact).error, ErrorCode::INVALID_STATE);
    EXPECT_FALSE(metadata_->contains(keys::artifact("art00003")));
}

TEST_F(UploadSessionTest, AbortSourcesAbortsEveryFile) {
    declare("a.bin", 100);
    declare("b.bin", 100);
    auto session = saved_session();
    
    ASSERT_TRUE(session->abort_sources());
    EXPECT_EQ(objects_->call_count(StoreCall::ABORT_MULTIPART), 2u);
    EXPECT_EQ(objects_->open_multipart_count(), 0u);
}
