#include <gtest/gtest.h>
#include "fastpack/transfer/progress_reporter.hpp"
#include "fastpack/storage/memory_metadata_store.hpp"
#include <thread>

using namespace fastpack::transfer;
using namespace fastpack::storage;
using fastpack::core::ErrorCode;

class ProgressReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryMetadataStore>();
        reporter_ = std::make_unique<ProgressReporter>(store_, 4);
    }
    
    std::shared_ptr<MemoryMetadataStore> store_;
    std::unique_ptr<ProgressReporter> reporter_;
};

TEST_F(ProgressReporterTest, BeginCreatesReadingEntry) {
    reporter_->begin("u1", 4);
    
    auto entry = reporter_->get("u1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, UploadStatus::REPACKAGING);
    EXPECT_EQ(entry->phase, "reading");
    EXPECT_EQ(entry->total_files, 4u);
    EXPECT_DOUBLE_EQ(entry->percent, 0.0);
    EXPECT_EQ(reporter_->active_count(), 1u);
}

TEST_F(ProgressReporterTest, FileCompletionScalesToReadingShare) {
    reporter_->begin("u1", 4);
    reporter_->file_started("u1", "a.bin", 0);
    reporter_->file_completed("u1", "a.bin", 0);
    EXPECT_DOUBLE_EQ(reporter_->get("u1")->percent, 20.0);
    
    reporter_->file_started("u1", "b.bin", 1);
    EXPECT_EQ(reporter_->get("u1")->current_file, "b.bin");
    reporter_->file_completed("u1", "b.bin", 1);
    EXPECT_DOUBLE_EQ(reporter_->get("u1")->percent, 40.0);
    EXPECT_EQ(reporter_->get("u1")->processed_files, 2u);
}

TEST_F(ProgressReporterTest, FinalizingIsNinetyPercentAndNotPersisted) {
    reporter_->begin("u1", 1);
    auto writes = reporter_->snapshot_writes();
    
    reporter_->finalizing("u1");
    auto entry = reporter_->get("u1");
    EXPECT_EQ(entry->phase, "finalizing");
    EXPECT_DOUBLE_EQ(entry->percent, FINALIZING_PROGRESS);
    EXPECT_EQ(reporter_->snapshot_writes(), writes);
}

TEST_F(ProgressReporterTest, MilestonesArePersisted) {
    reporter_->begin("u1", 2);
    reporter_->file_started("u1", "a.bin", 0);
    reporter_->file_completed("u1", "a.bin", 0);
    EXPECT_EQ(reporter_->snapshot_writes(), 2u);
    
    ProgressSnapshot snapshot;
    ASSERT_TRUE(reporter_->load_snapshot("u1", snapshot));
    EXPECT_EQ(snapshot.milestone, Milestone::FILE_COMPLETED);
    EXPECT_DOUBLE_EQ(snapshot.percent, 40.0);
    EXPECT_EQ(snapshot.current_file, "a.bin");
    EXPECT_EQ(snapshot.total_files, 2u);
    
    reporter_->repackaging_completed("u1");
    ASSERT_TRUE(reporter_->load_snapshot("u1", snapshot));
    EXPECT_EQ(snapshot.milestone, Milestone::REPACKAGING_COMPLETED);
    EXPECT_DOUBLE_EQ(snapshot.percent, 100.0);
}

TEST_F(ProgressReporterTest, SnapshotOutlivesEntry) {
    reporter_->begin("u1", 1);
    reporter_->file_completed("u1", "a.bin", 0);
    reporter_->end("u1");
    
    EXPECT_FALSE(reporter_->get("u1").has_value());
    EXPECT_EQ(reporter_->active_count(), 0u);
    
    ProgressSnapshot snapshot;
    ASSERT_TRUE(reporter_->load_snapshot("u1", snapshot));
    EXPECT_EQ(snapshot.processed_files, 1u);
}

TEST_F(ProgressReporterTest, FailureIsRecordedWithoutEntry) {
    reporter_->failed("u9", "disk exploded");
    
    ProgressSnapshot snapshot;
    ASSERT_TRUE(reporter_->load_snapshot("u9", snapshot));
    EXPECT_EQ(snapshot.milestone, Milestone::FAILED);
    EXPECT_EQ(snapshot.phase, "failed");
    EXPECT_EQ(snapshot.message, "disk exploded");
}

TEST_F(ProgressReporterTest, UnknownUploadUpdatesAreIgnored) {
    EXPECT_FALSE(reporter_->update("nope", [](ProgressEntry& entry) { entry.percent = 50.0; }));
    reporter_->file_started("nope", "a.bin", 0);
    EXPECT_EQ(reporter_->snapshot_writes(), 0u);
    
    ProgressSnapshot snapshot;
    EXPECT_EQ(reporter_->load_snapshot("nope", snapshot).error, ErrorCode::NOT_FOUND);
}

TEST_F(ProgressReporterTest, CorruptSnapshotIsMetadataError) {
    ASSERT_TRUE(store_->put(keys::progress("u1"), "junk"));
    ProgressSnapshot snapshot;
    EXPECT_EQ(reporter_->load_snapshot("u1", snapshot).error, ErrorCode::METADATA_ERROR);
}

TEST_F(ProgressReporterTest, ConcurrentUploadsDoNotInterfere) {
    constexpr int UPLOADS = 16;
    constexpr uint32_t FILES = 10;
    
    std::vector<std::thread> threads;
    for (int u = 0; u < UPLOADS; ++u) {
        threads.emplace_back([this, u] {
            auto id = "upload-" + std::to_string(u);
            reporter_->begin(id, FILES);
            for (uint32_t f = 0; f < FILES; ++f) {
                reporter_->file_started(id, "f" + std::to_string(f), f);
                reporter_->file_completed(id, "f" + std::to_string(f), f);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    EXPECT_EQ(reporter_->active_count(), static_cast<size_t>(UPLOADS));
    for (int u = 0; u < UPLOADS; ++u) {
        auto entry = reporter_->get("upload-" + std::to_string(u));
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->processed_files, FILES);
        EXPECT_DOUBLE_EQ(entry->percent, READING_PROGRESS_SHARE);
    }
    EXPECT_EQ(reporter_->snapshot_writes(), static_cast<uint64_t>(UPLOADS) * FILES * 2);
}
