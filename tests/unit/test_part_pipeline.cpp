#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "fastpack/transfer/part_pipeline.hpp"
#include "fastpack/storage/memory_object_store.hpp"
#include "fastpack/crypto/random.hpp"
#include <atomic>
#include <thread>

using namespace fastpack::transfer;
using namespace fastpack::storage;
using fastpack::core::ErrorCode;
using ::testing::_;
using ::testing::Return;
using StoreCall = fastpack::storage::StorageOperation;

namespace {
    std::shared_ptr<RetryExecutor> instant_retry() {
        RetryPolicy policy;
        policy.base_delay = std::chrono::milliseconds(0);
        policy.jitter_ceiling = std::chrono::milliseconds(0);
        auto retry = std::make_shared<RetryExecutor>(policy);
        retry->set_sleep_function([](std::chrono::milliseconds) {});
        return retry;
    }
    
    std::vector<uint8_t> sequence(size_t size, size_t start = 0) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<uint8_t>((start + i) % 251);
        }
        return data;
    }
    
    // Feeds `total` bytes in the given irregular segment sizes, cycling through them.
    std::vector<uint8_t> feed(PartPipeline& pipeline, size_t total, const std::vector<size_t>& sizes,
                              fastpack::core::Result& result) {
        std::vector<uint8_t> fed;
        size_t i = 0;
        while (fed.size() < total) {
            size_t size = std::min(sizes[i++ % sizes.size()], total - fed.size());
            auto segment = sequence(size, fed.size());
            fed.insert(fed.end(), segment.begin(), segment.end());
            result = pipeline.append(std::move(segment));
            if (!result) {
                break;
            }
        }
        return fed;
    }
    
    class MockObjectStore : public ObjectStore {
    public:
        MockObjectStore() {
            ON_CALL(*this, create_multipart_upload).WillByDefault([this](const std::string& key, MultipartHandle& handle) {
                return real_.create_multipart_upload(key, handle);
            });
            ON_CALL(*this, upload_part).WillByDefault(
                [this](const MultipartHandle& handle, uint32_t number, std::span<const uint8_t> data, std::string& tag) {
                    return real_.upload_part(handle, number, data, tag);
                });
            ON_CALL(*this, complete_multipart_upload).WillByDefault(
                [this](const MultipartHandle& handle, const std::vector<CompletedPart>& parts) {
                    return real_.complete_multipart_upload(handle, parts);
                });
            ON_CALL(*this, abort_multipart_upload).WillByDefault([this](const MultipartHandle& handle) {
                return real_.abort_multipart_upload(handle);
            });
        }
        
        MOCK_METHOD(StorageError, create_multipart_upload, (const std::string& key, MultipartHandle& handle), (override));
        MOCK_METHOD(StorageError, upload_part, (const MultipartHandle& handle, uint32_t part_number,
                                                std::span<const uint8_t> data, std::string& content_tag), (override));
        MOCK_METHOD(StorageError, complete_multipart_upload, (const MultipartHandle& handle,
                                                              const std::vector<CompletedPart>& parts), (override));
        MOCK_METHOD(StorageError, abort_multipart_upload, (const MultipartHandle& handle), (override));
        MOCK_METHOD(StorageError, head, (const std::string& key, uint64_t& size), (override));
        MOCK_METHOD(StorageError, read_range, (const std::string& key, uint64_t offset, uint64_t length,
                                               std::vector<uint8_t>& out), (override));
        MOCK_METHOD(StorageError, get, (const std::string& key, std::vector<uint8_t>& out), (override));
        MOCK_METHOD(StorageError, put, (const std::string& key, std::span<const uint8_t> data), (override));
        MOCK_METHOD(StorageError, copy, (const std::string& source_key, const std::string& destination_key), (override));
        MOCK_METHOD(StorageError, remove, (const std::string& key), (override));
        
        MemoryObjectStore real_;
    };
}

class PartPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(fastpack::crypto::SecureRandom::initialize());
        store_ = std::make_shared<MemoryObjectStore>();
        retry_ = instant_retry();
    }
    
    PipelineOptions options(uint64_t part_size, uint32_t pending = 4,
                            std::chrono::milliseconds drain = std::chrono::milliseconds(5000)) {
        PipelineOptions opts;
        opts.part_size = part_size;
        opts.max_pending_parts = pending;
        opts.drain_timeout = drain;
        return opts;
    }
    
    std::shared_ptr<MemoryObjectStore> store_;
    std::shared_ptr<RetryExecutor> retry_;
    boost::asio::thread_pool workers_{4};
};

TEST_F(PartPipelineTest, SlicesIrregularSegmentsIntoEqualParts) {
    PartPipeline pipeline(store_, retry_, workers_, options(100));
    ASSERT_TRUE(pipeline.open("artifact"));
    
    fastpack::core::Result result;
    auto fed = feed(pipeline, 1000, {7, 130, 1, 64, 299, 33}, result);
    ASSERT_TRUE(result) << result.message;
    
    std::vector<CompletedPart> parts;
    ASSERT_TRUE(pipeline.finish(parts));
    EXPECT_TRUE(pipeline.completed());
    EXPECT_EQ(pipeline.bytes_accepted(), 1000u);
    EXPECT_EQ(pipeline.parts_dispatched(), 10u);
    
    auto layout = store_->completed_parts("artifact");
    ASSERT_EQ(layout.size(), 10u);
    for (size_t i = 0; i < layout.size(); ++i) {
        EXPECT_EQ(layout[i].part_number, i + 1);
        EXPECT_EQ(layout[i].size, 100u);
    }
    EXPECT_EQ(*store_->object("artifact"), fed);
}

TEST_F(PartPipelineTest, TrailingPartHoldsRemainder) {
    PartPipeline pipeline(store_, retry_, workers_, options(100));
    ASSERT_TRUE(pipeline.open("artifact"));
    
    fastpack::core::Result result;
    auto fed = feed(pipeline, 345, {50, 17}, result);
    ASSERT_TRUE(result);
    
    std::vector<CompletedPart> parts;
    ASSERT_TRUE(pipeline.finish(parts));
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[3].size, 45u);
    
    auto layout = store_->completed_parts("artifact");
    ASSERT_EQ(layout.size(), 4u);
    EXPECT_GT(layout.back().size, 0u);
    EXPECT_LE(layout.back().size, 100u);
    EXPECT_EQ(*store_->object("artifact"), fed);
}

TEST_F(PartPipelineTest, OutputSmallerThanOnePartIsSinglePart) {
    PartPipeline pipeline(store_, retry_, workers_, options(1000));
    ASSERT_TRUE(pipeline.open("artifact"));
    ASSERT_TRUE(pipeline.append(sequence(10)));
    ASSERT_TRUE(pipeline.append(std::vector<uint8_t>{}));
    
    std::vector<CompletedPart> parts;
    ASSERT_TRUE(pipeline.finish(parts));
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].size, 10u);
}

TEST_F(PartPipelineTest, NoOutputFailsAndAborts) {
    PartPipeline pipeline(store_, retry_, workers_, options(100));
    ASSERT_TRUE(pipeline.open("artifact"));
    
    std::vector<CompletedPart> parts;
    EXPECT_EQ(pipeline.finish(parts).error, ErrorCode::REPACKAGING_FAILURE);
    EXPECT_TRUE(pipeline.aborted());
    EXPECT_EQ(store_->call_count(StoreCall::ABORT_MULTIPART), 1u);
    EXPECT_EQ(store_->open_multipart_count(), 0u);
}

TEST_F(PartPipelineTest, PendingPartsStayBounded) {
    store_->set_part_latency(std::chrono::milliseconds(20));
    PartPipeline pipeline(store_, retry_, workers_, options(10, 2));
    ASSERT_TRUE(pipeline.open("artifact"));
    
    fastpack::core::Result result;
    feed(pipeline, 200, {10}, result);
    ASSERT_TRUE(result);
    
    std::vector<CompletedPart> parts;
    ASSERT_TRUE(pipeline.finish(parts));
    EXPECT_EQ(parts.size(), 20u);
    EXPECT_LE(store_->peak_concurrent_part_uploads(), 2u);
}

TEST_F(PartPipelineTest, TransientPartFailureIsRetried) {
    store_->inject_fault(FaultRule{StoreCall::UPLOAD_PART,
                                   StorageError(StorageErrorKind::THROTTLED, "slow down", 503), 2,
                                   [](const std::string&, uint32_t part) { return part == 3; }});
    
    PartPipeline pipeline(store_, retry_, workers_, options(10));
    ASSERT_TRUE(pipeline.open("artifact"));
    
    fastpack::core::Result result;
    auto fed = feed(pipeline, 50, {10}, result);
    ASSERT_TRUE(result);
    
    std::vector<CompletedPart> parts;
    ASSERT_TRUE(pipeline.finish(parts));
    EXPECT_EQ(*store_->object("artifact"), fed);
    EXPECT_EQ(store_->call_count(StoreCall::UPLOAD_PART), 7u);
}

TEST_F(PartPipelineTest, DrainTimeoutAbortsDestination) {
    store_->set_part_latency(std::chrono::milliseconds(400));
    PartPipeline pipeline(store_, retry_, workers_, options(10, 4, std::chrono::milliseconds(50)));
    ASSERT_TRUE(pipeline.open("artifact"));
    ASSERT_TRUE(pipeline.append(sequence(10)));
    
    std::vector<CompletedPart> parts;
    EXPECT_EQ(pipeline.finish(parts).error, ErrorCode::REPACKAGING_TIMEOUT);
    EXPECT_TRUE(pipeline.aborted());
    EXPECT_EQ(store_->call_count(StoreCall::ABORT_MULTIPART), 1u);
    
    workers_.join();
    EXPECT_FALSE(store_->has_object("artifact"));
}

TEST_F(PartPipelineTest, DestructionWithoutFinishAborts) {
    {
        PartPipeline pipeline(store_, retry_, workers_, options(10));
        ASSERT_TRUE(pipeline.open("artifact"));
        ASSERT_TRUE(pipeline.append(sequence(5)));
    }
    EXPECT_EQ(store_->call_count(StoreCall::ABORT_MULTIPART), 1u);
    EXPECT_EQ(store_->open_multipart_count(), 0u);
}

TEST_F(PartPipelineTest, RejectsUseBeforeOpen) {
    PartPipeline pipeline(store_, retry_, workers_, options(10));
    EXPECT_EQ(pipeline.append(sequence(5)).error, ErrorCode::INVALID_STATE);
    
    std::vector<CompletedPart> parts;
    EXPECT_EQ(pipeline.finish(parts).error, ErrorCode::INVALID_STATE);
    EXPECT_TRUE(pipeline.abort("nothing to abort"));
    EXPECT_EQ(store_->call_count(StoreCall::ABORT_MULTIPART), 0u);
}

TEST(PartPipelineMockTest, PermanentPartFailureAbortsExactlyOnce) {
    ASSERT_TRUE(fastpack::crypto::SecureRandom::initialize());
    auto store = std::make_shared<::testing::NiceMock<MockObjectStore>>();
    auto retry = instant_retry();
    boost::asio::thread_pool workers(4);
    
    EXPECT_CALL(*store, upload_part(_, _, _, _)).Times(::testing::AnyNumber());
    EXPECT_CALL(*store, upload_part(_, 2, _, _))
        .WillRepeatedly(Return(StorageError(StorageErrorKind::BAD_REQUEST, "rejected", 400)));
    EXPECT_CALL(*store, abort_multipart_upload(_)).Times(1);
    EXPECT_CALL(*store, complete_multipart_upload(_, _)).Times(0);
    
    PipelineOptions opts;
    opts.part_size = 10;
    opts.max_pending_parts = 2;
    opts.drain_timeout = std::chrono::milliseconds(5000);
    
    {
        PartPipeline pipeline(store, retry, workers, opts);
        ASSERT_TRUE(pipeline.open("artifact"));
        
        fastpack::core::Result result;
        feed(pipeline, 100, {10}, result);
        if (result) {
            std::vector<CompletedPart> parts;
            result = pipeline.finish(parts);
        }
        EXPECT_EQ(result.error, ErrorCode::REPACKAGING_FAILURE);
        EXPECT_TRUE(pipeline.aborted());
        EXPECT_TRUE(pipeline.abort("again"));
    }
    
    workers.join();
    EXPECT_EQ(store->real_.open_multipart_count(), 0u);
    EXPECT_FALSE(store->real_.has_object("artifact"));
}

TEST(PartPipelineMockTest, AbortWaitsForPartsInFlight) {
    ASSERT_TRUE(fastpack::crypto::SecureRandom::initialize());
    auto store = std::make_shared<::testing::NiceMock<MockObjectStore>>();
    auto retry = instant_retry();
    boost::asio::thread_pool workers(4);
    
    std::atomic<bool> aborted{false};
    std::atomic<bool> landed_after_abort{false};
    
    EXPECT_CALL(*store, upload_part(_, _, _, _)).Times(::testing::AnyNumber());
    EXPECT_CALL(*store, upload_part(_, 1, _, _))
        .Times(::testing::AtMost(1))
        .WillRepeatedly([&](const MultipartHandle& handle, uint32_t number, std::span<const uint8_t> data,
                            std::string& tag) {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            auto error = store->real_.upload_part(handle, number, data, tag);
            landed_after_abort = aborted.load();
            return error;
        });
    EXPECT_CALL(*store, upload_part(_, 2, _, _))
        .WillRepeatedly(Return(StorageError(StorageErrorKind::BAD_REQUEST, "rejected", 400)));
    EXPECT_CALL(*store, abort_multipart_upload(_)).WillOnce([&](const MultipartHandle& handle) {
        aborted = true;
        return store->real_.abort_multipart_upload(handle);
    });
    
    PipelineOptions opts;
    opts.part_size = 10;
    opts.max_pending_parts = 4;
    opts.drain_timeout = std::chrono::milliseconds(5000);
    
    {
        PartPipeline pipeline(store, retry, workers, opts);
        ASSERT_TRUE(pipeline.open("artifact"));
        
        fastpack::core::Result result;
        feed(pipeline, 30, {10}, result);
        if (result) {
            std::vector<CompletedPart> parts;
            result = pipeline.finish(parts);
        }
        EXPECT_EQ(result.error, ErrorCode::REPACKAGING_FAILURE);
        EXPECT_TRUE(pipeline.aborted());
    }
    
    workers.join();
    EXPECT_FALSE(landed_after_abort.load());
    EXPECT_EQ(store->real_.open_multipart_count(), 0u);
}

TEST(PipelineOptionsTest, ZeroValuesAreClamped) {
    auto store = std::make_shared<MemoryObjectStore>();
    boost::asio::thread_pool workers(1);
    PipelineOptions opts;
    opts.part_size = 0;
    opts.max_pending_parts = 0;
    
    PartPipeline pipeline(store, instant_retry(), workers, opts);
    ASSERT_TRUE(pipeline.open("artifact"));
    ASSERT_TRUE(pipeline.append(sequence(3)));
    
    std::vector<CompletedPart> parts;
    ASSERT_TRUE(pipeline.finish(parts));
    EXPECT_EQ(pipeline.parts_dispatched(), 3u);
    EXPECT_EQ(parts.size(), 3u);
}
