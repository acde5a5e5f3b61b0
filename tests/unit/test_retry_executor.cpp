#include <gtest/gtest.h>
#include "fastpack/transfer/retry_executor.hpp"
#include "fastpack/storage/storage_config.hpp"
#include <set>
#include <vector>

using namespace fastpack::transfer;
using fastpack::storage::StorageError;
using fastpack::storage::StorageErrorKind;
using fastpack::core::ErrorCode;

class RetryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_unique<RetryExecutor>(RetryPolicy{});
        executor_->set_sleep_function([this](std::chrono::milliseconds delay) {
            sleeps_.push_back(delay);
        });
    }
    
    std::unique_ptr<RetryExecutor> executor_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(RetryExecutorTest, BackoffWindowsPerAttempt) {
    const int64_t lower[] = {1000, 2000, 4000, 8000, 16000};
    
    for (int round = 0; round < 200; ++round) {
        for (uint32_t attempt = 1; attempt <= 5; ++attempt) {
            auto delay = executor_->compute_delay(attempt).count();
            EXPECT_GE(delay, lower[attempt - 1]) << "attempt " << attempt;
            EXPECT_LT(delay, lower[attempt - 1] + 1000) << "attempt " << attempt;
        }
    }
}

TEST_F(RetryExecutorTest, JitterSpreadsDelays) {
    std::set<int64_t> distinct;
    for (int i = 0; i < 100; ++i) {
        distinct.insert(executor_->compute_delay(1).count());
    }
    EXPECT_GT(distinct.size(), 10u);
}

TEST_F(RetryExecutorTest, ZeroJitterIsDeterministic) {
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(10);
    policy.jitter_ceiling = std::chrono::milliseconds(0);
    RetryExecutor executor(policy);
    
    EXPECT_EQ(executor.compute_delay(1).count(), 10);
    EXPECT_EQ(executor.compute_delay(4).count(), 80);
}

TEST_F(RetryExecutorTest, SucceedsWithoutRetry) {
    int calls = 0;
    auto error = executor_->execute("op", [&] {
        ++calls;
        return StorageError::success();
    });
    
    EXPECT_TRUE(error.ok());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryExecutorTest, RetriesTransientUntilSuccess) {
    int calls = 0;
    auto error = executor_->execute("op", [&] {
        ++calls;
        if (calls < 3) {
            return StorageError(StorageErrorKind::SERVER_ERROR, "busy", 503);
        }
        return StorageError::success();
    });
    
    EXPECT_TRUE(error.ok());
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_GE(sleeps_[0].count(), 1000);
    EXPECT_GE(sleeps_[1].count(), 2000);
}

TEST_F(RetryExecutorTest, ReturnsLastErrorWhenExhausted) {
    int calls = 0;
    auto error = executor_->execute("op", [&] {
        ++calls;
        return StorageError(StorageErrorKind::TIMEOUT, "attempt " + std::to_string(calls));
    });
    
    EXPECT_EQ(error.kind, StorageErrorKind::TIMEOUT);
    EXPECT_EQ(error.message, "attempt 5");
    EXPECT_EQ(calls, 5);
    EXPECT_EQ(sleeps_.size(), 4u);
}

TEST_F(RetryExecutorTest, PermanentErrorSurfacesImmediately) {
    int calls = 0;
    auto error = executor_->execute("op", [&] {
        ++calls;
        return StorageError(StorageErrorKind::UNAUTHORIZED, "denied", 403);
    });
    
    EXPECT_EQ(error.kind, StorageErrorKind::UNAUTHORIZED);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryExecutorTest, CustomAttemptsAndClassifier) {
    int calls = 0;
    auto error = executor_->execute("op", [&] {
        ++calls;
        return StorageError(StorageErrorKind::NOT_FOUND, "eventually consistent");
    }, 3, [](const StorageError& e) { return e.kind == StorageErrorKind::NOT_FOUND; });
    
    EXPECT_EQ(error.kind, StorageErrorKind::NOT_FOUND);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps_.size(), 2u);
}

TEST_F(RetryExecutorTest, Classifier) {
    EXPECT_TRUE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::TIMEOUT, "")));
    EXPECT_TRUE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::CONNECTION_RESET, "")));
    EXPECT_TRUE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::THROTTLED, "", 429)));
    EXPECT_TRUE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::SERVER_ERROR, "", 500)));
    EXPECT_TRUE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::PROTOCOL_RESET, "")));
    EXPECT_TRUE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::BAD_REQUEST, "", 408)));
    EXPECT_TRUE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::BAD_REQUEST, "", 502)));
    
    EXPECT_FALSE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::BAD_REQUEST, "", 400)));
    EXPECT_FALSE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::UNAUTHORIZED, "", 403)));
    EXPECT_FALSE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::NOT_FOUND, "", 404)));
    EXPECT_FALSE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::INVALID_PART, "", 400)));
    EXPECT_FALSE(RetryExecutor::is_retryable(StorageError(StorageErrorKind::ABORTED, "")));
}

TEST_F(RetryExecutorTest, ClassifierIgnoresMessageText) {
    StorageError error(StorageErrorKind::BAD_REQUEST, "connection reset by peer (timeout)", 400);
    EXPECT_FALSE(RetryExecutor::is_retryable(error));
}

TEST_F(RetryExecutorTest, MapsToResultTaxonomy) {
    EXPECT_TRUE(to_result(StorageError::success(), "ctx"));
    EXPECT_EQ(to_result(StorageError(StorageErrorKind::TIMEOUT, "slow"), "ctx").error,
              ErrorCode::TRANSIENT_STORAGE_ERROR);
    EXPECT_EQ(to_result(StorageError(StorageErrorKind::NOT_FOUND, "gone"), "ctx").error, ErrorCode::NOT_FOUND);
    
    auto result = to_result(StorageError(StorageErrorKind::INVALID_PART, "tag mismatch", 400), "complete");
    EXPECT_EQ(result.error, ErrorCode::PERMANENT_STORAGE_ERROR);
    EXPECT_NE(result.message.find("complete"), std::string::npos);
}

TEST_F(RetryExecutorTest, PolicyFromConfig) {
    fastpack::storage::StorageConfig config;
    config.retry_max_attempts = 3;
    config.retry_base_delay = std::chrono::milliseconds(250);
    config.retry_jitter = std::chrono::milliseconds(50);
    
    auto policy = RetryPolicy::from_config(config);
    EXPECT_EQ(policy.max_attempts, 3u);
    EXPECT_EQ(policy.base_delay.count(), 250);
    EXPECT_EQ(policy.jitter_ceiling.count(), 50);
}
