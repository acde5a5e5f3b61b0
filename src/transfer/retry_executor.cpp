#include "fastpack/transfer/retry_executor.hpp"
#include "fastpack/storage/storage_config.hpp"
#include "fastpack/core/logger.hpp"
#include <algorithm>
#include <thread>

namespace fastpack::transfer {

RetryPolicy RetryPolicy::from_config(const storage::StorageConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = config.retry_max_attempts;
    policy.base_delay = config.retry_base_delay;
    policy.jitter_ceiling = config.retry_jitter;
    return policy;
}

RetryExecutor::RetryExecutor(const RetryPolicy& policy)
    : policy_(policy)
    , sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
    , rng_(std::random_device{}()) {
}

storage::StorageError RetryExecutor::execute(const std::string& operation_name,
                                             const StorageOperation& operation) const {
    return execute(operation_name, operation, policy_.max_attempts, &RetryExecutor::is_retryable);
}

storage::StorageError RetryExecutor::execute(const std::string& operation_name, const StorageOperation& operation,
                                             uint32_t max_attempts, const RetryClassifier& is_retryable) const {
    if (max_attempts == 0) {
        max_attempts = 1;
    }
    
    storage::StorageError last_error;
    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        last_error = operation();
        if (last_error.ok()) {
            if (attempt > 1) {
                LOG_INFO("{} succeeded on attempt {}", operation_name, attempt);
            }
            return last_error;
        }
        
        if (!is_retryable(last_error)) {
            LOG_ERROR("{} failed with non-retryable error: {}", operation_name, last_error.describe());
            return last_error;
        }
        
        if (attempt == max_attempts) {
            break;
        }
        
        auto delay = compute_delay(attempt);
        LOG_WARN("{} attempt {}/{} failed ({}), retrying in {}ms",
                 operation_name, attempt, max_attempts, last_error.describe(), delay.count());
        sleep_(delay);
    }
    
    LOG_ERROR("{} failed after {} attempts: {}", operation_name, max_attempts, last_error.describe());
    return last_error;
}

std::chrono::milliseconds RetryExecutor::compute_delay(uint32_t attempt) const {
    if (attempt == 0) {
        attempt = 1;
    }
    
    // Cap the exponent so the shift cannot overflow.
    uint32_t exponent = std::min<uint32_t>(attempt - 1, 30);
    int64_t delay = policy_.base_delay.count() * (int64_t{1} << exponent);
    
    if (policy_.jitter_ceiling.count() > 0) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_int_distribution<int64_t> jitter(0, policy_.jitter_ceiling.count() - 1);
        delay += jitter(rng_);
    }
    
    return std::chrono::milliseconds(delay);
}

bool RetryExecutor::is_retryable(const storage::StorageError& error) {
    using storage::StorageErrorKind;
    
    switch (error.kind) {
        case StorageErrorKind::TIMEOUT:
        case StorageErrorKind::CONNECTION_RESET:
        case StorageErrorKind::THROTTLED:
        case StorageErrorKind::SERVER_ERROR:
        case StorageErrorKind::PROTOCOL_RESET:
            return true;
        case StorageErrorKind::NONE:
        case StorageErrorKind::BAD_REQUEST:
        case StorageErrorKind::UNAUTHORIZED:
        case StorageErrorKind::NOT_FOUND:
        case StorageErrorKind::INVALID_PART:
        case StorageErrorKind::ABORTED:
            break;
    }
    
    // Transient status codes win even when the client picked a generic kind.
    int status = error.status_code;
    return status == 408 || status == 429 || (status >= 500 && status <= 599);
}

void RetryExecutor::set_sleep_function(SleepFunction sleep) {
    sleep_ = std::move(sleep);
}

core::Result to_result(const storage::StorageError& error, const std::string& context) {
    if (error.ok()) {
        return core::Result::ok();
    }
    
    auto message = context + ": " + error.describe();
    if (RetryExecutor::is_retryable(error)) {
        return core::Result(core::ErrorCode::TRANSIENT_STORAGE_ERROR, message);
    }
    if (error.kind == storage::StorageErrorKind::NOT_FOUND) {
        return core::Result(core::ErrorCode::NOT_FOUND, message);
    }
    return core::Result(core::ErrorCode::PERMANENT_STORAGE_ERROR, message);
}

} // namespace fastpack::transfer
