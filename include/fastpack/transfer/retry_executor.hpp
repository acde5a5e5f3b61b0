#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

#include "../core/result.hpp"
#include "../storage/object_store.hpp"

namespace fastpack::storage {
struct StorageConfig;
}

namespace fastpack::transfer {

struct RetryPolicy {
    uint32_t max_attempts = 5;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds jitter_ceiling{1000};
    
    static RetryPolicy from_config(const storage::StorageConfig& config);
};

using StorageOperation = std::function<storage::StorageError()>;
using RetryClassifier = std::function<bool(const storage::StorageError&)>;

// Exponential backoff with additive jitter. Thread-safe.
class RetryExecutor {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    
    explicit RetryExecutor(const RetryPolicy& policy = RetryPolicy{});
    
    storage::StorageError execute(const std::string& operation_name, const StorageOperation& operation) const;
    storage::StorageError execute(const std::string& operation_name, const StorageOperation& operation,
                                  uint32_t max_attempts, const RetryClassifier& is_retryable) const;
    
    // Wait after failed attempt `attempt` (1-based):
    // base * 2^(attempt-1) + uniform[0, jitter_ceiling).
    std::chrono::milliseconds compute_delay(uint32_t attempt) const;
    
    static bool is_retryable(const storage::StorageError& error);
    
    void set_sleep_function(SleepFunction sleep);
    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    SleepFunction sleep_;
    mutable std::mt19937_64 rng_;
    mutable std::mutex rng_mutex_;
};

// Maps a storage failure onto the engine's error taxonomy.
core::Result to_result(const storage::StorageError& error, const std::string& context);

} // namespace fastpack::transfer
