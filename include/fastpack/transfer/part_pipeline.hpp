#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "../core/result.hpp"
#include "../storage/object_store.hpp"
#include "retry_executor.hpp"

namespace fastpack::storage {
struct StorageConfig;
}

namespace fastpack::transfer {

struct PipelineOptions {
    uint64_t part_size = 50ULL * 1024 * 1024;
    uint32_t max_pending_parts = 4;
    std::chrono::milliseconds drain_timeout{60000};
    
    static PipelineOptions from_config(const storage::StorageConfig& config);
};

// Re-slices an irregular byte stream into equal-size parts of one destination
// multipart upload. Part numbers are assigned in arrival order at slice time;
// uploads run on `workers` and may complete in any order.
class PartPipeline {
public:
    PartPipeline(std::shared_ptr<storage::ObjectStore> store,
                 std::shared_ptr<RetryExecutor> retry,
                 boost::asio::thread_pool& workers,
                 const PipelineOptions& options);
    ~PartPipeline();
    
    PartPipeline(const PartPipeline&) = delete;
    PartPipeline& operator=(const PartPipeline&) = delete;
    
    core::Result open(const std::string& destination_key);
    
    // Blocks while max_pending_parts uploads are in flight.
    core::Result append(std::vector<uint8_t>&& segment);
    
    // Uploads the trailing unit, waits for the pending set to drain under the
    // drain timeout and completes the multipart upload. Every failure path
    // aborts the destination upload before returning.
    core::Result finish(std::vector<storage::CompletedPart>& parts);
    
    // Idempotent; only the first call reaches the store.
    core::Result abort(const std::string& reason);
    
    const storage::MultipartHandle& handle() const { return handle_; }
    uint64_t bytes_accepted() const { return bytes_accepted_; }
    uint32_t parts_dispatched() const { return next_part_number_; }
    bool completed() const { return completed_; }
    bool aborted() const { return aborted_; }

private:
    struct SharedState {
        std::mutex mutex;
        std::condition_variable changed;
        size_t in_flight = 0;
        std::map<uint32_t, storage::CompletedPart> completed;
        bool failed = false;
        storage::StorageError first_error;
    };
    
    std::vector<uint8_t> cut_unit(uint64_t size);
    core::Result dispatch(std::vector<uint8_t>&& unit);
    core::Result fail(core::ErrorCode code, const std::string& message);
    
    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<RetryExecutor> retry_;
    boost::asio::thread_pool& workers_;
    PipelineOptions options_;
    
    storage::MultipartHandle handle_;
    std::shared_ptr<SharedState> state_;
    
    std::deque<std::vector<uint8_t>> buffer_;
    size_t front_offset_ = 0;
    uint64_t buffered_ = 0;
    
    uint64_t bytes_accepted_ = 0;
    uint32_t next_part_number_ = 0;
    bool completed_ = false;
    bool aborted_ = false;
};

} // namespace fastpack::transfer
