#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "../core/result.hpp"
#include "../storage/object_store.hpp"
#include "../storage/records.hpp"
#include "../storage/storage_config.hpp"
#include "retry_executor.hpp"
#include "segment_channel.hpp"

namespace fastpack::archive {
class ZipWriter;
}

namespace fastpack::transfer {

struct RepackageOutcome {
    std::vector<storage::CompletedPart> parts;
    uint64_t archive_size = 0;
    uint32_t entries = 0;
};

struct RepackageObserver {
    std::function<void(const storage::FileUpload& file, uint32_t index)> on_file_started;
    std::function<void(const storage::FileUpload& file, uint32_t index)> on_file_completed;
    std::function<void()> on_finalizing;
};

// Streams finalized source blobs into one archive written to a destination
// multipart upload. Only a handful of read windows and part buffers are ever
// resident.
class Repackager {
public:
    static constexpr size_t ENCODER_QUEUE_DEPTH = 4;
    
    Repackager(std::shared_ptr<storage::ObjectStore> store,
               std::shared_ptr<RetryExecutor> retry,
               boost::asio::thread_pool& part_workers,
               const storage::StorageConfig& config);
    
    core::Result repackage(const storage::LogicalUpload& upload, const std::string& destination_key,
                           RepackageOutcome& outcome, const RepackageObserver& observer = {});

private:
    using Channel = SegmentChannel<std::vector<uint8_t>>;
    
    core::Result encode(const storage::LogicalUpload& upload, Channel& channel, const RepackageObserver& observer);
    core::Result stream_file(const storage::FileUpload& file, archive::ZipWriter& writer);
    
    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<RetryExecutor> retry_;
    boost::asio::thread_pool& part_workers_;
    storage::StorageConfig config_;
};

} // namespace fastpack::transfer
