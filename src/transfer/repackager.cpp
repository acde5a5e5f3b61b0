#include "fastpack/transfer/repackager.hpp"
#include "fastpack/transfer/part_pipeline.hpp"
#include "fastpack/archive/zip_writer.hpp"
#include "fastpack/core/logger.hpp"
#include "fastpack/core/utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace fastpack::transfer {

Repackager::Repackager(std::shared_ptr<storage::ObjectStore> store,
                       std::shared_ptr<RetryExecutor> retry,
                       boost::asio::thread_pool& part_workers,
                       const storage::StorageConfig& config)
    : store_(std::move(store))
    , retry_(std::move(retry))
    , part_workers_(part_workers)
    , config_(config) {
}

namespace {
    // Abort failures are logged; the caller already carries the primary error.
    void abort_quietly(PartPipeline& pipeline, const std::string& reason) {
        try {
            auto aborted = pipeline.abort(reason);
            if (!aborted) {
                LOG_ERROR("{}", aborted.message);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Abort of {} threw: {}", pipeline.handle().key, e.what());
        }
    }
}

core::Result Repackager::repackage(const storage::LogicalUpload& upload, const std::string& destination_key,
                                   RepackageOutcome& outcome, const RepackageObserver& observer) {
    LOG_INFO("Repackaging upload {} ({} files, {}) into {}", upload.upload_id, upload.files.size(),
             core::utils::StringUtils::format_bytes(upload.total_size()), destination_key);
    
    PartPipeline pipeline(store_, retry_, part_workers_, PipelineOptions::from_config(config_));
    auto result = pipeline.open(destination_key);
    if (!result) {
        return core::Result(core::ErrorCode::REPACKAGING_FAILURE, result.message);
    }
    
    Channel channel(ENCODER_QUEUE_DEPTH);
    core::Result encoder_result;
    
    std::thread encoder([&] {
        try {
            encoder_result = encode(upload, channel, observer);
        } catch (const std::exception& e) {
            encoder_result = core::Result(core::ErrorCode::REPACKAGING_FAILURE,
                                          std::string("Encoder error: ") + e.what());
        }
        
        if (encoder_result) {
            channel.close();
        } else {
            channel.cancel();
        }
    });
    
    // Stops and joins the encoder if the consumer side unwinds.
    struct EncoderJoin {
        Channel& channel;
        std::thread& thread;
        ~EncoderJoin() {
            if (thread.joinable()) {
                channel.cancel();
                thread.join();
            }
        }
    } encoder_join{channel, encoder};
    
    core::Result consumer_result;
    try {
        while (auto segment = channel.pop()) {
            consumer_result = pipeline.append(std::move(*segment));
            if (!consumer_result) {
                channel.cancel();
                break;
            }
        }
    } catch (const std::exception& e) {
        consumer_result = core::Result(core::ErrorCode::REPACKAGING_FAILURE,
                                       std::string("Part slicing error: ") + e.what());
        channel.cancel();
    }
    
    encoder.join();
    
    if (!consumer_result) {
        abort_quietly(pipeline, consumer_result.message);
        return consumer_result;
    }
    
    if (!encoder_result) {
        LOG_ERROR("Encoder for upload {} failed: {}", upload.upload_id, encoder_result.message);
        abort_quietly(pipeline, encoder_result.message);
        return core::Result(core::ErrorCode::REPACKAGING_FAILURE, encoder_result.message);
    }
    
    if (observer.on_finalizing) {
        observer.on_finalizing();
    }
    
    try {
        result = pipeline.finish(outcome.parts);
    } catch (const std::exception& e) {
        result = core::Result(core::ErrorCode::REPACKAGING_FAILURE, std::string("Part drain error: ") + e.what());
        abort_quietly(pipeline, result.message);
    }
    if (!result) {
        return result;
    }
    
    outcome.archive_size = 0;
    for (const auto& part : outcome.parts) {
        outcome.archive_size += part.size;
    }
    outcome.entries = static_cast<uint32_t>(upload.files.size());
    
    LOG_INFO("Upload {} repackaged: {} parts, {}", upload.upload_id, outcome.parts.size(),
             core::utils::StringUtils::format_bytes(outcome.archive_size));
    return core::Result::ok();
}

core::Result Repackager::encode(const storage::LogicalUpload& upload, Channel& channel,
                                const RepackageObserver& observer) {
    archive::ZipWriter writer([&channel](std::vector<uint8_t>&& segment) {
        return channel.push(std::move(segment));
    }, config_.compression_level);
    
    for (uint32_t index = 0; index < upload.files.size(); ++index) {
        const auto& file = upload.files[index];
        if (observer.on_file_started) {
            observer.on_file_started(file, index);
        }
        
        auto result = stream_file(file, writer);
        if (!result) {
            return result;
        }
        
        if (observer.on_file_completed) {
            observer.on_file_completed(file, index);
        }
        
        auto key = file.source_key();
        auto error = retry_->execute("delete source " + key, [&] {
            return store_->remove(key);
        });
        if (!error.ok()) {
            LOG_WARN("Could not delete source {} after repackaging: {}", key, error.describe());
        }
    }
    
    return writer.finish();
}

core::Result Repackager::stream_file(const storage::FileUpload& file, archive::ZipWriter& writer) {
    auto key = file.source_key();
    
    uint64_t size = 0;
    auto error = retry_->execute("head " + key, [&] {
        return store_->head(key, size);
    });
    if (!error.ok()) {
        return core::Result(core::ErrorCode::REPACKAGING_FAILURE, "Cannot stat source " + key + ": " + error.describe());
    }
    if (size != file.declared_size) {
        return core::Result(core::ErrorCode::REPACKAGING_FAILURE,
            "Source " + key + " holds " + std::to_string(size) + " bytes, declared " +
            std::to_string(file.declared_size));
    }
    
    auto result = writer.begin_entry(file.name, size);
    if (!result) {
        return result;
    }
    
    uint64_t offset = 0;
    while (offset < size) {
        uint64_t length = std::min(config_.read_window, size - offset);
        std::vector<uint8_t> window;
        
        error = retry_->execute("read " + key, [&] {
            return store_->read_range(key, offset, length, window);
        });
        if (!error.ok()) {
            return core::Result(core::ErrorCode::REPACKAGING_FAILURE,
                "Range read of " + key + " at " + std::to_string(offset) + " failed: " + error.describe());
        }
        if (window.size() != length) {
            return core::Result(core::ErrorCode::REPACKAGING_FAILURE,
                "Short range read of " + key + " at " + std::to_string(offset));
        }
        
        offset += length;
        result = writer.write(std::move(window));
        if (!result) {
            return result;
        }
    }
    
    LOG_DEBUG("Streamed {} ({} bytes) into archive", file.name, size);
    return writer.end_entry();
}

} // namespace fastpack::transfer
