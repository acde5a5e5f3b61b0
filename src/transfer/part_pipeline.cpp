#include "fastpack/transfer/part_pipeline.hpp"
#include "fastpack/storage/storage_config.hpp"
#include "fastpack/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cstring>

namespace fastpack::transfer {

PipelineOptions PipelineOptions::from_config(const storage::StorageConfig& config) {
    PipelineOptions options;
    options.part_size = config.part_size;
    options.max_pending_parts = config.max_pending_parts;
    options.drain_timeout = config.drain_timeout;
    return options;
}

PartPipeline::PartPipeline(std::shared_ptr<storage::ObjectStore> store,
                           std::shared_ptr<RetryExecutor> retry,
                           boost::asio::thread_pool& workers,
                           const PipelineOptions& options)
    : store_(std::move(store))
    , retry_(std::move(retry))
    , workers_(workers)
    , options_(options)
    , state_(std::make_shared<SharedState>()) {
    if (options_.part_size == 0) {
        options_.part_size = 1;
    }
    if (options_.max_pending_parts == 0) {
        options_.max_pending_parts = 1;
    }
}

PartPipeline::~PartPipeline() {
    if (handle_.valid() && !completed_ && !aborted_) {
        LOG_WARN("Part pipeline for {} destroyed without finish(), aborting", handle_.key);
        try {
            auto result = abort("pipeline destroyed before completion");
            if (!result) {
                LOG_ERROR("Abort of {} failed: {}", handle_.key, result.message);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Abort of {} threw: {}", handle_.key, e.what());
        }
    }
}

core::Result PartPipeline::open(const std::string& destination_key) {
    if (handle_.valid()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Pipeline already open for " + handle_.key);
    }
    
    storage::MultipartHandle handle;
    auto error = retry_->execute("create multipart upload for " + destination_key, [&] {
        return store_->create_multipart_upload(destination_key, handle);
    });
    if (!error.ok()) {
        return to_result(error, "Cannot start destination upload " + destination_key);
    }
    
    handle_ = handle;
    LOG_INFO("Opened destination multipart upload {} for {}", handle_.upload_id, handle_.key);
    return core::Result::ok();
}

core::Result PartPipeline::append(std::vector<uint8_t>&& segment) {
    if (!handle_.valid() || completed_ || aborted_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Pipeline is not accepting output");
    }
    
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failed) {
            return fail(core::ErrorCode::REPACKAGING_FAILURE,
                        "Part upload failed: " + state_->first_error.describe());
        }
    }
    
    if (segment.empty()) {
        return core::Result::ok();
    }
    
    bytes_accepted_ += segment.size();
    buffered_ += segment.size();
    buffer_.push_back(std::move(segment));
    
    while (buffered_ >= options_.part_size) {
        auto result = dispatch(cut_unit(options_.part_size));
        if (!result) {
            return result;
        }
    }
    
    return core::Result::ok();
}

core::Result PartPipeline::finish(std::vector<storage::CompletedPart>& parts) {
    if (!handle_.valid() || completed_ || aborted_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Pipeline is not open");
    }
    
    if (buffered_ > 0) {
        auto result = dispatch(cut_unit(buffered_));
        if (!result) {
            return result;
        }
    }
    
    if (next_part_number_ == 0) {
        return fail(core::ErrorCode::REPACKAGING_FAILURE, "Encoder produced no output");
    }
    
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool drained = state_->changed.wait_for(lock, options_.drain_timeout, [this] {
            return state_->in_flight == 0 || state_->failed;
        });
        
        if (!drained) {
            auto pending = state_->in_flight;
            lock.unlock();
            return fail(core::ErrorCode::REPACKAGING_TIMEOUT,
                        std::to_string(pending) + " part uploads still pending after " +
                        std::to_string(options_.drain_timeout.count()) + "ms");
        }
        
        if (state_->failed) {
            auto description = state_->first_error.describe();
            lock.unlock();
            return fail(core::ErrorCode::REPACKAGING_FAILURE, "Part upload failed: " + description);
        }
        
        parts.clear();
        parts.reserve(state_->completed.size());
        for (const auto& [number, part] : state_->completed) {
            parts.push_back(part);
        }
    }
    
    if (parts.size() != next_part_number_) {
        return fail(core::ErrorCode::REPACKAGING_FAILURE,
                    "Expected " + std::to_string(next_part_number_) + " parts, have " + std::to_string(parts.size()));
    }
    
    auto error = retry_->execute("complete multipart upload " + handle_.key, [&] {
        return store_->complete_multipart_upload(handle_, parts);
    });
    if (!error.ok()) {
        return fail(core::ErrorCode::REPACKAGING_FAILURE, "Cannot complete " + handle_.key + ": " + error.describe());
    }
    
    completed_ = true;
    LOG_INFO("Completed {} with {} parts ({} bytes)", handle_.key, parts.size(), bytes_accepted_);
    return core::Result::ok();
}

core::Result PartPipeline::abort(const std::string& reason) {
    if (!handle_.valid() || aborted_ || completed_) {
        return core::Result::ok();
    }
    aborted_ = true;
    
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->failed) {
            state_->failed = true;
            state_->first_error = storage::StorageError(storage::StorageErrorKind::ABORTED, reason);
        }
        state_->changed.notify_all();
        
        // A part that lands after the abort would outlive it on the destination.
        bool settled = state_->changed.wait_for(lock, options_.drain_timeout, [this] {
            return state_->in_flight == 0;
        });
        if (!settled) {
            LOG_WARN("Aborting {} with {} part uploads still in flight", handle_.key, state_->in_flight);
        }
    }
    
    buffer_.clear();
    front_offset_ = 0;
    buffered_ = 0;
    
    LOG_WARN("Aborting destination upload {} of {}: {}", handle_.upload_id, handle_.key, reason);
    auto error = retry_->execute("abort multipart upload " + handle_.key, [&] {
        return store_->abort_multipart_upload(handle_);
    });
    return to_result(error, "Abort of " + handle_.key + " failed");
}

std::vector<uint8_t> PartPipeline::cut_unit(uint64_t size) {
    // Whole front segment of exactly the right length: hand it over without copying.
    if (front_offset_ == 0 && !buffer_.empty() && buffer_.front().size() == size) {
        auto unit = std::move(buffer_.front());
        buffer_.pop_front();
        buffered_ -= size;
        return unit;
    }
    
    std::vector<uint8_t> unit;
    unit.reserve(size);
    
    while (unit.size() < size) {
        auto& front = buffer_.front();
        size_t available = front.size() - front_offset_;
        size_t take = static_cast<size_t>(std::min<uint64_t>(available, size - unit.size()));
        
        unit.insert(unit.end(), front.begin() + front_offset_, front.begin() + front_offset_ + take);
        front_offset_ += take;
        
        if (front_offset_ == front.size()) {
            buffer_.pop_front();
            front_offset_ = 0;
        }
    }
    
    buffered_ -= size;
    return unit;
}

core::Result PartPipeline::dispatch(std::vector<uint8_t>&& unit) {
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool has_room = state_->changed.wait_for(lock, options_.drain_timeout, [this] {
            return state_->in_flight < options_.max_pending_parts || state_->failed;
        });
        
        if (!has_room) {
            lock.unlock();
            return fail(core::ErrorCode::REPACKAGING_TIMEOUT,
                        "No part upload finished within " + std::to_string(options_.drain_timeout.count()) + "ms");
        }
        if (state_->failed) {
            auto description = state_->first_error.describe();
            lock.unlock();
            return fail(core::ErrorCode::REPACKAGING_FAILURE, "Part upload failed: " + description);
        }
        
        ++state_->in_flight;
    }
    
    uint32_t part_number = ++next_part_number_;
    LOG_DEBUG("Dispatching part {} of {} ({} bytes)", part_number, handle_.key, unit.size());
    
    auto payload = std::make_shared<std::vector<uint8_t>>(std::move(unit));
    boost::asio::post(workers_, [state = state_, store = store_, retry = retry_,
                                 handle = handle_, part_number, payload]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->failed) {
                --state->in_flight;
                state->changed.notify_all();
                return;
            }
        }
        
        std::string tag;
        auto error = retry->execute("upload part " + std::to_string(part_number) + " of " + handle.key, [&] {
            return store->upload_part(handle, part_number, std::span<const uint8_t>(*payload), tag);
        });
        
        std::lock_guard<std::mutex> lock(state->mutex);
        --state->in_flight;
        if (error.ok()) {
            state->completed[part_number] = storage::CompletedPart{part_number, tag, payload->size()};
        } else if (!state->failed) {
            state->failed = true;
            state->first_error = error;
        }
        state->changed.notify_all();
    });
    
    return core::Result::ok();
}

core::Result PartPipeline::fail(core::ErrorCode code, const std::string& message) {
    LOG_ERROR("Part pipeline for {} failed: {}", handle_.key, message);
    auto aborted = abort(message);
    if (!aborted) {
        LOG_ERROR("{}", aborted.message);
    }
    return core::Result(code, message);
}

} // namespace fastpack::transfer
