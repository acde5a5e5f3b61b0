#include "fastpack/storage/memory_object_store.hpp"
#include "fastpack/crypto/hash.hpp"
#include "fastpack/core/logger.hpp"
#include <algorithm>
#include <thread>

namespace fastpack::storage {

namespace {
    StorageError not_found(const std::string& what) {
        return StorageError(StorageErrorKind::NOT_FOUND, what + " not found", 404);
    }
}

StorageError MemoryObjectStore::create_multipart_upload(const std::string& key, MultipartHandle& handle) {
    count_call(StorageOperation::CREATE_MULTIPART);
    if (auto fault = take_fault(StorageOperation::CREATE_MULTIPART, key, 0)) {
        return *fault;
    }
    if (key.empty()) {
        return StorageError(StorageErrorKind::BAD_REQUEST, "Empty object key", 400);
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    handle.key = key;
    handle.upload_id = "mpu-" + std::to_string(next_upload_id_++);
    multipart_[handle.upload_id] = PendingMultipart{key, {}};
    return StorageError::success();
}

StorageError MemoryObjectStore::upload_part(const MultipartHandle& handle, uint32_t part_number,
                                            std::span<const uint8_t> data, std::string& content_tag) {
    count_call(StorageOperation::UPLOAD_PART);
    
    auto active = ++active_part_uploads_;
    auto peak = peak_part_uploads_.load();
    while (active > peak && !peak_part_uploads_.compare_exchange_weak(peak, active)) {
    }
    
    std::chrono::milliseconds latency;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latency = part_latency_;
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
    
    auto finish = [this](StorageError error) {
        --active_part_uploads_;
        return error;
    };
    
    if (auto fault = take_fault(StorageOperation::UPLOAD_PART, handle.key, part_number)) {
        return finish(*fault);
    }
    if (part_number == 0 || part_number > 10000) {
        return finish(StorageError(StorageErrorKind::BAD_REQUEST,
            "Part number out of range: " + std::to_string(part_number), 400));
    }
    
    auto tag = crypto::hash_utils::content_tag(data);
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = multipart_.find(handle.upload_id);
    if (it == multipart_.end() || it->second.key != handle.key) {
        return finish(not_found("Multipart upload " + handle.upload_id));
    }
    
    it->second.parts[part_number] = StoredPart{std::vector<uint8_t>(data.begin(), data.end()), tag};
    content_tag = tag;
    return finish(StorageError::success());
}

StorageError MemoryObjectStore::complete_multipart_upload(const MultipartHandle& handle,
                                                          const std::vector<CompletedPart>& parts) {
    count_call(StorageOperation::COMPLETE_MULTIPART);
    if (auto fault = take_fault(StorageOperation::COMPLETE_MULTIPART, handle.key, 0)) {
        return *fault;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = multipart_.find(handle.upload_id);
    if (it == multipart_.end() || it->second.key != handle.key) {
        return not_found("Multipart upload " + handle.upload_id);
    }
    
    std::map<uint32_t, StoredPartInfo> stored;
    for (const auto& [number, part] : it->second.parts) {
        stored[number] = StoredPartInfo{part.content_tag, part.data.size()};
    }
    
    std::vector<CompletedPart> layout;
    auto validation = validate_completion(parts, stored, layout);
    if (!validation.ok()) {
        return validation;
    }
    
    uint64_t total = 0;
    for (const auto& part : layout) {
        total += part.size;
    }
    
    auto blob = std::make_shared<std::vector<uint8_t>>();
    blob->reserve(total);
    for (const auto& part : layout) {
        const auto& bytes = it->second.parts[part.part_number].data;
        blob->insert(blob->end(), bytes.begin(), bytes.end());
    }
    
    objects_[handle.key] = std::move(blob);
    completed_layouts_[handle.key] = std::move(layout);
    multipart_.erase(it);
    return StorageError::success();
}

StorageError MemoryObjectStore::abort_multipart_upload(const MultipartHandle& handle) {
    count_call(StorageOperation::ABORT_MULTIPART);
    if (auto fault = take_fault(StorageOperation::ABORT_MULTIPART, handle.key, 0)) {
        return *fault;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    multipart_.erase(handle.upload_id);
    return StorageError::success();
}

StorageError MemoryObjectStore::head(const std::string& key, uint64_t& size) {
    count_call(StorageOperation::HEAD);
    if (auto fault = take_fault(StorageOperation::HEAD, key, 0)) {
        return *fault;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return not_found("Object " + key);
    }
    size = it->second->size();
    return StorageError::success();
}

StorageError MemoryObjectStore::read_range(const std::string& key, uint64_t offset, uint64_t length,
                                           std::vector<uint8_t>& out) {
    count_call(StorageOperation::READ_RANGE);
    if (auto fault = take_fault(StorageOperation::READ_RANGE, key, 0)) {
        return *fault;
    }
    
    std::shared_ptr<const std::vector<uint8_t>> blob;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return not_found("Object " + key);
        }
        blob = it->second;
    }
    
    if (offset > blob->size()) {
        return StorageError(StorageErrorKind::BAD_REQUEST, "Range starts past end of " + key, 416);
    }
    
    auto end = offset + std::min<uint64_t>(length, blob->size() - offset);
    out.assign(blob->begin() + static_cast<std::ptrdiff_t>(offset),
               blob->begin() + static_cast<std::ptrdiff_t>(end));
    return StorageError::success();
}

StorageError MemoryObjectStore::get(const std::string& key, std::vector<uint8_t>& out) {
    count_call(StorageOperation::GET);
    if (auto fault = take_fault(StorageOperation::GET, key, 0)) {
        return *fault;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return not_found("Object " + key);
    }
    out = *it->second;
    return StorageError::success();
}

StorageError MemoryObjectStore::put(const std::string& key, std::span<const uint8_t> data) {
    count_call(StorageOperation::PUT);
    if (auto fault = take_fault(StorageOperation::PUT, key, 0)) {
        return *fault;
    }
    
    auto blob = std::make_shared<const std::vector<uint8_t>>(data.begin(), data.end());
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = std::move(blob);
    return StorageError::success();
}

StorageError MemoryObjectStore::copy(const std::string& source_key, const std::string& destination_key) {
    count_call(StorageOperation::COPY);
    if (auto fault = take_fault(StorageOperation::COPY, source_key, 0)) {
        return *fault;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(source_key);
    if (it == objects_.end()) {
        return not_found("Object " + source_key);
    }
    // Blobs are immutable, so the copy can share storage.
    objects_[destination_key] = it->second;
    return StorageError::success();
}

StorageError MemoryObjectStore::remove(const std::string& key) {
    count_call(StorageOperation::REMOVE);
    if (auto fault = take_fault(StorageOperation::REMOVE, key, 0)) {
        return *fault;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
    return StorageError::success();
}

void MemoryObjectStore::inject_fault(FaultRule rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_.push_back(std::move(rule));
}

void MemoryObjectStore::clear_faults() {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_.clear();
}

void MemoryObjectStore::set_part_latency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    part_latency_ = latency;
}

size_t MemoryObjectStore::call_count(StorageOperation operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = call_counts_.find(static_cast<int>(operation));
    return it != call_counts_.end() ? it->second : 0;
}

bool MemoryObjectStore::has_object(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.find(key) != objects_.end();
}

std::optional<std::vector<uint8_t>> MemoryObjectStore::object(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return *it->second;
}

size_t MemoryObjectStore::object_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

size_t MemoryObjectStore::open_multipart_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return multipart_.size();
}

std::vector<CompletedPart> MemoryObjectStore::completed_parts(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = completed_layouts_.find(key);
    if (it == completed_layouts_.end()) {
        return {};
    }
    return it->second;
}

std::optional<StorageError> MemoryObjectStore::take_fault(StorageOperation operation, const std::string& key,
                                                          uint32_t part_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = faults_.begin(); it != faults_.end(); ++it) {
        if (it->operation != operation) {
            continue;
        }
        if (it->matches && !it->matches(key, part_number)) {
            continue;
        }
        
        auto error = it->error;
        if (it->remaining > 0 && --it->remaining == 0) {
            faults_.erase(it);
        }
        LOG_DEBUG("Injected fault on {}: {}", key, error.describe());
        return error;
    }
    return std::nullopt;
}

void MemoryObjectStore::count_call(StorageOperation operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++call_counts_[static_cast<int>(operation)];
}

} // namespace fastpack::storage
