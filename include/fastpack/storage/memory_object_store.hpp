#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "object_store.hpp"

namespace fastpack::storage {

enum class StorageOperation {
    CREATE_MULTIPART,
    UPLOAD_PART,
    COMPLETE_MULTIPART,
    ABORT_MULTIPART,
    HEAD,
    READ_RANGE,
    GET,
    PUT,
    COPY,
    REMOVE
};

// Injected failure. Fires for calls whose key/part match `matches` (all calls
// when unset), `remaining` times or forever when not positive.
struct FaultRule {
    StorageOperation operation;
    StorageError error;
    int remaining = -1;
    std::function<bool(const std::string& key, uint32_t part_number)> matches;
};

class MemoryObjectStore : public ObjectStore {
public:
    MemoryObjectStore() = default;
    ~MemoryObjectStore() override = default;
    
    StorageError create_multipart_upload(const std::string& key, MultipartHandle& handle) override;
    StorageError upload_part(const MultipartHandle& handle, uint32_t part_number,
                             std::span<const uint8_t> data, std::string& content_tag) override;
    StorageError complete_multipart_upload(const MultipartHandle& handle,
                                           const std::vector<CompletedPart>& parts) override;
    StorageError abort_multipart_upload(const MultipartHandle& handle) override;
    
    StorageError head(const std::string& key, uint64_t& size) override;
    StorageError read_range(const std::string& key, uint64_t offset, uint64_t length,
                            std::vector<uint8_t>& out) override;
    StorageError get(const std::string& key, std::vector<uint8_t>& out) override;
    StorageError put(const std::string& key, std::span<const uint8_t> data) override;
    StorageError copy(const std::string& source_key, const std::string& destination_key) override;
    StorageError remove(const std::string& key) override;
    
    void inject_fault(FaultRule rule);
    void clear_faults();
    void set_part_latency(std::chrono::milliseconds latency);
    
    size_t call_count(StorageOperation operation) const;
    bool has_object(const std::string& key) const;
    std::optional<std::vector<uint8_t>> object(const std::string& key) const;
    size_t object_count() const;
    size_t open_multipart_count() const;
    
    // Part layout of the last successful complete for `key`.
    std::vector<CompletedPart> completed_parts(const std::string& key) const;
    
    // Largest number of upload_part calls observed running at the same time.
    size_t peak_concurrent_part_uploads() const { return peak_part_uploads_.load(); }

private:
    struct StoredPart {
        std::vector<uint8_t> data;
        std::string content_tag;
    };
    
    struct PendingMultipart {
        std::string key;
        std::map<uint32_t, StoredPart> parts;
    };
    
    std::optional<StorageError> take_fault(StorageOperation operation, const std::string& key,
                                           uint32_t part_number);
    void count_call(StorageOperation operation);
    
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const std::vector<uint8_t>>> objects_;
    std::unordered_map<std::string, PendingMultipart> multipart_;
    std::unordered_map<std::string, std::vector<CompletedPart>> completed_layouts_;
    std::vector<FaultRule> faults_;
    std::unordered_map<int, size_t> call_counts_;
    std::chrono::milliseconds part_latency_{0};
    uint64_t next_upload_id_ = 1;
    
    std::atomic<size_t> active_part_uploads_{0};
    std::atomic<size_t> peak_part_uploads_{0};
};

} // namespace fastpack::storage
