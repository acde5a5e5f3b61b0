#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace fastpack::storage {

enum class StorageErrorKind {
    NONE,
    TIMEOUT,
    CONNECTION_RESET,
    THROTTLED,
    SERVER_ERROR,
    PROTOCOL_RESET,
    BAD_REQUEST,
    UNAUTHORIZED,
    NOT_FOUND,
    INVALID_PART,
    ABORTED
};

const char* storage_error_kind_name(StorageErrorKind kind);

struct StorageError {
    StorageErrorKind kind = StorageErrorKind::NONE;
    int status_code = 0;
    std::string message;
    
    StorageError() = default;
    StorageError(StorageErrorKind k, const std::string& msg, int status = 0)
        : kind(k), status_code(status), message(msg) {}
    
    bool ok() const { return kind == StorageErrorKind::NONE; }
    explicit operator bool() const { return ok(); }
    
    static StorageError success() { return StorageError{}; }
    std::string describe() const;
};

struct MultipartHandle {
    std::string key;
    std::string upload_id;
    
    bool valid() const { return !key.empty() && !upload_id.empty(); }
};

struct CompletedPart {
    uint32_t part_number = 0;
    std::string content_tag;
    uint64_t size = 0;
};

// Blob storage with an S3-style multipart protocol. Implementations must be
// safe to call from several threads at once.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;
    
    virtual StorageError create_multipart_upload(const std::string& key, MultipartHandle& handle) = 0;
    
    virtual StorageError upload_part(const MultipartHandle& handle, uint32_t part_number,
                                     std::span<const uint8_t> data, std::string& content_tag) = 0;
    
    // Fails with INVALID_PART when parts are not contiguous from 1, not
    // ascending, carry a stale tag, or a non-terminal part differs in size.
    virtual StorageError complete_multipart_upload(const MultipartHandle& handle,
                                                   const std::vector<CompletedPart>& parts) = 0;
    
    // Idempotent.
    virtual StorageError abort_multipart_upload(const MultipartHandle& handle) = 0;
    
    virtual StorageError head(const std::string& key, uint64_t& size) = 0;
    virtual StorageError read_range(const std::string& key, uint64_t offset, uint64_t length,
                                    std::vector<uint8_t>& out) = 0;
    virtual StorageError get(const std::string& key, std::vector<uint8_t>& out) = 0;
    virtual StorageError put(const std::string& key, std::span<const uint8_t> data) = 0;
    virtual StorageError copy(const std::string& source_key, const std::string& destination_key) = 0;
    virtual StorageError remove(const std::string& key) = 0;
};

struct StoredPartInfo {
    std::string content_tag;
    uint64_t size = 0;
};

// Shared completion rules for ObjectStore implementations. On success
// `layout` receives the requested parts with their stored sizes.
StorageError validate_completion(const std::vector<CompletedPart>& requested,
                                 const std::map<uint32_t, StoredPartInfo>& stored,
                                 std::vector<CompletedPart>& layout);

namespace object_keys {

std::string source_object(const std::string& upload_id, const std::string& file_name);
std::string artifact_object(const std::string& artifact_id);

} // namespace object_keys

} // namespace fastpack::storage
