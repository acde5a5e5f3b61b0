#include "fastpack/storage/object_store.hpp"

namespace fastpack::storage {

const char* storage_error_kind_name(StorageErrorKind kind) {
    switch (kind) {
        case StorageErrorKind::NONE: return "none";
        case StorageErrorKind::TIMEOUT: return "timeout";
        case StorageErrorKind::CONNECTION_RESET: return "connection_reset";
        case StorageErrorKind::THROTTLED: return "throttled";
        case StorageErrorKind::SERVER_ERROR: return "server_error";
        case StorageErrorKind::PROTOCOL_RESET: return "protocol_reset";
        case StorageErrorKind::BAD_REQUEST: return "bad_request";
        case StorageErrorKind::UNAUTHORIZED: return "unauthorized";
        case StorageErrorKind::NOT_FOUND: return "not_found";
        case StorageErrorKind::INVALID_PART: return "invalid_part";
        case StorageErrorKind::ABORTED: return "aborted";
    }
    return "unknown";
}

std::string StorageError::describe() const {
    std::string text = storage_error_kind_name(kind);
    if (status_code != 0) {
        text += " (" + std::to_string(status_code) + ")";
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

StorageError validate_completion(const std::vector<CompletedPart>& requested,
                                 const std::map<uint32_t, StoredPartInfo>& stored,
                                 std::vector<CompletedPart>& layout) {
    layout.clear();
    if (requested.empty()) {
        return StorageError(StorageErrorKind::INVALID_PART, "No parts supplied", 400);
    }
    
    layout.reserve(requested.size());
    for (size_t i = 0; i < requested.size(); ++i) {
        const auto& part = requested[i];
        if (part.part_number != i + 1) {
            return StorageError(StorageErrorKind::INVALID_PART,
                "Part list is not contiguous and ascending at part " + std::to_string(part.part_number), 400);
        }
        
        auto it = stored.find(part.part_number);
        if (it == stored.end()) {
            return StorageError(StorageErrorKind::INVALID_PART,
                "Part " + std::to_string(part.part_number) + " was never uploaded", 400);
        }
        if (it->second.content_tag != part.content_tag) {
            return StorageError(StorageErrorKind::INVALID_PART,
                "Content tag mismatch for part " + std::to_string(part.part_number), 400);
        }
        
        CompletedPart entry = part;
        entry.size = it->second.size;
        layout.push_back(entry);
    }
    
    const uint64_t standard_size = layout.front().size;
    for (size_t i = 0; i + 1 < layout.size(); ++i) {
        if (layout[i].size != standard_size) {
            return StorageError(StorageErrorKind::INVALID_PART,
                "Non-terminal part " + std::to_string(layout[i].part_number) + " has size " +
                std::to_string(layout[i].size) + ", expected " + std::to_string(standard_size), 400);
        }
    }
    
    const auto& last = layout.back();
    if (last.size == 0 || last.size > standard_size) {
        return StorageError(StorageErrorKind::INVALID_PART,
            "Terminal part " + std::to_string(last.part_number) + " has invalid size " +
            std::to_string(last.size), 400);
    }
    
    return StorageError::success();
}

namespace object_keys {

std::string source_object(const std::string& upload_id, const std::string& file_name) {
    return "temp/" + upload_id + "/" + file_name;
}

std::string artifact_object(const std::string& artifact_id) {
    return artifact_id;
}

} // namespace object_keys

} // namespace fastpack::storage
