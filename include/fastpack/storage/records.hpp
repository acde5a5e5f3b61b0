#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace fastpack::storage {

enum class UploadStatus {
    COLLECTING,
    FINALIZING,
    REPACKAGING,
    COMPLETED,
    FAILED
};

const char* upload_status_name(UploadStatus status);
bool is_terminal(UploadStatus status);

// Forward moves only; FAILED is reachable from every non-terminal state.
bool can_transition(UploadStatus from, UploadStatus to);

struct FileUpload {
    std::string name;
    uint64_t declared_size = 0;
    uint32_t total_chunks = 0;
    MultipartHandle multipart;
    
    std::string source_key() const { return multipart.key; }
    uint64_t chunk_length(uint32_t index, uint64_t chunk_size) const;
};

struct LogicalUpload {
    std::string upload_id;
    UploadStatus status = UploadStatus::COLLECTING;
    std::string failure_reason;
    std::vector<FileUpload> files;
    uint64_t chunk_size = 0;
    std::string password_hash;
    std::string artifact_id;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    
    uint64_t total_chunks() const;
    uint64_t total_size() const;
    const FileUpload* find_file(const std::string& name) const;
    
    std::string serialize() const;
    static std::optional<LogicalUpload> deserialize(const std::string& data);
};

struct ChunkRecord {
    std::string file_name;
    uint32_t index = 0;
    uint32_t part_number = 0;
    std::string content_tag;
    std::chrono::system_clock::time_point recorded_at;
    
    std::string serialize() const;
    static std::optional<ChunkRecord> deserialize(const std::string& data);
};

struct Artifact {
    std::string id;
    std::string name;
    uint64_t size = 0;
    uint32_t file_count = 0;
    std::string upload_id;
    std::string password_hash;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point expires_at;
    
    bool is_expired(std::chrono::system_clock::time_point now) const { return now >= expires_at; }
    
    std::string serialize() const;
    static std::optional<Artifact> deserialize(const std::string& data);
};

enum class Milestone {
    FILE_STARTED,
    FILE_COMPLETED,
    REPACKAGING_COMPLETED,
    FAILED
};

const char* milestone_name(Milestone milestone);

// Coarse durable progress, written only at milestones.
struct ProgressSnapshot {
    Milestone milestone = Milestone::FILE_STARTED;
    std::string phase;
    double percent = 0.0;
    std::string current_file;
    uint32_t processed_files = 0;
    uint32_t total_files = 0;
    std::string message;
    std::chrono::system_clock::time_point recorded_at;
    
    std::string serialize() const;
    static std::optional<ProgressSnapshot> deserialize(const std::string& data);
};

namespace keys {

std::string upload(const std::string& upload_id);
std::string chunk(const std::string& upload_id, const std::string& file_name, uint32_t index);
std::string uploaded_counter(const std::string& upload_id);
std::string progress(const std::string& upload_id);
std::string artifact(const std::string& artifact_id);

} // namespace keys

} // namespace fastpack::storage
