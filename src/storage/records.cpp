#include "fastpack/storage/records.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace fastpack::storage {

namespace {
    constexpr uint32_t UPLOAD_RECORD_VERSION = 1;
    constexpr uint32_t CHUNK_RECORD_VERSION = 1;
    constexpr uint32_t ARTIFACT_RECORD_VERSION = 1;
    constexpr uint32_t PROGRESS_RECORD_VERSION = 1;
    
    class RecordWriter {
    public:
        void write_u32(uint32_t value) { write_raw(&value, sizeof(value)); }
        void write_u64(uint64_t value) { write_raw(&value, sizeof(value)); }
        void write_i64(int64_t value) { write_raw(&value, sizeof(value)); }
        void write_double(double value) { write_raw(&value, sizeof(value)); }
        
        void write_string(const std::string& value) {
            write_u32(static_cast<uint32_t>(value.size()));
            oss_.write(value.data(), static_cast<std::streamsize>(value.size()));
        }
        
        void write_time(std::chrono::system_clock::time_point time) {
            write_i64(std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count());
        }
        
        std::string str() const { return oss_.str(); }
    
    private:
        void write_raw(const void* data, size_t size) {
            oss_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
        }
        
        std::ostringstream oss_;
    };
    
    // Every read is bounds-checked; a truncated or corrupt record yields false.
    class RecordReader {
    public:
        explicit RecordReader(const std::string& data) : data_(data) {}
        
        bool read_u32(uint32_t& value) { return read_raw(&value, sizeof(value)); }
        bool read_u64(uint64_t& value) { return read_raw(&value, sizeof(value)); }
        bool read_i64(int64_t& value) { return read_raw(&value, sizeof(value)); }
        bool read_double(double& value) { return read_raw(&value, sizeof(value)); }
        
        bool read_string(std::string& value) {
            uint32_t size;
            if (!read_u32(size) || data_.size() - offset_ < size) {
                return false;
            }
            value.assign(data_, offset_, size);
            offset_ += size;
            return true;
        }
        
        bool read_time(std::chrono::system_clock::time_point& time) {
            int64_t millis;
            if (!read_i64(millis)) {
                return false;
            }
            time = std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
            return true;
        }
        
        bool at_end() const { return offset_ == data_.size(); }
    
    private:
        bool read_raw(void* out, size_t size) {
            if (data_.size() - offset_ < size) {
                return false;
            }
            std::memcpy(out, data_.data() + offset_, size);
            offset_ += size;
            return true;
        }
        
        const std::string& data_;
        size_t offset_ = 0;
    };
}

const char* upload_status_name(UploadStatus status) {
    switch (status) {
        case UploadStatus::COLLECTING: return "collecting";
        case UploadStatus::FINALIZING: return "finalizing";
        case UploadStatus::REPACKAGING: return "repackaging";
        case UploadStatus::COMPLETED: return "completed";
        case UploadStatus::FAILED: return "failed";
    }
    return "unknown";
}

bool is_terminal(UploadStatus status) {
    return status == UploadStatus::COMPLETED || status == UploadStatus::FAILED;
}

bool can_transition(UploadStatus from, UploadStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    if (to == UploadStatus::FAILED) {
        return true;
    }
    
    switch (from) {
        case UploadStatus::COLLECTING:
            return to == UploadStatus::FINALIZING;
        case UploadStatus::FINALIZING:
            // The single-archive fast path completes without repackaging.
            return to == UploadStatus::REPACKAGING || to == UploadStatus::COMPLETED;
        case UploadStatus::REPACKAGING:
            return to == UploadStatus::COMPLETED;
        default:
            return false;
    }
}

uint64_t FileUpload::chunk_length(uint32_t index, uint64_t chunk_size) const {
    uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    if (offset >= declared_size) {
        return 0;
    }
    return std::min(chunk_size, declared_size - offset);
}

uint64_t LogicalUpload::total_chunks() const {
    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.total_chunks;
    }
    return total;
}

uint64_t LogicalUpload::total_size() const {
    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.declared_size;
    }
    return total;
}

const FileUpload* LogicalUpload::find_file(const std::string& name) const {
    for (const auto& file : files) {
        if (file.name == name) {
            return &file;
        }
    }
    return nullptr;
}

std::string LogicalUpload::serialize() const {
    RecordWriter writer;
    writer.write_u32(UPLOAD_RECORD_VERSION);
    writer.write_string(upload_id);
    writer.write_u32(static_cast<uint32_t>(status));
    writer.write_string(failure_reason);
    writer.write_u64(chunk_size);
    writer.write_string(password_hash);
    writer.write_string(artifact_id);
    writer.write_time(created_at);
    writer.write_time(updated_at);
    
    writer.write_u32(static_cast<uint32_t>(files.size()));
    for (const auto& file : files) {
        writer.write_string(file.name);
        writer.write_u64(file.declared_size);
        writer.write_u32(file.total_chunks);
        writer.write_string(file.multipart.key);
        writer.write_string(file.multipart.upload_id);
    }
    
    return writer.str();
}

std::optional<LogicalUpload> LogicalUpload::deserialize(const std::string& data) {
    RecordReader reader(data);
    LogicalUpload upload;
    
    uint32_t version;
    uint32_t status;
    if (!reader.read_u32(version) || version != UPLOAD_RECORD_VERSION) {
        return std::nullopt;
    }
    if (!reader.read_string(upload.upload_id) || !reader.read_u32(status) ||
        !reader.read_string(upload.failure_reason) || !reader.read_u64(upload.chunk_size) ||
        !reader.read_string(upload.password_hash) || !reader.read_string(upload.artifact_id) ||
        !reader.read_time(upload.created_at) || !reader.read_time(upload.updated_at)) {
        return std::nullopt;
    }
    if (status > static_cast<uint32_t>(UploadStatus::FAILED)) {
        return std::nullopt;
    }
    upload.status = static_cast<UploadStatus>(status);
    
    uint32_t file_count;
    if (!reader.read_u32(file_count)) {
        return std::nullopt;
    }
    
    for (uint32_t i = 0; i < file_count; ++i) {
        FileUpload file;
        if (!reader.read_string(file.name) || !reader.read_u64(file.declared_size) ||
            !reader.read_u32(file.total_chunks) || !reader.read_string(file.multipart.key) ||
            !reader.read_string(file.multipart.upload_id)) {
            return std::nullopt;
        }
        upload.files.push_back(std::move(file));
    }
    
    if (!reader.at_end()) {
        return std::nullopt;
    }
    return upload;
}

std::string ChunkRecord::serialize() const {
    RecordWriter writer;
    writer.write_u32(CHUNK_RECORD_VERSION);
    writer.write_string(file_name);
    writer.write_u32(index);
    writer.write_u32(part_number);
    writer.write_string(content_tag);
    writer.write_time(recorded_at);
    return writer.str();
}

std::optional<ChunkRecord> ChunkRecord::deserialize(const std::string& data) {
    RecordReader reader(data);
    ChunkRecord record;
    
    uint32_t version;
    if (!reader.read_u32(version) || version != CHUNK_RECORD_VERSION) {
        return std::nullopt;
    }
    if (!reader.read_string(record.file_name) || !reader.read_u32(record.index) ||
        !reader.read_u32(record.part_number) || !reader.read_string(record.content_tag) ||
        !reader.read_time(record.recorded_at) || !reader.at_end()) {
        return std::nullopt;
    }
    return record;
}

std::string Artifact::serialize() const {
    RecordWriter writer;
    writer.write_u32(ARTIFACT_RECORD_VERSION);
    writer.write_string(id);
    writer.write_string(name);
    writer.write_u64(size);
    writer.write_u32(file_count);
    writer.write_string(upload_id);
    writer.write_string(password_hash);
    writer.write_time(created_at);
    writer.write_time(expires_at);
    return writer.str();
}

std::optional<Artifact> Artifact::deserialize(const std::string& data) {
    RecordReader reader(data);
    Artifact artifact;
    
    uint32_t version;
    if (!reader.read_u32(version) || version != ARTIFACT_RECORD_VERSION) {
        return std::nullopt;
    }
    if (!reader.read_string(artifact.id) || !reader.read_string(artifact.name) ||
        !reader.read_u64(artifact.size) || !reader.read_u32(artifact.file_count) ||
        !reader.read_string(artifact.upload_id) || !reader.read_string(artifact.password_hash) ||
        !reader.read_time(artifact.created_at) || !reader.read_time(artifact.expires_at) ||
        !reader.at_end()) {
        return std::nullopt;
    }
    return artifact;
}

const char* milestone_name(Milestone milestone) {
    switch (milestone) {
        case Milestone::FILE_STARTED: return "file-started";
        case Milestone::FILE_COMPLETED: return "file-completed";
        case Milestone::REPACKAGING_COMPLETED: return "repackaging-completed";
        case Milestone::FAILED: return "failed";
    }
    return "unknown";
}

std::string ProgressSnapshot::serialize() const {
    RecordWriter writer;
    writer.write_u32(PROGRESS_RECORD_VERSION);
    writer.write_u32(static_cast<uint32_t>(milestone));
    writer.write_string(phase);
    writer.write_double(percent);
    writer.write_string(current_file);
    writer.write_u32(processed_files);
    writer.write_u32(total_files);
    writer.write_string(message);
    writer.write_time(recorded_at);
    return writer.str();
}

std::optional<ProgressSnapshot> ProgressSnapshot::deserialize(const std::string& data) {
    RecordReader reader(data);
    ProgressSnapshot snapshot;
    
    uint32_t version;
    uint32_t milestone;
    if (!reader.read_u32(version) || version != PROGRESS_RECORD_VERSION) {
        return std::nullopt;
    }
    if (!reader.read_u32(milestone) || milestone > static_cast<uint32_t>(Milestone::FAILED) ||
        !reader.read_string(snapshot.phase) || !reader.read_double(snapshot.percent) ||
        !reader.read_string(snapshot.current_file) || !reader.read_u32(snapshot.processed_files) ||
        !reader.read_u32(snapshot.total_files) || !reader.read_string(snapshot.message) ||
        !reader.read_time(snapshot.recorded_at) || !reader.at_end()) {
        return std::nullopt;
    }
    snapshot.milestone = static_cast<Milestone>(milestone);
    return snapshot;
}

namespace keys {

std::string upload(const std::string& upload_id) {
    return "upload:" + upload_id;
}

std::string chunk(const std::string& upload_id, const std::string& file_name, uint32_t index) {
    return "upload:" + upload_id + ":chunk:" + file_name + ":" + std::to_string(index);
}

std::string uploaded_counter(const std::string& upload_id) {
    return "upload:" + upload_id + ":uploaded";
}

std::string progress(const std::string& upload_id) {
    return "progress:" + upload_id;
}

std::string artifact(const std::string& artifact_id) {
    return "artifact:" + artifact_id;
}

} // namespace keys

} // namespace fastpack::storage
