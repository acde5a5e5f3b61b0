#include "fastpack/storage/chunk_ledger.hpp"
#include "fastpack/core/logger.hpp"
#include <algorithm>

namespace fastpack::storage {

ChunkLedger::ChunkLedger(std::shared_ptr<MetadataStore> store)
    : store_(std::move(store)) {
}

core::Result ChunkLedger::record_chunk(const std::string& upload_id, const std::string& file_name,
                                       uint32_t index, uint32_t part_number, const std::string& content_tag,
                                       RecordOutcome& outcome) {
    ChunkRecord record;
    record.file_name = file_name;
    record.index = index;
    record.part_number = part_number;
    record.content_tag = content_tag;
    record.recorded_at = std::chrono::system_clock::now();
    
    auto key = keys::chunk(upload_id, file_name, index);
    bool inserted = false;
    auto result = store_->insert_if_absent(key, record.serialize(), inserted);
    if (!result) {
        return result;
    }
    
    if (inserted) {
        result = store_->increment(keys::uploaded_counter(upload_id), 1, outcome.uploaded);
        if (!result) {
            // The record exists but was not counted; finalize reconciles the counter.
            LOG_WARN("Chunk {} of {} recorded but counter update failed: {}", index, file_name, result.message);
            return result;
        }
        outcome.is_new = true;
        return core::Result::ok();
    }
    
    outcome.is_new = false;
    
    std::string existing_raw;
    result = store_->get(key, existing_raw);
    if (!result) {
        return result;
    }
    
    auto existing = ChunkRecord::deserialize(existing_raw);
    if (!existing || existing->content_tag != content_tag) {
        // The client re-uploaded this part; the destination now holds the new tag.
        LOG_WARN("Chunk {} of {} in upload {} re-recorded with a different content tag", index, file_name, upload_id);
        result = store_->put(key, record.serialize());
        if (!result) {
            return result;
        }
    }
    
    return store_->read_counter(keys::uploaded_counter(upload_id), outcome.uploaded);
}

core::Result ChunkLedger::count_uploaded(const std::string& upload_id, int64_t& count) {
    return store_->read_counter(keys::uploaded_counter(upload_id), count);
}

core::Result ChunkLedger::load_chunk(const std::string& upload_id, const std::string& file_name,
                                     uint32_t index, ChunkRecord& record) {
    std::string raw;
    auto result = store_->get(keys::chunk(upload_id, file_name, index), raw);
    if (!result) {
        return result;
    }
    
    auto parsed = ChunkRecord::deserialize(raw);
    if (!parsed) {
        return core::Result(core::ErrorCode::METADATA_ERROR,
            "Corrupt chunk record " + std::to_string(index) + " of " + file_name);
    }
    record = std::move(*parsed);
    return core::Result::ok();
}

core::Result ChunkLedger::collect_file(const std::string& upload_id, const FileUpload& file,
                                       std::vector<ChunkRecord>& records, std::vector<MissingChunk>& missing) {
    records.clear();
    records.reserve(file.total_chunks);
    
    for (uint32_t index = 0; index < file.total_chunks; ++index) {
        ChunkRecord record;
        auto result = load_chunk(upload_id, file.name, index, record);
        if (result.error == core::ErrorCode::NOT_FOUND) {
            missing.push_back(MissingChunk{file.name, index});
            continue;
        }
        if (!result) {
            return result;
        }
        records.push_back(std::move(record));
    }
    
    std::sort(records.begin(), records.end(), [](const ChunkRecord& a, const ChunkRecord& b) {
        return a.part_number < b.part_number;
    });
    return core::Result::ok();
}

core::Result ChunkLedger::find_missing(const LogicalUpload& upload, std::vector<MissingChunk>& missing) {
    missing.clear();
    for (const auto& file : upload.files) {
        std::vector<ChunkRecord> records;
        auto result = collect_file(upload.upload_id, file, records, missing);
        if (!result) {
            return result;
        }
    }
    return core::Result::ok();
}

core::Result ChunkLedger::reconcile(const std::string& upload_id, int64_t actual) {
    int64_t current = 0;
    auto result = count_uploaded(upload_id, current);
    if (!result || current == actual) {
        return result;
    }
    
    LOG_WARN("Upload {} chunk counter drifted ({} counted, {} recorded), reconciling", upload_id, current, actual);
    int64_t updated = 0;
    return store_->increment(keys::uploaded_counter(upload_id), actual - current, updated);
}

core::Result ChunkLedger::purge(const LogicalUpload& upload) {
    for (const auto& file : upload.files) {
        for (uint32_t index = 0; index < file.total_chunks; ++index) {
            auto result = store_->remove(keys::chunk(upload.upload_id, file.name, index));
            if (!result) {
                return result;
            }
        }
    }
    return store_->remove_counter(keys::uploaded_counter(upload.upload_id));
}

} // namespace fastpack::storage
