#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../core/result.hpp"
#include "metadata_store.hpp"
#include "records.hpp"

namespace fastpack::storage {

struct RecordOutcome {
    bool is_new = false;
    int64_t uploaded = 0;
};

struct MissingChunk {
    std::string file_name;
    uint32_t index = 0;
};

// Per-chunk records on independent keys plus one counter per upload. A record
// is inserted at most once; only the writer that created it bumps the
// counter, so concurrent duplicate confirmations never count twice.
class ChunkLedger {
public:
    explicit ChunkLedger(std::shared_ptr<MetadataStore> store);
    
    core::Result record_chunk(const std::string& upload_id, const std::string& file_name,
                              uint32_t index, uint32_t part_number, const std::string& content_tag,
                              RecordOutcome& outcome);
    
    // O(1): a single counter read.
    core::Result count_uploaded(const std::string& upload_id, int64_t& count);
    
    core::Result load_chunk(const std::string& upload_id, const std::string& file_name,
                            uint32_t index, ChunkRecord& record);
    
    // Reads every declared index of `file`; `records` is ordered by part number.
    core::Result collect_file(const std::string& upload_id, const FileUpload& file,
                              std::vector<ChunkRecord>& records, std::vector<MissingChunk>& missing);
    
    core::Result find_missing(const LogicalUpload& upload, std::vector<MissingChunk>& missing);
    
    // Brings the counter in line with `actual` after a finalize-time scan.
    core::Result reconcile(const std::string& upload_id, int64_t actual);
    
    // Drops chunk records and the counter once the upload no longer needs them.
    core::Result purge(const LogicalUpload& upload);

private:
    std::shared_ptr<MetadataStore> store_;
};

} // namespace fastpack::storage
