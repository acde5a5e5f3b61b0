#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "../core/result.hpp"

namespace fastpack::archive {

// Receives encoder output in order. Returning false stops the encoder.
using SegmentSink = std::function<bool(std::vector<uint8_t>&&)>;

struct ZipEntry {
    std::string name;
    uint64_t declared_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t compressed_size = 0;
    uint32_t crc32 = 0;
    uint64_t local_header_offset = 0;
    uint16_t method = 0;
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;
    bool zip64 = false;
};

// Streaming ZIP encoder. Entry sizes and CRCs go into data descriptors after
// the entry data, so nothing is buffered beyond one deflate window. ZIP64
// records are added when sizes, offsets or the entry count outgrow 32/16 bits.
class ZipWriter {
public:
    static constexpr uint16_t METHOD_STORED = 0;
    static constexpr uint16_t METHOD_DEFLATED = 8;
    
    // compression_level 0 stores entries as-is; 1..9 uses raw deflate.
    explicit ZipWriter(SegmentSink sink, int compression_level = 0);
    ~ZipWriter();
    
    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;
    
    core::Result begin_entry(const std::string& name, uint64_t declared_size,
                             std::chrono::system_clock::time_point modified = std::chrono::system_clock::now());
    core::Result write(std::vector<uint8_t>&& data);
    core::Result write(std::span<const uint8_t> data);
    core::Result end_entry();
    
    // Writes the central directory and end records.
    core::Result finish();
    
    uint64_t bytes_written() const { return bytes_written_; }
    size_t entry_count() const { return entries_.size(); }
    bool finished() const { return finished_; }
    const std::vector<ZipEntry>& entries() const { return entries_; }

private:
    struct DeflateState;
    
    core::Result emit(std::vector<uint8_t>&& bytes);
    core::Result deflate_input(const uint8_t* data, size_t size, bool finish_entry);
    
    SegmentSink sink_;
    int compression_level_;
    std::unique_ptr<DeflateState> deflate_;
    
    std::vector<ZipEntry> entries_;
    bool in_entry_ = false;
    bool finished_ = false;
    uint64_t bytes_written_ = 0;
};

} // namespace fastpack::archive
