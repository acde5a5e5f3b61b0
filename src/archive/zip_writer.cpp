#include "fastpack/archive/zip_writer.hpp"
#include "fastpack/core/logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <ctime>
#include <limits>
#include <stdexcept>

namespace fastpack::archive {

namespace {
    constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
    constexpr uint32_t DATA_DESCRIPTOR_SIGNATURE = 0x08074b50;
    constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
    constexpr uint32_t ZIP64_END_SIGNATURE = 0x06064b50;
    constexpr uint32_t ZIP64_LOCATOR_SIGNATURE = 0x07064b50;
    constexpr uint32_t END_SIGNATURE = 0x06054b50;
    
    constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;
    constexpr uint16_t VERSION_DEFAULT = 20;
    constexpr uint16_t VERSION_ZIP64 = 45;
    constexpr uint16_t MADE_BY_UNIX = 3 << 8;
    constexpr uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;
    constexpr uint16_t FLAG_UTF8 = 0x0800;
    constexpr uint32_t UNIX_REGULAR_FILE_ATTRS = 0100644u << 16;
    
    constexpr uint32_t MAX_U32 = 0xFFFFFFFFu;
    constexpr uint16_t MAX_U16 = 0xFFFFu;
    constexpr size_t DEFLATE_BUFFER_SIZE = 256 * 1024;
    
    void put_u16(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value));
        out.push_back(static_cast<uint8_t>(value >> 8));
    }
    
    void put_u32(std::vector<uint8_t>& out, uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }
    
    void put_u64(std::vector<uint8_t>& out, uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }
    
    void put_string(std::vector<uint8_t>& out, const std::string& value) {
        out.insert(out.end(), value.begin(), value.end());
    }
    
    uint32_t clamp_u32(uint64_t value) {
        return value >= MAX_U32 ? MAX_U32 : static_cast<uint32_t>(value);
    }
    
    void to_dos_time(std::chrono::system_clock::time_point time, uint16_t& dos_time, uint16_t& dos_date) {
        auto time_t = std::chrono::system_clock::to_time_t(time);
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        
        if (tm.tm_year < 80) {
            dos_time = 0;
            dos_date = (1 << 5) | 1;
            return;
        }
        
        dos_time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
        dos_date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
    }
}

struct ZipWriter::DeflateState {
    z_stream stream{};
    std::vector<uint8_t> buffer;
};

ZipWriter::ZipWriter(SegmentSink sink, int compression_level)
    : sink_(std::move(sink))
    , compression_level_(compression_level) {
    if (compression_level_ < 0 || compression_level_ > Z_BEST_COMPRESSION) {
        throw std::invalid_argument("Compression level must be in 0..9");
    }
    
    if (compression_level_ > 0) {
        deflate_ = std::make_unique<DeflateState>();
        if (deflateInit2(&deflate_->stream, compression_level_, Z_DEFLATED, -MAX_WBITS, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("Failed to initialize deflate stream");
        }
    }
}

ZipWriter::~ZipWriter() {
    if (deflate_) {
        deflateEnd(&deflate_->stream);
    }
}

core::Result ZipWriter::begin_entry(const std::string& name, uint64_t declared_size,
                                    std::chrono::system_clock::time_point modified) {
    if (finished_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Archive already finished");
    }
    if (in_entry_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Previous entry not ended");
    }
    if (name.empty() || name.size() > MAX_U16) {
        return core::Result(core::ErrorCode::VALIDATION_ERROR, "Invalid entry name length");
    }
    
    ZipEntry entry;
    entry.name = name;
    entry.declared_size = declared_size;
    entry.local_header_offset = bytes_written_;
    entry.method = compression_level_ > 0 ? METHOD_DEFLATED : METHOD_STORED;
    to_dos_time(modified, entry.dos_time, entry.dos_date);
    
    uint64_t worst_case = declared_size;
    if (deflate_) {
        if (deflateReset(&deflate_->stream) != Z_OK) {
            return core::Result(core::ErrorCode::REPACKAGING_FAILURE, "Failed to reset deflate stream");
        }
        worst_case = deflateBound(&deflate_->stream, static_cast<uLong>(declared_size));
    }
    entry.zip64 = declared_size >= MAX_U32 || worst_case >= MAX_U32;
    
    std::vector<uint8_t> header;
    header.reserve(30 + name.size() + 20);
    put_u32(header, LOCAL_HEADER_SIGNATURE);
    put_u16(header, entry.zip64 ? VERSION_ZIP64 : VERSION_DEFAULT);
    put_u16(header, FLAG_DATA_DESCRIPTOR | FLAG_UTF8);
    put_u16(header, entry.method);
    put_u16(header, entry.dos_time);
    put_u16(header, entry.dos_date);
    put_u32(header, 0);
    put_u32(header, entry.zip64 ? MAX_U32 : 0);
    put_u32(header, entry.zip64 ? MAX_U32 : 0);
    put_u16(header, static_cast<uint16_t>(name.size()));
    put_u16(header, entry.zip64 ? 20 : 0);
    put_string(header, name);
    if (entry.zip64) {
        put_u16(header, ZIP64_EXTRA_ID);
        put_u16(header, 16);
        put_u64(header, 0);
        put_u64(header, 0);
    }
    
    entries_.push_back(std::move(entry));
    in_entry_ = true;
    return emit(std::move(header));
}

core::Result ZipWriter::write(std::vector<uint8_t>&& data) {
    if (!in_entry_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "No open archive entry");
    }
    if (data.empty()) {
        return core::Result::ok();
    }
    
    auto& entry = entries_.back();
    entry.crc32 = static_cast<uint32_t>(crc32_z(entry.crc32, data.data(), data.size()));
    entry.uncompressed_size += data.size();
    
    if (!deflate_) {
        entry.compressed_size += data.size();
        return emit(std::move(data));
    }

    // avail_in is a 32-bit field.
    constexpr size_t max_input = size_t{1} << 30;
    for (size_t offset = 0; offset < data.size(); offset += max_input) {
        auto result = deflate_input(data.data() + offset, std::min(max_input, data.size() - offset), false);
        if (!result) {
            return result;
        }
    }
    return core::Result::ok();
}

core::Result ZipWriter::write(std::span<const uint8_t> data) {
    return write(std::vector<uint8_t>(data.begin(), data.end()));
}

core::Result ZipWriter::end_entry() {
    if (!in_entry_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "No open archive entry");
    }
    
    if (deflate_) {
        auto result = deflate_input(nullptr, 0, true);
        if (!result) {
            return result;
        }
    }
    
    in_entry_ = false;
    auto& entry = entries_.back();
    
    if (entry.uncompressed_size != entry.declared_size) {
        return core::Result(core::ErrorCode::REPACKAGING_FAILURE,
            "Entry " + entry.name + " received " + std::to_string(entry.uncompressed_size) +
            " bytes, declared " + std::to_string(entry.declared_size));
    }
    if (!entry.zip64 && (entry.compressed_size >= MAX_U32 || entry.uncompressed_size >= MAX_U32)) {
        return core::Result(core::ErrorCode::REPACKAGING_FAILURE, "Entry " + entry.name + " outgrew 32-bit sizes");
    }
    
    std::vector<uint8_t> descriptor;
    descriptor.reserve(24);
    put_u32(descriptor, DATA_DESCRIPTOR_SIGNATURE);
    put_u32(descriptor, entry.crc32);
    if (entry.zip64) {
        put_u64(descriptor, entry.compressed_size);
        put_u64(descriptor, entry.uncompressed_size);
    } else {
        put_u32(descriptor, static_cast<uint32_t>(entry.compressed_size));
        put_u32(descriptor, static_cast<uint32_t>(entry.uncompressed_size));
    }
    
    return emit(std::move(descriptor));
}

core::Result ZipWriter::finish() {
    if (finished_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Archive already finished");
    }
    if (in_entry_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Entry still open");
    }
    
    const uint64_t directory_offset = bytes_written_;
    std::vector<uint8_t> directory;
    
    for (const auto& entry : entries_) {
        bool usize64 = entry.zip64 || entry.uncompressed_size >= MAX_U32;
        bool csize64 = entry.zip64 || entry.compressed_size >= MAX_U32;
        bool offset64 = entry.local_header_offset >= MAX_U32;
        uint16_t extra_size = static_cast<uint16_t>((usize64 ? 8 : 0) + (csize64 ? 8 : 0) + (offset64 ? 8 : 0));
        bool any64 = extra_size > 0;
        uint16_t version = any64 ? VERSION_ZIP64 : VERSION_DEFAULT;
        
        put_u32(directory, CENTRAL_HEADER_SIGNATURE);
        put_u16(directory, MADE_BY_UNIX | version);
        put_u16(directory, version);
        put_u16(directory, FLAG_DATA_DESCRIPTOR | FLAG_UTF8);
        put_u16(directory, entry.method);
        put_u16(directory, entry.dos_time);
        put_u16(directory, entry.dos_date);
        put_u32(directory, entry.crc32);
        put_u32(directory, csize64 ? MAX_U32 : static_cast<uint32_t>(entry.compressed_size));
        put_u32(directory, usize64 ? MAX_U32 : static_cast<uint32_t>(entry.uncompressed_size));
        put_u16(directory, static_cast<uint16_t>(entry.name.size()));
        put_u16(directory, any64 ? static_cast<uint16_t>(extra_size + 4) : 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, UNIX_REGULAR_FILE_ATTRS);
        put_u32(directory, offset64 ? MAX_U32 : static_cast<uint32_t>(entry.local_header_offset));
        put_string(directory, entry.name);
        
        if (any64) {
            put_u16(directory, ZIP64_EXTRA_ID);
            put_u16(directory, extra_size);
            if (usize64) put_u64(directory, entry.uncompressed_size);
            if (csize64) put_u64(directory, entry.compressed_size);
            if (offset64) put_u64(directory, entry.local_header_offset);
        }
    }
    
    const uint64_t directory_size = directory.size();
    const uint64_t entry_count = entries_.size();
    bool needs_zip64_end = entry_count >= MAX_U16 || directory_size >= MAX_U32 || directory_offset >= MAX_U32;
    
    std::vector<uint8_t> trailer;
    if (needs_zip64_end) {
        const uint64_t zip64_end_offset = directory_offset + directory_size;
        put_u32(trailer, ZIP64_END_SIGNATURE);
        put_u64(trailer, 44);
        put_u16(trailer, MADE_BY_UNIX | VERSION_ZIP64);
        put_u16(trailer, VERSION_ZIP64);
        put_u32(trailer, 0);
        put_u32(trailer, 0);
        put_u64(trailer, entry_count);
        put_u64(trailer, entry_count);
        put_u64(trailer, directory_size);
        put_u64(trailer, directory_offset);
        
        put_u32(trailer, ZIP64_LOCATOR_SIGNATURE);
        put_u32(trailer, 0);
        put_u64(trailer, zip64_end_offset);
        put_u32(trailer, 1);
    }
    
    uint16_t short_count = entry_count >= MAX_U16 ? MAX_U16 : static_cast<uint16_t>(entry_count);
    put_u32(trailer, END_SIGNATURE);
    put_u16(trailer, 0);
    put_u16(trailer, 0);
    put_u16(trailer, short_count);
    put_u16(trailer, short_count);
    put_u32(trailer, clamp_u32(directory_size));
    put_u32(trailer, clamp_u32(directory_offset));
    put_u16(trailer, 0);
    
    directory.insert(directory.end(), trailer.begin(), trailer.end());
    auto result = emit(std::move(directory));
    if (!result) {
        return result;
    }
    
    finished_ = true;
    LOG_DEBUG("Archive finished: {} entries, {} bytes", entries_.size(), bytes_written_);
    return core::Result::ok();
}

core::Result ZipWriter::emit(std::vector<uint8_t>&& bytes) {
    if (bytes.empty()) {
        return core::Result::ok();
    }
    
    auto size = bytes.size();
    if (!sink_(std::move(bytes))) {
        return core::Result(core::ErrorCode::REPACKAGING_FAILURE, "Archive consumer stopped accepting output");
    }
    bytes_written_ += size;
    return core::Result::ok();
}

core::Result ZipWriter::deflate_input(const uint8_t* data, size_t size, bool finish_entry) {
    auto& stream = deflate_->stream;
    auto& entry = entries_.back();
    
    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);
    int flush = finish_entry ? Z_FINISH : Z_NO_FLUSH;
    
    while (true) {
        if (deflate_->buffer.empty()) {
            deflate_->buffer.resize(DEFLATE_BUFFER_SIZE);
            stream.next_out = deflate_->buffer.data();
            stream.avail_out = static_cast<uInt>(DEFLATE_BUFFER_SIZE);
        }
        
        int status = deflate(&stream, flush);
        if (status == Z_STREAM_ERROR) {
            return core::Result(core::ErrorCode::REPACKAGING_FAILURE, "deflate failed for " + entry.name);
        }
        
        bool buffer_full = stream.avail_out == 0;
        bool done = finish_entry ? status == Z_STREAM_END : stream.avail_in == 0 && !buffer_full;
        
        if (buffer_full || (done && finish_entry)) {
            auto produced = DEFLATE_BUFFER_SIZE - stream.avail_out;
            deflate_->buffer.resize(produced);
            entry.compressed_size += produced;
            auto result = emit(std::move(deflate_->buffer));
            deflate_->buffer.clear();
            if (!result) {
                return result;
            }
        }
        
        if (done) {
            return core::Result::ok();
        }
    }
}

} // namespace fastpack::archive
