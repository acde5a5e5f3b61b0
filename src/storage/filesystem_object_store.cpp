#include "fastpack/storage/filesystem_object_store.hpp"
#include "fastpack/crypto/hash.hpp"
#include "fastpack/crypto/random.hpp"
#include "fastpack/core/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fastpack::storage {

namespace {
    constexpr const char* MULTIPART_DIR = ".multipart";
    constexpr const char* KEY_FILE = "key";
    
    StorageError io_error(const std::string& what) {
        return StorageError(StorageErrorKind::SERVER_ERROR, what, 500);
    }
    
    bool read_text(const std::filesystem::path& path, std::string& out) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        out = oss.str();
        return true;
    }
}

FilesystemObjectStore::FilesystemObjectStore(const std::filesystem::path& root)
    : root_(root) {
}

bool FilesystemObjectStore::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(root_ / MULTIPART_DIR, ec);
    if (ec) {
        LOG_ERROR("Cannot create object store root {}: {}", root_.string(), ec.message());
        return false;
    }
    return true;
}

StorageError FilesystemObjectStore::create_multipart_upload(const std::string& key, MultipartHandle& handle) {
    std::filesystem::path target;
    auto resolved = resolve(key, target);
    if (!resolved.ok()) {
        return resolved;
    }
    
    auto upload_id = crypto::SecureRandom::generate_id(16);
    auto dir = multipart_dir(upload_id);
    
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return io_error("Cannot create multipart directory: " + ec.message());
    }
    
    std::ofstream key_file(dir / KEY_FILE, std::ios::binary | std::ios::trunc);
    key_file << key;
    if (!key_file) {
        return io_error("Cannot record multipart key for " + key);
    }
    
    handle.key = key;
    handle.upload_id = upload_id;
    return StorageError::success();
}

StorageError FilesystemObjectStore::upload_part(const MultipartHandle& handle, uint32_t part_number,
                                                std::span<const uint8_t> data, std::string& content_tag) {
    if (part_number == 0 || part_number > 10000) {
        return StorageError(StorageErrorKind::BAD_REQUEST,
            "Part number out of range: " + std::to_string(part_number), 400);
    }
    
    auto dir = multipart_dir(handle.upload_id);
    std::string recorded_key;
    if (!read_text(dir / KEY_FILE, recorded_key) || recorded_key != handle.key) {
        return StorageError(StorageErrorKind::NOT_FOUND, "Multipart upload " + handle.upload_id + " not found", 404);
    }
    
    auto tag = crypto::hash_utils::content_tag(data);
    auto path = part_path(handle.upload_id, part_number);
    
    // Write to a private name first so a concurrent re-upload never exposes a torn part.
    auto staging = path;
    staging += "." + crypto::SecureRandom::generate_id(8);
    auto written = write_file(staging, data);
    if (!written.ok()) {
        return written;
    }
    
    std::ofstream tag_file(staging.string() + ".tag", std::ios::binary | std::ios::trunc);
    tag_file << tag;
    tag_file.close();
    if (!tag_file) {
        return io_error("Cannot write part tag");
    }
    
    std::error_code ec;
    std::filesystem::rename(staging.string() + ".tag", path.string() + ".tag", ec);
    if (!ec) {
        std::filesystem::rename(staging, path, ec);
    }
    if (ec) {
        return io_error("Cannot publish part: " + ec.message());
    }
    
    content_tag = tag;
    return StorageError::success();
}

StorageError FilesystemObjectStore::complete_multipart_upload(const MultipartHandle& handle,
                                                              const std::vector<CompletedPart>& parts) {
    std::lock_guard<std::mutex> lock(complete_mutex_);
    
    auto dir = multipart_dir(handle.upload_id);
    std::string recorded_key;
    if (!read_text(dir / KEY_FILE, recorded_key) || recorded_key != handle.key) {
        return StorageError(StorageErrorKind::NOT_FOUND, "Multipart upload " + handle.upload_id + " not found", 404);
    }
    
    std::map<uint32_t, StoredPartInfo> stored;
    for (const auto& part : parts) {
        auto path = part_path(handle.upload_id, part.part_number);
        std::string tag;
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec || !read_text(path.string() + ".tag", tag)) {
            continue;
        }
        stored[part.part_number] = StoredPartInfo{tag, size};
    }
    
    std::vector<CompletedPart> layout;
    auto validation = validate_completion(parts, stored, layout);
    if (!validation.ok()) {
        return validation;
    }
    
    std::filesystem::path target;
    auto resolved = resolve(handle.key, target);
    if (!resolved.ok()) {
        return resolved;
    }
    
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    
    auto assembling = dir / "assembled";
    {
        std::ofstream out(assembling, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return io_error("Cannot open assembly file for " + handle.key);
        }
        
        std::vector<char> buffer(1 << 20);
        for (const auto& part : layout) {
            std::ifstream in(part_path(handle.upload_id, part.part_number), std::ios::binary);
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                out.write(buffer.data(), in.gcount());
            }
        }
        
        out.close();
        if (!out) {
            return io_error("Failed to assemble " + handle.key);
        }
    }
    
    std::filesystem::rename(assembling, target, ec);
    if (ec) {
        return io_error("Cannot publish " + handle.key + ": " + ec.message());
    }
    
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        LOG_WARN("Could not remove multipart directory {}: {}", dir.string(), ec.message());
    }
    return StorageError::success();
}

StorageError FilesystemObjectStore::abort_multipart_upload(const MultipartHandle& handle) {
    if (handle.upload_id.empty() || handle.upload_id.find('/') != std::string::npos) {
        return StorageError(StorageErrorKind::BAD_REQUEST, "Invalid multipart handle", 400);
    }
    
    std::error_code ec;
    std::filesystem::remove_all(multipart_dir(handle.upload_id), ec);
    if (ec) {
        return io_error("Cannot abort multipart upload: " + ec.message());
    }
    return StorageError::success();
}

StorageError FilesystemObjectStore::head(const std::string& key, uint64_t& size) {
    std::filesystem::path path;
    auto resolved = resolve(key, path);
    if (!resolved.ok()) {
        return resolved;
    }
    
    std::error_code ec;
    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return StorageError(StorageErrorKind::NOT_FOUND, "Object " + key + " not found", 404);
    }
    size = file_size;
    return StorageError::success();
}

StorageError FilesystemObjectStore::read_range(const std::string& key, uint64_t offset, uint64_t length,
                                               std::vector<uint8_t>& out) {
    std::filesystem::path path;
    auto resolved = resolve(key, path);
    if (!resolved.ok()) {
        return resolved;
    }
    
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return StorageError(StorageErrorKind::NOT_FOUND, "Object " + key + " not found", 404);
    }
    
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return io_error("Cannot stat " + key);
    }
    if (offset > size) {
        return StorageError(StorageErrorKind::BAD_REQUEST, "Range starts past end of " + key, 416);
    }
    
    auto count = std::min<uint64_t>(length, size - offset);
    out.resize(count);
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(count));
    if (static_cast<uint64_t>(file.gcount()) != count) {
        return io_error("Short read on " + key);
    }
    return StorageError::success();
}

StorageError FilesystemObjectStore::get(const std::string& key, std::vector<uint8_t>& out) {
    uint64_t size = 0;
    auto error = head(key, size);
    if (!error.ok()) {
        return error;
    }
    return read_range(key, 0, size, out);
}

StorageError FilesystemObjectStore::put(const std::string& key, std::span<const uint8_t> data) {
    std::filesystem::path path;
    auto resolved = resolve(key, path);
    if (!resolved.ok()) {
        return resolved;
    }
    
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return io_error("Cannot create directory for " + key);
    }
    return write_file(path, data);
}

StorageError FilesystemObjectStore::copy(const std::string& source_key, const std::string& destination_key) {
    std::filesystem::path source;
    std::filesystem::path destination;
    auto resolved = resolve(source_key, source);
    if (!resolved.ok()) {
        return resolved;
    }
    resolved = resolve(destination_key, destination);
    if (!resolved.ok()) {
        return resolved;
    }
    
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return StorageError(StorageErrorKind::NOT_FOUND, "Object " + source_key + " not found", 404);
    }
    
    std::filesystem::create_directories(destination.parent_path(), ec);
    std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return io_error("Cannot copy " + source_key + ": " + ec.message());
    }
    return StorageError::success();
}

StorageError FilesystemObjectStore::remove(const std::string& key) {
    std::filesystem::path path;
    auto resolved = resolve(key, path);
    if (!resolved.ok()) {
        return resolved;
    }
    
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return io_error("Cannot remove " + key + ": " + ec.message());
    }
    return StorageError::success();
}

StorageError FilesystemObjectStore::resolve(const std::string& key, std::filesystem::path& path) const {
    if (key.empty() || key.front() == '/' || key.starts_with(MULTIPART_DIR)) {
        return StorageError(StorageErrorKind::BAD_REQUEST, "Invalid object key: " + key, 400);
    }
    
    std::filesystem::path relative(key);
    for (const auto& component : relative) {
        if (component == ".." || component == ".") {
            return StorageError(StorageErrorKind::BAD_REQUEST, "Invalid object key: " + key, 400);
        }
    }
    
    path = root_ / relative;
    return StorageError::success();
}

std::filesystem::path FilesystemObjectStore::multipart_dir(const std::string& upload_id) const {
    return root_ / MULTIPART_DIR / upload_id;
}

std::filesystem::path FilesystemObjectStore::part_path(const std::string& upload_id, uint32_t part_number) const {
    std::ostringstream name;
    name << "part-" << std::setw(6) << std::setfill('0') << part_number;
    return multipart_dir(upload_id) / name.str();
}

StorageError FilesystemObjectStore::write_file(const std::filesystem::path& path,
                                               std::span<const uint8_t> data) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return io_error("Cannot open " + path.string() + " for writing");
    }
    
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        return io_error("Failed to write " + path.string());
    }
    return StorageError::success();
}

} // namespace fastpack::storage
