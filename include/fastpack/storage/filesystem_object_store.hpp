#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "object_store.hpp"

namespace fastpack::storage {

// Objects are files under `root`; keys map to relative paths. Open multipart
// uploads live under `root/.multipart/<upload id>/`.
class FilesystemObjectStore : public ObjectStore {
public:
    explicit FilesystemObjectStore(const std::filesystem::path& root);
    ~FilesystemObjectStore() override = default;
    
    bool initialize();
    
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
    
    const std::filesystem::path& root() const { return root_; }

private:
    StorageError resolve(const std::string& key, std::filesystem::path& path) const;
    std::filesystem::path multipart_dir(const std::string& upload_id) const;
    std::filesystem::path part_path(const std::string& upload_id, uint32_t part_number) const;
    StorageError write_file(const std::filesystem::path& path, std::span<const uint8_t> data) const;
    
    std::filesystem::path root_;
    std::mutex complete_mutex_;
};

} // namespace fastpack::storage
