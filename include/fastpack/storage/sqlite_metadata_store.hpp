#pragma once

#include <filesystem>
#include <string>

#include "metadata_store.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace fastpack::storage {

class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::filesystem::path& db_path);
    ~SqliteMetadataStore() override;
    
    SqliteMetadataStore(const SqliteMetadataStore&) = delete;
    SqliteMetadataStore& operator=(const SqliteMetadataStore&) = delete;
    
    bool initialize();
    
    core::Result get(const std::string& key, std::string& value) override;
    core::Result put(const std::string& key, const std::string& value) override;
    core::Result remove(const std::string& key) override;
    core::Result insert_if_absent(const std::string& key, const std::string& value, bool& inserted) override;
    core::Result increment(const std::string& key, int64_t delta, int64_t& value) override;
    core::Result read_counter(const std::string& key, int64_t& value) override;
    core::Result remove_counter(const std::string& key) override;

private:
    bool create_tables();
    core::Result prepare(const char* sql, sqlite3_stmt** stmt) const;
    core::Result execute_key(const char* sql, const std::string& key);
    core::Result failure(const std::string& context) const;
    
    std::filesystem::path db_path_;
    sqlite3* db_;
};

} // namespace fastpack::storage
