#include "fastpack/storage/sqlite_metadata_store.hpp"
#include "fastpack/core/logger.hpp"
#include <sqlite3.h>

namespace fastpack::storage {

SqliteMetadataStore::SqliteMetadataStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SqliteMetadataStore::~SqliteMetadataStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteMetadataStore::initialize() {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot open metadata database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(result));
        return false;
    }
    
    sqlite3_busy_timeout(db_, 5000);
    return create_tables();
}

bool SqliteMetadataStore::create_tables() {
    const char* schema = R"(
        PRAGMA journal_mode = WAL;
        CREATE TABLE IF NOT EXISTS kv (
            key TEXT PRIMARY KEY,
            value BLOB NOT NULL
        );
        CREATE TABLE IF NOT EXISTS counters (
            key TEXT PRIMARY KEY,
            value INTEGER NOT NULL
        );
    )";
    
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, schema, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create metadata tables: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

core::Result SqliteMetadataStore::get(const std::string& key, std::string& value) {
    sqlite3_stmt* stmt;
    auto prepared = prepare("SELECT value FROM kv WHERE key = ?;", &stmt);
    if (!prepared) {
        return prepared;
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    
    int result = sqlite3_step(stmt);
    if (result == SQLITE_ROW) {
        auto data = static_cast<const char*>(sqlite3_column_blob(stmt, 0));
        auto size = sqlite3_column_bytes(stmt, 0);
        value.assign(data ? data : "", static_cast<size_t>(size));
        sqlite3_finalize(stmt);
        return core::Result::ok();
    }
    
    sqlite3_finalize(stmt);
    if (result == SQLITE_DONE) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Key not found: " + key);
    }
    return failure("get " + key);
}

core::Result SqliteMetadataStore::put(const std::string& key, const std::string& value) {
    sqlite3_stmt* stmt;
    auto prepared = prepare(
        "INSERT INTO kv (key, value) VALUES (?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value;", &stmt);
    if (!prepared) {
        return prepared;
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return failure("put " + key);
    }
    return core::Result::ok();
}

core::Result SqliteMetadataStore::remove(const std::string& key) {
    return execute_key("DELETE FROM kv WHERE key = ?;", key);
}

core::Result SqliteMetadataStore::insert_if_absent(const std::string& key, const std::string& value, bool& inserted) {
    sqlite3_stmt* stmt;
    auto prepared = prepare(
        "INSERT INTO kv (key, value) VALUES (?, ?) "
        "ON CONFLICT(key) DO NOTHING RETURNING key;", &stmt);
    if (!prepared) {
        return prepared;
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    
    int result = sqlite3_step(stmt);
    inserted = (result == SQLITE_ROW);
    if (inserted) {
        result = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return failure("insert " + key);
    }
    return core::Result::ok();
}

core::Result SqliteMetadataStore::increment(const std::string& key, int64_t delta, int64_t& value) {
    sqlite3_stmt* stmt;
    auto prepared = prepare(
        "INSERT INTO counters (key, value) VALUES (?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = value + excluded.value RETURNING value;", &stmt);
    if (!prepared) {
        return prepared;
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, delta);
    
    int result = sqlite3_step(stmt);
    if (result != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return failure("increment " + key);
    }
    
    value = sqlite3_column_int64(stmt, 0);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return failure("increment " + key);
    }
    return core::Result::ok();
}

core::Result SqliteMetadataStore::read_counter(const std::string& key, int64_t& value) {
    sqlite3_stmt* stmt;
    auto prepared = prepare("SELECT value FROM counters WHERE key = ?;", &stmt);
    if (!prepared) {
        return prepared;
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    
    int result = sqlite3_step(stmt);
    value = (result == SQLITE_ROW) ? sqlite3_column_int64(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_ROW && result != SQLITE_DONE) {
        return failure("read counter " + key);
    }
    return core::Result::ok();
}

core::Result SqliteMetadataStore::remove_counter(const std::string& key) {
    return execute_key("DELETE FROM counters WHERE key = ?;", key);
}

core::Result SqliteMetadataStore::prepare(const char* sql, sqlite3_stmt** stmt) const {
    if (!db_) {
        return core::Result(core::ErrorCode::METADATA_ERROR, "Metadata database not initialized");
    }
    
    int result = sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr);
    if (result != SQLITE_OK) {
        return failure("prepare");
    }
    return core::Result::ok();
}

core::Result SqliteMetadataStore::execute_key(const char* sql, const std::string& key) {
    sqlite3_stmt* stmt;
    auto prepared = prepare(sql, &stmt);
    if (!prepared) {
        return prepared;
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return failure("delete " + key);
    }
    return core::Result::ok();
}

core::Result SqliteMetadataStore::failure(const std::string& context) const {
    std::string message = context + ": " + (db_ ? sqlite3_errmsg(db_) : "no database");
    LOG_ERROR("Metadata store error, {}", message);
    return core::Result(core::ErrorCode::METADATA_ERROR, message);
}

} // namespace fastpack::storage
