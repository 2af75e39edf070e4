#pragma once

#include "chatvault/file_record.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace chatvault {

enum class StoreStatus {
    Ok,
    NotFound,
    Unavailable  // store could not be reached or the statement failed
};

const char* store_status_to_string(StoreStatus status);

struct StoreWrite {
    StoreStatus status = StoreStatus::Unavailable;
    std::string error_message;

    bool ok() const { return status == StoreStatus::Ok; }
};

struct RecordLookup {
    StoreStatus status = StoreStatus::Unavailable;
    FileRecord record;
    std::string error_message;

    bool ok() const { return status == StoreStatus::Ok; }
};

// Records sharing one path, newest first
struct RecordList {
    StoreStatus status = StoreStatus::Unavailable;
    std::vector<FileRecord> records;
    std::string error_message;

    bool ok() const { return status == StoreStatus::Ok; }
};

struct SummaryList {
    StoreStatus status = StoreStatus::Unavailable;
    std::vector<FileSummary> entries;
    std::string error_message;

    bool ok() const { return status == StoreStatus::Ok; }
};

/// Persistence for FileRecords. The store is the single source of truth for
/// which files exist; a record and its segments are written and removed
/// atomically.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual std::string type_name() const = 0;

    /// Insert a new record with all its segments.
    virtual StoreWrite insert(const FileRecord& record) = 0;

    virtual RecordLookup get(const std::string& id) = 0;

    /// Every record whose path equals `path` exactly, newest first.
    virtual RecordList find_by_path(const std::string& path) = 0;

    /// Summaries of records at or beneath `prefix` (already normalised; empty
    /// means all), ordered by path.
    virtual SummaryList list(const std::string& prefix) = 0;

    /// NotFound if the row vanished.
    virtual StoreWrite update_path(const std::string& id, const std::string& new_path) = 0;

    /// Flag segments as confirmed absent remotely.
    virtual StoreWrite mark_segments_deleted(const std::string& id,
                                             const std::vector<uint32_t>& sequence_indices) = 0;

    /// Remove a record and its segments. NotFound if already gone.
    virtual StoreWrite remove(const std::string& id) = 0;

    virtual bool is_healthy() const = 0;
};

/// SQLite (WAL) implementation. One connection, statements serialised by
/// db_mutex_.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(std::filesystem::path db_path);
    ~SqliteMetadataStore() override;

    SqliteMetadataStore(const SqliteMetadataStore&) = delete;
    SqliteMetadataStore& operator=(const SqliteMetadataStore&) = delete;

    /// Open the database and create the schema.
    /// Returns error message on failure, empty string on success.
    std::string open();

    std::string type_name() const override { return "sqlite"; }

    StoreWrite insert(const FileRecord& record) override;
    RecordLookup get(const std::string& id) override;
    RecordList find_by_path(const std::string& path) override;
    SummaryList list(const std::string& prefix) override;
    StoreWrite update_path(const std::string& id, const std::string& new_path) override;
    StoreWrite mark_segments_deleted(const std::string& id,
                                     const std::vector<uint32_t>& sequence_indices) override;
    StoreWrite remove(const std::string& id) override;
    bool is_healthy() const override;

    const std::filesystem::path& path() const { return db_path_; }

private:
    void close();

    // Load segments for a file row; caller holds db_mutex_
    bool load_segments(FileRecord& record, std::string& error);
    // Read the current files row of stmt into a record (columns in schema order)
    static FileRecord row_to_record(sqlite3_stmt* stmt);

    std::string last_error() const;

    std::filesystem::path db_path_;

    mutable std::mutex db_mutex_;  // Protects prepared statement usage
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_insert_file_ = nullptr;
    sqlite3_stmt* stmt_insert_segment_ = nullptr;
    sqlite3_stmt* stmt_get_file_ = nullptr;
    sqlite3_stmt* stmt_get_segments_ = nullptr;
    sqlite3_stmt* stmt_find_by_path_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
    sqlite3_stmt* stmt_update_path_ = nullptr;
    sqlite3_stmt* stmt_mark_deleted_ = nullptr;
    sqlite3_stmt* stmt_set_pending_ = nullptr;
    sqlite3_stmt* stmt_delete_segments_ = nullptr;
    sqlite3_stmt* stmt_delete_file_ = nullptr;
};

}  // namespace chatvault
