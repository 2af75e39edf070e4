#include "chatvault/metadata_store.hpp"
#include "chatvault/log.hpp"

#include <sqlite3.h>

#include <chrono>
#include <thread>

namespace chatvault {

namespace {

constexpr const char* METADATA_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS files (
    id TEXT PRIMARY KEY,
    path TEXT NOT NULL,
    size_bytes INTEGER NOT NULL,
    digest TEXT NOT NULL,
    segment_size INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    bot_pool_version INTEGER NOT NULL DEFAULT 0,
    delete_pending INTEGER NOT NULL DEFAULT 0
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_files_path ON files(path);

CREATE TABLE IF NOT EXISTS segments (
    file_id TEXT NOT NULL,
    sequence_index INTEGER NOT NULL,
    bot_id TEXT NOT NULL,
    message_id INTEGER NOT NULL,
    file_token TEXT NOT NULL,
    byte_length INTEGER NOT NULL,
    segment_digest TEXT NOT NULL,
    remote_deleted INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (file_id, sequence_index)
) WITHOUT ROWID;
)";

constexpr const char* FILE_COLUMNS =
    "id, path, size_bytes, digest, segment_size, created_at, bot_pool_version";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

// Rolls back unless commit() was called
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        active_ = sql_exec(db_, "BEGIN IMMEDIATE");
    }
    ~Transaction() {
        if (active_) sql_exec(db_, "ROLLBACK");
    }
    bool active() const { return active_; }
    bool commit() {
        if (!active_) return false;
        active_ = false;
        if (sql_exec(db_, "COMMIT")) return true;
        sql_exec(db_, "ROLLBACK");
        return false;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

}  // namespace

const char* store_status_to_string(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok: return "ok";
        case StoreStatus::NotFound: return "not_found";
        case StoreStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

SqliteMetadataStore::SqliteMetadataStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {}

SqliteMetadataStore::~SqliteMetadataStore() {
    close();
}

void SqliteMetadataStore::close() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);

    for (auto** stmt : {&stmt_insert_file_, &stmt_insert_segment_, &stmt_get_file_,
                        &stmt_get_segments_, &stmt_find_by_path_, &stmt_list_,
                        &stmt_update_path_, &stmt_mark_deleted_, &stmt_set_pending_,
                        &stmt_delete_segments_, &stmt_delete_file_}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string SqliteMetadataStore::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

std::string SqliteMetadataStore::open() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (db_) return {};

    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) return "Failed to create metadata directory: " + ec.message();
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = "Cannot open metadata database: " + last_error();
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, METADATA_SCHEMA)) {
        return "Failed to create metadata schema: " + last_error();
    }

    struct Prepared {
        sqlite3_stmt** stmt;
        std::string sql;
    };
    const std::string cols = FILE_COLUMNS;
    const Prepared statements[] = {
        {&stmt_insert_file_,
         "INSERT INTO files (id, path, size_bytes, digest, segment_size, created_at, "
         "bot_pool_version, delete_pending) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, 0)"},
        {&stmt_insert_segment_,
         "INSERT INTO segments (file_id, sequence_index, bot_id, message_id, file_token, "
         "byte_length, segment_digest, remote_deleted) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)"},
        {&stmt_get_file_, "SELECT " + cols + " FROM files WHERE id = ?1"},
        {&stmt_get_segments_,
         "SELECT sequence_index, bot_id, message_id, file_token, byte_length, segment_digest, "
         "remote_deleted FROM segments WHERE file_id = ?1 ORDER BY sequence_index ASC"},
        {&stmt_find_by_path_,
         "SELECT " + cols + " FROM files WHERE path = ?1 ORDER BY created_at DESC, id DESC"},
        {&stmt_list_,
         "SELECT f.id, f.path, f.size_bytes, f.created_at, "
         "(SELECT COUNT(*) FROM segments s WHERE s.file_id = f.id) "
         "FROM files f WHERE ?1 = '' OR f.path = ?1 OR substr(f.path, 1, length(?1) + 1) = ?1 || '/' "
         "ORDER BY f.path ASC, f.created_at ASC"},
        {&stmt_update_path_, "UPDATE files SET path = ?2 WHERE id = ?1"},
        {&stmt_mark_deleted_,
         "UPDATE segments SET remote_deleted = 1 WHERE file_id = ?1 AND sequence_index = ?2"},
        {&stmt_set_pending_, "UPDATE files SET delete_pending = 1 WHERE id = ?1"},
        {&stmt_delete_segments_, "DELETE FROM segments WHERE file_id = ?1"},
        {&stmt_delete_file_, "DELETE FROM files WHERE id = ?1"},
    };

    for (const auto& p : statements) {
        if (sqlite3_prepare_v2(db_, p.sql.c_str(), -1, p.stmt, nullptr) != SQLITE_OK) {
            return "Failed to prepare statement: " + last_error();
        }
    }

    log_debug("Metadata store open at %s", db_path_.c_str());
    return {};
}

bool SqliteMetadataStore::is_healthy() const {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    return db_ != nullptr;
}

FileRecord SqliteMetadataStore::row_to_record(sqlite3_stmt* stmt) {
    FileRecord record;
    record.id = column_text(stmt, 0);
    record.path = column_text(stmt, 1);
    record.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    record.digest = column_text(stmt, 3);
    record.segment_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    record.created_at = from_epoch_seconds(sqlite3_column_int64(stmt, 5));
    record.bot_pool_version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    return record;
}

bool SqliteMetadataStore::load_segments(FileRecord& record, std::string& error) {
    sqlite3_reset(stmt_get_segments_);
    sqlite3_bind_text(stmt_get_segments_, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);

    record.segments.clear();
    int rc;
    while ((rc = sql_step_retry(stmt_get_segments_)) == SQLITE_ROW) {
        SegmentRef seg;
        seg.sequence_index = static_cast<uint32_t>(sqlite3_column_int64(stmt_get_segments_, 0));
        seg.bot_id = column_text(stmt_get_segments_, 1);
        seg.remote_message_id = sqlite3_column_int64(stmt_get_segments_, 2);
        seg.remote_file_token = column_text(stmt_get_segments_, 3);
        seg.byte_length = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_segments_, 4));
        seg.segment_digest = column_text(stmt_get_segments_, 5);
        seg.remote_deleted = sqlite3_column_int(stmt_get_segments_, 6) != 0;
        record.segments.push_back(std::move(seg));
    }
    sqlite3_reset(stmt_get_segments_);

    if (rc != SQLITE_DONE) {
        error = "Failed to read segments: " + last_error();
        return false;
    }
    return true;
}

StoreWrite SqliteMetadataStore::insert(const FileRecord& record) {
    StoreWrite result;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) {
        result.error_message = "database not open";
        return result;
    }

    Transaction txn(db_);
    if (!txn.active()) {
        result.error_message = "Failed to begin transaction: " + last_error();
        return result;
    }

    sqlite3_reset(stmt_insert_file_);
    sqlite3_bind_text(stmt_insert_file_, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_file_, 2, record.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_file_, 3, static_cast<int64_t>(record.size_bytes));
    sqlite3_bind_text(stmt_insert_file_, 4, record.digest.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_file_, 5, static_cast<int64_t>(record.segment_size));
    sqlite3_bind_int64(stmt_insert_file_, 6, to_epoch_seconds(record.created_at));
    sqlite3_bind_int64(stmt_insert_file_, 7, static_cast<int64_t>(record.bot_pool_version));
    int rc = sql_step_retry(stmt_insert_file_);
    sqlite3_reset(stmt_insert_file_);
    if (rc != SQLITE_DONE) {
        result.error_message = "Failed to insert file " + record.id + ": " + last_error();
        return result;
    }

    for (const auto& seg : record.segments) {
        sqlite3_reset(stmt_insert_segment_);
        sqlite3_bind_text(stmt_insert_segment_, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_insert_segment_, 2, seg.sequence_index);
        sqlite3_bind_text(stmt_insert_segment_, 3, seg.bot_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_insert_segment_, 4, seg.remote_message_id);
        sqlite3_bind_text(stmt_insert_segment_, 5, seg.remote_file_token.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_insert_segment_, 6, static_cast<int64_t>(seg.byte_length));
        sqlite3_bind_text(stmt_insert_segment_, 7, seg.segment_digest.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt_insert_segment_, 8, seg.remote_deleted ? 1 : 0);
        rc = sql_step_retry(stmt_insert_segment_);
        sqlite3_reset(stmt_insert_segment_);
        if (rc != SQLITE_DONE) {
            result.error_message = "Failed to insert segment " +
                                   std::to_string(seg.sequence_index) + ": " + last_error();
            return result;
        }
    }

    if (!txn.commit()) {
        result.error_message = "Failed to commit file " + record.id + ": " + last_error();
        return result;
    }

    result.status = StoreStatus::Ok;
    return result;
}

RecordLookup SqliteMetadataStore::get(const std::string& id) {
    RecordLookup result;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) {
        result.error_message = "database not open";
        return result;
    }

    sqlite3_reset(stmt_get_file_);
    sqlite3_bind_text(stmt_get_file_, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_get_file_);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(stmt_get_file_);
        result.status = StoreStatus::NotFound;
        result.error_message = "no record with id " + id;
        return result;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_reset(stmt_get_file_);
        result.error_message = "Failed to read file " + id + ": " + last_error();
        return result;
    }

    result.record = row_to_record(stmt_get_file_);
    sqlite3_reset(stmt_get_file_);

    if (!load_segments(result.record, result.error_message)) {
        return result;
    }
    result.status = StoreStatus::Ok;
    return result;
}

RecordList SqliteMetadataStore::find_by_path(const std::string& path) {
    RecordList result;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) {
        result.error_message = "database not open";
        return result;
    }

    sqlite3_reset(stmt_find_by_path_);
    sqlite3_bind_text(stmt_find_by_path_, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    int rc;
    while ((rc = sql_step_retry(stmt_find_by_path_)) == SQLITE_ROW) {
        result.records.push_back(row_to_record(stmt_find_by_path_));
    }
    sqlite3_reset(stmt_find_by_path_);
    if (rc != SQLITE_DONE) {
        result.records.clear();
        result.error_message = "Failed to look up path " + path + ": " + last_error();
        return result;
    }

    for (auto& record : result.records) {
        if (!load_segments(record, result.error_message)) {
            result.records.clear();
            return result;
        }
    }

    result.status = result.records.empty() ? StoreStatus::NotFound : StoreStatus::Ok;
    if (result.records.empty()) result.error_message = "no record at " + path;
    return result;
}

SummaryList SqliteMetadataStore::list(const std::string& prefix) {
    SummaryList result;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) {
        result.error_message = "database not open";
        return result;
    }

    sqlite3_reset(stmt_list_);
    sqlite3_bind_text(stmt_list_, 1, prefix.c_str(), -1, SQLITE_TRANSIENT);
    int rc;
    while ((rc = sql_step_retry(stmt_list_)) == SQLITE_ROW) {
        FileSummary s;
        s.id = column_text(stmt_list_, 0);
        s.path = column_text(stmt_list_, 1);
        s.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt_list_, 2));
        s.created_at = from_epoch_seconds(sqlite3_column_int64(stmt_list_, 3));
        s.segment_count = static_cast<uint32_t>(sqlite3_column_int64(stmt_list_, 4));
        result.entries.push_back(std::move(s));
    }
    sqlite3_reset(stmt_list_);

    if (rc != SQLITE_DONE) {
        result.entries.clear();
        result.error_message = "Failed to list files: " + last_error();
        return result;
    }
    result.status = StoreStatus::Ok;
    return result;
}

StoreWrite SqliteMetadataStore::update_path(const std::string& id, const std::string& new_path) {
    StoreWrite result;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) {
        result.error_message = "database not open";
        return result;
    }

    sqlite3_reset(stmt_update_path_);
    sqlite3_bind_text(stmt_update_path_, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_update_path_, 2, new_path.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_update_path_);
    sqlite3_reset(stmt_update_path_);
    if (rc != SQLITE_DONE) {
        result.error_message = "Failed to rename " + id + ": " + last_error();
        return result;
    }

    if (sqlite3_changes(db_) == 0) {
        result.status = StoreStatus::NotFound;
        result.error_message = "no record with id " + id;
        return result;
    }
    result.status = StoreStatus::Ok;
    return result;
}

StoreWrite SqliteMetadataStore::mark_segments_deleted(const std::string& id,
                                                      const std::vector<uint32_t>& sequence_indices) {
    StoreWrite result;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) {
        result.error_message = "database not open";
        return result;
    }
    if (sequence_indices.empty()) {
        result.status = StoreStatus::Ok;
        return result;
    }

    Transaction txn(db_);
    if (!txn.active()) {
        result.error_message = "Failed to begin transaction: " + last_error();
        return result;
    }

    sqlite3_reset(stmt_set_pending_);
    sqlite3_bind_text(stmt_set_pending_, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_set_pending_);
    sqlite3_reset(stmt_set_pending_);
    if (rc != SQLITE_DONE) {
        result.error_message = "Failed to flag " + id + ": " + last_error();
        return result;
    }
    if (sqlite3_changes(db_) == 0) {
        result.status = StoreStatus::NotFound;
        result.error_message = "no record with id " + id;
        return result;
    }

    for (uint32_t index : sequence_indices) {
        sqlite3_reset(stmt_mark_deleted_);
        sqlite3_bind_text(stmt_mark_deleted_, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_mark_deleted_, 2, index);
        rc = sql_step_retry(stmt_mark_deleted_);
        sqlite3_reset(stmt_mark_deleted_);
        if (rc != SQLITE_DONE) {
            result.error_message = "Failed to mark segment " + std::to_string(index) +
                                   " deleted: " + last_error();
            return result;
        }
    }

    if (!txn.commit()) {
        result.error_message = "Failed to commit segment marks for " + id + ": " + last_error();
        return result;
    }
    result.status = StoreStatus::Ok;
    return result;
}

StoreWrite SqliteMetadataStore::remove(const std::string& id) {
    StoreWrite result;
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    if (!db_) {
        result.error_message = "database not open";
        return result;
    }

    Transaction txn(db_);
    if (!txn.active()) {
        result.error_message = "Failed to begin transaction: " + last_error();
        return result;
    }

    sqlite3_reset(stmt_delete_file_);
    sqlite3_bind_text(stmt_delete_file_, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_delete_file_);
    sqlite3_reset(stmt_delete_file_);
    if (rc != SQLITE_DONE) {
        result.error_message = "Failed to delete file " + id + ": " + last_error();
        return result;
    }
    if (sqlite3_changes(db_) == 0) {
        result.status = StoreStatus::NotFound;
        result.error_message = "no record with id " + id;
        return result;
    }

    sqlite3_reset(stmt_delete_segments_);
    sqlite3_bind_text(stmt_delete_segments_, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    rc = sql_step_retry(stmt_delete_segments_);
    sqlite3_reset(stmt_delete_segments_);
    if (rc != SQLITE_DONE) {
        result.error_message = "Failed to delete segments of " + id + ": " + last_error();
        return result;
    }

    if (!txn.commit()) {
        result.error_message = "Failed to commit delete of " + id + ": " + last_error();
        return result;
    }
    result.status = StoreStatus::Ok;
    return result;
}

}  // namespace chatvault
