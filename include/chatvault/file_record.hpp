#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatvault {

/// One physical chunk of a file, stored as one remote message.
struct SegmentRef {
    uint32_t sequence_index = 0;    // 0-based position in the byte stream
    std::string bot_id;             // credential that created the message
    int64_t remote_message_id = 0;  // handle for deletion
    std::string remote_file_token;  // handle for download
    uint64_t byte_length = 0;
    std::string segment_digest;     // hex SHA-256 of this segment
    bool remote_deleted = false;    // confirmed absent by an unfinished hard delete
};

/// Metadata record mapping a logical file to its ordered segments.
struct FileRecord {
    std::string id;     // immutable; the handle for rename/delete
    std::string path;   // normalised logical path
    uint64_t size_bytes = 0;
    std::string digest; // hex SHA-256 of the reassembled file
    uint64_t segment_size = 0;
    std::vector<SegmentRef> segments;  // sorted by sequence_index
    std::chrono::system_clock::time_point created_at;
    uint64_t bot_pool_version = 0;

    /// True once a hard delete has removed some, but not all, segments.
    bool delete_pending() const;

    /// Segments not yet confirmed deleted.
    std::vector<SegmentRef> live_segments() const;

    /// Last path component / everything before it ("/" for top level).
    std::string name() const;
    std::string parent() const;
};

/// Row returned by list(): what a directory listing needs.
struct FileSummary {
    std::string id;
    std::string path;
    uint64_t size_bytes = 0;
    std::chrono::system_clock::time_point created_at;
    uint32_t segment_count = 0;
};

/// Normalise a logical path: collapse repeated slashes, force a leading '/',
/// drop a trailing '/'. Returns nullopt for empty, root-only, or paths with
/// "." / ".." components or NUL bytes.
std::optional<std::string> normalize_path(const std::string& path);

/// Normalise a listing prefix. "", "/" and "root" mean everything and map to
/// the empty string. Returns nullopt when the prefix is malformed.
std::optional<std::string> normalize_prefix(const std::string& prefix);

/// True when `path` equals `prefix` or lies beneath it. An empty prefix
/// matches everything.
bool path_has_prefix(const std::string& path, const std::string& prefix);

/// Random UUIDv4 string (OpenSSL RAND_bytes).
std::string generate_file_id();

/// Heuristic used to tell an id from a path in path_or_id arguments.
bool looks_like_file_id(const std::string& value);

int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_seconds(int64_t secs);

}  // namespace chatvault
