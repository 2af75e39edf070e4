#pragma once

#include "chatvault/bot_pool.hpp"
#include "chatvault/cancellation.hpp"
#include "chatvault/file_record.hpp"
#include "chatvault/vault_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chatvault {

class MessageBackend;
class MetadataStore;
class MetricsExporter;
class ThreadPool;
class TransportClient;

enum class VaultErrorCode {
    None,
    PoolExhausted,        // no eligible bot; retry_at says when one frees up
    TransportFailure,     // backend call failed after the retry budget
    IntegrityViolation,   // digest or length mismatch
    MetadataUnavailable,  // store unreachable or statement failed
    NotFound,
    PartialDelete,        // some segments still exist remotely; record kept
    DownloadIncomplete,
    Cancelled,
    InvalidArgument,
    PathConflict
};

const char* error_code_to_string(VaultErrorCode code);

/// A compensating delete that did not go through. The remote message is
/// orphaned; these details are what manual cleanup needs.
struct CompensationFailure {
    uint32_t sequence_index = 0;
    std::string bot_id;
    int64_t remote_message_id = 0;
    std::string error_message;
};

struct VaultError {
    VaultErrorCode code = VaultErrorCode::None;
    std::string message;
    std::string file_id;
    std::optional<uint32_t> segment_index;
    std::string bot_id;
    std::optional<std::chrono::steady_clock::time_point> retry_at;
    std::vector<uint32_t> remaining_segments;              // PartialDelete
    std::vector<CompensationFailure> compensation_failures;

    explicit operator bool() const { return code != VaultErrorCode::None; }

    /// One line with every identifying detail set on the error.
    std::string to_string() const;
};

enum class TransferPhase { Started, SegmentDone, Verifying, Committed, Completed, Failed };

const char* transfer_phase_to_string(TransferPhase phase);

struct TransferEvent {
    TransferPhase phase = TransferPhase::Started;
    std::string file_id;
    std::string path;
    uint64_t bytes_done = 0;
    uint64_t total_bytes = 0;    // 0 while an upload's size is still unknown
    uint32_t segments_done = 0;
    uint32_t total_segments = 0; // likewise
};

using ProgressCallback = std::function<void(const TransferEvent&)>;

/// Receives downloaded bytes in order. Returning false cancels the download.
using ByteSink = std::function<bool(std::span<const uint8_t>)>;

struct UploadOptions {
    const CancellationToken* cancel = nullptr;
    ProgressCallback on_progress;
};

struct DownloadOptions {
    const CancellationToken* cancel = nullptr;
    ProgressCallback on_progress;
};

struct UploadResult {
    bool success = false;
    FileRecord record;
    VaultError error;
};

struct DownloadResult {
    bool success = false;
    std::string file_id;
    std::string path;
    uint64_t bytes_written = 0;
    std::string digest;
    VaultError error;
};

struct ListResult {
    bool success = false;
    std::vector<FileSummary> entries;
    VaultError error;
};

struct RenameResult {
    bool success = false;
    FileRecord record;
    VaultError error;
};

struct RemoveResult {
    bool success = false;
    std::string file_id;
    uint32_t segments_deleted = 0;  // by this call
    VaultError error;
};

struct StatResult {
    bool success = false;
    FileRecord record;
    VaultError error;
};

/// Stores files as chat messages and keeps the metadata store consistent
/// with what exists remotely.
///
/// Every workflow runs on the calling thread; segment uploads and deletes
/// are dispatched to one shared ThreadPool. Upload commits the record only
/// after every segment is stored and verified, and deletes whatever it
/// uploaded when it cannot commit. Delete removes the record only after
/// every remote message is confirmed gone.
class Vault {
public:
    /// Backend and metadata store are built from `config` in start().
    explicit Vault(const VaultConfig& config);

    /// Use the given backend and store (tests, embedding). `clock` drives
    /// the bot pool.
    Vault(const VaultConfig& config,
          std::unique_ptr<MessageBackend> backend,
          std::unique_ptr<MetadataStore> store,
          BotPool::Clock clock = nullptr);

    ~Vault();

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    /// Validate config, open the store, build the backend and start workers.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Wait for queued segment work and stop workers.
    void stop();

    bool is_running() const { return running_.load(); }

    UploadResult upload(std::istream& in, const std::string& logical_path,
                        const UploadOptions& options = {});

    DownloadResult download(const std::string& path_or_id, const ByteSink& sink,
                            const DownloadOptions& options = {});

    /// Download into `<local_path>.partial`, rename into place once verified.
    /// The partial file is removed on any failure.
    DownloadResult download_to_file(const std::string& path_or_id,
                                    const std::filesystem::path& local_path,
                                    const DownloadOptions& options = {});

    ListResult list(const std::string& prefix);

    RenameResult rename(const std::string& id, const std::string& new_path);

    RemoveResult remove(const std::string& id);

    StatResult stat(const std::string& path_or_id);

    /// Counters are bumped here as well as in Stats. Not owned; may be null.
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Valid after start().
    BotPool& pool() { return *pool_; }
    MetadataStore& store() { return *store_; }

    const VaultConfig& config() const { return config_; }

    struct Stats {
        uint64_t uploads_completed = 0;
        uint64_t uploads_failed = 0;
        uint64_t uploads_cancelled = 0;
        uint64_t downloads_completed = 0;
        uint64_t downloads_failed = 0;
        uint64_t deletes_completed = 0;
        uint64_t deletes_partial = 0;
        uint64_t compensations_run = 0;
        uint64_t compensations_failed = 0;
        uint64_t segments_uploaded = 0;
        uint64_t bytes_uploaded = 0;
        uint64_t bytes_downloaded = 0;
    };
    Stats get_stats() const;

private:
    struct SegmentOutcome;
    struct UploadState;

    // Select a bot and push one segment through the retry policy
    SegmentOutcome upload_one_segment(const std::string& file_id, uint32_t index,
                                      const std::string& file_name,
                                      std::shared_ptr<const std::vector<uint8_t>> data,
                                      const std::string& local_digest,
                                      const CancellationToken* cancel);
    static SegmentOutcome lost_segment(const std::string& file_id, const char* what);

    struct SegmentFetch;

    // Resolve and read one whole segment, checking its length and digest
    SegmentFetch fetch_segment(const SegmentRef& segment, const CancellationToken* cancel);

    // Delete every created message of an aborted upload
    void compensate(const std::string& file_id, const std::vector<SegmentRef>& uploaded,
                    VaultError& error);

    struct DeleteOutcome {
        bool success = false;
        std::string error_message;
    };

    // Delete segments concurrently (bounded by delete_concurrency); one
    // outcome per input segment, in input order
    std::vector<DeleteOutcome> delete_segments(const std::vector<SegmentRef>& segments);

    // Delete one segment, retrying Transient / RateLimited results
    DeleteOutcome delete_with_retry(const SegmentRef& segment);

    // Lookup by id first, then by path (newest record wins)
    bool resolve_record(const std::string& path_or_id, FileRecord& record, VaultError& error);

    UploadResult fail_upload(UploadState& state, VaultError error);

    bool check_running(VaultError& error) const;

    VaultConfig config_;
    BotPool::Clock clock_;

    std::unique_ptr<MessageBackend> backend_;
    std::unique_ptr<MetadataStore> store_;
    std::unique_ptr<BotPool> pool_;
    std::unique_ptr<TransportClient> transport_;
    std::unique_ptr<ThreadPool> workers_;

    MetricsExporter* metrics_ = nullptr;

    std::atomic<bool> running_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace chatvault
