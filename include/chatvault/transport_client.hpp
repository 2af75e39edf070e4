#pragma once

#include "chatvault/bot_pool.hpp"
#include "chatvault/cancellation.hpp"
#include "chatvault/constants.hpp"
#include "chatvault/file_record.hpp"
#include "chatvault/message_backend.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace chatvault {

enum class TransportStatus {
    Ok,
    NotFound,     // delete: message already gone
    RateLimited,  // retry_after is set
    Transient,
    Permanent,
    Corrupted,    // backend stored something other than what was sent
    Cancelled
};

const char* transport_status_to_string(TransportStatus status);

struct TransportOptions {
    std::string chat_id;
    size_t read_block_bytes = constants::DEFAULT_READ_BLOCK_BYTES;
    uint32_t max_link_refreshes = constants::DEFAULT_MAX_LINK_REFRESHES;
    std::chrono::seconds max_rate_limit_wait{constants::DEFAULT_MAX_RATE_LIMIT_WAIT_SECONDS};
    size_t max_per_bot_in_flight = 0;  // 0 = no cap
};

// Caps the backend calls one bot has in flight across all workflows.
// acquire() blocks while the bot is at its cap; the permit releases its
// slot when it goes out of scope. A cap of 0 never blocks.
class BotThrottle {
public:
    class Permit {
    public:
        Permit(BotThrottle& owner, std::string bot_id)
            : owner_(owner), bot_id_(std::move(bot_id)) {}
        ~Permit() { owner_.release(bot_id_); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        BotThrottle& owner_;
        std::string bot_id_;
    };

    explicit BotThrottle(size_t cap) : cap_(cap) {}

    Permit acquire(const std::string& bot_id);

    size_t in_flight(const std::string& bot_id) const;
    size_t cap() const { return cap_; }

private:
    void release(const std::string& bot_id);

    const size_t cap_;
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::map<std::string, size_t> active_;
};

struct SegmentUpload {
    bool success = false;
    TransportStatus status = TransportStatus::Permanent;
    // Filled whenever a remote message was created, including Corrupted,
    // so the caller can compensate.
    SegmentRef segment;
    bool message_created = false;
    std::chrono::milliseconds retry_after{0};
    std::string error_message;
};

struct SegmentDelete {
    bool success = false;  // true for Ok and NotFound
    TransportStatus status = TransportStatus::Permanent;
    std::chrono::milliseconds retry_after{0};
    std::string error_message;
};

class TransportClient;

// Pulls one stored segment in ranged blocks. A link that expires mid-read
// is re-resolved and the read resumes at the current offset.
class SegmentReader {
public:
    struct ReadResult {
        bool success = false;
        TransportStatus status = TransportStatus::Permanent;
        bool eof = false;
        std::string error_message;
    };

    SegmentReader(TransportClient& transport, SegmentRef segment,
                  std::string bot_id, std::string url,
                  const CancellationToken* cancel);

    // Replace `out` with the next block. eof is set (with an empty block)
    // once the segment is exhausted or the remote object ends early.
    ReadResult read(std::vector<uint8_t>& out);

    uint64_t offset() const { return offset_; }
    uint32_t link_refreshes() const { return refreshes_; }
    const std::string& bot_id() const { return bot_id_; }

private:
    TransportClient& transport_;
    SegmentRef segment_;
    std::string bot_id_;
    std::string url_;
    const CancellationToken* cancel_;
    uint64_t offset_ = 0;
    uint32_t refreshes_ = 0;
    uint32_t retries_ = 0;
};

struct SegmentStream {
    bool success = false;
    TransportStatus status = TransportStatus::Permanent;
    std::unique_ptr<SegmentReader> reader;
    std::string bot_id;  // credential used to resolve
    std::chrono::milliseconds retry_after{0};
    std::string error_message;
};

// Moves single segments to and from the message backend.
//
// Credentials are looked up by bot_id from the pool at call time. Outcomes
// of resolve and delete calls are reported to the pool here; upload
// outcomes are left to the caller, which owns the upload retry policy.
class TransportClient {
public:
    TransportClient(MessageBackend& backend, BotPool& pool, TransportOptions options);

    // Send one segment as one message using `bot`. Never retries.
    // `digest` is the SHA-256 the caller already computed over `data`; when
    // empty it is computed here. The stored size is checked against `data`.
    SegmentUpload upload_segment(const BotEntry& bot, uint32_t sequence_index,
                                 const std::string& file_name,
                                 std::span<const uint8_t> data,
                                 const std::string& digest = {});

    // Resolve a stored segment to a reader. Uses the creating bot's
    // credential when it is still configured, otherwise any bot the pool
    // selects for Purpose::Download.
    SegmentStream resolve_download(const SegmentRef& segment,
                                   const CancellationToken* cancel = nullptr);

    // Remove the message behind `segment` with the creating bot's credential.
    // A message that is already gone is success (status NotFound).
    SegmentDelete delete_segment(const SegmentRef& segment);

    const TransportOptions& options() const { return options_; }

    // <basename>.part<index>
    static std::string segment_file_name(const std::string& basename, uint32_t index);

private:
    friend class SegmentReader;

    struct Link {
        bool success = false;
        TransportStatus status = TransportStatus::Permanent;
        std::string url;
        std::string bot_id;
        std::optional<uint64_t> file_size;
        std::chrono::milliseconds retry_after{0};
        std::string error_message;
    };

    // getFile with rate-limit waits, used for first resolution and refreshes
    Link resolve_link(const SegmentRef& segment, const CancellationToken* cancel);

    void report(const std::string& bot_id, RemoteStatus status,
                std::chrono::milliseconds retry_after);

    static TransportStatus map_status(RemoteStatus status);

    MessageBackend& backend_;
    BotPool& pool_;
    TransportOptions options_;
    BotThrottle throttle_;
};

}  // namespace chatvault
