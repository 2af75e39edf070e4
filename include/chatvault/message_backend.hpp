#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chatvault {

// How a remote call ended. The transport layer maps this onto the
// pool outcome and its own retry policy.
enum class RemoteStatus {
    Ok,
    NotFound,     // message / file does not exist
    RateLimited,  // retry_after is set
    Transient,    // network error, 5xx
    Permanent     // other 4xx, malformed response
};

const char* remote_status_to_string(RemoteStatus status);

// Result of sending one document message
struct SendResult {
    bool success = false;
    RemoteStatus status = RemoteStatus::Permanent;
    int64_t message_id = 0;
    std::string file_token;
    uint64_t stored_size = 0;  // size the backend reports having stored
    std::chrono::milliseconds retry_after{0};
    std::string error_message;
};

// Result of exchanging a file token for a download link
struct LinkResult {
    bool success = false;
    RemoteStatus status = RemoteStatus::Permanent;
    std::string url;
    std::optional<uint64_t> file_size;
    std::chrono::milliseconds retry_after{0};
    std::string error_message;
};

// Result of a ranged read of a download link
struct FetchResult {
    bool success = false;
    RemoteStatus status = RemoteStatus::Permanent;
    std::vector<uint8_t> data;
    bool link_expired = false;  // link must be re-resolved
    std::chrono::milliseconds retry_after{0};
    std::string error_message;
};

// Result of deleting one message
struct DeleteResult {
    bool success = false;
    RemoteStatus status = RemoteStatus::Permanent;
    std::chrono::milliseconds retry_after{0};
    std::string error_message;
};

// Abstract interface for a chat backend that stores opaque documents as
// messages. Every call carries the credential to act with; the backend
// holds no per-bot state.
class MessageBackend {
public:
    virtual ~MessageBackend() = default;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Post `data` as a document attachment named `file_name` into `chat_id`
    virtual SendResult send_document(const std::string& token,
                                     const std::string& chat_id,
                                     const std::string& file_name,
                                     std::span<const uint8_t> data) = 0;

    // Exchange a stored file token for a time-limited direct link
    virtual LinkResult resolve_file(const std::string& token,
                                    const std::string& file_token) = 0;

    // Read up to `length` bytes of a link starting at `offset`.
    // A short (or empty) read means end of object.
    virtual FetchResult fetch(const std::string& url, uint64_t offset, uint64_t length) = 0;

    // Remove a message. A message that no longer exists reports NotFound.
    virtual DeleteResult delete_message(const std::string& token,
                                        const std::string& chat_id,
                                        int64_t message_id) = 0;

    // Health check
    virtual bool is_healthy() const = 0;
};

// Factory for creating message backends from configuration
class MessageBackendFactory {
public:
    // type "botapi": params api_url, verify_ssl, ca_cert_path, request_timeout
    // type "local":  params path
    static std::unique_ptr<MessageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& config);

    // Filesystem backend rooted at `root_path`
    static std::unique_ptr<MessageBackend> create_local(
        const std::filesystem::path& root_path);
};

// Classification of a Bot API method reply, without its result payload
struct BotApiStatus {
    RemoteStatus status = RemoteStatus::Permanent;
    std::chrono::milliseconds retry_after{0};
    std::string description;
};

// Map an HTTP status, JSON body and Retry-After header value onto a
// RemoteStatus. A 429 waits parameters.retry_after seconds, or the header
// value when the body is not JSON, defaulting to 1 s.
BotApiStatus classify_bot_api_reply(int http_status, const std::string& body,
                                    const std::string& retry_after_header = {});

// Short stable fingerprint of a credential, safe to log and to persist
std::string token_fingerprint(const std::string& token);

}  // namespace chatvault
