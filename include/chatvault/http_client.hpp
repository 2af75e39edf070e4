#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace chatvault::net {

enum class HttpMethod {
    GET,
    POST
};

bool is_success_status(int status);
bool is_server_error_status(int status);

// Percent-encoding for query strings and form bodies
std::string url_encode(const std::string& str);

// Bot API URLs carry the credential as "/bot<token>/". Returns the URL with
// every such token replaced, for logging.
std::string redact_url(const std::string& url);

// Header map keyed by lowercase name. A repeated header keeps its last value.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    const std::map<std::string, std::string>& entries() const { return headers_; }

private:
    static std::string normalize_name(const std::string& name);

    std::map<std::string, std::string> headers_;
};

// One part of a multipart/form-data body. A part with a file_name is sent
// as a file attachment from `data`; otherwise `value` is sent as a plain
// field. `data` is not copied and must outlive execute().
struct MultipartPart {
    std::string name;
    std::string value;
    std::string file_name;
    std::span<const uint8_t> data;
    std::string content_type = "application/octet-stream";

    static MultipartPart field(const std::string& name, const std::string& value);
    static MultipartPart file(const std::string& name, const std::string& file_name,
                              std::span<const uint8_t> data);
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;  // application/x-www-form-urlencoded

    // When non-empty the request is sent as multipart/form-data and body is
    // ignored.
    std::vector<MultipartPart> multipart;

    // Zero means "use the client default"
    std::chrono::milliseconds total_timeout{0};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = client default, then system

    // start, end (inclusive)
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    static HttpRequest get(const std::string& url);
    static HttpRequest post_form(const std::string& url,
                                 const std::vector<std::pair<std::string, std::string>>& fields);
    static HttpRequest post_multipart(const std::string& url, std::vector<MultipartPart> parts);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds elapsed{0};

    // Set when no HTTP status was received (DNS, connect, TLS, timeout)
    std::string error;
    bool is_network_error = false;
};

struct HttpClientConfig {
    size_t max_idle_handles = 16;

    std::chrono::milliseconds default_connect_timeout{10000};
    std::chrono::milliseconds default_total_timeout{600000};

    // Larger bodies abort the transfer (0 = unlimited)
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "chatvault/1.0";
    bool tcp_keepalive = true;
};

// libcurl client shared by every bot of a backend. Thread-safe.
//
// Easy handles are returned to an idle list after each request so that
// keep-alive connections to the Bot API server survive between segments.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chatvault::net
