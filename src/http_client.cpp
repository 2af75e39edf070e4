#include "chatvault/http_client.hpp"
#include "chatvault/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>

namespace chatvault::net {

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_server_error_status(int status) {
    return status >= 500 && status < 600;
}

std::string url_encode(const std::string& str) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string redact_url(const std::string& url) {
    std::string out = url;
    size_t pos = 0;
    while ((pos = out.find("/bot", pos)) != std::string::npos) {
        size_t start = pos + 4;
        size_t end = out.find('/', start);
        if (end == std::string::npos) end = out.size();
        if (end > start) {
            out.replace(start, end - start, "<redacted>");
            end = start + 10;
        }
        pos = end;
    }
    return out;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = value;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it == headers_.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// HttpRequest / MultipartPart
// ============================================================================

MultipartPart MultipartPart::field(const std::string& name, const std::string& value) {
    MultipartPart part;
    part.name = name;
    part.value = value;
    return part;
}

MultipartPart MultipartPart::file(const std::string& name, const std::string& file_name,
                                  std::span<const uint8_t> data) {
    MultipartPart part;
    part.name = name;
    part.file_name = file_name;
    part.data = data;
    return part;
}

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post_form(const std::string& url,
                                   const std::vector<std::pair<std::string, std::string>>& fields) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    for (const auto& [name, value] : fields) {
        if (!req.body.empty()) req.body += '&';
        req.body += url_encode(name) + '=' + url_encode(value);
    }
    req.headers.set("Content-Type", "application/x-www-form-urlencoded");
    return req;
}

HttpRequest HttpRequest::post_multipart(const std::string& url, std::vector<MultipartPart> parts) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.multipart = std::move(parts);
    return req;
}

// ============================================================================
// CURL callbacks
// ============================================================================

namespace {

struct BodySink {
    std::vector<uint8_t>* body;
    size_t limit;
    bool overflow = false;
};

size_t body_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<BodySink*>(userdata);
    size_t bytes = size * nmemb;
    if (sink->limit > 0 && sink->body->size() + bytes > sink->limit) {
        sink->overflow = true;
        return 0;  // aborts the transfer
    }
    sink->body->insert(sink->body->end(), ptr, ptr + bytes);
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    auto colon = line.find(':');
    if (colon == std::string::npos) return bytes;  // status line or blank

    auto value_start = line.find_first_not_of(" \t", colon + 1);
    auto value_end = line.find_last_not_of(" \t\r\n");
    std::string value;
    if (value_start != std::string::npos && value_end != std::string::npos && value_end >= value_start) {
        value = line.substr(value_start, value_end - value_start + 1);
    }
    headers->set(line.substr(0, colon), value);
    return bytes;
}

// Streams one multipart file part straight from the caller's buffer
struct PartReader {
    std::span<const uint8_t> data;
    size_t pos = 0;
};

size_t part_read_callback(char* buffer, size_t size, size_t nitems, void* arg) {
    auto* reader = static_cast<PartReader*>(arg);
    size_t n = std::min(size * nitems, reader->data.size() - reader->pos);
    if (n > 0) {
        std::memcpy(buffer, reader->data.data() + reader->pos, n);
        reader->pos += n;
    }
    return n;
}

int part_seek_callback(void* arg, curl_off_t offset, int origin) {
    auto* reader = static_cast<PartReader*>(arg);
    if (origin != SEEK_SET || offset < 0 || static_cast<size_t>(offset) > reader->data.size()) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    reader->pos = static_cast<size_t>(offset);
    return CURL_SEEKFUNC_OK;
}

}  // namespace

// ============================================================================
// HttpClient
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
        idle_.clear();
    }

    // Borrowed easy handle; goes back to the idle list (reset) on destruction
    class Lease {
    public:
        explicit Lease(Impl& owner) : owner_(owner), handle_(owner.acquire()) {}
        ~Lease() { owner_.release(handle_); }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        CURL* get() const { return handle_; }

    private:
        Impl& owner_;
        CURL* handle_;
    };

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        Lease lease(*this);
        CURL* curl = lease.get();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        struct curl_slist* header_list = nullptr;
        for (const auto& [name, value] : request.headers.entries()) {
            header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
        }
        if (header_list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

        curl_mime* mime = nullptr;
        std::vector<PartReader> readers;
        if (!request.multipart.empty()) {
            readers.reserve(request.multipart.size());
            mime = curl_mime_init(curl);
            for (const auto& part : request.multipart) {
                curl_mimepart* p = curl_mime_addpart(mime);
                curl_mime_name(p, part.name.c_str());
                if (part.file_name.empty()) {
                    curl_mime_data(p, part.value.c_str(), CURL_ZERO_TERMINATED);
                    continue;
                }
                readers.push_back(PartReader{part.data, 0});
                curl_mime_data_cb(p, static_cast<curl_off_t>(part.data.size()),
                                  part_read_callback, part_seek_callback, nullptr, &readers.back());
                curl_mime_filename(p, part.file_name.c_str());
                curl_mime_type(p, part.content_type.c_str());
            }
            curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        BodySink sink{&response.body, config_.max_response_size};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, body_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        auto total_timeout = request.total_timeout.count() > 0 ? request.total_timeout
                                                               : config_.default_total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.default_connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total_timeout.count()));

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        }

        apply_tls(curl, request);

        auto start = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(curl);
        response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (sink.overflow) {
            response.body.clear();
            response.status_code = 0;
            response.is_network_error = true;
            response.error = "response larger than " + std::to_string(config_.max_response_size) +
                             " bytes";
        } else if (rc != CURLE_OK) {
            response.body.clear();
            response.is_network_error = true;
            response.error = curl_easy_strerror(rc);
        } else {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
        }

        if (response.is_network_error) {
            log_debug("HTTP %s %s failed after %lld ms: %s",
                      request.method == HttpMethod::POST ? "POST" : "GET",
                      redact_url(request.url).c_str(),
                      static_cast<long long>(response.elapsed.count()), response.error.c_str());
        }

        if (mime) curl_mime_free(mime);
        if (header_list) curl_slist_free_all(header_list);
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    void apply_tls(CURL* curl, const HttpRequest& request) {
        bool verify = request.verify_ssl && config_.verify_ssl_by_default;
        if (!verify) {
            static std::once_flag warned;
            std::call_once(warned, [] { log_warn("TLS certificate verification is disabled"); });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        const std::string& ca = request.ca_bundle_path.empty() ? config_.default_ca_bundle
                                                               : request.ca_bundle_path;
        if (!ca.empty()) curl_easy_setopt(curl, CURLOPT_CAINFO, ca.c_str());
    }

    CURL* acquire() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release(CURL* handle) {
        if (!handle) return;
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < config_.max_idle_handles) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace chatvault::net
