#include "chatvault/message_backend.hpp"
#include "chatvault/constants.hpp"
#include "chatvault/digest.hpp"
#include "chatvault/http_client.hpp"
#include "chatvault/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace chatvault {

const char* remote_status_to_string(RemoteStatus status) {
    switch (status) {
        case RemoteStatus::Ok: return "ok";
        case RemoteStatus::NotFound: return "not_found";
        case RemoteStatus::RateLimited: return "rate_limited";
        case RemoteStatus::Transient: return "transient";
        case RemoteStatus::Permanent: return "permanent";
    }
    return "unknown";
}

std::string token_fingerprint(const std::string& token) {
    auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(token.data()),
                                          token.size());
    return sha256_hex(bytes).substr(0, 16);
}

namespace {

constexpr const char* FILE_SCHEME = "file://";

// Ranged read of a file:// link. Shared by the local backend and by botapi
// when a local Bot API server hands out absolute paths.
FetchResult read_file_link(const std::string& url, uint64_t offset, uint64_t length) {
    FetchResult result;
    std::filesystem::path path = url.substr(std::char_traits<char>::length(FILE_SCHEME));

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        result.status = RemoteStatus::NotFound;
        result.link_expired = true;
        result.error_message = "Object not found: " + path.string();
        return result;
    }

    auto tellg_val = file.tellg();
    if (tellg_val < 0) {
        result.status = RemoteStatus::Transient;
        result.error_message = "Cannot determine file size: " + path.string();
        return result;
    }
    uint64_t file_size = static_cast<uint64_t>(tellg_val);

    result.success = true;
    result.status = RemoteStatus::Ok;
    if (offset >= file_size) {
        return result;  // end of object
    }

    uint64_t to_read = std::min(length, file_size - offset);
    file.seekg(static_cast<std::streamoff>(offset));
    result.data.resize(to_read);
    file.read(reinterpret_cast<char*>(result.data.data()), static_cast<std::streamsize>(to_read));
    if (!file) {
        result.success = false;
        result.status = RemoteStatus::Transient;
        result.data.clear();
        result.error_message = "Failed to read file: " + path.string();
    }
    return result;
}

}  // namespace

// ============================================================================
// LocalMessageBackend - File system implementation
// ============================================================================

// Messages live under <root>/<chat_id>/<message_id>.bin with a JSON sidecar
// (<message_id>.json) recording the owner fingerprint and the file token.
// Only the owning credential may delete a message.
class LocalMessageBackend : public MessageBackend {
public:
    explicit LocalMessageBackend(const std::filesystem::path& root)
        : root_(std::filesystem::absolute(root)) {
        std::filesystem::create_directories(root_);
        initialize_counter();
        log_debug("LocalMessageBackend at %s (next message id %lld)",
                  root_.c_str(), static_cast<long long>(next_message_id_));
    }

    std::string type_name() const override { return "local"; }

    SendResult send_document(const std::string& token,
                             const std::string& chat_id,
                             const std::string& file_name,
                             std::span<const uint8_t> data) override {
        SendResult result;
        if (chat_id.empty() || chat_id.find('/') != std::string::npos) {
            result.error_message = "Bad Request: chat not found";
            return result;
        }

        std::unique_lock lock(mutex_);
        int64_t message_id = next_message_id_++;
        auto dir = root_ / chat_id;

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            result.status = RemoteStatus::Transient;
            result.error_message = "Failed to create chat directory: " + ec.message();
            return result;
        }

        auto bin_path = blob_path(chat_id, message_id);
        auto temp_path = bin_path.string() + ".tmp";
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                result.status = RemoteStatus::Transient;
                result.error_message = "Failed to create file";
                return result;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                file.close();
                std::filesystem::remove(temp_path, ec);
                result.status = RemoteStatus::Transient;
                result.error_message = "Failed to write data";
                return result;
            }
        }
        std::filesystem::rename(temp_path, bin_path, ec);
        if (ec) {
            std::filesystem::remove(temp_path, ec);
            result.status = RemoteStatus::Transient;
            result.error_message = "Failed to rename file: " + ec.message();
            return result;
        }

        std::string file_token = chat_id + ":" + std::to_string(message_id) + ":" +
                                 sha256_hex(data).substr(0, 12);

        nlohmann::json sidecar;
        sidecar["owner"] = token_fingerprint(token);
        sidecar["file_token"] = file_token;
        sidecar["file_name"] = file_name;
        sidecar["file_size"] = data.size();
        {
            std::ofstream meta(sidecar_path(chat_id, message_id));
            meta << sidecar.dump();
            if (!meta) {
                std::filesystem::remove(bin_path, ec);
                result.status = RemoteStatus::Transient;
                result.error_message = "Failed to write message metadata";
                return result;
            }
        }

        result.success = true;
        result.status = RemoteStatus::Ok;
        result.message_id = message_id;
        result.file_token = file_token;
        result.stored_size = data.size();
        return result;
    }

    LinkResult resolve_file(const std::string& /*token*/,
                            const std::string& file_token) override {
        LinkResult result;

        auto first = file_token.find(':');
        auto second = file_token.find(':', first == std::string::npos ? 0 : first + 1);
        if (first == std::string::npos || second == std::string::npos) {
            result.error_message = "Bad Request: invalid file_id";
            return result;
        }
        std::string chat_id = file_token.substr(0, first);
        int64_t message_id = 0;
        try {
            message_id = std::stoll(file_token.substr(first + 1, second - first - 1));
        } catch (const std::exception&) {
            result.error_message = "Bad Request: invalid file_id";
            return result;
        }

        std::shared_lock lock(mutex_);
        auto sidecar = load_sidecar(chat_id, message_id);
        if (!sidecar || sidecar->value("file_token", "") != file_token) {
            result.status = RemoteStatus::NotFound;
            result.error_message = "Bad Request: file not found";
            return result;
        }

        result.success = true;
        result.status = RemoteStatus::Ok;
        result.url = std::string(FILE_SCHEME) + blob_path(chat_id, message_id).string();
        result.file_size = sidecar->value("file_size", uint64_t{0});
        return result;
    }

    FetchResult fetch(const std::string& url, uint64_t offset, uint64_t length) override {
        if (!url.starts_with(FILE_SCHEME)) {
            FetchResult result;
            result.error_message = "Unsupported link: " + url;
            return result;
        }
        std::shared_lock lock(mutex_);
        return read_file_link(url, offset, length);
    }

    DeleteResult delete_message(const std::string& token,
                                const std::string& chat_id,
                                int64_t message_id) override {
        DeleteResult result;
        std::unique_lock lock(mutex_);

        auto sidecar = load_sidecar(chat_id, message_id);
        if (!sidecar) {
            result.status = RemoteStatus::NotFound;
            result.error_message = "Bad Request: message to delete not found";
            return result;
        }
        if (sidecar->value("owner", "") != token_fingerprint(token)) {
            result.error_message = "Bad Request: message can't be deleted";
            return result;
        }

        std::error_code ec;
        std::filesystem::remove(blob_path(chat_id, message_id), ec);
        if (ec) {
            result.status = RemoteStatus::Transient;
            result.error_message = "Failed to remove message: " + ec.message();
            return result;
        }
        std::filesystem::remove(sidecar_path(chat_id, message_id), ec);

        result.success = true;
        result.status = RemoteStatus::Ok;
        return result;
    }

    bool is_healthy() const override {
        std::error_code ec;
        return std::filesystem::is_directory(root_, ec);
    }

private:
    std::filesystem::path blob_path(const std::string& chat_id, int64_t message_id) const {
        return root_ / chat_id / (std::to_string(message_id) + ".bin");
    }

    std::filesystem::path sidecar_path(const std::string& chat_id, int64_t message_id) const {
        return root_ / chat_id / (std::to_string(message_id) + ".json");
    }

    std::optional<nlohmann::json> load_sidecar(const std::string& chat_id,
                                               int64_t message_id) const {
        std::ifstream in(sidecar_path(chat_id, message_id));
        if (!in) return std::nullopt;
        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return std::nullopt;
        return j;
    }

    // Message ids continue after the highest id already on disk
    void initialize_counter() {
        int64_t max_id = 0;
        std::error_code ec;
        for (const auto& chat : std::filesystem::directory_iterator(root_, ec)) {
            if (!chat.is_directory()) continue;
            for (const auto& entry : std::filesystem::directory_iterator(chat.path(), ec)) {
                if (entry.path().extension() != ".json") continue;
                try {
                    max_id = std::max<int64_t>(max_id, std::stoll(entry.path().stem().string()));
                } catch (const std::exception&) {
                    // Not a message sidecar
                }
            }
        }
        next_message_id_ = max_id + 1;
    }

    std::filesystem::path root_;
    mutable std::shared_mutex mutex_;
    int64_t next_message_id_ = 1;
};

// ============================================================================
// Bot API reply classification
// ============================================================================

namespace {

std::chrono::milliseconds parse_retry_after_header(const std::string& value) {
    if (!value.empty()) {
        try {
            return std::chrono::seconds(std::stol(value));
        } catch (const std::exception&) {
            // HTTP-date form; fall through to default
        }
    }
    return std::chrono::seconds(constants::DEFAULT_RETRY_AFTER_SECONDS);
}

bool is_not_found_description(const std::string& description) {
    return description.find("message to delete not found") != std::string::npos ||
           description.find("message not found") != std::string::npos ||
           description.find("MESSAGE_ID_INVALID") != std::string::npos;
}

BotApiStatus classify_reply(int http_status, const nlohmann::json& body,
                            const std::string& retry_after_header) {
    BotApiStatus reply;

    if (body.is_discarded() || !body.is_object()) {
        if (http_status == 429) {
            reply.status = RemoteStatus::RateLimited;
            reply.retry_after = parse_retry_after_header(retry_after_header);
        } else if (net::is_server_error_status(http_status)) {
            reply.status = RemoteStatus::Transient;
        }
        reply.description = "HTTP " + std::to_string(http_status) + ": malformed response";
        return reply;
    }

    if (body.value("ok", false)) {
        reply.status = RemoteStatus::Ok;
        return reply;
    }

    int error_code = http_status;
    if (body.contains("error_code") && body["error_code"].is_number_integer()) {
        error_code = body["error_code"].get<int>();
    }
    reply.description = body.value("description", "HTTP " + std::to_string(error_code));

    if (error_code == 429) {
        reply.status = RemoteStatus::RateLimited;
        reply.retry_after = std::chrono::seconds(constants::DEFAULT_RETRY_AFTER_SECONDS);
        if (body.contains("parameters") && body["parameters"].is_object()) {
            const auto& params = body["parameters"];
            if (params.contains("retry_after") && params["retry_after"].is_number()) {
                reply.retry_after = std::chrono::seconds(params["retry_after"].get<int64_t>());
            }
        }
    } else if (net::is_server_error_status(error_code)) {
        reply.status = RemoteStatus::Transient;
    } else if (is_not_found_description(reply.description)) {
        reply.status = RemoteStatus::NotFound;
    } else {
        reply.status = RemoteStatus::Permanent;
    }
    return reply;
}

}  // namespace

BotApiStatus classify_bot_api_reply(int http_status, const std::string& body,
                                    const std::string& retry_after_header) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    return classify_reply(http_status, json, retry_after_header);
}

// ============================================================================
// BotApiBackend - Telegram Bot API over HTTP
// ============================================================================

class BotApiBackend : public MessageBackend {
public:
    struct Config {
        std::string api_url = constants::DEFAULT_API_URL;
        bool verify_ssl = true;
        std::string ca_cert_path;
        uint32_t connect_timeout_secs = constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS;
        uint32_t request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    };

    explicit BotApiBackend(const Config& config)
        : config_(config)
        , client_(make_client_config(config)) {
        while (!config_.api_url.empty() && config_.api_url.back() == '/') {
            config_.api_url.pop_back();
        }
    }

    std::string type_name() const override { return "botapi"; }

    SendResult send_document(const std::string& token,
                             const std::string& chat_id,
                             const std::string& file_name,
                             std::span<const uint8_t> data) override {
        SendResult result;

        std::vector<net::MultipartPart> parts;
        parts.push_back(net::MultipartPart::field("chat_id", chat_id));
        parts.push_back(net::MultipartPart::file("document", file_name, data));
        auto req = net::HttpRequest::post_multipart(method_url(token, "sendDocument"),
                                                    std::move(parts));
        apply_request_options(req);

        auto reply = interpret(client_.execute(req));
        result.status = reply.status;
        result.retry_after = reply.retry_after;
        if (reply.status != RemoteStatus::Ok) {
            result.error_message = "sendDocument: " + reply.description;
            return result;
        }

        const auto& r = reply.result;
        if (!r.is_object() || !r.contains("message_id") || !r.contains("document") ||
            !r["document"].is_object() || !r["document"].contains("file_id")) {
            result.status = RemoteStatus::Permanent;
            result.error_message = "sendDocument: response missing message_id or document";
            return result;
        }

        try {
            result.message_id = r["message_id"].get<int64_t>();
            result.file_token = r["document"]["file_id"].get<std::string>();
            result.stored_size = r["document"].value("file_size", uint64_t{data.size()});
        } catch (const nlohmann::json::exception& e) {
            result.status = RemoteStatus::Permanent;
            result.error_message = std::string("sendDocument: malformed response: ") + e.what();
            return result;
        }

        result.success = true;
        return result;
    }

    LinkResult resolve_file(const std::string& token,
                            const std::string& file_token) override {
        LinkResult result;

        auto req = net::HttpRequest::get(method_url(token, "getFile") +
                                         "?file_id=" + net::url_encode(file_token));
        apply_request_options(req);

        auto reply = interpret(client_.execute(req));
        result.status = reply.status;
        result.retry_after = reply.retry_after;
        if (reply.status != RemoteStatus::Ok) {
            result.error_message = "getFile: " + reply.description;
            return result;
        }

        const auto& r = reply.result;
        if (!r.is_object() || !r.contains("file_path") || !r["file_path"].is_string()) {
            result.status = RemoteStatus::Permanent;
            result.error_message = "getFile: response missing file_path";
            return result;
        }

        std::string file_path = r["file_path"].get<std::string>();
        if (file_path.starts_with("/")) {
            // Local Bot API server (--local) returns absolute paths
            result.url = std::string(FILE_SCHEME) + file_path;
        } else {
            result.url = config_.api_url + "/file/bot" + token + "/" + file_path;
        }
        if (r.contains("file_size") && r["file_size"].is_number_unsigned()) {
            result.file_size = r["file_size"].get<uint64_t>();
        }
        result.success = true;
        return result;
    }

    FetchResult fetch(const std::string& url, uint64_t offset, uint64_t length) override {
        if (url.starts_with(FILE_SCHEME)) {
            return read_file_link(url, offset, length);
        }

        FetchResult result;
        if (length == 0) {
            result.success = true;
            result.status = RemoteStatus::Ok;
            return result;
        }

        auto req = net::HttpRequest::get(url);
        req.byte_range = std::make_pair(offset, offset + length - 1);
        apply_request_options(req);

        auto resp = client_.execute(req);
        if (resp.is_network_error) {
            result.status = RemoteStatus::Transient;
            result.error_message = "fetch: " + resp.error;
            return result;
        }

        int code = resp.status_code;
        if (code == 206 || code == 200) {
            result.success = true;
            result.status = RemoteStatus::Ok;
            if (code == 200 && offset > 0) {
                // Server ignored the range; slice locally
                if (offset < resp.body.size()) {
                    auto end = std::min<uint64_t>(resp.body.size(), offset + length);
                    result.data.assign(resp.body.begin() + static_cast<std::ptrdiff_t>(offset),
                                       resp.body.begin() + static_cast<std::ptrdiff_t>(end));
                }
            } else {
                result.data = std::move(resp.body);
                if (result.data.size() > length) result.data.resize(length);
            }
            return result;
        }
        if (code == 416) {
            result.success = true;  // offset at or past the end
            result.status = RemoteStatus::Ok;
            return result;
        }
        if (code == 401 || code == 403 || code == 404 || code == 410) {
            result.status = RemoteStatus::NotFound;
            result.link_expired = true;
            result.error_message = "fetch: link rejected with HTTP " + std::to_string(code);
            return result;
        }
        if (code == 429) {
            result.status = RemoteStatus::RateLimited;
            result.retry_after = parse_retry_after_header(resp.headers.get("Retry-After").value_or(""));
            result.error_message = "fetch: rate limited";
            return result;
        }
        result.status = net::is_server_error_status(code) ? RemoteStatus::Transient
                                                          : RemoteStatus::Permanent;
        result.error_message = "fetch: HTTP " + std::to_string(code);
        return result;
    }

    DeleteResult delete_message(const std::string& token,
                                const std::string& chat_id,
                                int64_t message_id) override {
        DeleteResult result;

        auto req = net::HttpRequest::post_form(
            method_url(token, "deleteMessage"),
            {{"chat_id", chat_id}, {"message_id", std::to_string(message_id)}});
        apply_request_options(req);

        auto reply = interpret(client_.execute(req));
        result.status = reply.status;
        result.retry_after = reply.retry_after;
        if (reply.status == RemoteStatus::Ok) {
            result.success = true;
        } else {
            result.error_message = "deleteMessage: " + reply.description;
        }
        return result;
    }

    bool is_healthy() const override {
        return !config_.api_url.empty();
    }

private:
    struct ApiReply {
        RemoteStatus status = RemoteStatus::Permanent;
        nlohmann::json result;
        std::chrono::milliseconds retry_after{0};
        std::string description;
    };

    static net::HttpClientConfig make_client_config(const Config& config) {
        net::HttpClientConfig cc;
        cc.verify_ssl_by_default = config.verify_ssl;
        cc.default_ca_bundle = config.ca_cert_path;
        cc.default_connect_timeout = std::chrono::seconds(config.connect_timeout_secs);
        cc.default_total_timeout = std::chrono::seconds(config.request_timeout_secs);
        return cc;
    }

    void apply_request_options(net::HttpRequest& req) const {
        req.verify_ssl = config_.verify_ssl;
        req.ca_bundle_path = config_.ca_cert_path;
    }

    std::string method_url(const std::string& token, const char* method) const {
        return config_.api_url + "/bot" + token + "/" + method;
    }

    // Map a Bot API reply onto a RemoteStatus
    static ApiReply interpret(const net::HttpResponse& resp) {
        ApiReply reply;

        if (resp.is_network_error) {
            reply.status = RemoteStatus::Transient;
            reply.description = resp.error;
            return reply;
        }

        auto body = nlohmann::json::parse(resp.body.begin(), resp.body.end(), nullptr, false);
        auto classified = classify_reply(resp.status_code, body,
                                         resp.headers.get("Retry-After").value_or(""));
        reply.status = classified.status;
        reply.retry_after = classified.retry_after;
        reply.description = std::move(classified.description);
        if (reply.status == RemoteStatus::Ok) {
            reply.result = body.contains("result") ? body["result"] : nlohmann::json();
        }
        return reply;
    }

    Config config_;
    net::HttpClient client_;
};

// ============================================================================
// MessageBackendFactory implementation
// ============================================================================

std::unique_ptr<MessageBackend> MessageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config) {

    if (type == "local") {
        auto it = config.find("path");
        if (it == config.end() || it->second.empty()) {
            throw std::runtime_error("Local backend requires 'path' config");
        }
        return std::make_unique<LocalMessageBackend>(it->second);
    }

    if (type == "botapi") {
        BotApiBackend::Config api_config;

        auto it = config.find("api_url");
        if (it != config.end() && !it->second.empty()) {
            api_config.api_url = it->second;
        }
        if ((it = config.find("verify_ssl")) != config.end()) {
            api_config.verify_ssl = (it->second == "true" || it->second == "1");
        }
        if ((it = config.find("ca_cert_path")) != config.end()) {
            api_config.ca_cert_path = it->second;
        }
        if ((it = config.find("connect_timeout")) != config.end()) {
            try {
                api_config.connect_timeout_secs = static_cast<uint32_t>(std::stoul(it->second));
            } catch (const std::exception&) {
                log_warn("Ignoring invalid connect_timeout '%s'", it->second.c_str());
            }
        }
        if ((it = config.find("request_timeout")) != config.end()) {
            try {
                api_config.request_timeout_secs = static_cast<uint32_t>(std::stoul(it->second));
            } catch (const std::exception&) {
                log_warn("Ignoring invalid request_timeout '%s'", it->second.c_str());
            }
        }

        return std::make_unique<BotApiBackend>(api_config);
    }

    throw std::runtime_error("Unknown message backend type: " + type);
}

std::unique_ptr<MessageBackend> MessageBackendFactory::create_local(
    const std::filesystem::path& root_path) {
    return std::make_unique<LocalMessageBackend>(root_path);
}

}  // namespace chatvault
