#include "chatvault/file_record.hpp"

#include <openssl/rand.h>

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace chatvault {

bool FileRecord::delete_pending() const {
    for (const auto& s : segments) {
        if (s.remote_deleted) return true;
    }
    return false;
}

std::vector<SegmentRef> FileRecord::live_segments() const {
    std::vector<SegmentRef> out;
    out.reserve(segments.size());
    for (const auto& s : segments) {
        if (!s.remote_deleted) out.push_back(s);
    }
    return out;
}

std::string FileRecord::name() const {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string FileRecord::parent() const {
    auto pos = path.rfind('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return path.substr(0, pos);
}

// --- Paths ---

std::optional<std::string> normalize_path(const std::string& path) {
    std::string out;
    out.reserve(path.size() + 1);

    size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/') ++i;
        if (i >= path.size()) break;

        size_t end = path.find('/', i);
        if (end == std::string::npos) end = path.size();
        std::string component = path.substr(i, end - i);

        if (component == "." || component == "..") return std::nullopt;
        if (component.find('\0') != std::string::npos) return std::nullopt;

        out += '/';
        out += component;
        i = end;
    }

    if (out.empty()) return std::nullopt;
    return out;
}

std::optional<std::string> normalize_prefix(const std::string& prefix) {
    if (prefix.empty() || prefix == "/" || prefix == "root") {
        return std::string();
    }
    return normalize_path(prefix);
}

bool path_has_prefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) return true;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

// --- Identifiers ---

std::string generate_file_id() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf, 36);
}

bool looks_like_file_id(const std::string& value) {
    if (value.size() != 36) return false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_seconds(int64_t secs) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
}

}  // namespace chatvault
