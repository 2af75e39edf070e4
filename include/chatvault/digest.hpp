#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <span>
#include <string>

// Forward declaration (OpenSSL)
struct evp_md_ctx_st;

namespace chatvault {

/// Streaming SHA-256 over a byte stream of unknown length.
///
/// Bytes are hashed as they pass through; nothing is buffered. The same
/// state type is used on the upload path (hashing what is read from the
/// caller) and on the download path (hashing what comes back).
class DigestState {
public:
    DigestState();
    ~DigestState();

    DigestState(DigestState&&) noexcept;
    DigestState& operator=(DigestState&&) noexcept;
    DigestState(const DigestState&) = delete;
    DigestState& operator=(const DigestState&) = delete;

    /// Feed more bytes. Throws std::logic_error after finalize().
    void update(std::span<const uint8_t> chunk);
    void update(const void* data, size_t size);

    /// Lowercase hex digest. Idempotent: later calls return the same value.
    std::string finalize();

    /// Bytes fed so far.
    uint64_t bytes() const { return bytes_; }

    bool finalized() const { return finalized_; }

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    uint64_t bytes_ = 0;
    bool finalized_ = false;
    std::string hex_;
};

/// One-shot SHA-256 of a buffer.
std::string sha256_hex(std::span<const uint8_t> data);

/// Hash a stream to EOF and compare with the expected hex digest
/// (case-insensitive).
bool verify_digest(const std::string& expected, std::istream& in);
bool verify_digest(const std::string& expected, std::span<const uint8_t> data);
/// Finalizes `state` (if not already) and compares.
bool verify_digest(const std::string& expected, DigestState& state);

/// SHA-256 of the empty input.
constexpr const char* EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

}  // namespace chatvault
