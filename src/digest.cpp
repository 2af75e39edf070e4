#include "chatvault/digest.hpp"
#include "chatvault/constants.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace chatvault {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

}  // namespace

void DigestState::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

DigestState::DigestState() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 context initialisation failed");
    }
}

DigestState::~DigestState() = default;
DigestState::DigestState(DigestState&&) noexcept = default;
DigestState& DigestState::operator=(DigestState&&) noexcept = default;

void DigestState::update(std::span<const uint8_t> chunk) {
    update(chunk.data(), chunk.size());
}

void DigestState::update(const void* data, size_t size) {
    if (finalized_) {
        throw std::logic_error("DigestState::update after finalize");
    }
    if (size == 0) return;
    EVP_DigestUpdate(ctx_.get(), data, size);
    bytes_ += size;
}

std::string DigestState::finalize() {
    if (finalized_) return hex_;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_.get(), hash, &len);
    hex_ = to_hex(hash, len);
    finalized_ = true;
    return hex_;
}

std::string sha256_hex(std::span<const uint8_t> data) {
    DigestState state;
    state.update(data);
    return state.finalize();
}

bool verify_digest(const std::string& expected, std::istream& in) {
    DigestState state;
    std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if (n > 0) state.update(buf.data(), static_cast<size_t>(n));
    }
    return equals_ignore_case(state.finalize(), expected);
}

bool verify_digest(const std::string& expected, std::span<const uint8_t> data) {
    return equals_ignore_case(sha256_hex(data), expected);
}

bool verify_digest(const std::string& expected, DigestState& state) {
    return equals_ignore_case(state.finalize(), expected);
}

}  // namespace chatvault
