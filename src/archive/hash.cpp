#include "wheelsmith/hash.hpp"

#include <openssl/evp.h>

namespace wheelsmith {

// ============================================================================
// SHA-256 Implementation
// ============================================================================

struct Sha256::Impl {
    EVP_MD_CTX* ctx = nullptr;
    bool ok = false;

    Impl() : ctx(EVP_MD_CTX_new()) {
        ok = ctx != nullptr && EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    }
    ~Impl() { if (ctx) EVP_MD_CTX_free(ctx); }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {}

Sha256::~Sha256() = default;

bool Sha256::update(const void* data, size_t len) {
    if (!impl_->ok) return false;
    if (len == 0) return true;
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        impl_->ok = false;
    }
    return impl_->ok;
}

HashResult Sha256::finish() {
    HashResult result;

    if (!impl_->ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }
    if (!impl_->ok) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx, hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }
    impl_->ok = false;

    result.digest.assign(reinterpret_cast<const char*>(hash), hash_len);
    result.ok = true;
    return result;
}

HashResult compute_sha256(const std::string& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

// ============================================================================
// URL-safe Base64
// ============================================================================

namespace {

const char B64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int b64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

} // namespace

std::string urlsafe_b64encode_nopad(const std::string& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        out.push_back(B64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(B64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(B64_ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(B64_ALPHABET[n & 0x3F]);
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out.push_back(B64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(B64_ALPHABET[(n >> 12) & 0x3F]);
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out.push_back(B64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(B64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(B64_ALPHABET[(n >> 6) & 0x3F]);
    }
    return out;
}

bool urlsafe_b64decode_nopad(const std::string& text, std::string& out) {
    out.clear();
    if (text.size() % 4 == 1) return false;

    uint32_t acc = 0;
    int bits = 0;
    for (char c : text) {
        int v = b64_value(c);
        if (v < 0) return false;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return true;
}

} // namespace wheelsmith
