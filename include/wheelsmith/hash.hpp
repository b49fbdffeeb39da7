#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace wheelsmith {

// ============================================================================
// SHA-256 (OpenSSL 3.0+ EVP API)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string digest;         // Raw 32-byte digest
};

// Incremental SHA-256. Feed chunks with update(), then call finish() once.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    bool update(const void* data, size_t len);
    HashResult finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// One-shot hash of an in-memory buffer
HashResult compute_sha256(const std::string& data);

// RFC 4648 section 5 alphabet ('-' and '_'), no '=' padding
std::string urlsafe_b64encode_nopad(const std::string& bytes);

// Inverse of urlsafe_b64encode_nopad; false on a character outside the alphabet
bool urlsafe_b64decode_nopad(const std::string& text, std::string& out);

} // namespace wheelsmith
