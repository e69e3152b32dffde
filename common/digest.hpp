#pragma once

// ============================================================
// digest.hpp -- Incremental SHA-256 (OpenSSL EVP) used as the
//               end-to-end payload checksum
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <openssl/evp.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace digest {

// Feeds payload bytes in stream order; finalize() ends its life.
class IntegrityAccumulator {
public:
    IntegrityAccumulator() {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
    }

    ~IntegrityAccumulator() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    IntegrityAccumulator(const IntegrityAccumulator&) = delete;
    IntegrityAccumulator& operator=(const IntegrityAccumulator&) = delete;

    void update(const void* data, size_t len) {
        if (finalized_) throw std::logic_error("IntegrityAccumulator::update after finalize");
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        bytes_ += len;
    }

    Digest finalize() {
        if (finalized_) throw std::logic_error("IntegrityAccumulator::finalize called twice");
        Digest out{};
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &out_len) != 1 || out_len != DIGEST_LEN) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        finalized_ = true;
        return out;
    }

    u64 bytes_fed() const { return bytes_; }

private:
    EVP_MD_CTX* ctx_{nullptr};
    u64         bytes_{0};
    bool        finalized_{false};
};

// One-shot digest of a buffer
inline Digest sha256(const void* data, size_t len) {
    IntegrityAccumulator acc;
    acc.update(data, len);
    return acc.finalize();
}

inline std::string to_hex(const Digest& d) {
    static const char* HEX = "0123456789abcdef";
    std::string s;
    s.reserve(d.size() * 2);
    for (u8 b : d) {
        s += HEX[b >> 4];
        s += HEX[b & 0x0F];
    }
    return s;
}

} // namespace digest
