#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace nsm {

inline uint32_t crc32(std::string_view data, uint32_t seed = 0) {
    uint32_t crc = ~seed;
    for (unsigned char b : data) {
        crc ^= b;
        for (int i = 0; i < 8; ++i) {
            uint32_t mask = (crc & 1u) ? 0xFFFFFFFFu : 0u;
            crc = (crc >> 1) ^ (0xEDB88320u & mask);
        }
    }
    return ~crc;
}

using Sha256Digest = std::array<uint8_t, 32>;

// Incremental SHA-256 over OpenSSL's EVP interface. EVP failures throw
// ArchiveError(ArchiveReadFailure).
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(std::string_view data);
    Sha256Digest finish();

    static Sha256Digest digest(std::string_view data);

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// Hash `length` bytes of a file starting at `offset`. Throws ArchiveError(ArchiveReadFailure).
Sha256Digest sha256FileRange(const std::string& path, uint64_t offset, uint64_t length);

std::string toHex(const Sha256Digest& digest);

} // namespace nsm
