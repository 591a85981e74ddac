#include "nsm/Checksum.hpp"

#include <algorithm>
#include <fstream>
#include <vector>
#include <openssl/evp.h>
#include "nsm/Errors.hpp"

namespace nsm {

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "sha256: EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(std::string_view data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "sha256: EVP_DigestUpdate failed");
    }
}

Sha256Digest Sha256::finish() {
    Sha256Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "sha256: EVP_DigestFinal_ex failed");
    }
    return out;
}

Sha256Digest Sha256::digest(std::string_view data) {
    Sha256 h;
    h.update(data);
    return h.finish();
}

Sha256Digest sha256FileRange(const std::string& path, uint64_t offset, uint64_t length) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "checksum: cannot open " + path);
    }
    in.seekg(static_cast<std::streamoff>(offset));

    Sha256 h;
    std::vector<char> buf(64 * 1024);
    uint64_t remaining = length;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
        if (!in.read(buf.data(), static_cast<std::streamsize>(want))) {
            throw ArchiveError(ErrorCode::ArchiveReadFailure,
                               "checksum: data block truncated in " + path);
        }
        h.update(std::string_view(buf.data(), want));
        remaining -= want;
    }
    return h.finish();
}

std::string toHex(const Sha256Digest& digest) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t b : digest) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

} // namespace nsm
