#include "nsm/Cipher.hpp"

#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include "nsm/Errors.hpp"

namespace nsm {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

CipherCtx newContext() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw ArchiveError(ErrorCode::CompressionFailure, "cipher: EVP_CIPHER_CTX_new failed");
    return ctx;
}

} // namespace

FrameCipher::FrameCipher(const std::string& keyHex) {
    if (keyHex.size() != kKeySize * 2) {
        throw ArchiveError(ErrorCode::InvalidArgument, "encryption key must be 64 hex characters");
    }
    for (size_t i = 0; i < kKeySize; ++i) {
        int hi = hexValue(keyHex[2 * i]);
        int lo = hexValue(keyHex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ArchiveError(ErrorCode::InvalidArgument, "encryption key is not valid hex");
        }
        key_[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
}

std::string FrameCipher::seal(std::string_view plaintext, std::string_view aad) const {
    std::string frame(kNonceSize + plaintext.size() + kTagSize, '\0');
    auto* nonce = reinterpret_cast<unsigned char*>(frame.data());
    if (RAND_bytes(nonce, static_cast<int>(kNonceSize)) != 1) {
        throw ArchiveError(ErrorCode::CompressionFailure, "cipher: RAND_bytes failed");
    }

    CipherCtx ctx = newContext();
    int len = 0;
    auto* out = nonce + kNonceSize;
    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) == 1 &&
              EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) == 1;
    if (ok && !aad.empty()) {
        ok = EVP_EncryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                               static_cast<int>(aad.size())) == 1;
    }
    int total = 0;
    if (ok && !plaintext.empty()) {
        ok = EVP_EncryptUpdate(ctx.get(), out, &len, reinterpret_cast<const unsigned char*>(plaintext.data()),
                               static_cast<int>(plaintext.size())) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_EncryptFinal_ex(ctx.get(), out + total, &len) == 1;
        total += len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), out + total) == 1;
    }
    if (!ok || static_cast<size_t>(total) != plaintext.size()) {
        throw ArchiveError(ErrorCode::CompressionFailure, "cipher: AES-256-GCM encryption failed");
    }
    return frame;
}

std::string FrameCipher::open(std::string_view frame, std::string_view aad) const {
    if (frame.size() < kNonceSize + kTagSize) {
        throw ArchiveError(ErrorCode::DecryptionFailure, "cipher: encrypted frame too short");
    }
    const auto* nonce = reinterpret_cast<const unsigned char*>(frame.data());
    const auto* cipherText = nonce + kNonceSize;
    const size_t cipherLen = frame.size() - kNonceSize - kTagSize;
    std::string tag(frame.substr(kNonceSize + cipherLen, kTagSize));
    std::string plain(cipherLen, '\0');

    CipherCtx ctx = newContext();
    int len = 0;
    int total = 0;
    bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) == 1 &&
              EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) == 1;
    if (ok && !aad.empty()) {
        ok = EVP_DecryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                               static_cast<int>(aad.size())) == 1;
    }
    if (ok && cipherLen > 0) {
        ok = EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()), &len, cipherText,
                               static_cast<int>(cipherLen)) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) == 1;
    }
    if (ok) {
        ok = EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()) + total, &len) == 1;
    }
    if (!ok) {
        throw ArchiveError(ErrorCode::DecryptionFailure,
                           "cipher: authentication failed (wrong key or tampered frame)");
    }
    return plain;
}

} // namespace nsm
