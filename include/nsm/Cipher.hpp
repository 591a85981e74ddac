#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace nsm {

// AES-256-GCM sealing of whole frames: nonce(12) | ciphertext | tag(16).
class FrameCipher {
public:
    static constexpr size_t kKeySize = 32;
    static constexpr size_t kNonceSize = 12;
    static constexpr size_t kTagSize = 16;

    // Throws ArchiveError(InvalidArgument) unless keyHex is 64 hex characters.
    explicit FrameCipher(const std::string& keyHex);

    std::string seal(std::string_view plaintext, std::string_view aad) const;
    // Throws ArchiveError(DecryptionFailure) on a wrong key or tampered frame.
    std::string open(std::string_view frame, std::string_view aad) const;

private:
    std::array<uint8_t, kKeySize> key_{};
};

} // namespace nsm
