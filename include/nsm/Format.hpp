#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "nsm/Checksum.hpp"

namespace nsm {

enum class Algorithm : uint8_t { Zstd = 1, Gzip = 2 };
enum class Encryption : uint8_t { None = 0, Aes256Gcm = 1 };

const char* algorithmName(Algorithm algo);
// Throws ArchiveError(UnsupportedAlgorithm) for unknown names.
Algorithm parseAlgorithm(const std::string& name);
// Throws ArchiveError(UnsupportedAlgorithm) for unknown tags.
Algorithm algorithmFromTag(uint8_t tag);

constexpr char kMagic[4] = {'N', 'S', 'M', '\x01'};
constexpr uint16_t kFormatVersion = 2;
// Version 1 archives have no search index.
constexpr uint16_t kFirstVersion = 1;
constexpr size_t kHeaderSize = 96;
constexpr uint16_t kFlagSearchIndex = 0x0001;

struct Header {
    uint16_t version = kFormatVersion;
    uint16_t flags = 0;
    Algorithm algorithm = Algorithm::Zstd;
    Encryption encryption = Encryption::None;
    int64_t timestamp = 0;
    uint64_t indexOffset = 0;
    uint64_t indexLength = 0;
    uint64_t dataLength = 0;
    Sha256Digest dataChecksum{};

    bool hasSearchIndex() const { return (flags & kFlagSearchIndex) != 0; }
};

struct Entry {
    std::string path;
    uint64_t uncompressedSize = 0;
    uint64_t compressedSize = 0;
    // Relative to the start of the data block.
    uint64_t offset = 0;
    int64_t mtime = 0;
    uint32_t mode = 0644;
    uint32_t checksum = 0;
};

struct Posting {
    uint32_t entry;
    uint32_t tf;
};

struct Index {
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::vector<Posting>> searchIndex;

    const Entry* find(const std::string& path) const;
};

// --- Header ---
std::string encodeHeader(const Header& header);
// Throws InvalidFormat / UnsupportedVersion / UnsupportedAlgorithm.
Header decodeHeader(std::string_view bytes);
void writeHeader(std::ostream& out, const Header& header);
Header readHeader(std::istream& in);

// --- Index block ---
// Self-delimiting: u32 length | payload | u32 crc32(payload).
std::string encodeIndex(const Index& index, bool withSearchIndex);
Index decodeIndex(std::string_view block, bool withSearchIndex, uint64_t dataLength);

// Archive paths always use forward slashes and never start with one.
std::string normalizeArchivePath(const std::string& path);
bool isSafeArchivePath(const std::string& path);

} // namespace nsm
