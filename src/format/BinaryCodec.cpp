#include "nsm/Format.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <unordered_set>
#include "nsm/Errors.hpp"

namespace nsm {

namespace {

template <typename T>
void writeLE(std::string& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFFu));
    }
}

template <typename T>
bool readLE(std::string_view data, size_t& offset, T& value) {
    if (offset + sizeof(T) > data.size()) return false;
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<uint64_t>(static_cast<unsigned char>(data[offset + i])) << (8 * i);
    }
    value = static_cast<T>(v);
    offset += sizeof(T);
    return true;
}

constexpr size_t kHeaderCrcOffset = 76;

[[noreturn]] void badIndex(const std::string& what) {
    throw ArchiveError(ErrorCode::InvalidFormat, "index: " + what);
}

} // namespace

const char* algorithmName(Algorithm algo) {
    switch (algo) {
    case Algorithm::Zstd: return "zstd";
    case Algorithm::Gzip: return "gzip";
    }
    return "unknown";
}

Algorithm parseAlgorithm(const std::string& name) {
    if (name == "zstd") return Algorithm::Zstd;
    if (name == "gzip") return Algorithm::Gzip;
    throw ArchiveError(ErrorCode::UnsupportedAlgorithm, "unsupported compression algorithm: " + name);
}

Algorithm algorithmFromTag(uint8_t tag) {
    switch (tag) {
    case static_cast<uint8_t>(Algorithm::Zstd): return Algorithm::Zstd;
    case static_cast<uint8_t>(Algorithm::Gzip): return Algorithm::Gzip;
    default:
        throw ArchiveError(ErrorCode::UnsupportedAlgorithm,
                           "unsupported compression algorithm tag " + std::to_string(tag));
    }
}

const Entry* Index::find(const std::string& path) const {
    for (const auto& e : entries) {
        if (e.path == path) return &e;
    }
    return nullptr;
}

// --------------------------------------------------------------------------
// Header
// --------------------------------------------------------------------------
std::string encodeHeader(const Header& header) {
    std::string out;
    out.reserve(kHeaderSize);
    out.append(kMagic, sizeof(kMagic));
    writeLE(out, header.version);
    writeLE(out, header.flags);
    writeLE(out, static_cast<uint8_t>(header.algorithm));
    writeLE(out, static_cast<uint8_t>(header.encryption));
    writeLE(out, static_cast<uint16_t>(0));
    writeLE(out, header.timestamp);
    writeLE(out, header.indexOffset);
    writeLE(out, header.indexLength);
    writeLE(out, header.dataLength);
    out.append(reinterpret_cast<const char*>(header.dataChecksum.data()), header.dataChecksum.size());
    writeLE(out, crc32(out));
    out.resize(kHeaderSize, '\0');
    return out;
}

Header decodeHeader(std::string_view bytes) {
    if (bytes.size() < kHeaderSize) {
        throw ArchiveError(ErrorCode::InvalidFormat,
                           "not an NSM archive (only " + std::to_string(bytes.size()) + " bytes)");
    }
    if (std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
        throw ArchiveError(ErrorCode::InvalidFormat, "not an NSM archive (magic number mismatch)");
    }

    Header h;
    size_t cursor = sizeof(kMagic);
    readLE(bytes, cursor, h.version);
    if (h.version == 0) {
        throw ArchiveError(ErrorCode::InvalidFormat, "invalid archive version 0");
    }
    if (h.version > kFormatVersion) {
        throw ArchiveError(ErrorCode::UnsupportedVersion,
                           "archive version " + std::to_string(h.version) + " is newer than supported version " +
                               std::to_string(kFormatVersion));
    }

    size_t crcCursor = kHeaderCrcOffset;
    uint32_t storedCrc = 0;
    readLE(bytes, crcCursor, storedCrc);
    if (crc32(bytes.substr(0, kHeaderCrcOffset)) != storedCrc) {
        throw ArchiveError(ErrorCode::InvalidFormat, "archive header checksum mismatch");
    }

    uint8_t algoTag = 0;
    uint8_t encTag = 0;
    uint16_t reserved = 0;
    readLE(bytes, cursor, h.flags);
    readLE(bytes, cursor, algoTag);
    readLE(bytes, cursor, encTag);
    readLE(bytes, cursor, reserved);
    readLE(bytes, cursor, h.timestamp);
    readLE(bytes, cursor, h.indexOffset);
    readLE(bytes, cursor, h.indexLength);
    readLE(bytes, cursor, h.dataLength);
    std::memcpy(h.dataChecksum.data(), bytes.data() + cursor, h.dataChecksum.size());

    h.algorithm = algorithmFromTag(algoTag);
    if (encTag > static_cast<uint8_t>(Encryption::Aes256Gcm)) {
        throw ArchiveError(ErrorCode::UnsupportedAlgorithm,
                           "unsupported encryption algorithm tag " + std::to_string(encTag));
    }
    h.encryption = static_cast<Encryption>(encTag);
    if (h.version == kFirstVersion) {
        h.flags &= static_cast<uint16_t>(~kFlagSearchIndex);
    }
    if (h.dataLength > std::numeric_limits<uint64_t>::max() - kHeaderSize ||
        h.indexOffset != kHeaderSize + h.dataLength) {
        throw ArchiveError(ErrorCode::InvalidFormat, "index offset does not follow the data block");
    }
    return h;
}

void writeHeader(std::ostream& out, const Header& header) {
    const std::string bytes = encodeHeader(header);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw ArchiveError(ErrorCode::ArchiveWriteFailure, "failed to write archive header");
    }
}

Header readHeader(std::istream& in) {
    std::string bytes(kHeaderSize, '\0');
    in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    bytes.resize(static_cast<size_t>(in.gcount()));
    return decodeHeader(bytes);
}

// --------------------------------------------------------------------------
// Index block
// --------------------------------------------------------------------------
std::string encodeIndex(const Index& index, bool withSearchIndex) {
    std::string payload;
    writeLE(payload, static_cast<uint32_t>(index.entries.size()));
    for (const auto& e : index.entries) {
        if (e.path.size() > std::numeric_limits<uint16_t>::max()) {
            throw ArchiveError(ErrorCode::InvalidArgument, "archive path too long: " + e.path.substr(0, 64));
        }
        writeLE(payload, static_cast<uint16_t>(e.path.size()));
        payload.append(e.path);
        writeLE(payload, e.uncompressedSize);
        writeLE(payload, e.compressedSize);
        writeLE(payload, e.offset);
        writeLE(payload, e.mtime);
        writeLE(payload, e.mode);
        writeLE(payload, e.checksum);
    }

    if (withSearchIndex) {
        std::vector<std::pair<std::string, std::vector<Posting>>> terms(index.searchIndex.begin(),
                                                                         index.searchIndex.end());
        std::sort(terms.begin(), terms.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
        writeLE(payload, static_cast<uint32_t>(terms.size()));
        for (const auto& termEntry : terms) {
            writeLE(payload, static_cast<uint16_t>(termEntry.first.size()));
            payload.append(termEntry.first);
            writeLE(payload, static_cast<uint32_t>(termEntry.second.size()));
            for (const auto& p : termEntry.second) {
                writeLE(payload, p.entry);
                writeLE(payload, p.tf);
            }
        }
    }

    std::string block;
    block.reserve(payload.size() + 8);
    writeLE(block, static_cast<uint32_t>(payload.size()));
    block.append(payload);
    writeLE(block, crc32(payload));
    return block;
}

Index decodeIndex(std::string_view block, bool withSearchIndex, uint64_t dataLength) {
    size_t cursor = 0;
    uint32_t payloadLen = 0;
    if (!readLE(block, cursor, payloadLen)) badIndex("truncated length prefix");
    if (static_cast<uint64_t>(payloadLen) + 8 != block.size()) badIndex("length prefix disagrees with header");

    std::string_view payload = block.substr(4, payloadLen);
    size_t crcCursor = 4 + static_cast<size_t>(payloadLen);
    uint32_t storedCrc = 0;
    readLE(block, crcCursor, storedCrc);
    if (crc32(payload) != storedCrc) badIndex("checksum mismatch");

    Index index;
    size_t pc = 0;
    uint32_t entryCount = 0;
    if (!readLE(payload, pc, entryCount)) badIndex("truncated entry count");
    index.entries.reserve(std::min<uint32_t>(entryCount, 1u << 16));

    std::unordered_set<std::string> seen;
    uint64_t expectedOffset = 0;
    for (uint32_t i = 0; i < entryCount; ++i) {
        Entry e;
        uint16_t pathLen = 0;
        if (!readLE(payload, pc, pathLen) || pc + pathLen > payload.size()) badIndex("truncated entry path");
        e.path.assign(payload.data() + pc, pathLen);
        pc += pathLen;
        if (!readLE(payload, pc, e.uncompressedSize) || !readLE(payload, pc, e.compressedSize) ||
            !readLE(payload, pc, e.offset) || !readLE(payload, pc, e.mtime) || !readLE(payload, pc, e.mode) ||
            !readLE(payload, pc, e.checksum)) {
            badIndex("truncated entry " + std::to_string(i));
        }
        if (e.offset != expectedOffset) badIndex("entry " + e.path + " is out of frame order");
        if (e.offset > dataLength || e.compressedSize > dataLength - e.offset) {
            badIndex("entry " + e.path + " extends past the data block");
        }
        if (!seen.insert(e.path).second) badIndex("duplicate path " + e.path);
        expectedOffset += e.compressedSize;
        index.entries.push_back(std::move(e));
    }
    if (expectedOffset != dataLength) badIndex("frames do not cover the data block");

    if (withSearchIndex) {
        uint32_t termCount = 0;
        if (!readLE(payload, pc, termCount)) badIndex("truncated term count");
        for (uint32_t t = 0; t < termCount; ++t) {
            uint16_t termLen = 0;
            if (!readLE(payload, pc, termLen) || pc + termLen > payload.size()) badIndex("truncated term");
            std::string term(payload.data() + pc, termLen);
            pc += termLen;
            uint32_t postingCount = 0;
            if (!readLE(payload, pc, postingCount)) badIndex("truncated posting count");
            if (static_cast<uint64_t>(postingCount) * 8 > payload.size() - pc) badIndex("truncated postings");
            std::vector<Posting> postings;
            postings.reserve(postingCount);
            for (uint32_t p = 0; p < postingCount; ++p) {
                Posting posting{};
                readLE(payload, pc, posting.entry);
                readLE(payload, pc, posting.tf);
                if (posting.entry >= index.entries.size()) badIndex("posting for unknown entry");
                if (!postings.empty() && posting.entry <= postings.back().entry) badIndex("unsorted postings");
                postings.push_back(posting);
            }
            index.searchIndex.emplace(std::move(term), std::move(postings));
        }
    }
    if (pc != payload.size()) badIndex("trailing bytes after index payload");
    return index;
}

std::string normalizeArchivePath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        char ch = c == '\\' ? '/' : c;
        if (ch == '/' && (out.empty() || out.back() == '/')) continue;
        out.push_back(ch);
    }
    while (out.size() >= 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    if (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

bool isSafeArchivePath(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string::npos) return false;
    if (path.size() >= 2 && path[1] == ':') return false;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string_view part(path.data() + start, end - start);
        if (part.empty() || part == "." || part == "..") return false;
        start = end + 1;
    }
    return true;
}

} // namespace nsm
