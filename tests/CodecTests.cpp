#include "nsm/Analyzer.hpp"
#include "nsm/Checksum.hpp"
#include "nsm/Format.hpp"
#include "TestSupport.hpp"

#include <limits>
#include <vector>

using namespace nsm;

static void resealHeader(std::string& bytes) {
    uint32_t crc = crc32(std::string_view(bytes).substr(0, 76));
    for (int i = 0; i < 4; ++i) bytes[76 + i] = static_cast<char>((crc >> (8 * i)) & 0xFF);
}

static Header sampleHeader() {
    Header h;
    h.flags = kFlagSearchIndex;
    h.algorithm = Algorithm::Gzip;
    h.encryption = Encryption::Aes256Gcm;
    h.timestamp = 1700000000123456789LL;
    h.dataLength = 4242;
    h.indexOffset = kHeaderSize + h.dataLength;
    h.indexLength = 77;
    for (size_t i = 0; i < h.dataChecksum.size(); ++i) h.dataChecksum[i] = static_cast<uint8_t>(i * 7);
    return h;
}

static Index sampleIndex() {
    Index idx;
    Entry a;
    a.path = "docs/a.txt";
    a.uncompressedSize = 11;
    a.compressedSize = 20;
    a.offset = 0;
    a.mtime = 1234567890;
    a.mode = 0640;
    a.checksum = crc32("hello world");
    Entry b;
    b.path = "b.txt";
    b.uncompressedSize = 7;
    b.compressedSize = 16;
    b.offset = 20;
    b.mode = 0755;
    b.checksum = crc32("goodbye");
    idx.entries = {a, b};
    idx.searchIndex["hello"] = {{0, 1}};
    idx.searchIndex["world"] = {{0, 1}};
    idx.searchIndex["goodbye"] = {{1, 1}};
    return idx;
}

int main() {
    // Checksums
    expect(crc32("123456789") == 0xCBF43926u, "crc32 check value");
    expect(crc32("") == 0, "crc32 of empty input");
    expect(toHex(Sha256::digest("abc")) ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
           "sha256 of abc");
    {
        Sha256 incremental;
        incremental.update("a");
        incremental.update("bc");
        expect(incremental.finish() == Sha256::digest("abc"), "incremental sha256 matches one-shot");
        Sha256 empty;
        expect(toHex(empty.finish()) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
               "sha256 of nothing");
    }
    {
        const fs::path dir = freshDir("codec");
        writeFile(dir / "range.bin", "xxabcyy");
        expect(sha256FileRange((dir / "range.bin").string(), 2, 3) == Sha256::digest("abc"), "sha256 of a file range");
        expectError(ErrorCode::ArchiveReadFailure, [&] { sha256FileRange((dir / "range.bin").string(), 4, 10); },
                    "range past the end of the file");
        expectError(ErrorCode::ArchiveReadFailure, [&] { sha256FileRange((dir / "missing.bin").string(), 0, 1); },
                    "missing file");
        fs::remove_all(dir);
    }

    // Analyzer
    {
        auto tokens = Analyzer::tokenize("Hello, World! hello_again 42");
        std::vector<std::string> want{"hello", "world", "hello", "again", "42"};
        expect(tokens == want, "tokenize splits on non-alnum and lowercases");
        expect(Analyzer::tokenize(std::string(65, 'x')).size() == 1, "long words are kept");
        bool overlong = false;
        auto kept = Analyzer::tokenize("ok " + std::string(Analyzer::kMaxTokenLength + 1, 'x'), overlong);
        expect(kept == std::vector<std::string>{"ok"} && overlong, "overlong tokens are dropped and reported");
        Analyzer::tokenize("short words only", overlong);
        expect(!overlong, "no overlong token reported");
        expect(Analyzer::normalizeQuery("  HeLLo \n") == "hello", "normalizeQuery trims and lowercases");
    }

    expect(!isRetriable(ErrorCode::ChecksumMismatch) && !isRetriable(ErrorCode::InvalidFormat),
           "corruption is not retriable");
    expect(isRetriable(ErrorCode::NoTokensAvailable) && isRetriable(ErrorCode::ArchiveWriteFailure),
           "environmental failures are retriable");
    expect(std::string(errorCodeName(ErrorCode::PartialExtractFailure)) == "PartialExtractFailure", "error names");

    // Algorithm names
    expect(parseAlgorithm("zstd") == Algorithm::Zstd, "parse zstd");
    expect(parseAlgorithm("gzip") == Algorithm::Gzip, "parse gzip");
    expectError(ErrorCode::UnsupportedAlgorithm, [] { parseAlgorithm("lz4"); }, "lz4 is not supported");
    expectError(ErrorCode::UnsupportedAlgorithm, [] { algorithmFromTag(9); }, "unknown algorithm tag");

    // Header layout
    const Header h = sampleHeader();
    std::string bytes = encodeHeader(h);
    expect(bytes.size() == kHeaderSize, "header is fixed size");
    expect(bytes.compare(0, 4, std::string("NSM\x01", 4)) == 0, "header starts with magic");
    {
        Header back = decodeHeader(bytes);
        expect(back.version == kFormatVersion, "version preserved");
        expect(back.hasSearchIndex(), "flags preserved");
        expect(back.algorithm == Algorithm::Gzip, "algorithm preserved");
        expect(back.encryption == Encryption::Aes256Gcm, "encryption preserved");
        expect(back.timestamp == h.timestamp, "timestamp preserved");
        expect(back.indexOffset == h.indexOffset && back.indexLength == h.indexLength, "index location preserved");
        expect(back.dataLength == h.dataLength, "data length preserved");
        expect(back.dataChecksum == h.dataChecksum, "data checksum preserved");
    }

    // Foreign and damaged headers
    expectError(ErrorCode::InvalidFormat, [] { decodeHeader(randomBytes(128, 7)); }, "random bytes are not an archive");
    expectError(ErrorCode::InvalidFormat, [] { decodeHeader(std::string("NSM\x01", 4)); }, "truncated header");
    expectError(ErrorCode::InvalidFormat, [] { decodeHeader(std::string(kHeaderSize, '\0')); },
                "zeroed placeholder header is rejected");
    {
        std::string damaged = bytes;
        damaged[20] ^= 0x01;
        expectError(ErrorCode::InvalidFormat, [&] { decodeHeader(damaged); }, "header crc mismatch");
    }
    {
        Header future = h;
        future.version = kFormatVersion + 1;
        std::string fb = encodeHeader(future);
        expectError(ErrorCode::UnsupportedVersion, [&] { decodeHeader(fb); }, "newer version is refused");
    }
    {
        std::string badAlgo = bytes;
        badAlgo[8] = 9;
        resealHeader(badAlgo);
        expectError(ErrorCode::UnsupportedAlgorithm, [&] { decodeHeader(badAlgo); }, "unknown algorithm tag in header");
    }
    {
        Header old = h;
        old.version = kFirstVersion;
        Header back = decodeHeader(encodeHeader(old));
        expect(back.version == kFirstVersion, "version 1 accepted");
        expect(!back.hasSearchIndex(), "version 1 never carries a search index");
    }
    {
        Header misplaced = h;
        misplaced.indexOffset += 1;
        std::string mb = encodeHeader(misplaced);
        expectError(ErrorCode::InvalidFormat, [&] { decodeHeader(mb); }, "index must follow the data block");
    }
    {
        Header wrapped = h;
        wrapped.dataLength = std::numeric_limits<uint64_t>::max() - 10;
        wrapped.indexOffset = kHeaderSize + wrapped.dataLength;
        std::string wb = encodeHeader(wrapped);
        expectError(ErrorCode::InvalidFormat, [&] { decodeHeader(wb); }, "data length wrapping past the index");
    }

    // Index block
    const Index idx = sampleIndex();
    const uint64_t dataLength = 36;
    {
        std::string block = encodeIndex(idx, true);
        Index back = decodeIndex(block, true, dataLength);
        expect(back.entries.size() == 2, "two entries decoded");
        expect(back.entries[0].path == "docs/a.txt" && back.entries[1].path == "b.txt", "entry order preserved");
        expect(back.entries[0].mode == 0640 && back.entries[1].mode == 0755, "modes preserved");
        expect(back.entries[0].mtime == 1234567890, "mtime preserved");
        expect(back.entries[1].offset == 20 && back.entries[1].compressedSize == 16, "frame location preserved");
        expect(back.searchIndex.size() == 3, "terms decoded");
        expect(back.searchIndex.at("goodbye").front().entry == 1, "posting ordinal preserved");
        expect(back.find("b.txt") != nullptr && back.find("zzz") == nullptr, "find by path");

        std::string trailing = block + "x";
        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(trailing, true, dataLength); }, "trailing bytes");

        std::string flipped = block;
        flipped[10] ^= 0x40;
        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(flipped, true, dataLength); }, "index crc mismatch");

        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(block.substr(0, 6), true, dataLength); },
                    "truncated index");
        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(block, true, 30); },
                    "frames past the data block");
        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(block, false, dataLength); },
                    "search index bytes where none are declared");
    }
    {
        std::string block = encodeIndex(idx, false);
        Index back = decodeIndex(block, false, dataLength);
        expect(back.entries.size() == 2 && back.searchIndex.empty(), "index without search terms");
    }
    {
        Index gap = idx;
        gap.entries[1].offset = 24;
        std::string block = encodeIndex(gap, false);
        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(block, false, 40); }, "frames must be contiguous");
    }

    {
        // Offsets that only line up through unsigned wraparound
        Index wrapped;
        Entry a;
        a.path = "a";
        a.compressedSize = 5;
        a.offset = 0;
        Entry b;
        b.path = "b";
        b.compressedSize = std::numeric_limits<uint64_t>::max();
        b.offset = 5;
        Entry c;
        c.path = "c";
        c.compressedSize = 6;
        c.offset = 4;
        wrapped.entries = {a, b, c};
        std::string block = encodeIndex(wrapped, false);
        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(block, false, 10); }, "frame size overflowing the data block");

        Index huge;
        Entry only;
        only.path = "only";
        only.compressedSize = std::numeric_limits<uint64_t>::max();
        huge.entries = {only};
        std::string hb = encodeIndex(huge, false);
        expectError(ErrorCode::InvalidFormat, [&] { decodeIndex(hb, false, 10); }, "frame larger than the data block");
    }

    // Archive paths
    expect(normalizeArchivePath("./a//b\\c/") == "a/b/c", "normalize separators");
    expect(normalizeArchivePath("/abs/path") == "abs/path", "leading slash stripped");
    expect(isSafeArchivePath("a/b.txt"), "relative path is safe");
    expect(!isSafeArchivePath("../etc/passwd"), "parent traversal is unsafe");
    expect(!isSafeArchivePath("a/../../b"), "embedded traversal is unsafe");
    expect(!isSafeArchivePath("/etc/passwd"), "absolute path is unsafe");
    expect(!isSafeArchivePath(""), "empty path is unsafe");

    std::cout << "All codec tests passed." << std::endl;
    return 0;
}
