#include "NsmEngine.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>
#include <unordered_map>
#include <fcntl.h>
#include <sys/stat.h>
#include "nsm/Analyzer.hpp"
#include "nsm/DurableFile.hpp"
#include "nsm/algorithms/SearchAlgorithms.hpp"

namespace fs = std::filesystem;

namespace nsm {

namespace {

int64_t nowNanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string readWholeFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "cannot open input " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "failed reading input " + path);
    }
    return ss.str();
}

// Removes `<output>.partial` unless the archive was committed.
struct PartialFile {
    std::string path;
    bool committed = false;

    ~PartialFile() {
        if (!committed) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
};

} // namespace

NsmEngine::NsmEngine(Config config, Compressor& compressor, UsageLedger& ledger)
    : config_(std::move(config)), compressor_(compressor), ledger_(ledger) {
    if (!config_.encryptionKeyHex.empty()) {
        cipher_.emplace(config_.encryptionKeyHex);
    }
    if (config_.verbose) {
        std::cerr << "NsmEngine: algorithm=" << algorithmName(config_.algorithm)
                  << " codecJobs=" << compressor_.maxJobs()
                  << " searchIndex=" << (config_.buildSearchIndex ? "on" : "off")
                  << " encryption=" << (cipher_ ? "on" : "off") << "\n";
    }
}

const FrameCipher& NsmEngine::cipher() const {
    if (!cipher_) {
        throw ArchiveError(ErrorCode::DecryptionFailure, "archive is encrypted but no key is configured");
    }
    return *cipher_;
}

// --------------------------------------------------------------------------
// Create
// --------------------------------------------------------------------------
std::vector<NsmEngine::PendingInput> NsmEngine::collectInputs(const std::vector<std::string>& inputPaths) const {
    if (inputPaths.empty()) {
        throw ArchiveError(ErrorCode::InvalidArgument, "at least one input path is required");
    }

    std::vector<PendingInput> out;
    std::set<std::string> seen;
    auto add = [&](const fs::path& source, const std::string& archivePath) {
        std::string name = normalizeArchivePath(archivePath);
        if (!isSafeArchivePath(name)) {
            throw ArchiveError(ErrorCode::InvalidArgument, "cannot archive " + source.string() + " as '" + name + "'");
        }
        if (!seen.insert(name).second) {
            throw ArchiveError(ErrorCode::InvalidArgument, "duplicate archive path: " + name);
        }
        std::ifstream probe(source, std::ios::binary);
        if (!probe) {
            throw ArchiveError(ErrorCode::ArchiveReadFailure, "input is not readable: " + source.string());
        }
        out.push_back({source.string(), name});
    };

    for (const auto& input : inputPaths) {
        std::error_code ec;
        fs::path source(input);
        auto status = fs::status(source, ec);
        if (ec || !fs::exists(status)) {
            throw ArchiveError(ErrorCode::ArchiveReadFailure, "input does not exist: " + input);
        }
        if (fs::is_regular_file(status)) {
            add(source, source.filename().string());
            continue;
        }
        if (!fs::is_directory(status)) {
            throw ArchiveError(ErrorCode::InvalidArgument, "input is not a regular file or directory: " + input);
        }

        std::string prefix = source.lexically_normal().filename().string();
        if (prefix.empty() || prefix == "." || prefix == "..") {
            prefix = fs::absolute(source, ec).lexically_normal().filename().string();
        }
        std::vector<fs::path> files;
        for (fs::recursive_directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file()) files.push_back(it->path());
        }
        if (ec) {
            throw ArchiveError(ErrorCode::ArchiveReadFailure, "cannot walk directory " + input + ": " + ec.message());
        }
        std::sort(files.begin(), files.end());
        for (const auto& file : files) {
            std::string rel = file.lexically_relative(source).generic_string();
            add(file, prefix.empty() ? rel : prefix + "/" + rel);
        }
    }
    if (out.empty()) {
        throw ArchiveError(ErrorCode::InvalidArgument, "inputs contain no regular files");
    }
    return out;
}

ArchiveSummary NsmEngine::create(const std::string& outputPath, const std::vector<std::string>& inputPaths,
                                 const CreateOptions& options) {
    if (outputPath.empty()) {
        throw ArchiveError(ErrorCode::InvalidArgument, "output path is empty");
    }
    const Algorithm algo = options.algorithm.value_or(config_.algorithm);
    const bool encrypt = options.encrypt.value_or(cipher_.has_value());
    // Terms would expose plaintext, so encrypted archives are searched by scanning.
    bool withIndex = !encrypt && options.buildSearchIndex.value_or(config_.buildSearchIndex);
    if (encrypt && !cipher_) {
        throw ArchiveError(ErrorCode::InvalidArgument, "encryption requested but NSM_ENCRYPTION_KEY is not set");
    }
    auto inputs = collectInputs(inputPaths);

    // Charged on attempt: nothing below refunds the token.
    ledger_.consumeToken();

    PartialFile partial{outputPath + ".partial"};
    std::ofstream out(partial.path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ArchiveError(ErrorCode::ArchiveWriteFailure, "cannot open " + partial.path);
    }
    const std::string placeholder(kHeaderSize, '\0');
    out.write(placeholder.data(), static_cast<std::streamsize>(placeholder.size()));

    Index index;
    index.entries.reserve(inputs.size());
    uint64_t cursor = 0;
    uint64_t uncompressed = 0;

    for (const auto& input : inputs) {
        std::string content = readWholeFile(input.sourcePath);
        struct stat st {};
        if (::stat(input.sourcePath.c_str(), &st) != 0) {
            throw ArchiveError(ErrorCode::ArchiveReadFailure, "cannot stat " + input.sourcePath);
        }

        Entry entry;
        entry.path = input.archivePath;
        entry.uncompressedSize = content.size();
        entry.offset = cursor;
        entry.mtime = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
        entry.mode = static_cast<uint32_t>(st.st_mode & 07777);
        entry.checksum = crc32(content);

        if (withIndex) {
            bool overlong = false;
            auto tokens = Analyzer::tokenize(content, overlong);
            if (overlong) {
                // An unindexed token would hide its substrings from the index tier.
                std::cerr << "NsmEngine: " << input.archivePath
                          << " has a token longer than the search index holds; writing without an index\n";
                withIndex = false;
                index.searchIndex.clear();
            } else {
                const uint32_t ordinal = static_cast<uint32_t>(index.entries.size());
                std::unordered_map<std::string, uint32_t> tf;
                for (auto& token : tokens) {
                    auto& n = tf[std::move(token)];
                    if (n < UINT32_MAX) ++n;
                }
                for (auto& kv : tf) {
                    index.searchIndex[kv.first].push_back({ordinal, kv.second});
                }
            }
        }

        try {
            if (encrypt) {
                std::ostringstream frame;
                compressor_.compress(frame, content, algo);
                std::string sealed = cipher_->seal(frame.str(), entry.path);
                out.write(sealed.data(), static_cast<std::streamsize>(sealed.size()));
                entry.compressedSize = sealed.size();
            } else {
                entry.compressedSize = compressor_.compress(out, content, algo);
            }
        } catch (const ArchiveError& e) {
            throw ArchiveError(e.code(), "compressing " + entry.path + ": " + e.what());
        }
        if (!out) {
            throw ArchiveError(ErrorCode::ArchiveWriteFailure, "failed writing frame for " + entry.path);
        }
        cursor += entry.compressedSize;
        uncompressed += entry.uncompressedSize;
        index.entries.push_back(std::move(entry));
    }

    const std::string indexBlock = encodeIndex(index, withIndex);
    out.write(indexBlock.data(), static_cast<std::streamsize>(indexBlock.size()));
    out.flush();
    if (!out) {
        throw ArchiveError(ErrorCode::ArchiveWriteFailure, "failed writing index to " + partial.path);
    }
    out.close();

    Header header;
    header.version = kFormatVersion;
    header.flags = withIndex ? kFlagSearchIndex : 0;
    header.algorithm = algo;
    header.encryption = encrypt ? Encryption::Aes256Gcm : Encryption::None;
    header.timestamp = nowNanos();
    header.dataLength = cursor;
    header.indexOffset = kHeaderSize + cursor;
    header.indexLength = indexBlock.size();
    header.dataChecksum = sha256FileRange(partial.path, kHeaderSize, cursor);

    {
        std::fstream patch(partial.path, std::ios::binary | std::ios::in | std::ios::out);
        if (!patch) {
            throw ArchiveError(ErrorCode::ArchiveWriteFailure, "cannot reopen " + partial.path);
        }
        patch.seekp(0);
        writeHeader(patch, header);
        patch.flush();
        if (!patch) {
            throw ArchiveError(ErrorCode::ArchiveWriteFailure, "failed writing header to " + partial.path);
        }
    }

    syncFile(partial.path, ErrorCode::ArchiveWriteFailure);
    std::error_code ec;
    fs::rename(partial.path, outputPath, ec);
    if (ec) {
        throw ArchiveError(ErrorCode::ArchiveWriteFailure, "cannot move archive into place at " + outputPath + ": " + ec.message());
    }
    partial.committed = true;
    syncParentDirectory(outputPath, ErrorCode::ArchiveWriteFailure);

    ArchiveSummary summary;
    summary.outputPath = outputPath;
    summary.fileCount = index.entries.size();
    summary.uncompressedBytes = uncompressed;
    summary.dataBytes = cursor;
    summary.indexBytes = indexBlock.size();
    summary.algorithm = algo;
    summary.encryption = header.encryption;
    summary.searchTerms = index.searchIndex.size();
    summary.tokensRemaining = ledger_.availableTokens();
    if (config_.verbose) {
        std::cerr << "NsmEngine: created " << outputPath << " files=" << summary.fileCount
                  << " raw=" << uncompressed << " data=" << cursor << " terms=" << summary.searchTerms << "\n";
    }
    return summary;
}

// --------------------------------------------------------------------------
// Reading
// --------------------------------------------------------------------------
NsmEngine::OpenArchive NsmEngine::openArchive(const std::string& archivePath) const {
    OpenArchive archive;
    archive.path = archivePath;
    archive.in.open(archivePath, std::ios::binary);
    if (!archive.in) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "cannot open archive " + archivePath);
    }
    archive.header = readHeader(archive.in);

    std::error_code ec;
    const uint64_t fileSize = fs::file_size(archivePath, ec);
    if (ec) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "cannot stat archive " + archivePath);
    }
    const Header& h = archive.header;
    if (h.indexLength < 8 || h.indexOffset > fileSize || h.indexLength != fileSize - h.indexOffset) {
        throw ArchiveError(ErrorCode::InvalidFormat,
                           "archive size " + std::to_string(fileSize) + " does not match header layout");
    }

    std::string block(h.indexLength, '\0');
    archive.in.seekg(static_cast<std::streamoff>(h.indexOffset));
    archive.in.read(block.data(), static_cast<std::streamsize>(block.size()));
    if (static_cast<uint64_t>(archive.in.gcount()) != h.indexLength) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "short read of index in " + archivePath);
    }
    archive.index = decodeIndex(block, h.hasSearchIndex(), h.dataLength);
    return archive;
}

void NsmEngine::verifyDataBlock(const OpenArchive& archive) const {
    Sha256Digest actual = sha256FileRange(archive.path, kHeaderSize, archive.header.dataLength);
    if (actual != archive.header.dataChecksum) {
        throw ArchiveError(ErrorCode::ChecksumMismatch,
                           "data block checksum mismatch in " + archive.path + " (expected " +
                               toHex(archive.header.dataChecksum) + ", got " + toHex(actual) + ")");
    }
}

std::string NsmEngine::readEntry(OpenArchive& archive, const Entry& entry) const {
    std::string frame(entry.compressedSize, '\0');
    archive.in.clear();
    archive.in.seekg(static_cast<std::streamoff>(kHeaderSize + entry.offset));
    archive.in.read(frame.data(), static_cast<std::streamsize>(frame.size()));
    if (static_cast<uint64_t>(archive.in.gcount()) != entry.compressedSize) {
        throw ArchiveError(ErrorCode::ArchiveReadFailure, "short read of frame for " + entry.path);
    }
    if (archive.header.encryption == Encryption::Aes256Gcm) {
        frame = cipher().open(frame, entry.path);
    }

    std::ostringstream decoded;
    try {
        compressor_.decompress(decoded, frame, archive.header.algorithm, entry.uncompressedSize);
    } catch (const ArchiveError& e) {
        throw ArchiveError(e.code(), "decompressing " + entry.path + ": " + e.what());
    }
    std::string content = decoded.str();
    if (content.size() != entry.uncompressedSize) {
        throw ArchiveError(ErrorCode::ChecksumMismatch,
                           entry.path + ": decoded " + std::to_string(content.size()) + " bytes, expected " +
                               std::to_string(entry.uncompressedSize));
    }
    if (crc32(content) != entry.checksum) {
        throw ArchiveError(ErrorCode::ChecksumMismatch, entry.path + ": content checksum mismatch");
    }
    return content;
}

// --------------------------------------------------------------------------
// Extract
// --------------------------------------------------------------------------
void NsmEngine::writeEntry(const Entry& entry, const std::string& content, const std::string& destinationDir) const {
    fs::path target = fs::path(destinationDir) / fs::path(entry.path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ArchiveError(ErrorCode::ArchiveWriteFailure,
                               "cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ArchiveError(ErrorCode::ArchiveWriteFailure, "cannot open " + target.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw ArchiveError(ErrorCode::ArchiveWriteFailure, "failed writing " + target.string());
        }
    }

    // setuid, setgid and sticky bits are never restored.
    fs::permissions(target, static_cast<fs::perms>(entry.mode & 0777), fs::perm_options::replace, ec);
    if (ec) {
        throw ArchiveError(ErrorCode::ArchiveWriteFailure, "cannot set permissions on " + target.string());
    }
    // Floor division keeps tv_nsec in [0, 1e9) for times before the epoch.
    int64_t seconds = entry.mtime / 1000000000LL;
    int64_t nanos = entry.mtime % 1000000000LL;
    if (nanos < 0) {
        nanos += 1000000000LL;
        --seconds;
    }
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(seconds);
    times[0].tv_nsec = static_cast<long>(nanos);
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, target.c_str(), times, 0) != 0) {
        std::cerr << "NsmEngine: could not restore mtime on " << target.string() << "\n";
    }
}

ExtractReport NsmEngine::extractEntries(OpenArchive& archive, const std::vector<const Entry*>& selected,
                                        std::vector<ExtractFailure> failures,
                                        const std::string& destinationDir) const {
    verifyDataBlock(archive);

    ExtractReport report;
    report.failures = std::move(failures);
    for (const Entry* entry : selected) {
        if (!isSafeArchivePath(entry->path)) {
            report.failures.push_back({entry->path, ErrorCode::PartialExtractFailure,
                                       "refusing to extract unsafe path"});
            continue;
        }
        std::string content = readEntry(archive, *entry);
        writeEntry(*entry, content, destinationDir);
        report.extracted.push_back(entry->path);
    }
    if (!report.failures.empty()) {
        std::cerr << "NsmEngine: extract from " << archive.path << " skipped " << report.failures.size()
                  << " entr" << (report.failures.size() == 1 ? "y" : "ies") << "\n";
    } else if (config_.verbose) {
        std::cerr << "NsmEngine: extracted " << report.extracted.size() << " file(s) from " << archive.path << "\n";
    }
    return report;
}

ExtractReport NsmEngine::extract(const std::string& archivePath, const std::vector<std::string>& paths,
                                 const std::string& destinationDir) const {
    OpenArchive archive = openArchive(archivePath);

    std::unordered_map<std::string, const Entry*> byPath;
    for (const auto& e : archive.index.entries) byPath.emplace(e.path, &e);

    std::vector<const Entry*> selected;
    std::vector<ExtractFailure> failures;
    std::set<std::string> requested;
    for (const auto& raw : paths) {
        std::string name = normalizeArchivePath(raw);
        if (!requested.insert(name).second) continue;
        if (!isSafeArchivePath(name)) {
            failures.push_back({raw, ErrorCode::PartialExtractFailure, "unsafe path"});
            continue;
        }
        auto it = byPath.find(name);
        if (it == byPath.end()) {
            failures.push_back({raw, ErrorCode::PartialExtractFailure, "not found in archive"});
            continue;
        }
        selected.push_back(it->second);
    }
    // Physical order keeps reads sequential.
    std::sort(selected.begin(), selected.end(), [](const Entry* a, const Entry* b) { return a->offset < b->offset; });
    return extractEntries(archive, selected, std::move(failures), destinationDir);
}

ExtractReport NsmEngine::extractAll(const std::string& archivePath, const std::string& destinationDir) const {
    OpenArchive archive = openArchive(archivePath);
    std::vector<const Entry*> selected;
    selected.reserve(archive.index.entries.size());
    for (const auto& e : archive.index.entries) selected.push_back(&e);
    return extractEntries(archive, selected, {}, destinationDir);
}

// --------------------------------------------------------------------------
// Search
// --------------------------------------------------------------------------
std::vector<SearchResult> NsmEngine::search(const std::string& archivePath, const std::string& query,
                                            const SearchOptions& options) const {
    const std::string normalized = Analyzer::normalizeQuery(query);
    if (normalized.empty()) {
        throw ArchiveError(ErrorCode::InvalidArgument, "search query is empty");
    }
    const size_t maxResults = options.maxResults ? options.maxResults : config_.searchLimit;

    OpenArchive archive = openArchive(archivePath);
    const auto terms = Analyzer::tokenize(normalized);
    const bool singleToken = terms.size() == 1 && terms[0] == normalized;
    const bool hasIndex = archive.header.hasSearchIndex();

    bool useIndex = false;
    switch (options.mode) {
    case SearchMode::Index:
        if (!hasIndex) {
            throw ArchiveError(ErrorCode::InvalidArgument, "archive " + archivePath + " has no search index");
        }
        useIndex = true;
        break;
    case SearchMode::Scan:
        useIndex = false;
        break;
    case SearchMode::Auto:
        useIndex = hasIndex && singleToken;
        break;
    }

    std::vector<algo::SearchHit> hits;
    if (useIndex) {
        hits = algo::searchIndexed(archive.index, terms);
    } else {
        verifyDataBlock(archive);
        for (uint32_t i = 0; i < archive.index.entries.size(); ++i) {
            const Entry& entry = archive.index.entries[i];
            std::string content = readEntry(archive, entry);
            uint64_t matches = algo::countOccurrences(content, normalized);
            if (matches == 0) continue;
            hits.push_back({i, matches, algo::matchDensity(matches, entry.uncompressedSize)});
            if (maxResults > 0 && hits.size() >= maxResults) break;
        }
    }
    algo::rankHits(hits, archive.index, maxResults);

    std::vector<SearchResult> results;
    results.reserve(hits.size());
    for (const auto& hit : hits) {
        results.push_back({archive.index.entries[hit.entry].path, hit.matches, hit.density});
    }
    if (config_.verbose) {
        std::cerr << "NsmEngine: search '" << normalized << "' via " << (useIndex ? "index" : "scan")
                  << " hits=" << results.size() << "\n";
    }
    return results;
}

ArchiveInfo NsmEngine::inspect(const std::string& archivePath) const {
    OpenArchive archive = openArchive(archivePath);
    ArchiveInfo info;
    info.header = archive.header;
    info.entries = std::move(archive.index.entries);
    info.searchTerms = archive.index.searchIndex.size();
    return info;
}

} // namespace nsm
