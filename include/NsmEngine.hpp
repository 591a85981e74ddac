//NsmEngine.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include "nsm/Cipher.hpp"
#include "nsm/Compressor.hpp"
#include "nsm/Config.hpp"
#include "nsm/Errors.hpp"
#include "nsm/Format.hpp"
#include "nsm/UsageLedger.hpp"

namespace nsm {

struct ArchiveSummary {
    std::string outputPath;
    size_t fileCount = 0;
    uint64_t uncompressedBytes = 0;
    uint64_t dataBytes = 0;
    uint64_t indexBytes = 0;
    Algorithm algorithm = Algorithm::Zstd;
    Encryption encryption = Encryption::None;
    size_t searchTerms = 0;
    int64_t tokensRemaining = 0;
};

struct ExtractFailure {
    std::string path;
    ErrorCode code;
    std::string message;
};

struct ExtractReport {
    std::vector<std::string> extracted;
    std::vector<ExtractFailure> failures;

    bool complete() const { return failures.empty(); }
};

enum class SearchMode { Auto, Index, Scan };

struct SearchOptions {
    SearchMode mode = SearchMode::Auto;
    // 0 = Config::searchLimit
    size_t maxResults = 0;
};

struct SearchResult {
    std::string path;
    uint64_t matches = 0;
    double density = 0.0;
};

struct CreateOptions {
    std::optional<Algorithm> algorithm;
    std::optional<bool> encrypt;
    std::optional<bool> buildSearchIndex;
};

struct ArchiveInfo {
    Header header;
    std::vector<Entry> entries;
    size_t searchTerms = 0;
};

// Orchestrates archive creation, extraction and search. Holds references to the
// process-wide compressor and ledger; both must outlive the engine.
class NsmEngine {
public:
    NsmEngine(Config config, Compressor& compressor, UsageLedger& ledger);

    // Charges one token before writing anything. Throws ArchiveError.
    ArchiveSummary create(const std::string& outputPath, const std::vector<std::string>& inputPaths,
                          const CreateOptions& options = {});

    // Extract the named entries; unknown or unsafe names are reported per entry.
    ExtractReport extract(const std::string& archivePath, const std::vector<std::string>& paths,
                          const std::string& destinationDir) const;
    ExtractReport extractAll(const std::string& archivePath, const std::string& destinationDir) const;

    std::vector<SearchResult> search(const std::string& archivePath, const std::string& query,
                                     const SearchOptions& options = {}) const;

    ArchiveInfo inspect(const std::string& archivePath) const;

    const Config& config() const { return config_; }

private:
    struct OpenArchive {
        std::string path;
        std::ifstream in;
        Header header;
        Index index;
    };

    struct PendingInput {
        std::string sourcePath;
        std::string archivePath;
    };

    std::vector<PendingInput> collectInputs(const std::vector<std::string>& inputPaths) const;
    OpenArchive openArchive(const std::string& archivePath) const;
    void verifyDataBlock(const OpenArchive& archive) const;
    // Decoded, size- and CRC-verified content of one entry.
    std::string readEntry(OpenArchive& archive, const Entry& entry) const;
    void writeEntry(const Entry& entry, const std::string& content, const std::string& destinationDir) const;
    ExtractReport extractEntries(OpenArchive& archive, const std::vector<const Entry*>& selected,
                                 std::vector<ExtractFailure> failures, const std::string& destinationDir) const;
    const FrameCipher& cipher() const;

    Config config_;
    Compressor& compressor_;
    UsageLedger& ledger_;
    std::optional<FrameCipher> cipher_;
};

} // namespace nsm
