#include "NsmEngine.hpp"
#include "nsm/algorithms/SearchAlgorithms.hpp"
#include "TestSupport.hpp"

#include <vector>

using namespace nsm;

static std::vector<std::string> paths(const std::vector<SearchResult>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) out.push_back(r.path);
    return out;
}

static bool sameResults(const std::vector<SearchResult>& a, const std::vector<SearchResult>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].path != b[i].path || a[i].matches != b[i].matches) return false;
    }
    return true;
}

int main() {
    // Scanning primitives
    expect(algo::countOccurrences("aaaa", "aa") == 2, "occurrences do not overlap");
    expect(algo::countOccurrences("Hello HELLO hello", "hello") == 3, "occurrences ignore case");
    expect(algo::countOccurrences("abc", "") == 0, "empty needle never matches");
    expect(algo::countOccurrences("ab", "abc") == 0, "needle longer than haystack");
    expect(algo::matchDensity(3, 0) == 3.0, "density of an empty file divides by one");
    expect(algo::matchDensity(1, 4) == 0.25, "density is matches per byte");

    const fs::path root = freshDir("search");
    const fs::path src = root / "src";
    writeFile(src / "alpha.txt", "The quick brown fox");
    writeFile(src / "beta.txt", "lazy dog sleeps");
    writeFile(src / "gamma.txt", "Quick quick QUICK thinking");
    writeFile(src / "y.txt", "same words");
    writeFile(src / "x.txt", "same words");

    Config cfg;
    cfg.homeDir = root.string();
    Compressor compressor;
    UsageLedger ledger((root / UsageLedger::kFileName).string(), 5);
    NsmEngine engine(cfg, compressor, ledger);

    const fs::path archive = root / "corpus.nsm";
    engine.create(archive.string(), {(src / "alpha.txt").string(), (src / "beta.txt").string(),
                                     (src / "gamma.txt").string(), (src / "y.txt").string(),
                                     (src / "x.txt").string()});
    const int64_t tokens = ledger.availableTokens();
    const SearchOptions indexed{SearchMode::Index, 0};
    const SearchOptions scanned{SearchMode::Scan, 0};

    // Single token: index and scan agree, ranked by density
    {
        auto viaIndex = engine.search(archive.string(), "quick", indexed);
        auto viaScan = engine.search(archive.string(), "quick", scanned);
        auto automatic = engine.search(archive.string(), "  QUICK ");
        std::vector<std::string> want{"gamma.txt", "alpha.txt"};
        expect(paths(viaIndex) == want, "index ranks denser file first");
        expect(viaIndex[0].matches == 3 && viaIndex[1].matches == 1, "index match counts");
        expect(sameResults(viaIndex, viaScan), "index and scan agree");
        expect(sameResults(viaIndex, automatic), "auto mode normalizes the query");
        expect(viaIndex[0].density > viaIndex[1].density, "density ordering");
    }

    // A term present in exactly one file
    {
        auto viaIndex = engine.search(archive.string(), "sleeps", indexed);
        auto viaScan = engine.search(archive.string(), "sleeps", scanned);
        expect(paths(viaIndex) == std::vector<std::string>{"beta.txt"}, "unique term via index");
        expect(paths(viaScan) == std::vector<std::string>{"beta.txt"}, "unique term via scan");
        expect(engine.search(archive.string(), "absent").empty(), "absent term finds nothing");
    }

    // Phrases fall back to scanning; a word inside a longer token is still found by the index
    {
        auto phrase = engine.search(archive.string(), "brown fox");
        expect(paths(phrase) == std::vector<std::string>{"alpha.txt"}, "phrase search");
        auto substring = engine.search(archive.string(), "uic");
        expect(paths(substring) == (std::vector<std::string>{"gamma.txt", "alpha.txt"}), "substring search");
        auto substringIndexed = engine.search(archive.string(), "uic", indexed);
        auto substringScanned = engine.search(archive.string(), "uic", scanned);
        expect(sameResults(substringIndexed, substringScanned), "substring of indexed tokens matches the scan");
        expect(sameResults(substring, substringScanned), "auto substring search matches the scan");
        auto both = engine.search(archive.string(), "quick fox", indexed);
        expect(paths(both) == std::vector<std::string>{"alpha.txt"}, "index mode intersects terms");
        expect(both[0].matches == 2, "intersection sums term frequencies");
    }

    // Query embedded in longer tokens: every tier returns the same files
    {
        const fs::path words = root / "words";
        writeFile(words / "a.txt", "helloworld");
        writeFile(words / "b.txt", "goodbye");
        writeFile(words / "c.txt", "othello met hello_world2 and HELLO");
        writeFile(words / "d.txt", "hellohello");
        const fs::path embedded = root / "embedded.nsm";
        engine.create(embedded.string(), {words.string()});

        auto viaIndex = engine.search(embedded.string(), "hello", indexed);
        auto viaScan = engine.search(embedded.string(), "hello", scanned);
        auto automatic = engine.search(embedded.string(), "hello");
        std::vector<std::string> want{"words/d.txt", "words/a.txt", "words/c.txt"};
        expect(paths(viaScan) == want, "scan finds the word inside longer tokens");
        expect(sameResults(viaIndex, viaScan), "index finds the word inside longer tokens");
        expect(sameResults(automatic, viaScan), "auto finds the word inside longer tokens");
        expect(viaIndex[0].matches == 2 && viaIndex[2].matches == 3, "embedded occurrences are counted");
    }

    // A token too long for the index leaves the archive without one
    {
        const fs::path blob = root / "blob.txt";
        writeFile(blob, "start " + std::string(70000, 'x') + "needle end");
        const fs::path unindexed = root / "blob.nsm";
        engine.create(unindexed.string(), {blob.string()});
        expect(engine.inspect(unindexed.string()).searchTerms == 0, "no terms stored");
        expectError(ErrorCode::InvalidArgument, [&] { engine.search(unindexed.string(), "needle", indexed); },
                    "archive has no search index");
        auto found = engine.search(unindexed.string(), "needle");
        expect(paths(found) == std::vector<std::string>{"blob.txt"}, "auto scans the overlong token");
    }

    // Equal density breaks ties by path
    {
        auto tie = engine.search(archive.string(), "same");
        expect(paths(tie) == (std::vector<std::string>{"x.txt", "y.txt"}), "ties ordered by path");
    }

    // Result cap
    {
        SearchOptions capped{SearchMode::Auto, 1};
        auto one = engine.search(archive.string(), "quick", capped);
        expect(one.size() == 1 && one[0].path == "gamma.txt", "capped index results keep the best hit");
        SearchOptions cappedScan{SearchMode::Scan, 1};
        auto firstFound = engine.search(archive.string(), "quick", cappedScan);
        expect(firstFound.size() == 1 && firstFound[0].path == "alpha.txt", "scan stops at the first match");
    }

    // Errors
    expectError(ErrorCode::InvalidArgument, [&] { engine.search(archive.string(), "   "); }, "empty query");
    {
        const fs::path plain = root / "plain.nsm";
        CreateOptions noIndex;
        noIndex.buildSearchIndex = false;
        engine.create(plain.string(), {(src / "alpha.txt").string(), (src / "beta.txt").string()}, noIndex);
        expectError(ErrorCode::InvalidArgument, [&] { engine.search(plain.string(), "quick", indexed); },
                    "index mode needs a search index");
        auto fallback = engine.search(plain.string(), "quick");
        expect(paths(fallback) == std::vector<std::string>{"alpha.txt"}, "auto mode scans without an index");
    }

    expect(ledger.availableTokens() == tokens - 3, "searching is free");

    fs::remove_all(root);
    std::cout << "All search tests passed." << std::endl;
    return 0;
}
