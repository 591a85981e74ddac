#include "nsm/algorithms/SearchAlgorithms.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <numeric>

namespace nsm::algo {

namespace {

// Per-entry matches for one query term, sorted by entry ordinal.
using HitList = std::vector<SearchHit>;

// Every dictionary term containing `needle` contributes its occurrences of
// `needle` times its term frequency. Terms and needle are lowercase alnum, so
// this equals what a scan of the decoded frames would count.
HitList collectTermHits(const Index& index, const std::string& needle) {
    std::map<uint32_t, uint64_t> byEntry;
    auto exact = index.searchIndex.find(needle);
    if (exact != index.searchIndex.end()) {
        for (const auto& p : exact->second) byEntry[p.entry] += p.tf;
    }
    for (const auto& kv : index.searchIndex) {
        if (kv.first.size() <= needle.size()) continue;
        const uint64_t perToken = countOccurrences(kv.first, needle);
        if (perToken == 0) continue;
        for (const auto& p : kv.second) byEntry[p.entry] += perToken * p.tf;
    }

    HitList out;
    out.reserve(byEntry.size());
    for (const auto& kv : byEntry) out.push_back({kv.first, kv.second, 0.0});
    return out;
}

// Intersect all hit lists (AND semantics); lists are sorted by entry ordinal.
std::vector<SearchHit> intersectAll(const std::vector<HitList>& lists) {
    std::vector<size_t> order(lists.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return lists[a].size() < lists[b].size();
    });

    std::vector<size_t> pos(lists.size(), 0);
    std::vector<SearchHit> out;
    uint32_t target = lists[order[0]][0].entry;

    while (true) {
        bool anyEnd = false;
        uint32_t maxEntry = target;
        for (size_t idx : order) {
            const auto& plist = lists[idx];
            while (pos[idx] < plist.size() && plist[pos[idx]].entry < target) ++pos[idx];
            if (pos[idx] >= plist.size()) { anyEnd = true; break; }
            maxEntry = std::max(maxEntry, plist[pos[idx]].entry);
        }
        if (anyEnd) break;

        bool allEqual = true;
        for (size_t idx : order) {
            if (lists[idx][pos[idx]].entry != maxEntry) {
                allEqual = false;
                break;
            }
        }
        if (allEqual) {
            uint64_t matches = 0;
            for (size_t idx : order) {
                matches += lists[idx][pos[idx]].matches;
                ++pos[idx];
            }
            out.push_back({maxEntry, matches, 0.0});
            if (pos[order[0]] >= lists[order[0]].size()) break;
            target = lists[order[0]][pos[order[0]]].entry;
        } else {
            target = maxEntry;
        }
    }
    return out;
}

} // namespace

std::vector<SearchHit> searchIndexed(const Index& index, const std::vector<std::string>& terms) {
    if (terms.empty()) return {};

    std::vector<HitList> lists;
    lists.reserve(terms.size());
    for (const auto& term : terms) {
        HitList hits = collectTermHits(index, term);
        if (hits.empty()) return {};
        lists.push_back(std::move(hits));
    }

    auto hits = intersectAll(lists);
    for (auto& hit : hits) {
        hit.density = matchDensity(hit.matches, index.entries[hit.entry].uncompressedSize);
    }
    return hits;
}

uint64_t countOccurrences(std::string_view haystack, std::string_view needleLower) {
    if (needleLower.empty() || needleLower.size() > haystack.size()) return 0;
    uint64_t count = 0;
    size_t i = 0;
    const size_t last = haystack.size() - needleLower.size();
    while (i <= last) {
        size_t k = 0;
        while (k < needleLower.size() &&
               static_cast<char>(std::tolower(static_cast<unsigned char>(haystack[i + k]))) == needleLower[k]) {
            ++k;
        }
        if (k == needleLower.size()) {
            ++count;
            i += needleLower.size();
        } else {
            ++i;
        }
    }
    return count;
}

double matchDensity(uint64_t matches, uint64_t size) {
    return static_cast<double>(matches) / static_cast<double>(std::max<uint64_t>(1, size));
}

void rankHits(std::vector<SearchHit>& hits, const Index& index, size_t maxResults) {
    std::sort(hits.begin(), hits.end(), [&](const SearchHit& a, const SearchHit& b) {
        if (a.density != b.density) return a.density > b.density;
        return index.entries[a.entry].path < index.entries[b.entry].path;
    });
    if (maxResults > 0 && hits.size() > maxResults) hits.resize(maxResults);
}

} // namespace nsm::algo
