#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "nsm/Format.hpp"

namespace nsm::algo {

struct SearchHit {
    uint32_t entry;
    uint64_t matches;
    double density;
};

// AND over the persisted search index: entries containing every term, where a
// term matches any indexed token it is a substring of. matches sums the
// occurrences across the query terms. No frame is decoded.
std::vector<SearchHit> searchIndexed(const Index& index, const std::vector<std::string>& terms);

// Case-insensitive, non-overlapping occurrences of `needleLower` (already lowercased).
uint64_t countOccurrences(std::string_view haystack, std::string_view needleLower);

double matchDensity(uint64_t matches, uint64_t size);

// Descending density, then path ascending; truncated to maxResults.
void rankHits(std::vector<SearchHit>& hits, const Index& index, size_t maxResults);

} // namespace nsm::algo
