#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nsm {

// Simple text analyzer for tokenization; split on non-alnum and lowercase.
class Analyzer {
public:
    static std::vector<std::string> tokenize(std::string_view text);
    // Same, and reports whether any token was too long to keep.
    static std::vector<std::string> tokenize(std::string_view text, bool& droppedOverlong);

    // Lowercase and trim surrounding whitespace; used to decide whether a query
    // is a single token or needs substring matching.
    static std::string normalizeQuery(std::string_view query);

    // Longest token the index block can store (u16 term length).
    static constexpr size_t kMaxTokenLength = 0xFFFF;
};

} // namespace nsm
