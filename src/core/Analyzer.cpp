#include "nsm/Analyzer.hpp"

#include <cctype>

namespace nsm {

std::vector<std::string> Analyzer::tokenize(std::string_view text) {
    bool dropped = false;
    return tokenize(text, dropped);
}

std::vector<std::string> Analyzer::tokenize(std::string_view text, bool& droppedOverlong) {
    std::vector<std::string> tokens;
    std::string current;
    droppedOverlong = false;

    auto flush = [&]() {
        if (current.size() > kMaxTokenLength) {
            droppedOverlong = true;
        } else if (!current.empty()) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (unsigned char ch : text) {
        if (std::isalnum(ch)) {
            current.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            flush();
        }
    }
    flush();

    return tokens;
}

std::string Analyzer::normalizeQuery(std::string_view query) {
    size_t begin = 0;
    size_t end = query.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(query[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(query[end - 1]))) --end;

    std::string out;
    out.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(query[i]))));
    }
    return out;
}

} // namespace nsm
