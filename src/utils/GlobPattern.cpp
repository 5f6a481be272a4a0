#include "GlobPattern.hpp"

#include <utility>

GlobPattern::GlobPattern(std::string pattern)
    : pattern_(std::move(pattern)),
      literal_(pattern_.find_first_of("*?") == std::string::npos) {}

bool GlobPattern::matches(const std::string& key) const {
    if (literal_) {
        return pattern_ == key;
    }
    return match(pattern_, key);
}

namespace {
    bool isContinuationByte(char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    // Index of the first byte after the UTF-8 sequence starting at i
    size_t nextCodePoint(const std::string& s, size_t i) {
        ++i;
        while (i < s.size() && isContinuationByte(s[i])) {
            ++i;
        }
        return i;
    }
}

// Greedy two-pointer match with backtracking to the last '*'.
// Linear in practice, O(n*m) worst case, no recursion. Literal characters
// compare byte by byte; '?' and '*' advance over whole UTF-8 code points.
bool GlobPattern::match(const std::string& pattern, const std::string& key) {
    size_t p = 0;
    size_t k = 0;
    size_t star = std::string::npos;
    size_t star_k = 0;

    while (k < key.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_k = k;
        } else if (p < pattern.size() && pattern[p] == '?') {
            ++p;
            k = nextCodePoint(key, k);
        } else if (p < pattern.size() && pattern[p] == key[k]) {
            ++p;
            ++k;
        } else if (star != std::string::npos) {
            p = star + 1;
            star_k = nextCodePoint(key, star_k);
            k = star_k;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::string GlobPattern::toRedisMatch() const {
    std::string escaped;
    escaped.reserve(pattern_.size());
    for (char c : pattern_) {
        if (c == '?') {
            // Redis '?' is one byte; widen it and let matches() narrow the result
            escaped.push_back('*');
            continue;
        }
        if (c == '[' || c == ']' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}
