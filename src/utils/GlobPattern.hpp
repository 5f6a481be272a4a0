#ifndef GLOBPATTERN_HPP
#define GLOBPATTERN_HPP

#include <string>

// Glob matcher for cache keys.
// '*' matches any run of characters (including none), '?' matches exactly one
// character. Keys are UTF-8: a character is a code point, not a byte.
// Matching is case-sensitive and anchored to the whole key; every other
// character, including '[' and '\\', is literal.
class GlobPattern {
public:
    explicit GlobPattern(std::string pattern);

    bool matches(const std::string& key) const;
    const std::string& pattern() const { return pattern_; }

    // True if the pattern has no wildcards, i.e. it names a single key.
    bool isLiteral() const { return literal_; }

    // Pattern text suitable for Redis SCAN MATCH: our literal characters that
    // Redis would treat as metacharacters are backslash-escaped and '?' becomes
    // '*'. The result may over-match; filter SCAN output through matches().
    std::string toRedisMatch() const;

    static bool match(const std::string& pattern, const std::string& key);

private:
    std::string pattern_;
    bool literal_;
};

#endif // GLOBPATTERN_HPP
