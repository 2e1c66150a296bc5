#pragma once
#include <regex>
#include <string>

namespace kushn {

// A shell-style glob compiled to a regular expression.
//
//   ?        any single character
//   *        any run of characters, '/' included
//   **       any number of whole path components; must stand alone
//            between separators ("a/**/b", "**/x", "x/**")
//   [abc]    one of the listed characters, ranges allowed ("[a-z]")
//   [!abc]   any character not listed
//
// Matching is case-sensitive and always anchored at both ends.
class GlobPattern {
public:
    // Throws PatternError if `pattern` is not a valid glob.
    explicit GlobPattern(const std::string& pattern);

    bool matches(const std::string& path) const;

    const std::string& str() const { return pattern_; }

private:
    static std::string glob_to_regex(const std::string& glob);

    std::string pattern_;
    std::regex regex_;
};

} // namespace kushn
