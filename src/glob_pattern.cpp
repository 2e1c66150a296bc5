#include "glob_pattern.hpp"
#include "errors.hpp"
#include <cctype>

namespace kushn {

namespace {

const char* const kAnyChar = "[\\s\\S]";
const char* const kNoChar = "[^\\s\\S]";
const char* const kAnyRun = "[\\s\\S]*";
// Zero or more leading components, each ending in '/'.
const char* const kAnyComponents = "(?:[\\s\\S]*/)?";

void append_literal(std::string& out, char c) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '/' && c != '_') {
        out += '\\';
    }
    out += c;
}

void append_class_char(std::string& out, char c) {
    if (!std::isalnum(static_cast<unsigned char>(c))) {
        out += '\\';
    }
    out += c;
}

// Translates the body of a bracket expression ("a-z0", without the
// brackets or the leading '!') into regex class items. Reversed ranges
// such as "z-a" match nothing and are dropped.
std::string class_items(const std::string& body) {
    std::string items;
    std::size_t i = 0;
    while (i < body.size()) {
        if (i + 2 < body.size() && body[i + 1] == '-') {
            char lo = body[i];
            char hi = body[i + 2];
            if (static_cast<unsigned char>(lo) <= static_cast<unsigned char>(hi)) {
                append_class_char(items, lo);
                items += '-';
                append_class_char(items, hi);
            }
            i += 3;
        } else {
            append_class_char(items, body[i]);
            ++i;
        }
    }
    return items;
}

} // namespace

GlobPattern::GlobPattern(const std::string& pattern)
    : pattern_(pattern)
{
    std::string expr = glob_to_regex(pattern);
    try {
        regex_ = std::regex(expr, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw PatternError(pattern, std::string("cannot compile: ") + e.what());
    }
}

bool GlobPattern::matches(const std::string& path) const {
    return std::regex_match(path, regex_);
}

std::string GlobPattern::glob_to_regex(const std::string& glob) {
    std::string out;
    std::size_t i = 0;
    const std::size_t n = glob.size();
    bool lastWasRecursive = false;

    while (i < n) {
        char c = glob[i];

        if (c == '*') {
            std::size_t start = i;
            while (i < n && glob[i] == '*') ++i;
            std::size_t count = i - start;

            if (count > 2) {
                throw PatternError(glob, "wildcards are either regular `*` or recursive `**`");
            }
            if (count == 1) {
                out += kAnyRun;
                lastWasRecursive = false;
                continue;
            }

            bool boundedBefore = start == 0 || glob[start - 1] == '/';
            bool boundedAfter = i == n || glob[i] == '/';
            if (!boundedBefore || !boundedAfter) {
                throw PatternError(glob, "recursive wildcards must form a single path component");
            }

            if (i == n) {
                out += kAnyRun;
            } else {
                ++i; // the separator belongs to the recursive wildcard
                if (!lastWasRecursive) {
                    out += kAnyComponents;
                }
            }
            lastWasRecursive = true;
            continue;
        }

        lastWasRecursive = false;

        if (c == '?') {
            out += kAnyChar;
            ++i;
        } else if (c == '[') {
            // The first character after '[' (or "[!") is always part of the
            // set, which is how "[]]" names a literal ']'.
            bool negated = i + 1 < n && glob[i + 1] == '!';
            std::size_t bodyStart = i + (negated ? 2 : 1);
            std::size_t close = bodyStart < n ? glob.find(']', bodyStart + 1) : std::string::npos;
            if (close == std::string::npos) {
                throw PatternError(glob, "invalid range pattern");
            }

            std::string items = class_items(glob.substr(bodyStart, close - bodyStart));
            if (items.empty()) {
                out += negated ? kAnyChar : kNoChar;
            } else {
                out += negated ? "[^" : "[";
                out += items;
                out += ']';
            }
            i = close + 1;
        } else {
            append_literal(out, c);
            ++i;
        }
    }
    return out;
}

} // namespace kushn
