#pragma once
#include "glob_pattern.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace kushn {

// Compiled form of the user's ignore rules. Each raw rule R yields
//   a directory form "R/**"  - the directory R (relative to the root) and
//                              everything beneath it
//   a file form      "**/R"  - any path in the tree that ends in R
// Backslashes in rules and queried paths are read as '/'.
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;

    // Throws PatternError naming the first rule that is not a valid glob.
    // Blank rules are skipped; a trailing '/' on a rule is dropped.
    explicit IgnoreMatcher(const std::vector<std::string>& rules);

    // True if `relPath` must be left out of the manifest. For a directory
    // this also means the traversal must not descend into it.
    bool excludes(const std::string& relPath, bool isDir) const;

    bool excludes_directory(const std::string& relPath) const;
    bool excludes_file(const std::string& relPath) const;

    const std::vector<std::string>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }

private:
    std::vector<std::string> rules_;
    std::vector<GlobPattern> dirPatterns_;
    std::vector<GlobPattern> filePatterns_;
};

std::string normalize_separators(std::string path);

// Reads an ignore file: one rule per line, surrounding whitespace trimmed,
// blank lines dropped, order preserved. Throws IoError if it cannot be read.
std::vector<std::string> load_ignore_file(const std::filesystem::path& file);

} // namespace kushn
