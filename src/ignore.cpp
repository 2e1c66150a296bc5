#include "ignore.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <fstream>

namespace kushn {

namespace {

bool any_match(const std::vector<GlobPattern>& patterns, const std::string& path) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const GlobPattern& p) { return p.matches(path); });
}

} // namespace

std::string normalize_separators(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

IgnoreMatcher::IgnoreMatcher(const std::vector<std::string>& rules) {
    for (const auto& raw : rules) {
        std::string rule = normalize_separators(raw);
        while (rule.size() > 1 && rule.back() == '/') {
            rule.pop_back();
        }
        if (rule.empty()) {
            KUSHN_LOG(Debug, "skipping blank ignore rule");
            continue;
        }

        try {
            dirPatterns_.emplace_back(rule + "/**");
            filePatterns_.emplace_back("**/" + rule);
        } catch (const PatternError& e) {
            throw PatternError(raw, e.reason());
        }
        rules_.push_back(rule);
        KUSHN_LOG(Debug, "ignore rule '%s' compiled", rule.c_str());
    }
}

bool IgnoreMatcher::excludes(const std::string& relPath, bool isDir) const {
    return isDir ? excludes_directory(relPath) : excludes_file(relPath);
}

bool IgnoreMatcher::excludes_directory(const std::string& relPath) const {
    // "R/**" also covers R itself: the recursive tail matches the empty
    // remainder of "R/".
    std::string path = normalize_separators(relPath);
    if (path.empty() || path.back() != '/') {
        path += '/';
    }
    return any_match(dirPatterns_, path);
}

bool IgnoreMatcher::excludes_file(const std::string& relPath) const {
    std::string path = normalize_separators(relPath);
    return any_match(dirPatterns_, path) || any_match(filePatterns_, path);
}

std::vector<std::string> load_ignore_file(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw IoError("cannot open ignore file " + file.string(), file.generic_string());
    }

    std::vector<std::string> rules;
    std::string line;
    while (std::getline(in, line)) {
        boost::algorithm::trim(line);
        if (!line.empty()) {
            rules.push_back(line);
        }
    }
    if (in.bad()) {
        throw IoError("failed reading ignore file " + file.string(), file.generic_string());
    }

    KUSHN_LOG(Info, "loaded %zu ignore rules from %s", rules.size(), file.string().c_str());
    return rules;
}

} // namespace kushn
