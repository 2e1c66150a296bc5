#include "scanner.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace kushn {

bool operator==(const FileEntry& lhs, const FileEntry& rhs) {
    return lhs.path == rhs.path && lhs.hash == rhs.hash;
}

bool operator!=(const FileEntry& lhs, const FileEntry& rhs) {
    return !(lhs == rhs);
}

Scanner::Scanner(IgnoreMatcher matcher, ScanOptions options)
    : matcher_(std::move(matcher))
    , options_(std::move(options))
{
}

std::vector<FileEntry> Scanner::scan(const fs::path& root) {
    failures_.clear();

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw IoError(root.string() + " is not a directory", root.generic_string());
    }

    std::vector<fs::path> ancestors;
    fs::path canonicalRoot = fs::canonical(root, ec);
    ancestors.push_back(ec ? root : canonicalRoot);

    std::vector<FileEntry> entries;
    walk(root, "", ancestors, entries);

    KUSHN_LOG(Info, "scanned %s: %zu files, %zu skipped entries",
              root.string().c_str(), entries.size(), failures_.size());
    return entries;
}

void Scanner::walk(const fs::path& dir,
                   const std::string& relDir,
                   std::vector<fs::path>& ancestors,
                   std::vector<FileEntry>& out)
{
    std::error_code ec;
    std::vector<fs::directory_entry> children;

    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        std::string message = "cannot read directory " + dir.string() + ": " + ec.message();
        if (relDir.empty()) {
            throw TraversalError(message, dir.generic_string());
        }
        report(relDir, message);
        return;
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().native() < b.path().filename().native();
              });

    for (const auto& child : children) {
        std::string name = normalize_separators(child.path().filename().generic_string());
        std::string rel = relDir.empty() ? name : relDir + "/" + name;

        // status() follows symlinks.
        fs::file_status st = child.status(ec);
        if (st.type() == fs::file_type::not_found) {
            std::error_code linkEc;
            if (fs::is_symlink(fs::symlink_status(child.path(), linkEc))) {
                KUSHN_LOG(Debug, "skipping dangling symlink %s", rel.c_str());
                continue;
            }
            // Listed a moment ago, gone now.
            throw IoError(child.path().string() + " disappeared during the scan", rel);
        }
        if (ec) {
            report(rel, "cannot stat " + child.path().string() + ": " + ec.message());
            continue;
        }

        if (fs::is_directory(st)) {
            if (matcher_.excludes_directory(rel)) {
                KUSHN_LOG(Debug, "pruned directory %s", rel.c_str());
                continue;
            }

            fs::path canonical = child.path();
            if (child.is_symlink(ec)) {
                canonical = fs::canonical(child.path(), ec);
                if (ec) {
                    report(rel, "cannot resolve symlink " + child.path().string() + ": " + ec.message());
                    continue;
                }
                if (std::find(ancestors.begin(), ancestors.end(), canonical) != ancestors.end()) {
                    report(rel, "file system loop found: " + child.path().string()
                                + " points to an ancestor " + canonical.string());
                    continue;
                }
            } else {
                fs::path resolved = fs::canonical(child.path(), ec);
                if (!ec) canonical = resolved;
            }

            ancestors.push_back(canonical);
            walk(child.path(), rel, ancestors, out);
            ancestors.pop_back();
        } else if (fs::is_regular_file(st)) {
            if (options_.skipPaths.count(rel)) {
                KUSHN_LOG(Debug, "skipping %s", rel.c_str());
                continue;
            }
            if (matcher_.excludes_file(rel)) {
                KUSHN_LOG(Debug, "ignored file %s", rel.c_str());
                continue;
            }
            out.push_back(FileEntry{rel, hash_file(child.path())});
        } else {
            KUSHN_LOG(Debug, "skipping non-regular file %s", rel.c_str());
        }
    }
}

void Scanner::report(const std::string& relPath, const std::string& message) {
    if (options_.policy == TraversalPolicy::Strict) {
        throw TraversalError(message, relPath);
    }
    KUSHN_LOG(Warn, "%s", message.c_str());
    failures_.push_back(TraversalFailure{relPath, message});
}

std::string Scanner::hash_file(const fs::path& file) const {
    return sha256_file(file);
}

std::optional<FileEntry> Scanner::scan_file(const fs::path& root, const fs::path& file) const {
    std::error_code ec;
    fs::path absRoot = fs::absolute(root, ec);
    if (ec) {
        throw IoError("cannot resolve " + root.string() + ": " + ec.message(), root.generic_string());
    }
    fs::path absFile = file.is_absolute() ? file : absRoot / file;

    fs::path rel = absFile.lexically_normal().lexically_relative(absRoot.lexically_normal());
    std::string relStr = normalize_separators(rel.generic_string());
    if (rel.empty() || relStr == "." || *rel.begin() == "..") {
        throw TraversalError(file.string() + " is not inside " + root.string(), file.generic_string());
    }

    if (matcher_.excludes_file(relStr)) {
        return std::nullopt;
    }
    return FileEntry{relStr, hash_file(absFile)};
}

} // namespace kushn
