#pragma once
#include "ignore.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kushn {

struct FileEntry {
    std::string path;   // relative to the scanned root, '/'-separated
    std::string hash;   // lowercase hex SHA-256 of the file's bytes
};

bool operator==(const FileEntry& lhs, const FileEntry& rhs);
bool operator!=(const FileEntry& lhs, const FileEntry& rhs);

// What to do when a directory entry cannot be read during the walk.
enum class TraversalPolicy {
    Strict,     // abort the scan with a TraversalError
    Lenient     // log a warning, record it in failures(), keep going
};

struct TraversalFailure {
    std::string path;
    std::string message;
};

struct ScanOptions {
    TraversalPolicy policy = TraversalPolicy::Strict;
    // Exact relative file paths left out of the result regardless of the
    // ignore rules.
    std::set<std::string> skipPaths;
};

// Depth-first walk over a directory tree, following symbolic links.
// Siblings are visited in byte-wise order of their names so the result is
// deterministic for a given filesystem state. Excluded directories are
// pruned without being read.
class Scanner {
public:
    explicit Scanner(IgnoreMatcher matcher, ScanOptions options = {});
    virtual ~Scanner() = default;

    // Hashes every non-excluded regular file under `root`. File read errors
    // always propagate as IoError, including a file that vanishes after the
    // directory was listed. A directory that cannot be read, or a
    // symlink leading back to one of its own ancestors, is handled by the
    // traversal policy; an unreadable root always throws.
    std::vector<FileEntry> scan(const std::filesystem::path& root);

    // Hashes one file, naming it relative to `root`. Returns nothing if the
    // ignore rules exclude it.
    std::optional<FileEntry> scan_file(const std::filesystem::path& root,
                                       const std::filesystem::path& file) const;

    // Entries skipped under the lenient policy during the last scan().
    const std::vector<TraversalFailure>& failures() const { return failures_; }

    const IgnoreMatcher& matcher() const { return matcher_; }
    const ScanOptions& options() const { return options_; }

protected:
    // Digest of one surviving file; sha256_file unless overridden.
    virtual std::string hash_file(const std::filesystem::path& file) const;

private:
    void walk(const std::filesystem::path& dir,
              const std::string& relDir,
              std::vector<std::filesystem::path>& ancestors,
              std::vector<FileEntry>& out);

    void report(const std::string& relPath, const std::string& message);

    IgnoreMatcher matcher_;
    ScanOptions options_;
    std::vector<TraversalFailure> failures_;
};

} // namespace kushn
