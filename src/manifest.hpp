#pragma once
#include "scanner.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace kushn {

constexpr const char* kDefaultManifestName = "kushn_result.json";
constexpr const char* kDefaultIgnoreFileName = ".kushnignore";

// Writes a manifest that lists itself.
//
// The write happens in two passes:
//   1. the entries are serialized and written to the target file;
//   2. that file is hashed, an entry {outputName, hash} is appended and the
//      extended list overwrites the file.
// The self-entry therefore describes the bytes written by pass 1, not the
// final file. Hashing the final bytes would change them again, so there is
// no fixpoint to chase; consumers verifying the self-entry must re-serialize
// the list without its last element and hash that.
class ManifestWriter {
public:
    explicit ManifestWriter(std::filesystem::path root);

    // Pretty-printed JSON array, two-space indent, "path" before "hash".
    // Throws SerializationError if an entry cannot be encoded.
    static std::string serialize(const std::vector<FileEntry>& entries);

    // Runs both passes and returns the final list (self-entry last).
    // `outputName` is relative to the root and is recorded verbatim. Throws
    // IoError if it is absolute or leads outside the root.
    std::vector<FileEntry> write(std::vector<FileEntry> entries, const std::string& outputName) const;

    std::filesystem::path output_path(const std::string& outputName) const;

private:
    void write_file(const std::filesystem::path& target, const std::string& text) const;

    std::filesystem::path root_;
};

// Parses a manifest file written by ManifestWriter. Throws IoError when the
// file cannot be read and SerializationError when it is not a manifest.
std::vector<FileEntry> read_manifest(const std::filesystem::path& file);

struct ManifestResult {
    std::vector<FileEntry> entries;             // self-entry last
    std::vector<TraversalFailure> failures;     // only under the lenient policy
    std::filesystem::path outputPath;
};

// Scans `root` with `rules` and writes the self-describing manifest to
// root/outputName. A file already at root/outputName (a previous run's
// manifest) is not listed as an ordinary entry, so the output name appears
// exactly once, as the self-entry.
ManifestResult generate_manifest(const std::filesystem::path& root,
                                 const std::vector<std::string>& rules,
                                 const std::string& outputName = kDefaultManifestName,
                                 TraversalPolicy policy = TraversalPolicy::Strict);

} // namespace kushn
