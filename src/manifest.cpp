#include "manifest.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <utility>

using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace kushn {

namespace {

// The manifest lives inside the root and names itself relative to it.
void check_output_name(const std::string& outputName) {
    fs::path name(outputName);
    fs::path normal = name.lexically_normal();
    if (outputName.empty() || name.is_absolute() || name.has_root_path()
        || normal.empty() || normal == "." || *normal.begin() == "..") {
        throw IoError("output file name must be a path inside the processed directory: '"
                      + outputName + "'", outputName);
    }
}

} // namespace

ManifestWriter::ManifestWriter(fs::path root)
    : root_(std::move(root))
{
}

std::string ManifestWriter::serialize(const std::vector<FileEntry>& entries) {
    json j = json::array();
    for (const auto& entry : entries) {
        json obj;
        obj["path"] = entry.path;
        obj["hash"] = entry.hash;
        j.push_back(std::move(obj));
    }
    try {
        return j.dump(2);
    } catch (const json::exception& e) {
        throw SerializationError(e.what());
    }
}

fs::path ManifestWriter::output_path(const std::string& outputName) const {
    return root_ / outputName;
}

void ManifestWriter::write_file(const fs::path& target, const std::string& text) const {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError("cannot create output file " + target.string(), target.generic_string());
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        throw IoError("failed writing output file " + target.string(), target.generic_string());
    }
}

std::vector<FileEntry> ManifestWriter::write(std::vector<FileEntry> entries,
                                             const std::string& outputName) const
{
    check_output_name(outputName);
    fs::path target = output_path(outputName);

    write_file(target, serialize(entries));

    // Pass 1 bytes, read back from disk.
    std::string selfHash = sha256_file(target);
    entries.push_back(FileEntry{outputName, selfHash});

    write_file(target, serialize(entries));

    KUSHN_LOG(Info, "wrote %zu entries to %s", entries.size(), target.string().c_str());
    return entries;
}

std::vector<FileEntry> read_manifest(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw IoError("cannot open manifest " + file.string(), file.generic_string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::vector<FileEntry> entries;
    try {
        json j = json::parse(text);
        if (!j.is_array()) {
            throw SerializationError(file.string() + " is not a JSON array");
        }
        for (const auto& obj : j) {
            entries.push_back(FileEntry{
                obj.at("path").get<std::string>(),
                obj.at("hash").get<std::string>()
            });
        }
    } catch (const json::exception& e) {
        throw SerializationError(file.string() + ": " + e.what());
    }
    return entries;
}

ManifestResult generate_manifest(const fs::path& root,
                                 const std::vector<std::string>& rules,
                                 const std::string& outputName,
                                 TraversalPolicy policy)
{
    // Arguments are validated before anything touches the disk.
    check_output_name(outputName);
    IgnoreMatcher matcher(rules);

    ScanOptions options;
    options.policy = policy;
    options.skipPaths.insert(normalize_separators(fs::path(outputName).lexically_normal().generic_string()));

    Scanner scanner(std::move(matcher), std::move(options));
    std::vector<FileEntry> entries = scanner.scan(root);

    ManifestWriter writer(root);
    ManifestResult result;
    result.entries = writer.write(std::move(entries), outputName);
    result.failures = scanner.failures();
    result.outputPath = writer.output_path(outputName);
    return result;
}

} // namespace kushn
