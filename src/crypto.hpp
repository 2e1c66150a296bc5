#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace kushn {

std::vector<unsigned char> sha256(const std::vector<unsigned char>& data);
std::vector<unsigned char> sha256(const std::string& data);
std::string hex_encode(const std::vector<unsigned char>& data);

// Streams the file at `path` through SHA-256 and returns the lowercase hex
// digest (64 characters). The file is read in binary mode and closed before
// returning. Throws IoError if the file cannot be opened or a read fails;
// no partial digest is ever returned.
std::string sha256_file(const std::filesystem::path& path);

} // namespace kushn
