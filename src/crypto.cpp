#include "crypto.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace kushn {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

std::vector<unsigned char> sha256(const std::vector<unsigned char>& data) {
    std::vector<unsigned char> hash(SHA256_DIGEST_LENGTH);
    SHA256(data.data(), data.size(), hash.data());
    return hash;
}

std::vector<unsigned char> sha256(const std::string& data) {
    std::vector<unsigned char> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return hash;
}

std::string hex_encode(const std::vector<unsigned char>& data) {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return oss.str();
}

std::string sha256_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw IoError(path.string() + " is a directory", path.generic_string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError("cannot open file " + path.string(), path.generic_string());
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw IoError("failed to initialise SHA-256 context for " + path.string(),
                      path.generic_string());
    }

    std::array<char, kReadChunk> buffer;
    while (in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            throw IoError("SHA-256 update failed for " + path.string(), path.generic_string());
        }
    }
    // eof alone is the normal end of stream; badbit means the read itself failed.
    if (in.bad()) {
        throw IoError("read failed for " + path.string(), path.generic_string());
    }

    std::vector<unsigned char> hash(EVP_MAX_MD_SIZE);
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hashLen) != 1) {
        throw IoError("SHA-256 finalisation failed for " + path.string(), path.generic_string());
    }
    hash.resize(hashLen);

    KUSHN_LOG(Debug, "hashed %s", path.string().c_str());
    return hex_encode(hash);
}

} // namespace kushn
