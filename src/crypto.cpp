#include "crypto.hpp"
#include "errors.hpp"
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace {
    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    std::string ToHex(const unsigned char* digest, unsigned int length) {
        std::stringstream s;
        for (unsigned int i = 0; i < length; i++) {
            s << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
        }
        return s.str();
    }
}

std::string Crypto::ComputeSHA256(const std::vector<char>& bytes) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), NULL);
    EVP_DigestUpdate(ctx, bytes.data(), bytes.size());

    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx, result, &hash_len);
    EVP_MD_CTX_free(ctx);

    return ToHex(result, hash_len);
}

std::string Crypto::ComputeFileSHA256(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Failed to open file for hashing", path, std::make_error_code(std::errc::io_error));
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL) != 1) {
        throw IOError("Failed to initialize SHA-256 digest", path, std::make_error_code(std::errc::not_enough_memory));
    }

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), buffer.size());
        if (auto n = file.gcount(); n > 0)
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n));
    }
    if (file.bad()) {
        throw IOError("Failed to read file for hashing", path, std::make_error_code(std::errc::io_error));
    }

    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx.get(), result, &hash_len);
    return ToHex(result, hash_len);
}
