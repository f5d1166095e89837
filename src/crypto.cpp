#include "crypto.hpp"
#include <format>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <sstream>
#include <stdexcept>

namespace {
    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    std::string ToHex(const unsigned char* data, size_t len) {
        std::stringstream s;
        for (size_t i = 0; i < len; i++) {
            s << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
        }
        return s.str();
    }

    DigestContext NewSHA256Context() {
        DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (ctx == nullptr || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL) != 1) {
            throw std::runtime_error("Failed to initialize SHA256 digest");
        }
        return ctx;
    }

    std::string Finish(EVP_MD_CTX* ctx) {
        unsigned char result[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx, result, &hash_len) != 1) {
            throw std::runtime_error("Failed to finalize SHA256 digest");
        }
        return ToHex(result, hash_len);
    }
}

std::string Crypto::ComputeSHA256(const std::vector<char>& bytes) {
    auto ctx = NewSHA256Context();
    EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size());
    return Finish(ctx.get());
}

std::string Crypto::ComputeFileSHA256(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error(std::format("Failed to open {} for hashing", path.string()));
    }

    auto ctx = NewSHA256Context();
    std::vector<char> buf(1 << 16);
    while (file) {
        file.read(buf.data(), buf.size());
        if (auto n = file.gcount(); n > 0) {
            EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n));
        }
    }
    if (file.bad()) {
        throw std::runtime_error(std::format("Failed to read {} for hashing", path.string()));
    }
    return Finish(ctx.get());
}

std::string Crypto::RandomHex(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return ToHex(buf.data(), buf.size());
}
