#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "result.hpp"

// Content digests for confirming a transfer on disk. Transfer decisions only
// ever compare sizes.
class HashUtils {
public:

    static std::string computeStrongHash(const char* data, size_t len) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        EVP_Digest(data, len, hash, &hashLen, EVP_sha1(), nullptr);
        return toHex(hash, hashLen);
    }

    static Result<std::string> computeFileHash(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string>::Error("Failed to open file: " + path);
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return Result<std::string>::Error("Failed to initialise SHA-1 context");
        }

        std::vector<char> buffer(64 * 1024);
        while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
            EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(file.gcount()));
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);

        return Result<std::string>::Ok(toHex(hash, hashLen));
    }

private:
    static std::string toHex(const unsigned char* hash, unsigned int len) {
        static const char* hex = "0123456789abcdef";
        std::string result;
        for (unsigned int i = 0; i < len; ++i) {
            result += hex[(hash[i] >> 4) & 0xF];
            result += hex[hash[i] & 0xF];
        }
        return result;
    }
};
