#pragma once

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "Constants.h"

namespace Tessera {

/**
 * @brief SHA-256 over OpenSSL EVP, hex-encoded lowercase output
 *
 * One-shot helpers cover chunk payloads; the incremental form is used to
 * hash staged files without reading them into memory.
 *
 * @code
 * SHA256 hasher;
 * hasher.update(buf, n);
 * std::string hex = hasher.finalHex();   // "" if OpenSSL failed
 * @endcode
 */
class SHA256 {
public:
    SHA256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            ctx_.reset();
        }
    }

    bool update(const void* data, size_t len) {
        if (!ctx_) return false;
        if (len == 0) return true;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            ctx_.reset();
            return false;
        }
        return true;
    }

    /// Finish the digest; the hasher cannot be reused afterwards
    std::string finalHex() {
        if (!ctx_) return "";
        unsigned char digest[SHA256_DIGEST_LENGTH];
        unsigned int digestLen = 0;
        bool ok = EVP_DigestFinal_ex(ctx_.get(), digest, &digestLen) == 1;
        ctx_.reset();
        if (!ok) return "";
        return toHex(digest, digestLen);
    }

    static std::string hash(const std::string& input) {
        return hashBytes(input.data(), input.size());
    }

    static std::string hashBytes(const std::vector<uint8_t>& data) {
        return hashBytes(data.data(), data.size());
    }

    static std::string hashBytes(const void* data, size_t len) {
        SHA256 hasher;
        if (!hasher.update(data, len)) return "";
        return hasher.finalHex();
    }

    /**
     * @brief Hash a file in HASH_READ_BUFFER_SIZE pieces
     * @return Hex digest, or "" if the file cannot be read
     */
    static std::string hashFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) return "";

        SHA256 hasher;
        std::vector<char> buffer(tsr::config::HASH_READ_BUFFER_SIZE);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = file.gcount();
            if (got > 0 && !hasher.update(buffer.data(), static_cast<size_t>(got))) {
                return "";
            }
        }
        if (file.bad()) return "";
        return hasher.finalHex();
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;

    static std::string toHex(const unsigned char* bytes, unsigned int len) {
        std::stringstream ss;
        for (unsigned int i = 0; i < len; ++i) {
            ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }
};

} // namespace Tessera
