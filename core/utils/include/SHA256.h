#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <fstream>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>

namespace QuietSync {

/**
 * @brief Simple SHA256 hashing utility
 *
 * All functions return a lowercase hex digest, or an empty string if
 * OpenSSL or the underlying read failed.
 */
class SHA256 {
public:
    /**
     * @brief Incremental digest over data delivered in pieces
     */
    class Context {
    public:
        Context() : ctx_(EVP_MD_CTX_new()) {
            if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
                EVP_MD_CTX_free(ctx_);
                ctx_ = nullptr;
            }
        }

        ~Context() {
            if (ctx_) EVP_MD_CTX_free(ctx_);
        }

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

        bool valid() const { return ctx_ != nullptr && !finished_; }

        bool update(const void* data, size_t length) {
            if (!valid()) return false;
            if (length == 0) return true;
            if (EVP_DigestUpdate(ctx_, data, length) != 1) {
                EVP_MD_CTX_free(ctx_);
                ctx_ = nullptr;
                return false;
            }
            return true;
        }

        /// Finish the digest. The context cannot be updated afterwards.
        std::string finalHex() {
            if (!valid()) return "";
            unsigned char hash[SHA256_DIGEST_LENGTH];
            unsigned int hashLen = 0;
            finished_ = true;
            if (EVP_DigestFinal_ex(ctx_, hash, &hashLen) != 1) {
                return "";
            }
            return toHex(hash, hashLen);
        }

    private:
        EVP_MD_CTX* ctx_;
        bool finished_ = false;
    };

    /**
     * @brief Hash a string to hex-encoded SHA256
     */
    static std::string hash(const std::string& input) {
        Context ctx;
        if (!ctx.update(input.data(), input.size())) return "";
        return ctx.finalHex();
    }

    /**
     * @brief Hash binary data to hex-encoded SHA256
     */
    static std::string hashBytes(const std::vector<uint8_t>& data) {
        Context ctx;
        if (!ctx.update(data.data(), data.size())) return "";
        return ctx.finalHex();
    }

    /**
     * @brief Hash a file's full contents, streaming it in 64KB pieces
     */
    static std::string hashFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) return "";

        Context ctx;
        std::vector<char> buffer(64 * 1024);
        while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
            if (!ctx.update(buffer.data(), static_cast<size_t>(file.gcount()))) return "";
        }
        if (file.bad()) return "";
        return ctx.finalHex();
    }

private:
    static std::string toHex(const unsigned char* bytes, unsigned int length) {
        std::stringstream ss;
        for (unsigned int i = 0; i < length; ++i) {
            ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }
};

} // namespace QuietSync
