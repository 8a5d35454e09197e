#include "digest.h"
#include "logger.h"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

#define LOG_DIGEST_ERROR(message) LOG_ERROR("digest", message)

namespace lanmeet {

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    reset();
}

Md5::~Md5() {
    EVP_MD_CTX_free(ctx_);
}

void Md5::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5 digest");
    }
}

void Md5::update(const uint8_t* data, size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("MD5 update failed");
    }
}

std::string Md5::hex_digest() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
        throw std::runtime_error("MD5 finalization failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    reset();
    return hex.str();
}

std::string md5_hex(const uint8_t* data, size_t size) {
    Md5 md5;
    md5.update(data, size);
    return md5.hex_digest();
}

std::string md5_hex(const std::vector<uint8_t>& data) {
    return md5_hex(data.data(), data.size());
}

std::string md5_file_hex(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_DIGEST_ERROR("Failed to open file for digest: " << path);
        return "";
    }

    Md5 md5;
    std::vector<uint8_t> buffer(64 * 1024);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
        std::streamsize read = file.gcount();
        if (read > 0) {
            md5.update(buffer.data(), static_cast<size_t>(read));
        }
    }
    if (file.bad()) {
        LOG_DIGEST_ERROR("Read error while hashing " << path);
        return "";
    }
    return md5.hex_digest();
}

} // namespace lanmeet
