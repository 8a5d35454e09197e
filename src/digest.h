#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Opaque OpenSSL context
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace lanmeet {

/**
 * Incremental MD5, used to fingerprint files for transfer verification.
 * Not a security measure: it only detects corruption.
 */
class Md5 {
public:
    Md5();
    ~Md5();

    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * Finish and return the 32-character lowercase hex digest.
     * The object is reset afterwards and may be reused.
     */
    std::string hex_digest();

    void reset();

private:
    EVP_MD_CTX* ctx_;
};

std::string md5_hex(const uint8_t* data, size_t size);
std::string md5_hex(const std::vector<uint8_t>& data);

/**
 * Digest of a file's full contents, read in chunks
 * @return Hex digest, or empty string if the file cannot be read
 */
std::string md5_file_hex(const std::string& path);

} // namespace lanmeet
