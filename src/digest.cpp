#include "blobkit/core/digest.hpp"

#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace blobkit {

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize MD5 context");
    }
}

Md5::~Md5() {
    EVP_MD_CTX_free(ctx_);
}

void Md5::update(const void* data, size_t size) {
    EVP_DigestUpdate(ctx_, data, size);
}

std::vector<uint8_t> Md5::finish() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, digest, &len);
    return std::vector<uint8_t>(digest, digest + len);
}

std::string Md5::hex(const std::vector<uint8_t>& digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : digest) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string Md5::hex_of(const std::string& data) {
    Md5 md5;
    md5.update(data.data(), data.size());
    return hex(md5.finish());
}

} // namespace blobkit
