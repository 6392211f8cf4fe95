#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace blobkit {

// Incremental MD5 over OpenSSL EVP. Used for object etags and Content-MD5.
class Md5 {
public:
    Md5();
    ~Md5();

    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void update(const void* data, size_t size);

    // Raw 16-byte digest. The hasher cannot be updated afterwards.
    std::vector<uint8_t> finish();

    static std::string hex(const std::vector<uint8_t>& digest);
    static std::string hex_of(const std::string& data);

private:
    EVP_MD_CTX* ctx_;
};

} // namespace blobkit
