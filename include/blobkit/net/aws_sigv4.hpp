#pragma once

#include "blobkit/net/http.hpp"

#include <chrono>
#include <map>
#include <string>

namespace blobkit::net {

// AWS Signature Version 4, header and query-string forms
class AwsSigV4Signer {
public:
    using Clock = std::chrono::system_clock;

    AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                   std::string region, std::string service);

    /// Adds Host, X-Amz-Date, X-Amz-Content-Sha256 and Authorization. Every
    /// header already on the request is signed. A preset X-Amz-Content-Sha256
    /// (e.g. UNSIGNED-PAYLOAD) is kept instead of hashing the body.
    void sign(HttpRequest& request, Clock::time_point now = Clock::now()) const;

    /// sign() for temporary credentials (X-Amz-Security-Token)
    void sign_with_token(HttpRequest& request, const std::string& session_token,
                         Clock::time_point now = Clock::now()) const;

    /// `url` with the X-Amz-* query parameters and signature appended, or ""
    /// if the URL cannot be parsed. `signed_headers` must accompany the
    /// eventual request; host is always signed. The payload is unsigned.
    std::string presign(HttpMethod method,
                        const std::string& url,
                        std::chrono::seconds expires,
                        const std::map<std::string, std::string>& signed_headers = {},
                        const std::string& session_token = "",
                        Clock::time_point now = Clock::now()) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string scope(const std::string& date) const;

    // Hex signature over a canonical request built from the parts
    std::string signature(HttpMethod method, const ParsedUrl& url, const std::string& query,
                          const std::map<std::string, std::string>& headers,
                          const std::string& header_names, const std::string& payload_hash,
                          const std::string& timestamp) const;
};

std::string sha256_hex(const void* data, size_t size);

} // namespace blobkit::net
