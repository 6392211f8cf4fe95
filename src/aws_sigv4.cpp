#include "blobkit/net/aws_sigv4.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace blobkit::net {

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

std::string hex(const unsigned char* data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out(size * 2, '0');
    for (size_t i = 0; i < size; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return out;
}

std::string hmac(const std::string& key, const std::string& message) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              mac, &mac_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(mac), mac_len);
}

// 20130524T000000Z
std::string amz_timestamp(AwsSigV4Signer::Clock::time_point now) {
    std::time_t t = AwsSigV4Signer::Clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

// The query string of a URL is already percent-encoded; canonical form only
// sorts the pairs and gives bare names an empty value.
std::string canonical_query(const std::string& query) {
    std::multimap<std::string, std::string> pairs;
    size_t start = 0;
    while (start < query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                pairs.emplace(pair, "");
            } else {
                pairs.emplace(pair.substr(0, eq), pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }

    std::string out;
    for (const auto& [name, value] : pairs) {
        if (!out.empty()) out += '&';
        out += name + "=" + value;
    }
    return out;
}

std::string header_names(const std::map<std::string, std::string>& headers) {
    std::string names;
    for (const auto& entry : headers) {
        if (!names.empty()) names += ';';
        names += entry.first;
    }
    return names;
}

} // namespace

std::string sha256_hex(const void* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!EVP_Digest(data, size, digest, &digest_len, EVP_sha256(), nullptr)) {
        throw std::runtime_error("SHA-256 failed");
    }
    return hex(digest, digest_len);
}

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                               std::string region, std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string AwsSigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string AwsSigV4Signer::signature(HttpMethod method, const ParsedUrl& url,
                                      const std::string& query,
                                      const std::map<std::string, std::string>& headers,
                                      const std::string& names, const std::string& payload_hash,
                                      const std::string& timestamp) const {
    std::string canonical = std::string(http_method_to_string(method)) + "\n";
    canonical += (url.path.empty() ? "/" : url.path) + "\n";
    canonical += canonical_query(query) + "\n";
    for (const auto& [name, value] : headers) {
        canonical += name + ":" + value + "\n";
    }
    canonical += "\n" + names + "\n" + payload_hash;

    std::string date = timestamp.substr(0, 8);
    std::string string_to_sign = std::string(ALGORITHM) + "\n" + timestamp + "\n" + scope(date) +
                                 "\n" + sha256_hex(canonical.data(), canonical.size());

    std::string key = hmac("AWS4" + secret_access_key_, date);
    key = hmac(key, region_);
    key = hmac(key, service_);
    key = hmac(key, "aws4_request");
    std::string mac = hmac(key, string_to_sign);
    return hex(reinterpret_cast<const unsigned char*>(mac.data()), mac.size());
}

void AwsSigV4Signer::sign(HttpRequest& request, Clock::time_point now) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    std::string timestamp = amz_timestamp(now);
    request.headers.set("Host", url->host_header());
    request.headers.set("X-Amz-Date", timestamp);

    std::string payload_hash = request.headers.get("X-Amz-Content-Sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
        request.headers.set("X-Amz-Content-Sha256", payload_hash);
    }

    // Repeated headers sign as one comma-joined value
    std::map<std::string, std::string> headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (name == "authorization") continue;
        auto& joined = headers[name];
        joined = joined.empty() ? value : joined + "," + value;
    }
    std::string names = header_names(headers);

    std::string sig = signature(request.method, *url, url->query, headers, names,
                                payload_hash, timestamp);
    request.headers.set("Authorization",
                        std::string(ALGORITHM) + " Credential=" + access_key_id_ + "/" +
                        scope(timestamp.substr(0, 8)) + ", SignedHeaders=" + names +
                        ", Signature=" + sig);
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request, const std::string& session_token,
                                     Clock::time_point now) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request, now);
}

std::string AwsSigV4Signer::presign(HttpMethod method,
                                    const std::string& url,
                                    std::chrono::seconds expires,
                                    const std::map<std::string, std::string>& signed_headers,
                                    const std::string& session_token,
                                    Clock::time_point now) const {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
        return "";
    }

    std::map<std::string, std::string> headers;
    for (const auto& [name, value] : signed_headers) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        headers[lower] = value;
    }
    headers["host"] = parsed->host_header();
    std::string names = header_names(headers);

    std::string timestamp = amz_timestamp(now);
    std::string query = parsed->query;
    auto add_param = [&query](const char* name, const std::string& value) {
        if (!query.empty()) query += '&';
        query += std::string(name) + "=" + url_encode(value);
    };
    add_param("X-Amz-Algorithm", ALGORITHM);
    add_param("X-Amz-Credential", access_key_id_ + "/" + scope(timestamp.substr(0, 8)));
    add_param("X-Amz-Date", timestamp);
    add_param("X-Amz-Expires", std::to_string(expires.count()));
    if (!session_token.empty()) {
        add_param("X-Amz-Security-Token", session_token);
    }
    add_param("X-Amz-SignedHeaders", names);

    std::string sig = signature(method, *parsed, query, headers, names, "UNSIGNED-PAYLOAD",
                                timestamp);
    return parsed->scheme + "://" + parsed->host_header() +
           (parsed->path.empty() ? "/" : parsed->path) + "?" + query + "&X-Amz-Signature=" + sig;
}

} // namespace blobkit::net
