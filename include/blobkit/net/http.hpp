#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobkit::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// 429 and the 5xx statuses a later attempt can fix
bool is_retryable_status(int status);

// Case-insensitive header multimap. Names are stored lowercased.
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Every value, sorted by name
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type) { set("Content-Type", content_type); }
    std::optional<std::string> content_type() const { return get("Content-Type"); }
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> values_;
};

struct HttpProgress {
    uint64_t download_total = 0;
    uint64_t download_now = 0;
    uint64_t upload_total = 0;
    uint64_t upload_now = 0;
};

// Called during a transfer; returning false aborts it
using HttpProgressCallback = std::function<bool(const HttpProgress&)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{60000};  // 0 = none
    HttpProgressCallback progress_callback;

    bool verify_ssl = true;
    std::string ca_bundle_path;  // empty = system store

    // Used by HttpTransport::execute_with_retry
    int max_retries = 0;
    std::chrono::milliseconds initial_retry_delay{1000};
    double retry_backoff_multiplier = 2.0;
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Set when no HTTP status was received (DNS, connect, TLS, timeout, abort)
    bool is_network_error = false;
    std::string error;

    bool ok() const { return !is_network_error && is_success_status(status_code); }
    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

/// One HTTP exchange. HttpClient is the libcurl implementation; tests
/// substitute an in-process fake.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;

    /// Repeats network errors and retryable statuses up to request.max_retries
    /// times with exponential backoff. `stop` is polled before each retry and
    /// after each backoff sleep; once it returns true the last response is
    /// returned.
    HttpResponse execute_with_retry(const HttpRequest& request,
                                    const std::function<bool()>& stop = nullptr);
};

struct HttpClientConfig {
    size_t max_total_connections = 64;  // concurrent requests beyond this wait
    std::string user_agent = "blobkit/1.0";
};

// libcurl client over a pool of reusable easy handles. Thread-safe.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;       // 0 = scheme default
    std::string path;   // as written, still percent-encoded
    std::string query;  // without the '?'

    // host[:port], port omitted when it is the scheme default
    std::string host_header() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// Percent-encoding of everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& str);
// Same, but '/' passes through so object keys keep their path segments
std::string url_encode_path(const std::string& str);
// Inverse of url_encode; '+' decodes to a space
std::string url_decode(const std::string& str);

std::string base64_encode(const std::vector<uint8_t>& data);

} // namespace blobkit::net
