#include "blobkit/storage/s3_store.hpp"
#include "blobkit/storage/content_type.hpp"
#include "blobkit/storage/key.hpp"
#include "blobkit/core/digest.hpp"
#include "blobkit/core/log.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <future>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <unordered_map>

namespace blobkit {

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag> at or after start_pos, empty if not found
static std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Contents of every <tag>...</tag>, in document order
static std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

// Decode the entity set S3 emits
static std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

} // namespace xml

// ============================================================================
// S3Error
// ============================================================================

std::string S3Error::to_string() const {
    std::string out;
    if (status == 0) {
        out = "transport error";
    } else {
        out = "HTTP " + std::to_string(status);
    }
    if (!code.empty()) {
        out += " " + code;
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    if (!request_id.empty()) {
        out += " (request id " + request_id + ")";
    }
    return out;
}

S3Error S3Error::from_response(const net::HttpResponse& response) {
    S3Error error;
    if (response.is_network_error) {
        error.message = response.error;
        return error;
    }

    error.status = response.status_code;
    std::string body = response.body_string();
    size_t error_pos = body.find("<Error>");
    if (error_pos != std::string::npos) {
        error.code = xml::get_element(body, "Code", error_pos);
        error.message = xml::decode_entities(xml::get_element(body, "Message", error_pos));
        error.request_id = xml::get_element(body, "RequestId", error_pos);
    }
    if (error.request_id.empty()) {
        error.request_id = response.headers.get("x-amz-request-id").value_or("");
    }
    if (error.message.empty()) {
        error.message = response.error;
    }
    return error;
}

bool is_not_found(const S3Error& error) {
    if (error.code == "NoSuchKey" || error.code == "NotFound" || error.code == "404") {
        return true;
    }
    // HEAD responses carry no error document
    return error.status == 404 && error.code.empty();
}

// ============================================================================
// Helpers
// ============================================================================

static StoreError s3_failure(const Context& ctx, ErrorCode kind, const std::string& what,
                             const S3Error& cause, bool map_not_found = true) {
    if (ctx.done()) {
        return StoreError::make(ErrorCode::Cancelled, what, ctx.err());
    }
    if (map_not_found && is_not_found(cause)) {
        log_debug("s3: %s: not found", what.c_str());
        return StoreError::make(ErrorCode::NotFound, what, cause.to_string());
    }
    auto err = StoreError::make(kind, what, cause.to_string());
    log_error("s3: %s", err.to_string().c_str());
    return err;
}

static StoreError local_failure(ErrorCode kind, const std::string& what, const std::string& cause = "") {
    auto err = StoreError::make(kind, what, cause);
    log_error("s3: %s", err.to_string().c_str());
    return err;
}

static StoreError cancelled(const Context& ctx, const std::string& what) {
    return StoreError::make(ErrorCode::Cancelled, what, ctx.err());
}

// A 200 response whose body is an <Error> document (copy, complete multipart)
static bool has_error_document(const net::HttpResponse& response) {
    std::string body = response.body_string();
    return body.find("<Error>") != std::string::npos;
}

static std::string strip_etag_quotes(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

// Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
static std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

// ISO 8601 as used in listings: 2023-12-15T14:30:00.000Z
static std::chrono::system_clock::time_point parse_iso8601(const std::string& date_str) {
    std::tm tm = {};
    int year, month, day, hour, min, sec;
    int millis = 0;
    if (sscanf(date_str.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) >= 6) {
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = min;
        tm.tm_sec = sec;
        time_t tt = timegm(&tm);
        if (tt != -1) {
            return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
        }
    }
    return {};
}

// RFC 7231 date as used in Last-Modified: Wed, 21 Oct 2015 07:28:00 GMT
static std::chrono::system_clock::time_point parse_http_date(const std::string& date_str) {
    std::tm tm = {};
    if (strptime(date_str.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) {
        return {};
    }
    time_t tt = timegm(&tm);
    if (tt == -1) {
        return {};
    }
    return std::chrono::system_clock::from_time_t(tt);
}

// Total object size from "bytes 0-99/1234"
static bool parse_content_range_total(const std::string& header, uint64_t& total) {
    size_t slash = header.rfind('/');
    if (slash == std::string::npos || slash + 1 >= header.size() || header[slash + 1] == '*') {
        return false;
    }
    try {
        total = std::stoull(header.substr(slash + 1));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// Fill `out` with up to `size` bytes. False only on a stream error.
static bool read_part(std::istream& in, size_t size, std::vector<uint8_t>& out) {
    out.resize(size);
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    out.resize(static_cast<size_t>(in.gcount()));
    // A short read at the end sets failbit together with eofbit
    return !in.bad() && !(in.fail() && !in.eof());
}

// True only at a clean end of stream; a stream error is left for read_part
static bool at_eof(std::istream& in) {
    return std::char_traits<char>::eq_int_type(in.peek(), std::char_traits<char>::eof()) &&
           in.eof() && !in.bad();
}

// Read-only stream that owns a response body
class BodyStream : public std::istream {
public:
    explicit BodyStream(std::vector<uint8_t> data)
        : std::istream(nullptr), buf_(std::move(data)) {
        rdbuf(&buf_);
    }

private:
    class Buffer : public std::streambuf {
    public:
        explicit Buffer(std::vector<uint8_t> data) : data_(std::move(data)) {
            char* begin = reinterpret_cast<char*>(data_.data());
            setg(begin, begin, begin + data_.size());
        }

    private:
        std::vector<uint8_t> data_;
    };

    Buffer buf_;
};

// ============================================================================
// S3Store
// ============================================================================

S3Store::S3Store(Config config)
    : S3Store(std::move(config), nullptr) {}

S3Store::S3Store(Config config, std::shared_ptr<net::HttpTransport> transport)
    : config_(normalize_config(std::move(config)))
    , signer_(config_.access_key.str(), config_.secret_key.str(), config_.region, "s3")
    , transport_(std::move(transport)) {
    if (config_.bucket.empty()) {
        throw std::invalid_argument("S3Store: bucket is required");
    }

    if (!transport_) {
        net::HttpClientConfig http_config;
        http_config.user_agent = "blobkit-s3/1.0";
        http_config.max_total_connections =
            std::max<size_t>(16, 2 * std::max(config_.upload_concurrency, config_.download_concurrency));
        transport_ = std::make_shared<net::HttpClient>(http_config);
    }

    log_info("s3 store initialized for bucket %s (%s)", config_.bucket.c_str(),
             build_url("").c_str());
}

S3Store::Config S3Store::normalize_config(Config config) {
    if (config.region.empty()) {
        config.region = "us-east-1";
    }
    while (!config.endpoint.empty() && config.endpoint.back() == '/') {
        config.endpoint.pop_back();
    }
    if (!config.endpoint.empty() && config.endpoint.find("://") == std::string::npos) {
        config.endpoint = "https://" + config.endpoint;
    }
    if (config.upload_part_size < constants::S3_MIN_PART_SIZE) {
        log_warn("s3: upload part size %zu below the 5MB minimum, using %zu",
                 config.upload_part_size, constants::S3_MIN_PART_SIZE);
        config.upload_part_size = constants::S3_MIN_PART_SIZE;
    }
    if (config.upload_concurrency == 0) {
        config.upload_concurrency = 1;
    }
    if (config.download_part_size == 0) {
        config.download_part_size = constants::DEFAULT_DOWNLOAD_PART_SIZE;
    }
    if (config.download_concurrency == 0) {
        config.download_concurrency = 1;
    }
    return config;
}

std::string S3Store::build_url(const std::string& key) const {
    std::string url;
    if (!config_.endpoint.empty()) {
        if (config_.use_path_style) {
            url = config_.endpoint + "/" + config_.bucket;
        } else {
            // Virtual-hosted style on a custom endpoint: bucket becomes a subdomain
            size_t host_start = config_.endpoint.find("://") + 3;
            url = config_.endpoint.substr(0, host_start) + config_.bucket + "." +
                  config_.endpoint.substr(host_start);
        }
    } else {
        if (config_.use_path_style) {
            url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
        } else {
            url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
        }
    }
    if (!key.empty()) {
        url += "/" + net::url_encode_path(key);
    }
    return url;
}

net::HttpRequest S3Store::make_request(const Context& ctx, net::HttpMethod method,
                                       const std::string& url) const {
    net::HttpRequest request;
    request.method = method;
    request.url = url;

    request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
    std::chrono::milliseconds total = std::chrono::seconds(config_.request_timeout_secs);
    // The caller's deadline caps the request
    if (auto left = ctx.remaining()) {
        total = total.count() > 0 ? std::min(total, *left) : *left;
        total = std::max(total, std::chrono::milliseconds(1));
    }
    request.total_timeout = total;

    request.verify_ssl = config_.verify_ssl;
    request.ca_bundle_path = config_.ca_bundle;

    request.max_retries = static_cast<int>(config_.max_retries);
    request.initial_retry_delay = std::chrono::milliseconds(config_.retry_initial_delay_ms);

    // Aborts the transfer once the caller cancels
    request.progress_callback = [ctx](const net::HttpProgress&) { return !ctx.done(); };
    return request;
}

net::HttpResponse S3Store::send(const Context& ctx, net::HttpRequest& request) const {
    if (!config_.access_key.empty()) {
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token);
        } else {
            signer_.sign(request);
        }
    }
    return transport_->execute_with_retry(request, [&ctx] { return ctx.done(); });
}

// ----------------------------------------------------------------------------
// Upload
// ----------------------------------------------------------------------------

UploadResult S3Store::upload(const Context& ctx, const UploadInput& input) {
    UploadResult result;

    std::string key;
    if (auto err = sanitize_key(input.key, key); !err.ok()) {
        result.error = err;
        return result;
    }
    if (!input.body) {
        result.error = StoreError::make(ErrorCode::InvalidInput, "upload body is required");
        return result;
    }
    if (!*input.body) {
        result.error = StoreError::make(ErrorCode::InvalidInput, "upload body stream is in a failed state");
        return result;
    }
    if (ctx.done()) {
        result.error = cancelled(ctx, "upload " + key);
        return result;
    }

    std::string content_type = input.content_type.empty() ? detect_content_type(key)
                                                          : input.content_type;

    std::vector<uint8_t> first_part;
    if (!read_part(*input.body, config_.upload_part_size, first_part)) {
        result.error = local_failure(ErrorCode::UploadFailed, "upload " + key, "failed to read upload body");
        return result;
    }

    if (at_eof(*input.body)) {
        return put_single(ctx, key, input, content_type, std::move(first_part));
    }
    return put_multipart(ctx, key, input, content_type, std::move(first_part));
}

UploadResult S3Store::put_single(const Context& ctx, const std::string& key,
                                 const UploadInput& input, const std::string& content_type,
                                 std::vector<uint8_t> body) {
    UploadResult result;
    size_t size = body.size();

    Md5 md5;
    md5.update(body.data(), body.size());
    std::string content_md5 = net::base64_encode(md5.finish());

    auto request = make_request(ctx, net::HttpMethod::PUT, build_url(key));
    request.body = std::move(body);
    request.headers.set_content_type(content_type);
    request.headers.set("Content-MD5", content_md5);
    for (const auto& [k, v] : input.metadata) {
        request.headers.set("x-amz-meta-" + k, v);
    }

    auto response = send(ctx, request);
    if (!response.ok()) {
        // A missing bucket is a failed upload, not a missing object
        result.error = s3_failure(ctx, ErrorCode::UploadFailed, "upload " + key,
                                  S3Error::from_response(response), false);
        return result;
    }

    result.output.location = build_url(key);
    result.output.etag = strip_etag_quotes(response.headers.get("ETag").value_or(""));
    result.output.version_id = response.headers.get("x-amz-version-id");
    log_debug("s3: uploaded %s (%zu bytes)", key.c_str(), size);
    return result;
}

UploadResult S3Store::put_multipart(const Context& ctx, const std::string& key,
                                    const UploadInput& input, const std::string& content_type,
                                    std::vector<uint8_t> first_part) {
    UploadResult result;

    // 1. Initiate multipart upload
    std::string upload_id;
    S3Error error;
    if (!initiate_multipart_upload(ctx, key, input, content_type, upload_id, error)) {
        result.error = s3_failure(ctx, ErrorCode::UploadFailed,
                                  "initiate multipart upload of " + key, error, false);
        return result;
    }

    // 2. Read parts from the body and upload them in batches of upload_concurrency
    std::vector<PartResult> completed;
    StoreError failure;
    bool first = true;
    bool done_reading = false;
    int next_part = 1;
    uint64_t total = 0;

    while (!done_reading && failure.ok()) {
        if (ctx.done()) {
            failure = cancelled(ctx, "upload " + key);
            break;
        }

        std::vector<std::future<PartResult>> futures;
        for (size_t i = 0; i < config_.upload_concurrency && !done_reading; ++i) {
            std::vector<uint8_t> data;
            if (first) {
                data = std::move(first_part);
                first = false;
            } else if (!read_part(*input.body, config_.upload_part_size, data)) {
                failure = local_failure(ErrorCode::UploadFailed, "upload " + key,
                                        "failed to read upload body");
                break;
            }
            if (data.empty()) {
                done_reading = true;
                break;
            }
            if (static_cast<size_t>(next_part) > constants::S3_MAX_PARTS) {
                failure = local_failure(ErrorCode::UploadFailed, "upload " + key,
                                        "body needs more than 10000 parts at this part size");
                break;
            }

            total += data.size();
            int number = next_part++;
            futures.push_back(std::async(std::launch::async,
                [this, &ctx, &key, &upload_id, number, d = std::move(data)]() mutable {
                    return upload_part(ctx, key, upload_id, number, std::move(d));
                }));

            if (at_eof(*input.body)) {
                done_reading = true;
            }
        }

        for (auto& fut : futures) {
            PartResult part = fut.get();
            if (part.etag.empty()) {
                if (failure.ok()) {
                    failure = s3_failure(ctx, ErrorCode::UploadFailed,
                                         "upload part " + std::to_string(part.number) + " of " + key,
                                         part.error, false);
                }
            } else {
                completed.push_back(std::move(part));
            }
        }
    }

    if (!failure.ok()) {
        abort_multipart_upload(key, upload_id);
        result.error = failure;
        return result;
    }

    std::sort(completed.begin(), completed.end(),
              [](const PartResult& a, const PartResult& b) { return a.number < b.number; });

    // 3. Complete multipart upload
    if (!complete_multipart_upload(ctx, key, upload_id, completed, result.output, error)) {
        abort_multipart_upload(key, upload_id);
        result.error = s3_failure(ctx, ErrorCode::UploadFailed,
                                  "complete multipart upload of " + key, error, false);
        return result;
    }

    log_debug("s3: uploaded %s in %zu parts (%llu bytes)", key.c_str(), completed.size(),
              static_cast<unsigned long long>(total));
    return result;
}

bool S3Store::initiate_multipart_upload(const Context& ctx, const std::string& key,
                                        const UploadInput& input, const std::string& content_type,
                                        std::string& upload_id, S3Error& error) {
    auto request = make_request(ctx, net::HttpMethod::POST, build_url(key) + "?uploads");
    request.headers.set_content_type(content_type);
    for (const auto& [k, v] : input.metadata) {
        request.headers.set("x-amz-meta-" + k, v);
    }

    auto response = send(ctx, request);
    if (!response.ok()) {
        error = S3Error::from_response(response);
        return false;
    }

    upload_id = xml::get_element(response.body_string(), "UploadId");
    if (upload_id.empty()) {
        error = S3Error::from_response(response);
        error.message = "response carries no UploadId";
        return false;
    }
    return true;
}

S3Store::PartResult S3Store::upload_part(const Context& ctx, const std::string& key,
                                         const std::string& upload_id, int part_number,
                                         std::vector<uint8_t> data) {
    PartResult part;
    part.number = part_number;

    std::string url = build_url(key) +
        "?partNumber=" + std::to_string(part_number) +
        "&uploadId=" + net::url_encode(upload_id);

    auto request = make_request(ctx, net::HttpMethod::PUT, url);
    request.body = std::move(data);

    auto response = send(ctx, request);
    if (!response.ok()) {
        part.error = S3Error::from_response(response);
        return part;
    }

    // Quotes are kept for CompleteMultipartUpload
    part.etag = ensure_etag_quotes(response.headers.get("ETag").value_or(""));
    if (part.etag.empty()) {
        part.error = S3Error::from_response(response);
        part.error.message = "part response carries no ETag";
    }
    return part;
}

bool S3Store::complete_multipart_upload(const Context& ctx, const std::string& key,
                                        const std::string& upload_id,
                                        const std::vector<PartResult>& parts,
                                        UploadOutput& output, S3Error& error) {
    std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

    std::ostringstream body;
    body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (const auto& part : parts) {
        body << "  <Part>\n";
        body << "    <PartNumber>" << part.number << "</PartNumber>\n";
        body << "    <ETag>" << xml::escape(part.etag) << "</ETag>\n";
        body << "  </Part>\n";
    }
    body << "</CompleteMultipartUpload>";

    std::string payload = body.str();
    auto request = make_request(ctx, net::HttpMethod::POST, url);
    request.body.assign(payload.begin(), payload.end());
    request.headers.set_content_type("application/xml");

    auto response = send(ctx, request);
    // Completion can fail after a 200 with an <Error> document in the body
    if (!response.ok() || has_error_document(response)) {
        error = S3Error::from_response(response);
        return false;
    }

    std::string doc = response.body_string();
    std::string location = xml::decode_entities(xml::get_element(doc, "Location"));
    output.location = location.empty() ? build_url(key) : location;
    output.etag = strip_etag_quotes(xml::decode_entities(xml::get_element(doc, "ETag")));
    output.version_id = response.headers.get("x-amz-version-id");
    return true;
}

void S3Store::abort_multipart_upload(const std::string& key, const std::string& upload_id) {
    std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

    Context abort_ctx = Context::background();
    auto request = make_request(abort_ctx, net::HttpMethod::DELETE, url);
    auto response = send(abort_ctx, request);
    if (!response.ok()) {
        log_warn("s3: failed to abort multipart upload %s of %s: %s", upload_id.c_str(),
                 key.c_str(), S3Error::from_response(response).to_string().c_str());
    }
}

// ----------------------------------------------------------------------------
// Reads
// ----------------------------------------------------------------------------

DownloadResult S3Store::download(const Context& ctx, const std::string& raw_key,
                                 WriterAt& sink) const {
    DownloadResult result;

    std::string key;
    if (auto err = sanitize_key(raw_key, key); !err.ok()) {
        result.error = err;
        return result;
    }
    if (ctx.done()) {
        result.error = cancelled(ctx, "download " + key);
        return result;
    }

    const std::string url = build_url(key);
    const uint64_t part_size = config_.download_part_size;

    auto fetch = [&](uint64_t start, uint64_t end_inclusive, const std::string& if_match) {
        auto request = make_request(ctx, net::HttpMethod::GET, url);
        request.headers.set("Range", "bytes=" + std::to_string(start) + "-" +
                                     std::to_string(end_inclusive));
        if (!if_match.empty()) {
            request.headers.set("If-Match", if_match);
        }
        return send(ctx, request);
    };

    // First part also tells us the object size
    auto first = fetch(0, part_size - 1, "");
    if (first.status_code == 416) {
        // Ranged GET of an empty object
        log_debug("s3: downloaded %s (0 bytes)", key.c_str());
        return result;
    }
    if (!first.ok()) {
        result.error = s3_failure(ctx, ErrorCode::DownloadFailed, "download " + key,
                                  S3Error::from_response(first));
        return result;
    }

    uint64_t total = first.body.size();
    if (first.status_code == 206) {
        auto range = first.headers.get("Content-Range");
        if (!range || !parse_content_range_total(*range, total)) {
            result.error = local_failure(ErrorCode::DownloadFailed, "download " + key,
                                         "missing or invalid Content-Range");
            return result;
        }
    }

    if (!first.body.empty() && !sink.write_at(first.body, 0)) {
        result.error = local_failure(ErrorCode::DownloadFailed, "download " + key,
                                     "failed to write to sink");
        return result;
    }

    // Pin the remaining parts to the version the first part came from
    const std::string etag = first.headers.get("ETag").value_or("");
    uint64_t offset = first.body.size();

    while (offset < total) {
        if (ctx.done()) {
            result.error = cancelled(ctx, "download " + key);
            return result;
        }

        std::vector<std::future<StoreError>> futures;
        for (size_t i = 0; i < config_.download_concurrency && offset < total; ++i) {
            uint64_t start = offset;
            uint64_t end = std::min(start + part_size, total);
            offset = end;

            futures.push_back(std::async(std::launch::async, [&, start, end]() -> StoreError {
                auto response = fetch(start, end - 1, etag);
                if (!response.ok()) {
                    return s3_failure(ctx, ErrorCode::DownloadFailed,
                                      "download " + key + " range " + std::to_string(start) + "-" +
                                      std::to_string(end - 1),
                                      S3Error::from_response(response));
                }
                if (response.body.size() != end - start) {
                    return local_failure(ErrorCode::DownloadFailed, "download " + key,
                                         "short range response at offset " + std::to_string(start));
                }
                if (!sink.write_at(response.body, start)) {
                    return local_failure(ErrorCode::DownloadFailed, "download " + key,
                                         "failed to write to sink");
                }
                return {};
            }));
        }

        StoreError failure;
        for (auto& fut : futures) {
            auto err = fut.get();
            if (!err.ok() && failure.ok()) {
                failure = err;
            }
        }
        if (!failure.ok()) {
            result.error = failure;
            return result;
        }
    }

    result.bytes_written = static_cast<int64_t>(total);
    log_debug("s3: downloaded %s (%llu bytes)", key.c_str(), static_cast<unsigned long long>(total));
    return result;
}

GetObjectResult S3Store::get_object(const Context& ctx, const std::string& raw_key) const {
    GetObjectResult result;

    std::string key;
    if (auto err = sanitize_key(raw_key, key); !err.ok()) {
        result.error = err;
        return result;
    }
    if (ctx.done()) {
        result.error = cancelled(ctx, "get " + key);
        return result;
    }

    auto request = make_request(ctx, net::HttpMethod::GET, build_url(key));
    auto response = send(ctx, request);
    if (!response.ok()) {
        result.error = s3_failure(ctx, ErrorCode::DownloadFailed, "get " + key,
                                  S3Error::from_response(response));
        return result;
    }

    result.body = std::make_unique<BodyStream>(std::move(response.body));
    return result;
}

HeadResult S3Store::head_object(const Context& ctx, const std::string& raw_key) const {
    HeadResult result;

    std::string key;
    if (auto err = sanitize_key(raw_key, key); !err.ok()) {
        result.error = err;
        return result;
    }
    if (ctx.done()) {
        result.error = cancelled(ctx, "head " + key);
        return result;
    }

    auto request = make_request(ctx, net::HttpMethod::HEAD, build_url(key));
    auto response = send(ctx, request);
    if (!response.ok()) {
        result.error = s3_failure(ctx, ErrorCode::DownloadFailed, "head " + key,
                                  S3Error::from_response(response));
        return result;
    }

    // Missing optional headers leave the field empty
    result.info.key = key;
    result.info.size = static_cast<int64_t>(response.headers.content_length().value_or(0));
    result.info.content_type = response.headers.content_type().value_or("");
    result.info.etag = strip_etag_quotes(response.headers.get("ETag").value_or(""));
    if (auto modified = response.headers.get("Last-Modified")) {
        result.info.last_modified = parse_http_date(*modified);
    }
    for (const auto& [name, value] : response.headers.all()) {
        if (name.starts_with("x-amz-meta-")) {
            result.info.metadata[name.substr(11)] = value;
        }
    }
    return result;
}

ExistsResult S3Store::exists(const Context& ctx, const std::string& raw_key) const {
    ExistsResult result;

    auto head = head_object(ctx, raw_key);
    if (head.ok()) {
        result.exists = true;
    } else if (!head.error.is(ErrorCode::NotFound)) {
        result.error = head.error;
    }
    return result;
}

ListResult S3Store::list(const Context& ctx, const ListInput& input) const {
    ListResult result;
    int32_t max_keys = input.max_keys > 0 ? input.max_keys : constants::DEFAULT_LIST_MAX_KEYS;

    if (ctx.done()) {
        result.error = cancelled(ctx, "list");
        return result;
    }

    std::string url = build_url("") + "?list-type=2&max-keys=" + std::to_string(max_keys);
    if (!input.prefix.empty()) {
        url += "&prefix=" + net::url_encode(input.prefix);
    }
    if (!input.start_after.empty()) {
        url += "&start-after=" + net::url_encode(input.start_after);
    }

    auto request = make_request(ctx, net::HttpMethod::GET, url);
    auto response = send(ctx, request);
    if (!response.ok()) {
        result.error = s3_failure(ctx, ErrorCode::InternalError, "list prefix '" + input.prefix + "'",
                                  S3Error::from_response(response), false);
        return result;
    }

    std::string doc = response.body_string();
    result.output.is_truncated = xml::get_element(doc, "IsTruncated") == "true";

    for (const auto& content : xml::find_elements(doc, "Contents")) {
        ObjectInfo info;
        info.key = xml::decode_entities(xml::get_element(content, "Key"));

        std::string size_str = xml::get_element(content, "Size");
        if (!size_str.empty()) {
            try {
                info.size = std::stoll(size_str);
            } catch (const std::exception&) {
                info.size = 0;
            }
        }

        std::string date_str = xml::get_element(content, "LastModified");
        if (!date_str.empty()) {
            info.last_modified = parse_iso8601(date_str);
        }

        info.etag = strip_etag_quotes(xml::decode_entities(xml::get_element(content, "ETag")));
        result.output.objects.push_back(std::move(info));
    }

    if (!result.output.objects.empty()) {
        result.output.next_marker = result.output.objects.back().key;
    }
    return result;
}

// ----------------------------------------------------------------------------
// Mutations
// ----------------------------------------------------------------------------

StoreError S3Store::remove(const Context& ctx, const std::string& raw_key) {
    std::string key;
    if (auto err = sanitize_key(raw_key, key); !err.ok()) {
        return err;
    }
    if (ctx.done()) {
        return cancelled(ctx, "delete " + key);
    }

    auto request = make_request(ctx, net::HttpMethod::DELETE, build_url(key));
    auto response = send(ctx, request);
    if (!response.ok()) {
        auto error = S3Error::from_response(response);
        // Already gone counts as success
        if (!ctx.done() && is_not_found(error)) {
            return {};
        }
        return s3_failure(ctx, ErrorCode::DeleteFailed, "delete " + key, error, false);
    }

    log_debug("s3: deleted %s", key.c_str());
    return {};
}

DeleteMultipleResult S3Store::remove_multiple(const Context& ctx,
                                              const std::vector<std::string>& raw_keys) {
    DeleteMultipleResult result;
    if (raw_keys.empty()) {
        return result;
    }

    // Reject the whole batch before any request if a key is bad
    std::vector<std::string> keys;
    std::unordered_map<std::string, std::string> original;
    keys.reserve(raw_keys.size());
    for (const auto& raw : raw_keys) {
        std::string key;
        if (auto err = sanitize_key(raw, key); !err.ok()) {
            result.failed_keys.push_back(raw);
            continue;
        }
        original.emplace(key, raw);
        keys.push_back(std::move(key));
    }
    if (!result.failed_keys.empty()) {
        result.error = StoreError::make(ErrorCode::InvalidKey,
                                        std::to_string(result.failed_keys.size()) + " invalid keys in batch");
        return result;
    }

    const std::string url = build_url("") + "?delete";

    for (size_t batch_start = 0; batch_start < keys.size(); batch_start += constants::S3_MAX_DELETE_BATCH) {
        size_t batch_end = std::min(batch_start + constants::S3_MAX_DELETE_BATCH, keys.size());

        if (ctx.done()) {
            for (size_t i = batch_start; i < keys.size(); ++i) {
                result.failed_keys.push_back(raw_keys[i]);
            }
            result.error = cancelled(ctx, "delete batch");
            return result;
        }

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<Delete xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        body << "  <Quiet>true</Quiet>\n";
        for (size_t i = batch_start; i < batch_end; ++i) {
            body << "  <Object><Key>" << xml::escape(keys[i]) << "</Key></Object>\n";
        }
        body << "</Delete>";
        std::string payload = body.str();

        // S3 requires Content-MD5 on multi-object delete
        Md5 md5;
        md5.update(payload.data(), payload.size());

        auto request = make_request(ctx, net::HttpMethod::POST, url);
        request.body.assign(payload.begin(), payload.end());
        request.headers.set_content_type("application/xml");
        request.headers.set("Content-MD5", net::base64_encode(md5.finish()));

        auto response = send(ctx, request);
        if (!response.ok() && ctx.done()) {
            // Aborted by the caller: this batch and every later key stay unprocessed
            for (size_t i = batch_start; i < keys.size(); ++i) {
                result.failed_keys.push_back(raw_keys[i]);
            }
            result.error = cancelled(ctx, "delete batch");
            return result;
        }
        if (!response.ok()) {
            // Whole batch failed
            log_error("s3: delete batch of %zu keys failed: %s", batch_end - batch_start,
                      S3Error::from_response(response).to_string().c_str());
            for (size_t i = batch_start; i < batch_end; ++i) {
                result.failed_keys.push_back(raw_keys[i]);
            }
            continue;
        }

        // Quiet mode only reports per-object failures
        std::string doc = response.body_string();
        for (const auto& entry : xml::find_elements(doc, "Error")) {
            std::string key = xml::decode_entities(xml::get_element(entry, "Key"));
            std::string code = xml::get_element(entry, "Code");
            if (key.empty() || code == "NoSuchKey") {
                continue;
            }
            log_error("s3: delete %s failed: %s %s", key.c_str(), code.c_str(),
                      xml::decode_entities(xml::get_element(entry, "Message")).c_str());
            auto it = original.find(key);
            result.failed_keys.push_back(it != original.end() ? it->second : key);
        }
    }

    if (!result.failed_keys.empty() && ctx.done()) {
        result.error = cancelled(ctx, "delete batch");
        return result;
    }
    if (!result.failed_keys.empty()) {
        result.error = local_failure(ErrorCode::DeleteFailed,
                                     std::to_string(result.failed_keys.size()) + " objects failed to delete");
        return result;
    }

    log_debug("s3: deleted %zu objects", keys.size());
    return result;
}

StoreError S3Store::copy(const Context& ctx, const std::string& raw_source,
                         const std::string& raw_destination) {
    std::string source;
    std::string destination;
    if (auto err = sanitize_key(raw_source, source); !err.ok()) {
        return err;
    }
    if (auto err = sanitize_key(raw_destination, destination); !err.ok()) {
        return err;
    }
    if (ctx.done()) {
        return cancelled(ctx, "copy " + source);
    }

    auto request = make_request(ctx, net::HttpMethod::PUT, build_url(destination));
    request.headers.set("x-amz-copy-source", net::url_encode_path(config_.bucket + "/" + source));

    auto response = send(ctx, request);
    // Copy reports some failures (NoSuchKey included) as a 200 with an <Error> body
    if (!response.ok() || has_error_document(response)) {
        return s3_failure(ctx, ErrorCode::UploadFailed, "copy " + source + " to " + destination,
                          S3Error::from_response(response));
    }

    log_debug("s3: copied %s to %s", source.c_str(), destination.c_str());
    return {};
}

// ----------------------------------------------------------------------------
// Presigned URLs
// ----------------------------------------------------------------------------

PresignResult S3Store::presign_get(const Context& ctx, const std::string& key,
                                   std::chrono::seconds expiration) {
    return presign(ctx, net::HttpMethod::GET, key, "", expiration);
}

PresignResult S3Store::presign_put(const Context& ctx, const std::string& key,
                                   const std::string& content_type,
                                   std::chrono::seconds expiration) {
    return presign(ctx, net::HttpMethod::PUT, key, content_type, expiration);
}

PresignResult S3Store::presign(const Context& ctx, net::HttpMethod method, const std::string& raw_key,
                               const std::string& content_type, std::chrono::seconds expiration) {
    PresignResult result;

    std::string key;
    if (auto err = sanitize_key(raw_key, key); !err.ok()) {
        result.error = err;
        return result;
    }
    if (expiration.count() < 1 || expiration.count() > constants::S3_MAX_PRESIGN_SECONDS) {
        result.error = StoreError::make(ErrorCode::InvalidInput,
                                        "presign expiration must be between 1 second and 7 days");
        return result;
    }
    if (ctx.done()) {
        result.error = cancelled(ctx, "presign " + key);
        return result;
    }

    std::map<std::string, std::string> signed_headers;
    if (!content_type.empty()) {
        signed_headers["content-type"] = content_type;
    }

    result.url = signer_.presign(method, build_url(key), expiration, signed_headers,
                                 config_.session_token);
    if (result.url.empty()) {
        result.error = local_failure(ErrorCode::InternalError, "presign " + key,
                                     "cannot parse endpoint URL");
    }
    return result;
}

} // namespace blobkit
