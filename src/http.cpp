#include "blobkit/net/http.hpp"
#include "blobkit/core/log.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

namespace blobkit::net {

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status <= 299;
}

bool is_retryable_status(int status) {
    switch (status) {
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// Encoding
// ============================================================================

static const char HEX_DIGITS[] = "0123456789ABCDEF";

static bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

static std::string percent_encode(const std::string& str, bool keep_slash) {
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (is_unreserved(c) || (keep_slash && c == '/')) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX_DIGITS[c >> 4];
            out += HEX_DIGITS[c & 0x0F];
        }
    }
    return out;
}

std::string url_encode(const std::string& str) {
    return percent_encode(str, false);
}

std::string url_encode_path(const std::string& str) {
    return percent_encode(str, true);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < str.size() &&
                   hex_value(str[i + 1]) >= 0 && hex_value(str[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(str[i + 1]) * 16 + hex_value(str[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t group = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += alphabet[(group >> 18) & 0x3F];
        out += alphabet[(group >> 12) & 0x3F];
        out += alphabet[(group >> 6) & 0x3F];
        out += alphabet[group & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest > 0) {
        uint32_t group = data[i] << 16;
        if (rest == 2) group |= data[i + 1] << 8;
        out += alphabet[(group >> 18) & 0x3F];
        out += alphabet[(group >> 12) & 0x3F];
        out += rest == 2 ? alphabet[(group >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

// ============================================================================
// HttpHeaders
// ============================================================================

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    values_[lowercase(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    values_[lowercase(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = values_.find(lowercase(name));
    if (it == values_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return values_.count(lowercase(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> pairs;
    for (const auto& [name, values] : values_) {
        for (const auto& value : values) {
            pairs.emplace_back(name, value);
        }
    }
    return pairs;
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value || value->empty() ||
        value->find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(*value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// ============================================================================
// ParsedUrl
// ============================================================================

static bool parse_port(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    port = std::stoi(text);
    return port > 0 && port <= 65535;
}

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = lowercase(url.substr(0, scheme_end));

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos) {
        authority_end = url.size();
    }
    std::string authority = url.substr(authority_start, authority_end - authority_start);
    if (authority.empty()) {
        return std::nullopt;
    }

    // [v6addr]:port, host:port or host
    size_t port_sep = std::string::npos;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port_sep = close + 1;
        }
    } else {
        port_sep = authority.rfind(':');
    }
    if (port_sep != std::string::npos) {
        if (!parse_port(authority.substr(port_sep + 1), parsed.port)) return std::nullopt;
        parsed.host = authority.substr(0, port_sep);
    } else {
        parsed.host = authority;
    }

    std::string rest = url.substr(authority_end);
    rest = rest.substr(0, rest.find('#'));
    size_t query_start = rest.find('?');
    parsed.path = rest.substr(0, query_start);
    if (query_start != std::string::npos) {
        parsed.query = rest.substr(query_start + 1);
    }
    return parsed;
}

std::string ParsedUrl::host_header() const {
    bool default_port = port == 0 || (scheme == "http" && port == 80) ||
                        (scheme == "https" && port == 443);
    return default_port ? host : host + ":" + std::to_string(port);
}

// ============================================================================
// HttpTransport
// ============================================================================

HttpResponse HttpTransport::execute_with_retry(const HttpRequest& request,
                                               const std::function<bool()>& stop) {
    auto delay = request.initial_retry_delay;

    for (int attempt = 0;; ++attempt) {
        HttpResponse response = execute(request);

        bool transient = response.is_network_error || is_retryable_status(response.status_code);
        if (!transient || attempt >= request.max_retries || (stop && stop())) {
            return response;
        }

        log_debug("http: %s %s failed (%s), retry %d of %d in %lld ms",
                  http_method_to_string(request.method), request.url.c_str(),
                  response.is_network_error ? response.error.c_str()
                                            : std::to_string(response.status_code).c_str(),
                  attempt + 1, request.max_retries, static_cast<long long>(delay.count()));

        std::this_thread::sleep_for(delay);
        if (stop && stop()) {
            return response;
        }
        delay = std::chrono::milliseconds(
            static_cast<long long>(static_cast<double>(delay.count()) * request.retry_backoff_multiplier));
    }
}

} // namespace blobkit::net
