#include "blobkit/net/http.hpp"
#include "blobkit/core/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <vector>

namespace blobkit::net {

// ============================================================================
// Per-transfer state handed to the curl callbacks
// ============================================================================

namespace {

struct Transfer {
    const HttpRequest* request = nullptr;
    size_t upload_offset = 0;
    HttpResponse* response = nullptr;
};

size_t on_body(char* data, size_t size, size_t count, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t bytes = size * count;
    auto& body = transfer->response->body;
    body.insert(body.end(), data, data + bytes);
    return bytes;
}

size_t on_header(char* data, size_t size, size_t count, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t bytes = size * count;

    std::string line(data, bytes);
    if (line.rfind("HTTP/", 0) == 0) {
        // Status line of a new response (redirect or 100 Continue): start over
        transfer->response->headers = HttpHeaders();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return bytes;
    }
    size_t value_start = line.find_first_not_of(" \t", colon + 1);
    size_t value_end = line.find_last_not_of(" \t\r\n");
    std::string value;
    if (value_start != std::string::npos && value_end != std::string::npos && value_end >= value_start) {
        value = line.substr(value_start, value_end - value_start + 1);
    }
    transfer->response->headers.add(line.substr(0, colon), value);
    return bytes;
}

size_t on_upload(char* buffer, size_t size, size_t count, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    const auto& body = transfer->request->body;
    size_t n = std::min(size * count, body.size() - transfer->upload_offset);
    if (n > 0) {
        std::memcpy(buffer, body.data() + transfer->upload_offset, n);
        transfer->upload_offset += n;
    }
    return n;
}

int on_progress(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                curl_off_t ultotal, curl_off_t ulnow) {
    auto* transfer = static_cast<Transfer*>(userdata);
    HttpProgress progress;
    progress.download_total = static_cast<uint64_t>(dltotal);
    progress.download_now = static_cast<uint64_t>(dlnow);
    progress.upload_total = static_cast<uint64_t>(ultotal);
    progress.upload_now = static_cast<uint64_t>(ulnow);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return transfer->request->progress_callback(progress) ? 0 : 1;
}

// Owns a curl_slist
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(list_); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) {
        list_ = curl_slist_append(list_, line.c_str());
    }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

} // namespace

// ============================================================================
// HttpClient::Impl
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        if (config_.max_total_connections == 0) {
            config_.max_total_connections = 1;
        }
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        for (CURL* handle : idle_) {
            curl_easy_cleanup(handle);
        }
    }

    HttpResponse execute(const HttpRequest& request);

private:
    // Blocks while max_total_connections handles are in use
    CURL* lease() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !idle_.empty() || in_use_ < config_.max_total_connections; });
        ++in_use_;
        if (!idle_.empty()) {
            CURL* handle = idle_.back();
            idle_.pop_back();
            return handle;
        }
        lock.unlock();

        CURL* handle = curl_easy_init();
        if (!handle) {
            give_back(nullptr);
        }
        return handle;
    }

    // Resets and parks the handle so later requests reuse its connection
    void give_back(CURL* handle) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_use_;
            if (handle) {
                curl_easy_reset(handle);
                idle_.push_back(handle);
            }
        }
        cv_.notify_one();
    }

    void configure(CURL* curl, const HttpRequest& request, Transfer& transfer, HeaderList& headers);

    HttpClientConfig config_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<CURL*> idle_;
    size_t in_use_ = 0;
};

void HttpClient::Impl::configure(CURL* curl, const HttpRequest& request, Transfer& transfer,
                                 HeaderList& headers) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        case HttpMethod::PUT:
        case HttpMethod::POST:
            // Both send the body through the read callback; POST keeps its verb
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
            curl_easy_setopt(curl, CURLOPT_READDATA, &transfer);
            if (request.method == HttpMethod::POST) {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "POST");
            }
            break;
    }

    for (const auto& [name, value] : request.headers.all()) {
        headers.append(name + ": " + value);
    }
    headers.append("Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);

    if (request.progress_callback) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
    }

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.total_timeout.count()));

    if (!request.verify_ssl) {
        static std::once_flag warned;
        std::call_once(warned, [] {
            log_warn("http: TLS certificate verification is disabled");
        });
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);
    if (!request.ca_bundle_path.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
    }
}

HttpResponse HttpClient::Impl::execute(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = lease();
    if (!curl) {
        response.is_network_error = true;
        response.error = "curl_easy_init failed";
        return response;
    }

    Transfer transfer;
    transfer.request = &request;
    transfer.response = &response;
    HeaderList headers;
    configure(curl, request, transfer, headers);

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
    } else {
        response.is_network_error = true;
        response.error = curl_easy_strerror(rc);
        response.body.clear();
    }

    give_back(curl);
    return response;
}

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

} // namespace blobkit::net
