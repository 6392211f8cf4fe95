#pragma once

#include "blobkit/core/constants.hpp"
#include "blobkit/core/secure_string.hpp"
#include "blobkit/net/aws_sigv4.hpp"
#include "blobkit/net/http.hpp"
#include "blobkit/storage/store.hpp"

#include <memory>

namespace blobkit {

// Failure as reported by S3, or by the transport underneath it
struct S3Error {
    int status = 0;          // HTTP status, 0 for transport failures
    std::string code;        // <Code> of the error document, e.g. "NoSuchKey"
    std::string message;     // <Message>, or the transport error text
    std::string request_id;

    std::string to_string() const;

    // Reads the <Error> document from the body when there is one
    static S3Error from_response(const net::HttpResponse& response);
};

/// Every not-found shape S3 produces: NoSuchKey / NotFound / "404" error
/// codes, and a bare 404 with no error document (HEAD responses).
bool is_not_found(const S3Error& error);

// S3-compatible store (AWS, MinIO, ...). Uploads larger than one part go
// through multipart upload; downloads fetch ranged parts concurrently.
class S3Store : public Store, public PresignedUrlGenerator {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;           // Empty for AWS, custom for MinIO/etc
        bool use_path_style = false;    // For MinIO compatibility
        SecureString access_key;
        SecureString secret_key;
        std::string session_token;      // STS/temporary credentials
        bool verify_ssl = true;         // Disable for self-signed certs
        std::string ca_bundle;

        // Transfer managers
        size_t upload_part_size = constants::DEFAULT_UPLOAD_PART_SIZE;          // raised to 5MB minimum
        size_t upload_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
        size_t download_part_size = constants::DEFAULT_DOWNLOAD_PART_SIZE;
        size_t download_concurrency = constants::DEFAULT_DOWNLOAD_CONCURRENCY;

        // Timeouts
        uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
        uint32_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;

        // Retry (network errors, 429 and 5xx only)
        uint32_t max_retries = 0;
        uint32_t retry_initial_delay_ms = 200;
    };

    // Throws std::invalid_argument when the bucket is missing
    explicit S3Store(Config config);

    // Uses `transport` instead of a libcurl client
    S3Store(Config config, std::shared_ptr<net::HttpTransport> transport);

    std::string type_name() const override { return "s3"; }

    UploadResult upload(const Context& ctx, const UploadInput& input) override;
    DownloadResult download(const Context& ctx, const std::string& key,
                            WriterAt& sink) const override;
    GetObjectResult get_object(const Context& ctx, const std::string& key) const override;
    HeadResult head_object(const Context& ctx, const std::string& key) const override;
    StoreError remove(const Context& ctx, const std::string& key) override;
    DeleteMultipleResult remove_multiple(const Context& ctx,
                                         const std::vector<std::string>& keys) override;
    ListResult list(const Context& ctx, const ListInput& input) const override;
    ExistsResult exists(const Context& ctx, const std::string& key) const override;
    StoreError copy(const Context& ctx, const std::string& source,
                    const std::string& destination) override;

    PresignedUrlGenerator* presigner() override { return this; }

    PresignResult presign_get(const Context& ctx, const std::string& key,
                              std::chrono::seconds expiration) override;
    PresignResult presign_put(const Context& ctx, const std::string& key,
                              const std::string& content_type,
                              std::chrono::seconds expiration) override;

    const Config& config() const { return config_; }

    // Object URL for a sanitized key (bucket URL when key is empty)
    std::string build_url(const std::string& key) const;

private:
    struct PartResult {
        int number = 0;
        std::string etag;
        S3Error error;
    };

    Config config_;
    net::AwsSigV4Signer signer_;
    std::shared_ptr<net::HttpTransport> transport_;

    static Config normalize_config(Config config);

    net::HttpRequest make_request(const Context& ctx, net::HttpMethod method,
                                  const std::string& url) const;
    net::HttpResponse send(const Context& ctx, net::HttpRequest& request) const;

    UploadResult put_single(const Context& ctx, const std::string& key,
                            const UploadInput& input, const std::string& content_type,
                            std::vector<uint8_t> body);
    UploadResult put_multipart(const Context& ctx, const std::string& key,
                               const UploadInput& input, const std::string& content_type,
                               std::vector<uint8_t> first_part);

    bool initiate_multipart_upload(const Context& ctx, const std::string& key,
                                   const UploadInput& input, const std::string& content_type,
                                   std::string& upload_id, S3Error& error);
    PartResult upload_part(const Context& ctx, const std::string& key,
                           const std::string& upload_id, int part_number,
                           std::vector<uint8_t> data);
    bool complete_multipart_upload(const Context& ctx, const std::string& key,
                                   const std::string& upload_id,
                                   const std::vector<PartResult>& parts,
                                   UploadOutput& output, S3Error& error);
    // Runs regardless of the caller's context
    void abort_multipart_upload(const std::string& key, const std::string& upload_id);

    PresignResult presign(const Context& ctx, net::HttpMethod method, const std::string& key,
                          const std::string& content_type, std::chrono::seconds expiration);
};

} // namespace blobkit
