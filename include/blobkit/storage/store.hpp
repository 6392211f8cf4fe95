#pragma once

#include "blobkit/core/context.hpp"
#include "blobkit/storage/errors.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobkit {

// Metadata about a stored object
struct ObjectInfo {
    std::string key;
    int64_t size = 0;
    std::string content_type;
    std::string etag;  // opaque content fingerprint
    std::chrono::system_clock::time_point last_modified;
    std::map<std::string, std::string> metadata;
};

struct UploadInput {
    std::string key;
    std::istream* body = nullptr;  // caller-owned, read to EOF
    std::string content_type;      // empty = application/octet-stream
    std::map<std::string, std::string> metadata;
};

struct UploadOutput {
    std::string location;
    std::optional<std::string> version_id;
    std::string etag;
};

struct ListInput {
    std::string prefix;
    int32_t max_keys = 0;     // <= 0 means 1000
    std::string start_after;  // exclusive lower bound
};

struct ListOutput {
    std::vector<ObjectInfo> objects;  // ascending by key
    bool is_truncated = false;
    std::string next_marker;          // last returned key
};

struct UploadResult {
    StoreError error;
    UploadOutput output;
    bool ok() const { return error.ok(); }
};

struct DownloadResult {
    StoreError error;
    int64_t bytes_written = 0;
    bool ok() const { return error.ok(); }
};

struct GetObjectResult {
    StoreError error;
    std::unique_ptr<std::istream> body;  // owned by the caller
    bool ok() const { return error.ok(); }
};

struct HeadResult {
    StoreError error;
    ObjectInfo info;
    bool ok() const { return error.ok(); }
};

struct ExistsResult {
    StoreError error;
    bool exists = false;
    bool ok() const { return error.ok(); }
};

struct DeleteMultipleResult {
    StoreError error;
    std::vector<std::string> failed_keys;
    bool ok() const { return error.ok(); }
};

struct ListResult {
    StoreError error;
    ListOutput output;
    bool ok() const { return error.ok(); }
};

struct PresignResult {
    StoreError error;
    std::string url;
    bool ok() const { return error.ok(); }
};

// Random-access sink for download(). Parts may arrive out of order and from
// several threads at once.
class WriterAt {
public:
    virtual ~WriterAt() = default;

    // Write all of `data` at `offset`. Returns false on failure.
    virtual bool write_at(std::span<const uint8_t> data, uint64_t offset) = 0;
};

// In-memory sink that grows to fit the highest offset written
class BufferWriterAt : public WriterAt {
public:
    bool write_at(std::span<const uint8_t> data, uint64_t offset) override;

    std::vector<uint8_t> bytes() const;
    std::string str() const;

private:
    mutable std::mutex mutex_;
    std::vector<uint8_t> buffer_;
};

// Sink over a file opened for writing (truncated on open)
class FileWriterAt : public WriterAt {
public:
    explicit FileWriterAt(const std::string& path);
    ~FileWriterAt() override;

    FileWriterAt(const FileWriterAt&) = delete;
    FileWriterAt& operator=(const FileWriterAt&) = delete;

    bool is_open() const { return fd_ >= 0; }
    bool write_at(std::span<const uint8_t> data, uint64_t offset) override;

    // Flush and close; returns false if either step failed
    bool close();

private:
    int fd_ = -1;
};

class PresignedUrlGenerator;

// Abstract blob store. Every key-taking operation sanitizes the key first and
// fails with InvalidKey before any I/O.
class Store {
public:
    virtual ~Store() = default;

    // Backend type name (for logging/metrics)
    virtual std::string type_name() const = 0;

    // Atomically store input.body under input.key, replacing any previous object
    virtual UploadResult upload(const Context& ctx, const UploadInput& input) = 0;

    // Write the whole object into `sink` starting at offset 0
    virtual DownloadResult download(const Context& ctx, const std::string& key,
                                    WriterAt& sink) const = 0;

    virtual GetObjectResult get_object(const Context& ctx, const std::string& key) const = 0;

    virtual HeadResult head_object(const Context& ctx, const std::string& key) const = 0;

    // Removing an absent object is success
    virtual StoreError remove(const Context& ctx, const std::string& key) = 0;

    // Failed keys plus one aggregate error; already-absent keys are not failures
    virtual DeleteMultipleResult remove_multiple(const Context& ctx,
                                                 const std::vector<std::string>& keys) = 0;

    virtual ListResult list(const Context& ctx, const ListInput& input) const = 0;

    virtual ExistsResult exists(const Context& ctx, const std::string& key) const = 0;

    virtual StoreError copy(const Context& ctx, const std::string& source,
                            const std::string& destination) = 0;

    // Signed-URL capability, nullptr when the backend has none
    virtual PresignedUrlGenerator* presigner() = 0;
};

// Time-bounded signed URLs. No network I/O.
class PresignedUrlGenerator {
public:
    virtual ~PresignedUrlGenerator() = default;

    virtual PresignResult presign_get(const Context& ctx, const std::string& key,
                                      std::chrono::seconds expiration) = 0;

    // An empty content_type leaves the upload unconstrained
    virtual PresignResult presign_put(const Context& ctx, const std::string& key,
                                      const std::string& content_type,
                                      std::chrono::seconds expiration) = 0;
};

/// Capability query: the store's signed-URL generator or nullptr.
PresignedUrlGenerator* as_presigner(Store& store);

// Factory for creating stores from configuration
class StoreFactory {
public:
    // type is "local" or "s3"; throws std::invalid_argument on bad parameters
    // and std::runtime_error when the backend cannot be initialized
    static std::unique_ptr<Store> create(const std::string& type,
                                         const std::map<std::string, std::string>& params);

    static std::unique_ptr<Store> create_local(const std::string& root_path,
                                               bool create_root = true);

    static std::unique_ptr<Store> create_s3(const std::string& bucket,
                                            const std::string& region,
                                            const std::string& endpoint = "",
                                            const std::string& access_key = "",
                                            const std::string& secret_key = "");
};

} // namespace blobkit
