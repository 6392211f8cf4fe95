#include "blobkit/storage/local_store.hpp"
#include "blobkit/storage/content_type.hpp"
#include "blobkit/storage/key.hpp"
#include "blobkit/core/constants.hpp"
#include "blobkit/core/digest.hpp"
#include "blobkit/core/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <sys/stat.h>
#include <unistd.h>

namespace blobkit {

namespace fs = std::filesystem;

// ============================================================================
// Helpers
// ============================================================================

static StoreError failed(ErrorCode code, const std::string& message, const std::string& cause = "") {
    auto err = StoreError::make(code, message, cause);
    if (code == ErrorCode::NotFound) {
        log_debug("local: %s", err.to_string().c_str());
    } else {
        log_error("local: %s", err.to_string().c_str());
    }
    return err;
}

static StoreError cancelled(const Context& ctx, const std::string& what) {
    return StoreError::make(ErrorCode::Cancelled, what, ctx.err());
}

static std::chrono::system_clock::time_point to_system_time(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

static bool is_temp_file(const fs::path& path) {
    return path.filename().string().starts_with(constants::TEMP_FILE_PREFIX);
}

static bool write_fully(int fd, const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

// ============================================================================
// LocalStore
// ============================================================================

LocalStore::LocalStore(const fs::path& root, bool create_root) {
    if (root.empty()) {
        throw std::invalid_argument("LocalStore: root path is required");
    }

    std::error_code ec;
    root_ = fs::absolute(root, ec).lexically_normal();
    if (ec) {
        throw std::runtime_error("LocalStore: cannot resolve root " + root.string() + ": " + ec.message());
    }

    if (create_root) {
        fs::create_directories(root_, ec);
        if (ec) {
            throw std::runtime_error("LocalStore: cannot create root " + root_.string() + ": " + ec.message());
        }
    }

    if (!fs::is_directory(root_, ec)) {
        throw std::runtime_error("LocalStore: root is not a directory: " + root_.string());
    }

    log_info("local store initialized at %s", root_.c_str());
}

fs::path LocalStore::key_to_path(const std::string& normalized_key) const {
    return root_ / normalized_key;
}

StoreError LocalStore::write_atomic(const Context& ctx, const fs::path& path,
                                    std::istream& in, std::string& etag_out, int64_t& size_out) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return StoreError::make(ErrorCode::UploadFailed,
                                "failed to create directory " + path.parent_path().string(),
                                ec.message());
    }

    std::string tmpl = (path.parent_path() / (std::string(constants::TEMP_FILE_PREFIX) + "XXXXXX")).string();
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return StoreError::make(ErrorCode::UploadFailed, "failed to create temp file in " +
                                path.parent_path().string(), std::strerror(errno));
    }
    std::string temp_path(name.data());
    ::fchmod(fd, 0644);  // mkstemp creates 0600

    auto abandon = [&](StoreError err) {
        if (fd >= 0) {
            ::close(fd);
        }
        std::error_code rm_ec;
        fs::remove(temp_path, rm_ec);
        return err;
    };

    Md5 md5;
    std::vector<char> buffer(constants::DEFAULT_STREAM_BUFFER_SIZE);
    int64_t total = 0;

    while (true) {
        if (ctx.done()) {
            return abandon(cancelled(ctx, "upload to " + path.string()));
        }

        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n > 0) {
            md5.update(buffer.data(), static_cast<size_t>(n));
            if (!write_fully(fd, buffer.data(), static_cast<size_t>(n))) {
                return abandon(StoreError::make(ErrorCode::UploadFailed,
                                                "failed to write " + temp_path, std::strerror(errno)));
            }
            total += n;
        }

        if (in.bad() || (in.fail() && !in.eof())) {
            return abandon(StoreError::make(ErrorCode::UploadFailed, "failed to read upload body"));
        }
        if (in.eof()) {
            break;
        }
    }

    int rc = ::close(fd);
    fd = -1;
    if (rc != 0) {
        return abandon(StoreError::make(ErrorCode::UploadFailed,
                                        "failed to close " + temp_path, std::strerror(errno)));
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        return abandon(StoreError::make(ErrorCode::UploadFailed,
                                        "failed to rename into " + path.string(), ec.message()));
    }

    etag_out = Md5::hex(md5.finish());
    size_out = total;
    return {};
}

UploadResult LocalStore::upload(const Context& ctx, const UploadInput& input) {
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

    auto path = key_to_path(key);

    std::unique_lock lock(mutex_);

    std::string etag;
    int64_t size = 0;
    auto err = write_atomic(ctx, path, *input.body, etag, size);
    if (!err.ok()) {
        result.error = err.is(ErrorCode::Cancelled) ? err : failed(err.code, "upload " + key + ": " + err.message, err.cause);
        return result;
    }

    result.output.location = path.string();
    result.output.etag = etag;
    log_debug("local: uploaded %s (%lld bytes)", key.c_str(), static_cast<long long>(size));
    return result;
}

DownloadResult LocalStore::download(const Context& ctx, const std::string& raw_key,
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

    std::shared_lock lock(mutex_);

    auto path = key_to_path(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.error = failed(ErrorCode::NotFound, key);
        return result;
    }

    // Whole object is materialized in memory before the sink sees it
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        result.error = failed(ErrorCode::DownloadFailed, "open " + key, std::strerror(errno));
        return result;
    }
    auto tellg_val = file.tellg();
    if (tellg_val < 0) {
        result.error = failed(ErrorCode::DownloadFailed, "cannot determine size of " + key);
        return result;
    }

    std::vector<uint8_t> data(static_cast<size_t>(tellg_val));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        result.error = failed(ErrorCode::DownloadFailed, "read " + key);
        return result;
    }

    if (!data.empty() && !sink.write_at(data, 0)) {
        result.error = failed(ErrorCode::DownloadFailed, "write " + key + " to sink");
        return result;
    }

    result.bytes_written = static_cast<int64_t>(data.size());
    log_debug("local: downloaded %s (%zu bytes)", key.c_str(), data.size());
    return result;
}

GetObjectResult LocalStore::get_object(const Context& ctx, const std::string& raw_key) const {
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

    std::shared_lock lock(mutex_);

    auto path = key_to_path(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.error = failed(ErrorCode::NotFound, key);
        return result;
    }

    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        result.error = failed(ErrorCode::DownloadFailed, "open " + key, std::strerror(errno));
        return result;
    }

    result.body = std::move(stream);
    return result;
}

HeadResult LocalStore::head_object(const Context& ctx, const std::string& raw_key) const {
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

    std::shared_lock lock(mutex_);

    auto path = key_to_path(key);
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        result.error = failed(ErrorCode::NotFound, key);
        return result;
    }

    result.info.key = key;
    result.info.size = static_cast<int64_t>(fs::file_size(path, ec));
    if (ec) {
        result.error = failed(ErrorCode::DownloadFailed, "stat " + key, ec.message());
        return result;
    }
    auto ftime = fs::last_write_time(path, ec);
    if (!ec) {
        result.info.last_modified = to_system_time(ftime);
    }
    result.info.content_type = detect_content_type(key);

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = failed(ErrorCode::DownloadFailed, "open " + key, std::strerror(errno));
        return result;
    }
    Md5 md5;
    std::vector<char> buffer(constants::DEFAULT_STREAM_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.gcount() > 0) {
            md5.update(buffer.data(), static_cast<size_t>(file.gcount()));
        }
    }
    if (file.bad()) {
        result.error = failed(ErrorCode::DownloadFailed, "read " + key);
        return result;
    }
    result.info.etag = Md5::hex(md5.finish());

    return result;
}

StoreError LocalStore::remove_locked(const std::string& key) {
    std::error_code ec;
    fs::remove(key_to_path(key), ec);
    // Already gone counts as success
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return StoreError::make(ErrorCode::DeleteFailed, "delete " + key, ec.message());
    }
    return {};
}

StoreError LocalStore::remove(const Context& ctx, const std::string& raw_key) {
    std::string key;
    if (auto err = sanitize_key(raw_key, key); !err.ok()) {
        return err;
    }
    if (ctx.done()) {
        return cancelled(ctx, "delete " + key);
    }

    std::unique_lock lock(mutex_);

    auto err = remove_locked(key);
    if (!err.ok()) {
        return failed(err.code, err.message, err.cause);
    }
    log_debug("local: deleted %s", key.c_str());
    return {};
}

DeleteMultipleResult LocalStore::remove_multiple(const Context& ctx,
                                                 const std::vector<std::string>& raw_keys) {
    DeleteMultipleResult result;
    if (raw_keys.empty()) {
        return result;
    }

    // Reject the whole batch before touching the disk if any key is bad
    std::vector<std::string> keys;
    keys.reserve(raw_keys.size());
    for (const auto& raw : raw_keys) {
        std::string key;
        if (auto err = sanitize_key(raw, key); !err.ok()) {
            result.failed_keys.push_back(raw);
            continue;
        }
        keys.push_back(std::move(key));
    }
    if (!result.failed_keys.empty()) {
        result.error = StoreError::make(ErrorCode::InvalidKey,
                                        std::to_string(result.failed_keys.size()) + " invalid keys in batch");
        return result;
    }

    for (size_t i = 0; i < keys.size(); ++i) {
        if (ctx.done()) {
            // Everything not yet deleted is reported back
            for (size_t j = i; j < keys.size(); ++j) {
                result.failed_keys.push_back(raw_keys[j]);
            }
            result.error = cancelled(ctx, "delete batch");
            return result;
        }

        std::unique_lock lock(mutex_);
        if (auto err = remove_locked(keys[i]); !err.ok()) {
            log_error("local: %s", err.to_string().c_str());
            result.failed_keys.push_back(raw_keys[i]);
        }
    }

    if (!result.failed_keys.empty()) {
        result.error = failed(ErrorCode::DeleteFailed,
                              std::to_string(result.failed_keys.size()) + " files failed to delete");
        return result;
    }

    log_debug("local: deleted %zu files", keys.size());
    return result;
}

ListResult LocalStore::list(const Context& ctx, const ListInput& input) const {
    ListResult result;
    size_t max_keys = input.max_keys > 0 ? static_cast<size_t>(input.max_keys)
                                         : static_cast<size_t>(constants::DEFAULT_LIST_MAX_KEYS);

    if (ctx.done()) {
        result.error = cancelled(ctx, "list");
        return result;
    }

    std::shared_lock lock(mutex_);

    std::vector<ObjectInfo> objects;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;

    for (; !ec && it != end; it.increment(ec)) {
        if (ctx.done()) {
            result.error = cancelled(ctx, "list");
            return result;
        }

        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || is_temp_file(entry.path())) {
            continue;
        }

        std::string key = entry.path().lexically_relative(root_).generic_string();

        if (!input.prefix.empty() && !key.starts_with(input.prefix)) {
            continue;
        }
        if (!input.start_after.empty() && key <= input.start_after) {
            continue;
        }

        ObjectInfo info;
        info.key = key;
        info.size = static_cast<int64_t>(entry.file_size(entry_ec));
        if (entry_ec) {
            continue;  // vanished mid-walk
        }
        auto ftime = entry.last_write_time(entry_ec);
        if (!entry_ec) {
            info.last_modified = to_system_time(ftime);
        }
        info.content_type = detect_content_type(key);
        objects.push_back(std::move(info));
    }

    if (ec) {
        result.error = failed(ErrorCode::InternalError, "list " + root_.string(), ec.message());
        return result;
    }

    // Walk order is arbitrary; sort before truncating
    std::sort(objects.begin(), objects.end(),
              [](const ObjectInfo& a, const ObjectInfo& b) { return a.key < b.key; });

    if (objects.size() > max_keys) {
        objects.resize(max_keys);
        result.output.is_truncated = true;
    }
    if (!objects.empty()) {
        result.output.next_marker = objects.back().key;
    }
    result.output.objects = std::move(objects);
    return result;
}

ExistsResult LocalStore::exists(const Context& ctx, const std::string& raw_key) const {
    ExistsResult result;

    std::string key;
    if (auto err = sanitize_key(raw_key, key); !err.ok()) {
        result.error = err;
        return result;
    }
    if (ctx.done()) {
        result.error = cancelled(ctx, "exists " + key);
        return result;
    }

    std::shared_lock lock(mutex_);
    std::error_code ec;
    result.exists = fs::is_regular_file(key_to_path(key), ec);
    return result;
}

StoreError LocalStore::copy(const Context& ctx, const std::string& raw_source,
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

    std::unique_lock lock(mutex_);

    auto src_path = key_to_path(source);
    std::error_code ec;
    if (!fs::is_regular_file(src_path, ec)) {
        return failed(ErrorCode::NotFound, source);
    }

    std::ifstream in(src_path, std::ios::binary);
    if (!in) {
        return failed(ErrorCode::UploadFailed, "open copy source " + source, std::strerror(errno));
    }

    // Staged through a temp file, so a failed copy leaves no partial destination
    std::string etag;
    int64_t size = 0;
    auto err = write_atomic(ctx, key_to_path(destination), in, etag, size);
    if (!err.ok()) {
        return err.is(ErrorCode::Cancelled)
            ? err
            : failed(ErrorCode::UploadFailed, "copy " + source + " to " + destination + ": " + err.message,
                     err.cause);
    }

    log_debug("local: copied %s to %s", source.c_str(), destination.c_str());
    return {};
}

} // namespace blobkit
