#include "blobkit/storage/content_type.hpp"
#include "blobkit/storage/errors.hpp"
#include "blobkit/storage/key.hpp"
#include "blobkit/storage/store.hpp"
#include "blobkit/core/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>
#include <unordered_map>

namespace blobkit {

// ============================================================================
// Error taxonomy
// ============================================================================

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::InvalidKey: return "invalid blob key";
        case ErrorCode::InvalidInput: return "invalid input";
        case ErrorCode::NotFound: return "blob not found";
        case ErrorCode::UploadFailed: return "blob upload failed";
        case ErrorCode::DownloadFailed: return "blob download failed";
        case ErrorCode::DeleteFailed: return "blob delete failed";
        case ErrorCode::Cancelled: return "operation cancelled";
        case ErrorCode::InternalError: return "internal error";
    }
    return "unknown";
}

std::string StoreError::to_string() const {
    std::string out = error_code_name(code);
    if (!message.empty()) {
        out += ": " + message;
    }
    if (!cause.empty()) {
        out += ": " + cause;
    }
    return out;
}

StoreError StoreError::make(ErrorCode code, std::string message, std::string cause) {
    StoreError err;
    err.code = code;
    err.message = std::move(message);
    err.cause = std::move(cause);
    return err;
}

// ============================================================================
// Key sanitizer
// ============================================================================

StoreError sanitize_key(const std::string& key, std::string& normalized) {
    if (key.empty()) {
        return StoreError::make(ErrorCode::InvalidKey, "key is empty");
    }
    if (key.find('\0') != std::string::npos) {
        return StoreError::make(ErrorCode::InvalidKey, "key contains a NUL byte");
    }
    if (key.front() == '/') {
        return StoreError::make(ErrorCode::InvalidKey, "key is absolute: " + key);
    }
    if (key.back() == '/') {
        return StoreError::make(ErrorCode::InvalidKey, "key names a directory: " + key);
    }

    std::string clean = std::filesystem::path(key).lexically_normal().generic_string();

    if (clean.empty() || clean == "." || clean.back() == '/') {
        return StoreError::make(ErrorCode::InvalidKey, "key names a directory: " + key);
    }
    if (clean == ".." || clean.starts_with("../")) {
        return StoreError::make(ErrorCode::InvalidKey, "key escapes the store root: " + key);
    }

    normalized = std::move(clean);
    return {};
}

// ============================================================================
// Content-type resolver
// ============================================================================

std::string detect_content_type(const std::string& key) {
    static const std::unordered_map<std::string, std::string> types = {
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".tar", "application/x-tar"},
        {".gz", "application/gzip"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".ico", "image/x-icon"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".wasm", "application/wasm"},
    };

    std::string ext = std::filesystem::path(key).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = types.find(ext);
    return it != types.end() ? it->second : constants::DEFAULT_CONTENT_TYPE;
}

// ============================================================================
// Sinks
// ============================================================================

bool BufferWriterAt::write_at(std::span<const uint8_t> data, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t end = static_cast<size_t>(offset) + data.size();
    if (buffer_.size() < end) {
        buffer_.resize(end);
    }
    std::copy(data.begin(), data.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return true;
}

std::vector<uint8_t> BufferWriterAt::bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

std::string BufferWriterAt::str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::string(buffer_.begin(), buffer_.end());
}

FileWriterAt::FileWriterAt(const std::string& path) {
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

FileWriterAt::~FileWriterAt() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool FileWriterAt::write_at(std::span<const uint8_t> data, uint64_t offset) {
    if (fd_ < 0) {
        return false;
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + written, data.size() - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool FileWriterAt::close() {
    if (fd_ < 0) {
        return false;
    }
    bool ok = ::fsync(fd_) == 0;
    ok = ::close(fd_) == 0 && ok;
    fd_ = -1;
    return ok;
}

// ============================================================================
// Capability query
// ============================================================================

PresignedUrlGenerator* as_presigner(Store& store) {
    return store.presigner();
}

} // namespace blobkit
