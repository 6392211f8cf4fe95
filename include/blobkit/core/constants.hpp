#pragma once

#include <cstddef>
#include <cstdint>

namespace blobkit::constants {

// Listing
constexpr int32_t DEFAULT_LIST_MAX_KEYS = 1000;

// S3 protocol limits
constexpr size_t S3_MIN_PART_SIZE = 5 * 1024 * 1024;                    // 5MB
constexpr size_t S3_MAX_PARTS = 10000;
constexpr size_t S3_MAX_DELETE_BATCH = 1000;
constexpr int64_t S3_MAX_PRESIGN_SECONDS = 7 * 24 * 3600;               // 7 days

// Transfer manager defaults
constexpr size_t DEFAULT_UPLOAD_PART_SIZE = 10 * 1024 * 1024;           // 10MB
constexpr size_t DEFAULT_UPLOAD_CONCURRENCY = 5;
constexpr size_t DEFAULT_DOWNLOAD_PART_SIZE = 10 * 1024 * 1024;         // 10MB
constexpr size_t DEFAULT_DOWNLOAD_CONCURRENCY = 5;

// Local backend
constexpr size_t DEFAULT_STREAM_BUFFER_SIZE = 64 * 1024;                // 64KB
constexpr const char* TEMP_FILE_PREFIX = ".tmp-";

// Content type used when nothing better is known
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

// HTTP defaults
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_SECONDS = 60;

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace blobkit::constants
