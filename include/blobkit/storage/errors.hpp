#pragma once

#include <string>

namespace blobkit {

// Normalized failure kinds. Callers never see curl, HTTP or OS error types.
enum class ErrorCode {
    Ok = 0,
    InvalidKey,
    InvalidInput,
    NotFound,
    UploadFailed,
    DownloadFailed,
    DeleteFailed,
    Cancelled,
    InternalError
};

const char* error_code_name(ErrorCode code);

struct StoreError {
    ErrorCode code = ErrorCode::Ok;
    std::string message;  // what was attempted, usually naming the key
    std::string cause;    // backend detail (OS error, HTTP status, S3 error code)

    bool ok() const { return code == ErrorCode::Ok; }
    bool is(ErrorCode c) const { return code == c; }

    // "<kind>: <message>: <cause>", omitting empty parts
    std::string to_string() const;

    static StoreError make(ErrorCode code, std::string message, std::string cause = "");
};

} // namespace blobkit
