#pragma once

#include <string>

namespace blobkit {

/// MIME type for a key by its (case-insensitive) extension.
/// Unknown or missing extensions map to application/octet-stream.
std::string detect_content_type(const std::string& key);

} // namespace blobkit
