#pragma once

#include "blobkit/storage/errors.hpp"

#include <string>

namespace blobkit {

/// Normalize an object key into a clean relative path ("a//b/./c" -> "a/b/c").
///
/// Fails with InvalidKey when the key is empty, absolute, contains a NUL
/// byte, names a directory (normalizes to "." or ends with '/'), or climbs
/// above the root with "..". On success `normalized` holds the key both
/// backends address the object by.
StoreError sanitize_key(const std::string& key, std::string& normalized);

} // namespace blobkit
