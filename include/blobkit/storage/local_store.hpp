#pragma once

#include "blobkit/storage/store.hpp"

#include <filesystem>
#include <shared_mutex>

namespace blobkit {

// Filesystem store: each object is a plain file at <root>/<sanitized key>.
// Uploads land in a ".tmp-*" file beside the target and are renamed into
// place, so readers see either the old or the new content in full.
class LocalStore : public Store {
public:
    // Throws std::runtime_error if the root is missing (and not created) or
    // is not a directory
    explicit LocalStore(const std::filesystem::path& root, bool create_root = true);

    std::string type_name() const override { return "local"; }

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

    PresignedUrlGenerator* presigner() override { return nullptr; }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    // Mutations exclusive, reads shared
    mutable std::shared_mutex mutex_;

    std::filesystem::path key_to_path(const std::string& normalized_key) const;

    // Stream `in` into a temp file beside `path`, then rename over it.
    // Caller holds the exclusive lock.
    StoreError write_atomic(const Context& ctx, const std::filesystem::path& path,
                            std::istream& in, std::string& etag_out, int64_t& size_out);

    StoreError remove_locked(const std::string& normalized_key);
};

} // namespace blobkit
