#pragma once

#include "blobkit/core/constants.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace blobkit {

/// Configuration for a store and the process around it (logging, metrics).
struct StoreConfig {
    std::string type = "local";                 // "local" or "s3"
    std::map<std::string, std::string> params;  // Passed to StoreFactory::create

    std::string log_level;                      // Empty keeps BLOBKIT_LOG_LEVEL / info

    // Prometheus metrics (textfile collector), disabled when empty
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse leading options from argv[1..], stopping at the first argument
    /// that is not an option. `first_positional` receives its index (argc
    /// when there is none). Returns empty optional on error or --help.
    static std::optional<StoreConfig> from_args(int argc, char* argv[], int& first_positional);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill S3 bucket, region and credentials from the environment when unset.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    static void print_usage(const char* program);
};

} // namespace blobkit
