#include "blobkit/config/store_config.hpp"
#include "blobkit/core/log.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace blobkit {

namespace {

// Map a backend flag with a value to its StoreFactory parameter.
// Returns nullptr for anything that is not a backend flag.
const char* backend_param_for_flag(const std::string& arg) {
    static const std::map<std::string, const char*> flags = {
        {"--path", "path"},
        {"--bucket", "bucket"},
        {"--region", "region"},
        {"--endpoint", "endpoint"},
        {"--access-key", "access_key"},
        {"--secret-key", "secret_key"},
        {"--session-token", "session_token"},
        {"--ca-cert", "ca_bundle"},
        {"--part-size", "upload_part_size"},
        {"--concurrency", "upload_concurrency"},
        {"--download-part-size", "download_part_size"},
        {"--download-concurrency", "download_concurrency"},
        {"--connect-timeout", "connect_timeout"},
        {"--request-timeout", "request_timeout"},
        {"--max-retries", "max_retries"},
    };
    auto it = flags.find(arg);
    return it != flags.end() ? it->second : nullptr;
}

bool param_unset(const std::map<std::string, std::string>& params, const std::string& name) {
    auto it = params.find(name);
    return it == params.end() || it->second.empty();
}

bool is_unsigned(const std::string& value) {
    return !value.empty() && value.find_first_not_of("0123456789") == std::string::npos;
}

}  // namespace

std::optional<StoreConfig> StoreConfig::from_args(int argc, char* argv[], int& first_positional) {
    StoreConfig config;
    first_positional = argc;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-') {
            first_positional = i;
            break;
        }

        if (const char* param = backend_param_for_flag(arg)) {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.params[param] = v;
            continue;
        }

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--type") {
            auto* v = next_arg(i, "--type");
            if (!v) return std::nullopt;
            config.type = v;
        } else if (arg == "--path-style") {
            config.params["path_style"] = "true";
        } else if (arg == "--no-verify-ssl") {
            config.params["verify_ssl"] = "false";
        } else if (arg == "--no-create-root") {
            config.params["create_root"] = "false";
        } else if (arg == "--log-level") {
            auto* v = next_arg(i, "--log-level");
            if (!v) return std::nullopt;
            config.log_level = v;
        } else if (arg == "--verbose" || arg == "-v") {
            config.log_level = "debug";
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            if (!is_unsigned(v)) {
                std::cerr << "Error: --metrics-interval expects seconds, got '" << v << "'\n";
                return std::nullopt;
            }
            config.metrics_interval_secs = std::stoull(v);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool StoreConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("log_level")) log_level = j["log_level"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        // Store section: "type" plus factory parameters. Numbers and booleans
        // are accepted and passed on in their JSON spelling.
        if (j.contains("store") && j["store"].is_object()) {
            auto& js = j["store"];
            if (js.contains("type")) type = js["type"].get<std::string>();
            for (auto& [key, val] : js.items()) {
                if (key == "type") continue;
                params[key] = val.is_string() ? val.get<std::string>() : val.dump();
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void StoreConfig::apply_defaults() {
    if (type != "s3") return;

    auto from_env = [&](const char* param, const char* env) {
        if (param_unset(params, param)) {
            if (const char* v = std::getenv(env); v && *v) {
                params[param] = v;
            }
        }
    };
    from_env("bucket", "S3_BUCKET");
    from_env("region", "AWS_REGION");
    from_env("region", "AWS_DEFAULT_REGION");
    from_env("access_key", "AWS_ACCESS_KEY_ID");
    from_env("secret_key", "AWS_SECRET_ACCESS_KEY");
    from_env("session_token", "AWS_SESSION_TOKEN");
}

std::string StoreConfig::validate() const {
    if (type == "local") {
        if (param_unset(params, "path")) return "local store requires 'path' (--path)";
    } else if (type == "s3") {
        if (param_unset(params, "bucket")) return "s3 store requires 'bucket' (--bucket or S3_BUCKET)";
        if (param_unset(params, "access_key") != param_unset(params, "secret_key"))
            return "s3 access key and secret key must be given together";
    } else {
        return "unknown store type: " + type;
    }

    for (const char* numeric : {"upload_part_size", "upload_concurrency", "download_part_size",
                                "download_concurrency", "connect_timeout", "request_timeout",
                                "max_retries"}) {
        auto it = params.find(numeric);
        if (it != params.end() && !is_unsigned(it->second)) {
            return std::string(numeric) + " must be a non-negative integer, got '" + it->second + "'";
        }
    }

    if (!log_level.empty() && !parse_log_level(log_level)) {
        return "unknown log level: " + log_level;
    }
    if (!metrics_file.empty() && metrics_interval_secs == 0) {
        return "metrics_interval must be > 0";
    }
    return {};
}

void StoreConfig::print_usage(const char* program) {
    std::cerr <<
        "Usage: " << program << " [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  put <key> <file> [--content-type T]   Upload a file ('-' reads stdin)\n"
        "  get <key> <file>                      Download to a file\n"
        "  cat <key>                             Write an object to stdout\n"
        "  head <key>                            Show object metadata\n"
        "  rm <key>...                           Delete one or more objects\n"
        "  ls [--prefix P] [--max N] [--start-after K]\n"
        "                                        List objects\n"
        "  cp <src> <dst>                        Copy an object\n"
        "  presign <key> [--put] [--content-type T] [--expires S]\n"
        "                                        Print a presigned URL (s3 only)\n"
        "\n"
        "Store:\n"
        "  --config <path>                  JSON config file\n"
        "  --type <local|s3>                Store type (default: local)\n"
        "  --path <dir>                     Root directory (local)\n"
        "  --no-create-root                 Fail if the root directory is missing (local)\n"
        "  --bucket <name>                  Bucket (s3, or S3_BUCKET env)\n"
        "  --region <region>                Region (s3, or AWS_REGION env, default: us-east-1)\n"
        "  --endpoint <url>                 Custom endpoint (MinIO, ...)\n"
        "  --path-style                     Path-style bucket addressing\n"
        "  --access-key <key>               Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --secret-key <key>               Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --session-token <token>          Session token (or AWS_SESSION_TOKEN env)\n"
        "  --ca-cert <path>                 CA bundle for SSL\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --part-size <bytes>              Multipart upload part size (min 5MB)\n"
        "  --concurrency <N>                Parallel part uploads\n"
        "  --download-part-size <bytes>     Ranged download part size\n"
        "  --download-concurrency <N>       Parallel ranged downloads\n"
        "  --connect-timeout <secs>         Connect timeout (default: 10)\n"
        "  --request-timeout <secs>         Per-request timeout (default: 60)\n"
        "  --max-retries <N>                Retries for network errors and 5xx (default: 0)\n"
        "\n"
        "Process:\n"
        "  --log-level <level>              debug, info, warn, error\n"
        "  --verbose, -v                    Same as --log-level debug\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n"
        "\n"
        "Exit status: 0 success, 1 error, 2 object not found.\n";
}

}  // namespace blobkit
