#include "blobkit/storage/store.hpp"
#include "blobkit/storage/local_store.hpp"
#include "blobkit/storage/s3_store.hpp"

#include <stdexcept>

namespace blobkit {

namespace {

bool parse_bool(const std::string& name, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument("'" + name + "' must be true or false, got '" + value + "'");
}

uint64_t parse_uint(const std::string& name, const std::string& value) {
    std::string error = "'" + name + "' must be a non-negative integer, got '" + value + "'";
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument(error);
    }
    size_t pos = 0;
    uint64_t result = 0;
    try {
        result = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(error);
    }
    if (pos != value.size()) {
        throw std::invalid_argument(error);
    }
    return result;
}

} // namespace

std::unique_ptr<Store> StoreFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    if (type == "local") {
        auto it = params.find("path");
        if (it == params.end() || it->second.empty()) {
            throw std::invalid_argument("Local store requires 'path' parameter");
        }
        bool create_root = true;
        if (auto cr = params.find("create_root"); cr != params.end()) {
            create_root = parse_bool("create_root", cr->second);
        }
        return std::make_unique<LocalStore>(it->second, create_root);
    }

    if (type == "s3") {
        S3Store::Config s3_config;

        auto it = params.find("bucket");
        if (it == params.end() || it->second.empty()) {
            throw std::invalid_argument("S3 store requires 'bucket' parameter");
        }
        s3_config.bucket = it->second;

        if ((it = params.find("region")) != params.end()) {
            s3_config.region = it->second;
        }
        if ((it = params.find("access_key")) != params.end()) {
            s3_config.access_key = it->second;
        }
        if ((it = params.find("secret_key")) != params.end()) {
            s3_config.secret_key = it->second;
        }
        if ((it = params.find("session_token")) != params.end()) {
            s3_config.session_token = it->second;
        }
        if ((it = params.find("endpoint")) != params.end()) {
            s3_config.endpoint = it->second;
        }
        if ((it = params.find("path_style")) != params.end()) {
            s3_config.use_path_style = parse_bool("path_style", it->second);
        }
        if ((it = params.find("verify_ssl")) != params.end()) {
            s3_config.verify_ssl = parse_bool("verify_ssl", it->second);
        }
        if ((it = params.find("ca_bundle")) != params.end()) {
            s3_config.ca_bundle = it->second;
        }
        if ((it = params.find("upload_part_size")) != params.end()) {
            s3_config.upload_part_size = parse_uint("upload_part_size", it->second);
        }
        if ((it = params.find("upload_concurrency")) != params.end()) {
            s3_config.upload_concurrency = parse_uint("upload_concurrency", it->second);
        }
        if ((it = params.find("download_part_size")) != params.end()) {
            s3_config.download_part_size = parse_uint("download_part_size", it->second);
        }
        if ((it = params.find("download_concurrency")) != params.end()) {
            s3_config.download_concurrency = parse_uint("download_concurrency", it->second);
        }
        if ((it = params.find("connect_timeout")) != params.end()) {
            s3_config.connect_timeout_secs = static_cast<uint32_t>(parse_uint("connect_timeout", it->second));
        }
        if ((it = params.find("request_timeout")) != params.end()) {
            s3_config.request_timeout_secs = static_cast<uint32_t>(parse_uint("request_timeout", it->second));
        }
        if ((it = params.find("max_retries")) != params.end()) {
            s3_config.max_retries = static_cast<uint32_t>(parse_uint("max_retries", it->second));
        }

        return std::make_unique<S3Store>(std::move(s3_config));
    }

    throw std::invalid_argument("Unknown store type: " + type);
}

std::unique_ptr<Store> StoreFactory::create_local(const std::string& root_path, bool create_root) {
    return create("local", {{"path", root_path}, {"create_root", create_root ? "true" : "false"}});
}

std::unique_ptr<Store> StoreFactory::create_s3(const std::string& bucket,
                                               const std::string& region,
                                               const std::string& endpoint,
                                               const std::string& access_key,
                                               const std::string& secret_key) {
    std::map<std::string, std::string> params;
    params["bucket"] = bucket;
    if (!region.empty()) params["region"] = region;
    if (!endpoint.empty()) {
        params["endpoint"] = endpoint;
        params["path_style"] = "true";
    }
    if (!access_key.empty()) params["access_key"] = access_key;
    if (!secret_key.empty()) params["secret_key"] = secret_key;
    return create("s3", params);
}

} // namespace blobkit
