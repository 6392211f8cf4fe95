// Test suite for configuration, the store factory and metrics.
//
// Tests:
//   1. Command-line parsing
//   2. JSON config files and environment defaults
//   3. Validation messages
//   4. StoreFactory parameter handling
//   5. InstrumentedStore and the metrics exporter

#include "test_harness.hpp"

#include "blobkit/config/store_config.hpp"
#include "blobkit/storage/metrics.hpp"
#include "blobkit/storage/store.hpp"

#include <cstdlib>
#include <sstream>
#include <vector>

using namespace blobkit;

namespace {

// argv built from strings; argv[0] is the program name
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    Args(std::initializer_list<std::string> args) : storage(args) {
        storage.insert(storage.begin(), "blobctl");
        for (auto& s : storage) argv.push_back(s.data());
        argv.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
};

std::optional<StoreConfig> parse(Args& args, int& first_positional) {
    return StoreConfig::from_args(args.argc(), args.argv.data(), first_positional);
}

void clear_aws_env() {
    for (const char* name : {"S3_BUCKET", "AWS_REGION", "AWS_DEFAULT_REGION", "AWS_ACCESS_KEY_ID",
                             "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN"}) {
        unsetenv(name);
    }
}

template <typename Fn>
bool throws_invalid_argument(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. Command line
// ---------------------------------------------------------------------------

static void test_from_args() {
    std::cout << "\n=== Command line ===" << std::endl;
    clear_aws_env();

    {
        TEST(defaults);
        Args args{"ls"};
        int first = -1;
        auto config = parse(args, first);
        ASSERT_TRUE(config.has_value(), "parse failed");
        ASSERT_EQ(config->type, "local", "type");
        ASSERT_TRUE(config->params.empty(), "unexpected params");
        ASSERT_EQ(first, 1, "first positional");
        PASS();
    }

    {
        TEST(s3_flags_map_to_params);
        Args args{"--type", "s3", "--bucket", "media", "--region", "eu-west-1",
                  "--endpoint", "http://minio:9000", "--path-style", "--no-verify-ssl",
                  "--part-size", "8388608", "--concurrency", "4", "--max-retries", "2",
                  "--log-level", "warn", "put", "a.txt", "local.txt"};
        int first = -1;
        auto config = parse(args, first);
        ASSERT_TRUE(config.has_value(), "parse failed");
        ASSERT_EQ(config->type, "s3", "type");
        ASSERT_EQ(config->params.at("bucket"), "media", "bucket");
        ASSERT_EQ(config->params.at("region"), "eu-west-1", "region");
        ASSERT_EQ(config->params.at("endpoint"), "http://minio:9000", "endpoint");
        ASSERT_EQ(config->params.at("path_style"), "true", "path style");
        ASSERT_EQ(config->params.at("verify_ssl"), "false", "verify ssl");
        ASSERT_EQ(config->params.at("upload_part_size"), "8388608", "part size");
        ASSERT_EQ(config->params.at("upload_concurrency"), "4", "concurrency");
        ASSERT_EQ(config->params.at("max_retries"), "2", "retries");
        ASSERT_EQ(config->log_level, "warn", "log level");
        ASSERT_EQ(first, 19, "first positional");
        ASSERT_EQ(std::string(args.argv[first]), "put", "command");
        PASS();
    }

    {
        TEST(verbose_and_metrics);
        Args args{"-v", "--metrics-file", "/tmp/x.prom", "--metrics-interval", "30"};
        int first = -1;
        auto config = parse(args, first);
        ASSERT_TRUE(config.has_value(), "parse failed");
        ASSERT_EQ(config->log_level, "debug", "verbose");
        ASSERT_EQ(config->metrics_file.string(), "/tmp/x.prom", "metrics file");
        ASSERT_EQ(config->metrics_interval_secs, 30u, "interval");
        ASSERT_EQ(first, args.argc(), "no positional");
        PASS();
    }

    {
        TEST(bad_options_rejected);
        int first = 0;
        Args unknown{"--frobnicate", "ls"};
        ASSERT_TRUE(!parse(unknown, first).has_value(), "unknown option accepted");
        Args missing{"--bucket"};
        ASSERT_TRUE(!parse(missing, first).has_value(), "missing value accepted");
        Args interval{"--metrics-interval", "soon"};
        ASSERT_TRUE(!parse(interval, first).has_value(), "non-numeric interval accepted");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. JSON and environment
// ---------------------------------------------------------------------------

static void test_json_and_env() {
    std::cout << "\n=== JSON config and environment ===" << std::endl;
    auto dir = make_temp_dir("blobkit-config");

    {
        TEST(load_json);
        auto path = dir / "store.json";
        write_file(path, R"({
            "log_level": "error",
            "metrics_file": "/var/lib/node_exporter/blobkit.prom",
            "metrics_interval": 60,
            "store": {
                "type": "s3",
                "bucket": "assets",
                "upload_concurrency": 8,
                "path_style": true
            }
        })");

        StoreConfig config;
        ASSERT_TRUE(config.load_json(path), "load failed");
        ASSERT_EQ(config.type, "s3", "type");
        ASSERT_EQ(config.log_level, "error", "log level");
        ASSERT_EQ(config.metrics_interval_secs, 60u, "interval");
        ASSERT_EQ(config.params.at("bucket"), "assets", "bucket");
        ASSERT_EQ(config.params.at("upload_concurrency"), "8", "number spelled as text");
        ASSERT_EQ(config.params.at("path_style"), "true", "bool spelled as text");
        ASSERT_TRUE(!config.params.count("type"), "type leaked into params");
        PASS();
    }

    {
        TEST(flags_override_config_file);
        auto path = dir / "base.json";
        write_file(path, R"({"store": {"type": "local", "path": "/srv/a"}})");
        Args args{"--config", path.string(), "--path", "/srv/b"};
        int first = 0;
        auto config = parse(args, first);
        ASSERT_TRUE(config.has_value(), "parse failed");
        ASSERT_EQ(config->params.at("path"), "/srv/b", "later flag wins");
        PASS();
    }

    {
        TEST(bad_json_rejected);
        auto path = dir / "broken.json";
        write_file(path, "{ not json");
        StoreConfig config;
        ASSERT_TRUE(!config.load_json(path), "broken json accepted");
        ASSERT_TRUE(!config.load_json(dir / "absent.json"), "missing file accepted");
        PASS();
    }

    {
        TEST(env_defaults_for_s3);
        clear_aws_env();
        setenv("S3_BUCKET", "from-env", 1);
        setenv("AWS_DEFAULT_REGION", "ap-south-1", 1);
        setenv("AWS_ACCESS_KEY_ID", "AKIDENV", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "secretenv", 1);

        StoreConfig config;
        config.type = "s3";
        config.params["bucket"] = "explicit";
        config.apply_defaults();
        clear_aws_env();

        ASSERT_EQ(config.params.at("bucket"), "explicit", "explicit value replaced");
        ASSERT_EQ(config.params.at("region"), "ap-south-1", "region fallback");
        ASSERT_EQ(config.params.at("access_key"), "AKIDENV", "access key");
        ASSERT_EQ(config.params.at("secret_key"), "secretenv", "secret key");
        ASSERT_TRUE(!config.params.count("session_token"), "session token invented");
        PASS();
    }

    {
        TEST(env_ignored_for_local);
        setenv("S3_BUCKET", "from-env", 1);
        StoreConfig config;
        config.apply_defaults();
        clear_aws_env();
        ASSERT_TRUE(config.params.empty(), "local config picked up s3 env");
        PASS();
    }

    std::filesystem::remove_all(dir);
}

// ---------------------------------------------------------------------------
// 3. Validation
// ---------------------------------------------------------------------------

static void test_validate() {
    std::cout << "\n=== Validation ===" << std::endl;

    {
        TEST(required_fields);
        StoreConfig local;
        ASSERT_EQ(local.validate(), "local store requires 'path' (--path)", "local path");
        local.params["path"] = "/srv/blobs";
        ASSERT_EQ(local.validate(), "", "valid local");

        StoreConfig s3;
        s3.type = "s3";
        ASSERT_EQ(s3.validate(), "s3 store requires 'bucket' (--bucket or S3_BUCKET)", "bucket");
        s3.params["bucket"] = "b";
        s3.params["access_key"] = "AKID";
        ASSERT_EQ(s3.validate(), "s3 access key and secret key must be given together", "credential pair");
        s3.params["secret_key"] = "secret";
        ASSERT_EQ(s3.validate(), "", "valid s3");

        StoreConfig other;
        other.type = "gcs";
        ASSERT_EQ(other.validate(), "unknown store type: gcs", "type");
        PASS();
    }

    {
        TEST(value_checks);
        StoreConfig config;
        config.params["path"] = "/srv/blobs";
        config.params["upload_concurrency"] = "-1";
        ASSERT_EQ(config.validate(), "upload_concurrency must be a non-negative integer, got '-1'", "numeric");
        config.params.erase("upload_concurrency");

        config.log_level = "chatty";
        ASSERT_EQ(config.validate(), "unknown log level: chatty", "log level");
        config.log_level = "warn";

        config.metrics_file = "/tmp/m.prom";
        config.metrics_interval_secs = 0;
        ASSERT_EQ(config.validate(), "metrics_interval must be > 0", "interval");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. StoreFactory
// ---------------------------------------------------------------------------

static void test_factory() {
    std::cout << "\n=== StoreFactory ===" << std::endl;
    auto dir = make_temp_dir("blobkit-factory");

    {
        TEST(create_local);
        auto store = StoreFactory::create("local", {{"path", (dir / "root").string()}});
        ASSERT_TRUE(store != nullptr, "no store");
        ASSERT_EQ(store->type_name(), "local", "type");
        ASSERT_TRUE(std::filesystem::is_directory(dir / "root"), "root not created");
        ASSERT_TRUE(as_presigner(*store) == nullptr, "local store presigns");
        PASS();
    }

    {
        TEST(create_s3_offline);
        auto store = StoreFactory::create_s3("bkt", "eu-west-1", "http://minio:9000", "AKID", "secret");
        ASSERT_EQ(store->type_name(), "s3", "type");
        auto* presigner = as_presigner(*store);
        ASSERT_TRUE(presigner != nullptr, "s3 store has no presigner");
        auto url = presigner->presign_get(Context::background(), "a.txt", std::chrono::seconds(60));
        ASSERT_OK(url, "presign");
        ASSERT_TRUE(url.url.rfind("http://minio:9000/bkt/a.txt?", 0) == 0, "endpoint implies path style: " + url.url);
        PASS();
    }

    {
        TEST(bad_parameters_throw);
        ASSERT_TRUE(throws_invalid_argument([] { StoreFactory::create("ftp", {}); }), "unknown type");
        ASSERT_TRUE(throws_invalid_argument([] { StoreFactory::create("local", {}); }), "missing path");
        ASSERT_TRUE(throws_invalid_argument([] { StoreFactory::create("s3", {{"region", "x"}}); }),
                    "missing bucket");
        ASSERT_TRUE(throws_invalid_argument([] {
            StoreFactory::create("s3", {{"bucket", "b"}, {"path_style", "maybe"}});
        }), "bad bool");
        ASSERT_TRUE(throws_invalid_argument([] {
            StoreFactory::create("s3", {{"bucket", "b"}, {"upload_concurrency", "-4"}});
        }), "negative number");
        ASSERT_TRUE(throws_invalid_argument([] {
            StoreFactory::create("s3", {{"bucket", "b"}, {"max_retries", "3x"}});
        }), "trailing garbage");
        PASS();
    }

    {
        TEST(missing_root_without_create);
        bool threw = false;
        try {
            StoreFactory::create_local((dir / "absent").string(), false);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "missing root accepted");
        PASS();
    }

    std::filesystem::remove_all(dir);
}

// ---------------------------------------------------------------------------
// 5. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;
    auto dir = make_temp_dir("blobkit-metrics");
    auto ctx = Context::background();

    auto metrics = std::make_shared<StoreMetrics>(std::map<std::string, std::string>{{"store", "local"}});
    InstrumentedStore store(StoreFactory::create_local((dir / "root").string()), metrics);

    {
        TEST(counts_operations);
        std::istringstream body("hello world");
        UploadInput input;
        input.key = "docs/a.txt";
        input.body = &body;
        ASSERT_OK(store.upload(ctx, input), "upload");

        BufferWriterAt sink;
        ASSERT_OK(store.download(ctx, "docs/a.txt", sink), "download");
        ASSERT_CODE(store.head_object(ctx, "docs/missing.txt").error, ErrorCode::NotFound, "head");
        ASSERT_CODE(store.remove(ctx, "../x"), ErrorCode::InvalidKey, "remove");

        ASSERT_EQ(metrics->operation_count("upload", "success"), 1.0, "upload count");
        ASSERT_EQ(metrics->operation_count("download", "success"), 1.0, "download count");
        ASSERT_EQ(metrics->operation_count("head_object", "not_found"), 1.0, "not found count");
        ASSERT_EQ(metrics->operation_count("delete", "invalid_key"), 1.0, "invalid key count");
        ASSERT_EQ(metrics->upload_bytes(), 11.0, "upload bytes");
        ASSERT_EQ(metrics->download_bytes(), 11.0, "download bytes");
        PASS();
    }

    {
        TEST(failed_upload_counts_no_bytes);
        double before = metrics->upload_bytes();
        std::istringstream body("ignored");
        UploadInput input;
        input.key = "/abs";
        input.body = &body;
        ASSERT_CODE(store.upload(ctx, input).error, ErrorCode::InvalidKey, "upload");
        ASSERT_EQ(metrics->upload_bytes(), before, "bytes counted for failed upload");
        ASSERT_EQ(metrics->operation_count("upload", "invalid_key"), 1.0, "failure count");
        PASS();
    }

    {
        TEST(presign_follows_inner_store);
        ASSERT_TRUE(store.presigner() == nullptr, "decorator claims presign support");
        auto result = store.presign_get(ctx, "docs/a.txt", std::chrono::seconds(60));
        ASSERT_CODE(result.error, ErrorCode::InvalidInput, "presign on local");
        PASS();
    }

    {
        TEST(null_inner_rejected);
        ASSERT_TRUE(throws_invalid_argument([&] { InstrumentedStore bad(nullptr, metrics); }),
                    "null store accepted");
        PASS();
    }

    {
        TEST(exporter_writes_textfile);
        auto prom = dir / "blobkit.prom";
        MetricsExporter exporter(metrics, prom, std::chrono::seconds(3600));
        ASSERT_TRUE(exporter.write_file(), "write failed");
        std::string text = read_file(prom);
        ASSERT_TRUE(text.find("blobkit_store_operations_total") != std::string::npos, "operations family missing");
        ASSERT_TRUE(text.find("op=\"upload\"") != std::string::npos, "op label missing");
        ASSERT_TRUE(text.find("store=\"local\"") != std::string::npos, "constant label missing");
        ASSERT_TRUE(text.find("blobkit_store_operation_duration_seconds") != std::string::npos,
                    "duration family missing");
        PASS();
    }

    {
        TEST(exporter_final_snapshot_on_stop);
        auto prom = dir / "final.prom";
        MetricsExporter exporter(metrics, prom, std::chrono::seconds(3600));
        exporter.start();
        exporter.stop();
        ASSERT_TRUE(std::filesystem::exists(prom), "no snapshot written");
        ASSERT_TRUE(!std::filesystem::exists(prom.string() + ".tmp"), "temp file left behind");
        PASS();
    }

    std::filesystem::remove_all(dir);
}

int main() {
    std::cout << "blobkit config/factory/metrics test suite" << std::endl;
    std::cout << "=========================================" << std::endl;

    test_from_args();
    test_json_and_env();
    test_validate();
    test_factory();
    test_metrics();

    return print_results();
}
