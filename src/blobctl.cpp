// blobctl: command-line client for blobkit stores.
//
// Usage: blobctl [options] <command> [args]
//
// Commands:
//   put <key> <file>      Upload a file ('-' reads stdin)
//   get <key> <file>      Download to a file
//   cat <key>             Write an object to stdout
//   head <key>            Show object metadata
//   rm <key>...           Delete objects
//   ls                    List objects
//   cp <src> <dst>        Copy an object
//   presign <key>         Print a presigned URL
//
// Exit status: 0 success, 1 error, 2 object not found.

#include "blobkit/config/store_config.hpp"
#include "blobkit/core/log.hpp"
#include "blobkit/storage/metrics.hpp"
#include "blobkit/storage/store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_NOT_FOUND = 2;

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int sig) {
    (void)sig;
    g_interrupted = 1;
}

int report(const blobkit::StoreError& error) {
    fprintf(stderr, "Error: %s\n", error.to_string().c_str());
    return error.is(blobkit::ErrorCode::NotFound) ? EXIT_NOT_FOUND : EXIT_ERROR;
}

int usage_error(const char* message) {
    fprintf(stderr, "Error: %s (see --help)\n", message);
    return EXIT_ERROR;
}

void format_timestamp(std::chrono::system_clock::time_point tp, char* buf, size_t buf_size) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%dT%H:%M:%SZ", &tm_val);
}

// Command arguments after the command name: positionals plus --flag value pairs
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool put = false;

    bool parse(int argc, char* argv[], int start) {
        for (int i = start; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--put") {
                put = true;
            } else if (arg == "--content-type" || arg == "--prefix" || arg == "--max" ||
                       arg == "--start-after" || arg == "--expires") {
                if (++i >= argc) {
                    fprintf(stderr, "Error: %s requires an argument\n", arg.c_str());
                    return false;
                }
                options[arg.substr(2)] = argv[i];
            } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
                fprintf(stderr, "Error: unknown option: %s\n", arg.c_str());
                return false;
            } else {
                positional.push_back(arg);
            }
        }
        return true;
    }

    std::string option(const std::string& name, const std::string& fallback = "") const {
        auto it = options.find(name);
        return it != options.end() ? it->second : fallback;
    }
};

int cmd_put(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (args.positional.size() != 2) return usage_error("put takes <key> <file>");

    const std::string& key = args.positional[0];
    const std::string& file = args.positional[1];

    std::ifstream ifs;
    std::istream* body = &std::cin;
    if (file != "-") {
        ifs.open(file, std::ios::binary);
        if (!ifs) {
            fprintf(stderr, "Error: cannot open %s\n", file.c_str());
            return EXIT_ERROR;
        }
        body = &ifs;
    }

    blobkit::UploadInput input;
    input.key = key;
    input.body = body;
    input.content_type = args.option("content-type");

    auto result = store.upload(ctx, input);
    if (!result.ok()) return report(result.error);

    printf("%s\tetag=%s", result.output.location.c_str(), result.output.etag.c_str());
    if (result.output.version_id) {
        printf("\tversion=%s", result.output.version_id->c_str());
    }
    printf("\n");
    return EXIT_OK;
}

int cmd_get(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (args.positional.size() != 2) return usage_error("get takes <key> <file>");

    blobkit::FileWriterAt sink(args.positional[1]);
    if (!sink.is_open()) {
        fprintf(stderr, "Error: cannot open %s for writing\n", args.positional[1].c_str());
        return EXIT_ERROR;
    }

    auto result = store.download(ctx, args.positional[0], sink);
    if (!sink.close()) {
        fprintf(stderr, "Error: failed to flush %s\n", args.positional[1].c_str());
        return EXIT_ERROR;
    }
    if (!result.ok()) {
        std::remove(args.positional[1].c_str());
        return report(result.error);
    }

    printf("%lld bytes\n", static_cast<long long>(result.bytes_written));
    return EXIT_OK;
}

int cmd_cat(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (args.positional.size() != 1) return usage_error("cat takes <key>");

    auto result = store.get_object(ctx, args.positional[0]);
    if (!result.ok()) return report(result.error);

    std::cout << result.body->rdbuf();
    std::cout.flush();
    if (result.body->bad()) {
        fprintf(stderr, "Error: failed to read %s\n", args.positional[0].c_str());
        return EXIT_ERROR;
    }
    return EXIT_OK;
}

int cmd_head(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (args.positional.size() != 1) return usage_error("head takes <key>");

    auto result = store.head_object(ctx, args.positional[0]);
    if (!result.ok()) return report(result.error);

    const auto& info = result.info;
    char modified[64];
    format_timestamp(info.last_modified, modified, sizeof(modified));

    printf("key:           %s\n", info.key.c_str());
    printf("size:          %lld\n", static_cast<long long>(info.size));
    printf("content-type:  %s\n", info.content_type.c_str());
    printf("etag:          %s\n", info.etag.c_str());
    printf("last-modified: %s\n", modified);
    for (const auto& [name, value] : info.metadata) {
        printf("meta-%s: %s\n", name.c_str(), value.c_str());
    }
    return EXIT_OK;
}

int cmd_rm(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (args.positional.empty()) return usage_error("rm takes at least one <key>");

    if (args.positional.size() == 1) {
        auto error = store.remove(ctx, args.positional[0]);
        return error.ok() ? EXIT_OK : report(error);
    }

    auto result = store.remove_multiple(ctx, args.positional);
    for (const auto& key : result.failed_keys) {
        fprintf(stderr, "failed: %s\n", key.c_str());
    }
    return result.ok() ? EXIT_OK : report(result.error);
}

int cmd_ls(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (!args.positional.empty()) return usage_error("ls takes no positional arguments");

    blobkit::ListInput input;
    input.prefix = args.option("prefix");
    input.start_after = args.option("start-after");
    std::string max = args.option("max");
    if (!max.empty()) {
        char* end = nullptr;
        long value = strtol(max.c_str(), &end, 10);
        if (*end != '\0' || value <= 0) return usage_error("--max expects a positive number");
        input.max_keys = static_cast<int32_t>(value);
    }

    auto result = store.list(ctx, input);
    if (!result.ok()) return report(result.error);

    char modified[64];
    for (const auto& obj : result.output.objects) {
        format_timestamp(obj.last_modified, modified, sizeof(modified));
        printf("%s\t%12lld\t%s\n", modified, static_cast<long long>(obj.size), obj.key.c_str());
    }
    if (result.output.is_truncated) {
        fprintf(stderr, "(truncated, continue with --start-after %s)\n",
                result.output.next_marker.c_str());
    }
    return EXIT_OK;
}

int cmd_cp(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (args.positional.size() != 2) return usage_error("cp takes <src> <dst>");

    auto error = store.copy(ctx, args.positional[0], args.positional[1]);
    return error.ok() ? EXIT_OK : report(error);
}

int cmd_presign(blobkit::Store& store, const blobkit::Context& ctx, const CommandArgs& args) {
    if (args.positional.size() != 1) return usage_error("presign takes <key>");

    auto* presigner = blobkit::as_presigner(store);
    if (!presigner) {
        fprintf(stderr, "Error: %s store does not support presigned URLs\n", store.type_name().c_str());
        return EXIT_ERROR;
    }

    std::string expires_str = args.option("expires", "3600");
    char* end = nullptr;
    long long expires = strtoll(expires_str.c_str(), &end, 10);
    if (*end != '\0') return usage_error("--expires expects seconds");

    auto result = args.put
        ? presigner->presign_put(ctx, args.positional[0], args.option("content-type"),
                                 std::chrono::seconds(expires))
        : presigner->presign_get(ctx, args.positional[0], std::chrono::seconds(expires));
    if (!result.ok()) return report(result.error);

    printf("%s\n", result.url.c_str());
    return EXIT_OK;
}

}  // namespace

int main(int argc, char* argv[]) {
    int command_index = argc;
    auto config_opt = blobkit::StoreConfig::from_args(argc, argv, command_index);
    if (!config_opt) {
        return EXIT_ERROR;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_ERROR;
    }
    if (command_index >= argc) {
        blobkit::StoreConfig::print_usage(argv[0]);
        return EXIT_ERROR;
    }

    if (!config.log_level.empty()) {
        blobkit::set_log_level(*blobkit::parse_log_level(config.log_level));
    }

    std::string command = argv[command_index];
    CommandArgs args;
    if (!args.parse(argc, argv, command_index + 1)) {
        return EXIT_ERROR;
    }

    std::unique_ptr<blobkit::Store> store;
    try {
        store = blobkit::StoreFactory::create(config.type, config.params);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open store: " << e.what() << std::endl;
        return EXIT_ERROR;
    }

    std::unique_ptr<blobkit::MetricsExporter> exporter;
    if (!config.metrics_file.empty()) {
        auto metrics = std::make_shared<blobkit::StoreMetrics>(
            std::map<std::string, std::string>{{"store", config.type}});
        store = std::make_unique<blobkit::InstrumentedStore>(std::move(store), metrics);
        exporter = std::make_unique<blobkit::MetricsExporter>(
            metrics, config.metrics_file, std::chrono::seconds(config.metrics_interval_secs));
        exporter->start();
    }

    // Install signal handlers; Ctrl-C cancels the running operation
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto ctx = blobkit::Context::background();
    std::atomic<bool> finished{false};
    std::thread interrupt_watcher([&] {
        while (!finished.load()) {
            if (g_interrupted) {
                ctx.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int rc = EXIT_ERROR;
    if (command == "put") {
        rc = cmd_put(*store, ctx, args);
    } else if (command == "get") {
        rc = cmd_get(*store, ctx, args);
    } else if (command == "cat") {
        rc = cmd_cat(*store, ctx, args);
    } else if (command == "head") {
        rc = cmd_head(*store, ctx, args);
    } else if (command == "rm") {
        rc = cmd_rm(*store, ctx, args);
    } else if (command == "ls") {
        rc = cmd_ls(*store, ctx, args);
    } else if (command == "cp") {
        rc = cmd_cp(*store, ctx, args);
    } else if (command == "presign") {
        rc = cmd_presign(*store, ctx, args);
    } else {
        fprintf(stderr, "Error: unknown command: %s\n", command.c_str());
    }

    finished = true;
    interrupt_watcher.join();

    if (exporter) {
        exporter->stop();
    }
    return rc;
}
