#pragma once

#include "blobkit/storage/store.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobkit {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Metric families for store operations, owned by one prometheus::Registry.
///
///   blobkit_store_operations_total{op, result}   result is "success" or the
///                                                 error kind (not_found, ...)
///   blobkit_store_bytes_total{direction}          upload / download
///   blobkit_store_operation_duration_seconds{op}
class StoreMetrics {
public:
    /// @param labels  Constant labels applied to all metrics.
    explicit StoreMetrics(const std::map<std::string, std::string>& labels = {});

    StoreMetrics(const StoreMetrics&) = delete;
    StoreMetrics& operator=(const StoreMetrics&) = delete;

    void record(const std::string& op, const StoreError& error);
    void add_upload_bytes(uint64_t bytes) { upload_bytes_->Increment(static_cast<double>(bytes)); }
    void add_download_bytes(uint64_t bytes) { download_bytes_->Increment(static_cast<double>(bytes)); }

    prometheus::Histogram& duration(const std::string& op);

    double operation_count(const std::string& op, const std::string& result) const;
    double upload_bytes() const { return upload_bytes_->Value(); }
    double download_bytes() const { return download_bytes_->Value(); }

    const std::shared_ptr<prometheus::Registry>& registry() const { return registry_; }

    /// Metric label for an error kind ("success" for ok).
    static std::string result_label(const StoreError& error);

private:
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* operations_;
    prometheus::Family<prometheus::Histogram>* durations_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* download_bytes_;
};

/// Store decorator that records every call on the wrapped store in
/// StoreMetrics. Presigning goes through when the inner store supports it.
class InstrumentedStore : public Store, public PresignedUrlGenerator {
public:
    InstrumentedStore(std::unique_ptr<Store> inner, std::shared_ptr<StoreMetrics> metrics);

    std::string type_name() const override { return inner_->type_name(); }

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

    PresignedUrlGenerator* presigner() override {
        return inner_->presigner() ? this : nullptr;
    }

    PresignResult presign_get(const Context& ctx, const std::string& key,
                              std::chrono::seconds expiration) override;
    PresignResult presign_put(const Context& ctx, const std::string& key,
                              const std::string& content_type,
                              std::chrono::seconds expiration) override;

    Store& inner() { return *inner_; }

private:
    std::unique_ptr<Store> inner_;
    std::shared_ptr<StoreMetrics> metrics_;
};

/// Writes a StoreMetrics registry to a Prometheus textfile for node_exporter
/// pickup. A background thread rewrites the file every interval using atomic
/// temp+rename.
class MetricsExporter {
public:
    MetricsExporter(std::shared_ptr<StoreMetrics> metrics,
                    const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();

    /// Stop the writer thread (writes one final snapshot).
    void stop();

    /// Serialize the registry now. False if the file could not be written.
    bool write_file();

private:
    void writer_loop();

    std::shared_ptr<StoreMetrics> metrics_;
    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

} // namespace blobkit
