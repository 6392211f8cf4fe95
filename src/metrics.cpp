#include "blobkit/storage/metrics.hpp"
#include "blobkit/core/log.hpp"

#include <fstream>
#include <stdexcept>
#include <istream>
#include <streambuf>
#include <prometheus/text_serializer.h>

namespace blobkit {

// ============================================================================
// StoreMetrics
// ============================================================================

StoreMetrics::StoreMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    operations_ = &prometheus::BuildCounter()
        .Name("blobkit_store_operations_total")
        .Help("Store operations by outcome")
        .Labels(labels)
        .Register(*registry_);

    auto& bytes_family = prometheus::BuildCounter()
        .Name("blobkit_store_bytes_total")
        .Help("Bytes moved through the store")
        .Labels(labels)
        .Register(*registry_);
    upload_bytes_ = &bytes_family.Add({{"direction", "upload"}});
    download_bytes_ = &bytes_family.Add({{"direction", "download"}});

    durations_ = &prometheus::BuildHistogram()
        .Name("blobkit_store_operation_duration_seconds")
        .Help("Store operation duration in seconds")
        .Labels(labels)
        .Register(*registry_);
}

std::string StoreMetrics::result_label(const StoreError& error) {
    switch (error.code) {
        case ErrorCode::Ok: return "success";
        case ErrorCode::InvalidKey: return "invalid_key";
        case ErrorCode::InvalidInput: return "invalid_input";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::UploadFailed: return "upload_failed";
        case ErrorCode::DownloadFailed: return "download_failed";
        case ErrorCode::DeleteFailed: return "delete_failed";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::InternalError: return "internal_error";
    }
    return "unknown";
}

void StoreMetrics::record(const std::string& op, const StoreError& error) {
    operations_->Add({{"op", op}, {"result", result_label(error)}}).Increment();
}

prometheus::Histogram& StoreMetrics::duration(const std::string& op) {
    return durations_->Add({{"op", op}}, prometheus::Histogram::BucketBoundaries{
        0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

double StoreMetrics::operation_count(const std::string& op, const std::string& result) const {
    return operations_->Add({{"op", op}, {"result", result}}).Value();
}

// ============================================================================
// InstrumentedStore
// ============================================================================

namespace {

// Counts bytes pulled through an upload body without buffering it
class CountingStreamBuf : public std::streambuf {
public:
    explicit CountingStreamBuf(std::streambuf* source) : source_(source) {}

    uint64_t count() const { return count_; }

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        std::streamsize n = source_->sgetn(buffer_, sizeof(buffer_));
        if (n <= 0) {
            return traits_type::eof();
        }
        count_ += static_cast<uint64_t>(n);
        setg(buffer_, buffer_, buffer_ + n);
        return traits_type::to_int_type(*gptr());
    }

private:
    std::streambuf* source_;
    uint64_t count_ = 0;
    char buffer_[64 * 1024];
};

} // namespace

InstrumentedStore::InstrumentedStore(std::unique_ptr<Store> inner,
                                     std::shared_ptr<StoreMetrics> metrics)
    : inner_(std::move(inner))
    , metrics_(std::move(metrics)) {
    if (!inner_ || !metrics_) {
        throw std::invalid_argument("InstrumentedStore requires a store and metrics");
    }
}

UploadResult InstrumentedStore::upload(const Context& ctx, const UploadInput& input) {
    ScopedTimer timer(metrics_->duration("upload"));
    if (!input.body) {
        auto result = inner_->upload(ctx, input);
        metrics_->record("upload", result.error);
        return result;
    }

    CountingStreamBuf counter(input.body->rdbuf());
    std::istream counted(&counter);
    UploadInput wrapped = input;
    wrapped.body = &counted;

    auto result = inner_->upload(ctx, wrapped);
    metrics_->record("upload", result.error);
    if (result.ok()) {
        metrics_->add_upload_bytes(counter.count());
    }
    return result;
}

DownloadResult InstrumentedStore::download(const Context& ctx, const std::string& key,
                                           WriterAt& sink) const {
    ScopedTimer timer(metrics_->duration("download"));
    auto result = inner_->download(ctx, key, sink);
    metrics_->record("download", result.error);
    if (result.ok()) {
        metrics_->add_download_bytes(static_cast<uint64_t>(result.bytes_written));
    }
    return result;
}

GetObjectResult InstrumentedStore::get_object(const Context& ctx, const std::string& key) const {
    ScopedTimer timer(metrics_->duration("get_object"));
    auto result = inner_->get_object(ctx, key);
    metrics_->record("get_object", result.error);
    return result;
}

HeadResult InstrumentedStore::head_object(const Context& ctx, const std::string& key) const {
    ScopedTimer timer(metrics_->duration("head_object"));
    auto result = inner_->head_object(ctx, key);
    metrics_->record("head_object", result.error);
    return result;
}

StoreError InstrumentedStore::remove(const Context& ctx, const std::string& key) {
    ScopedTimer timer(metrics_->duration("delete"));
    auto error = inner_->remove(ctx, key);
    metrics_->record("delete", error);
    return error;
}

DeleteMultipleResult InstrumentedStore::remove_multiple(const Context& ctx,
                                                        const std::vector<std::string>& keys) {
    ScopedTimer timer(metrics_->duration("delete_multiple"));
    auto result = inner_->remove_multiple(ctx, keys);
    metrics_->record("delete_multiple", result.error);
    return result;
}

ListResult InstrumentedStore::list(const Context& ctx, const ListInput& input) const {
    ScopedTimer timer(metrics_->duration("list"));
    auto result = inner_->list(ctx, input);
    metrics_->record("list", result.error);
    return result;
}

ExistsResult InstrumentedStore::exists(const Context& ctx, const std::string& key) const {
    ScopedTimer timer(metrics_->duration("exists"));
    auto result = inner_->exists(ctx, key);
    metrics_->record("exists", result.error);
    return result;
}

StoreError InstrumentedStore::copy(const Context& ctx, const std::string& source,
                                   const std::string& destination) {
    ScopedTimer timer(metrics_->duration("copy"));
    auto error = inner_->copy(ctx, source, destination);
    metrics_->record("copy", error);
    return error;
}

PresignResult InstrumentedStore::presign_get(const Context& ctx, const std::string& key,
                                             std::chrono::seconds expiration) {
    PresignResult result;
    auto* inner = inner_->presigner();
    if (!inner) {
        result.error = StoreError::make(ErrorCode::InvalidInput,
                                        inner_->type_name() + " store does not support presigned URLs");
    } else {
        result = inner->presign_get(ctx, key, expiration);
    }
    metrics_->record("presign_get", result.error);
    return result;
}

PresignResult InstrumentedStore::presign_put(const Context& ctx, const std::string& key,
                                             const std::string& content_type,
                                             std::chrono::seconds expiration) {
    PresignResult result;
    auto* inner = inner_->presigner();
    if (!inner) {
        result.error = StoreError::make(ErrorCode::InvalidInput,
                                        inner_->type_name() + " store does not support presigned URLs");
    } else {
        result = inner->presign_put(ctx, key, content_type, expiration);
    }
    metrics_->record("presign_put", result.error);
    return result;
}

// ============================================================================
// MetricsExporter
// ============================================================================

MetricsExporter::MetricsExporter(std::shared_ptr<StoreMetrics> metrics,
                                 const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval)
    : metrics_(std::move(metrics))
    , prom_file_path_(prom_file_path)
    , write_interval_(write_interval) {}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        // Final snapshot
        write_file();
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto families = metrics_->registry()->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("metrics: cannot open %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(families);
    ofs.close();
    if (!ofs.good()) {
        log_warn("metrics: failed to write %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("metrics: failed to rename %s: %s", tmp_path.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

} // namespace blobkit
