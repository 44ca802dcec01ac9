#include "s3xfer/metrics.hpp"
#include "s3xfer/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace s3xfer {

TransferMetrics::TransferMetrics(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("s3xfer_uploads_total")
        .Help("Total uploads finished")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    auto& downloads_family = prometheus::BuildCounter()
        .Name("s3xfer_downloads_total")
        .Help("Total downloads finished")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});

    auto& copies_family = prometheus::BuildCounter()
        .Name("s3xfer_copies_total")
        .Help("Total remote-to-remote copies finished")
        .Labels(labels)
        .Register(*registry_);
    copies_success_ = &copies_family.Add({{"result", "success"}});
    copies_failure_ = &copies_family.Add({{"result", "failure"}});

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    upload_bytes_total_ = &counter_reg("s3xfer_upload_bytes_total", "Total bytes uploaded");
    download_bytes_total_ = &counter_reg("s3xfer_download_bytes_total", "Total bytes downloaded");
    copy_fallbacks_total_ = &counter_reg("s3xfer_copy_fallbacks_total",
                                         "Copies that fell back to download+upload");
    part_retries_total_ = &counter_reg("s3xfer_part_retries_total", "Retried part uploads");
    range_retries_total_ = &counter_reg("s3xfer_range_retries_total", "Retried ranged reads");
    throttle_reductions_total_ = &counter_reg("s3xfer_throttle_reductions_total",
                                              "Download concurrency reductions");
    multipart_aborts_total_ = &counter_reg("s3xfer_multipart_aborts_total",
                                           "Multipart uploads aborted");
    multipart_abort_failures_total_ = &counter_reg("s3xfer_multipart_abort_failures_total",
                                                   "Multipart aborts that themselves failed");
    orphans_recovered_total_ = &counter_reg("s3xfer_orphan_sessions_recovered_total",
                                            "Journaled sessions aborted at startup");

    // --- Gauges ---

    active_transfers_ = &prometheus::BuildGauge()
        .Name("s3xfer_active_transfers")
        .Help("Transfers in progress")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    const prometheus::Histogram::BucketBoundaries buckets{
        0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900};

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("s3xfer_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, buckets);

    download_duration_ = &prometheus::BuildHistogram()
        .Name("s3xfer_download_duration_seconds")
        .Help("Download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, buckets);

    copy_duration_ = &prometheus::BuildHistogram()
        .Name("s3xfer_copy_duration_seconds")
        .Help("Remote-to-remote copy duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, buckets);
}

TransferMetrics::~TransferMetrics() {
    stop();
}

void TransferMetrics::start() {
    if (prom_file_path_.empty()) return;
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&TransferMetrics::writer_loop, this);
}

void TransferMetrics::stop() {
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
    }
    write_file();
}

std::string TransferMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void TransferMetrics::record_upload(bool success, uint64_t bytes) {
    (success ? uploads_success_ : uploads_failure_)->Increment();
    if (success) upload_bytes_total_->Increment(static_cast<double>(bytes));
}

void TransferMetrics::record_download(bool success, uint64_t bytes) {
    (success ? downloads_success_ : downloads_failure_)->Increment();
    if (success) download_bytes_total_->Increment(static_cast<double>(bytes));
}

void TransferMetrics::record_copy(bool success, bool fallback) {
    (success ? copies_success_ : copies_failure_)->Increment();
    if (fallback) copy_fallbacks_total_->Increment();
}

void TransferMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void TransferMetrics::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("cannot publish metrics file %s: %s", prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace s3xfer
