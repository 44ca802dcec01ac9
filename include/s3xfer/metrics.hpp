#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace s3xfer {

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

/// Transfer counters and latency histograms in a prometheus::Registry.
///
/// When given a file path, a background writer thread periodically
/// serializes the registry to a .prom file (node_exporter textfile
/// collector) using atomic temp+rename. Without one the registry is only
/// reachable through serialize(). Engines take a nullable pointer to this.
class TransferMetrics {
public:
    /// @param prom_file_path  Path to the .prom output file, empty for none.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    TransferMetrics(const std::filesystem::path& prom_file_path = {},
                    std::chrono::seconds write_interval = std::chrono::seconds(15),
                    const std::map<std::string, std::string>& labels = {});
    ~TransferMetrics();

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    /// Start the background writer thread (no-op without a file path).
    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    /// Current registry contents in Prometheus text format.
    std::string serialize() const;

    // --- Recording helpers ---
    void record_upload(bool success, uint64_t bytes);
    void record_download(bool success, uint64_t bytes);
    void record_copy(bool success, bool fallback);

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& copies_success() { return *copies_success_; }
    prometheus::Counter& copies_failure() { return *copies_failure_; }
    prometheus::Counter& copy_fallbacks_total() { return *copy_fallbacks_total_; }
    prometheus::Counter& part_retries_total() { return *part_retries_total_; }
    prometheus::Counter& range_retries_total() { return *range_retries_total_; }
    prometheus::Counter& throttle_reductions_total() { return *throttle_reductions_total_; }
    prometheus::Counter& multipart_aborts_total() { return *multipart_aborts_total_; }
    prometheus::Counter& multipart_abort_failures_total() { return *multipart_abort_failures_total_; }
    prometheus::Counter& orphans_recovered_total() { return *orphans_recovered_total_; }

    // --- Gauge accessors ---
    prometheus::Gauge& active_transfers() { return *active_transfers_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }
    prometheus::Histogram& copy_duration() { return *copy_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* copies_success_;
    prometheus::Counter* copies_failure_;
    prometheus::Counter* copy_fallbacks_total_;
    prometheus::Counter* part_retries_total_;
    prometheus::Counter* range_retries_total_;
    prometheus::Counter* throttle_reductions_total_;
    prometheus::Counter* multipart_aborts_total_;
    prometheus::Counter* multipart_abort_failures_total_;
    prometheus::Counter* orphans_recovered_total_;

    // --- Gauges ---
    prometheus::Gauge* active_transfers_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;
    prometheus::Histogram* copy_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

/// Tracks one in-progress transfer in the active_transfers gauge.
class ActiveTransfer {
public:
    explicit ActiveTransfer(TransferMetrics* metrics) : metrics_(metrics) {
        if (metrics_) metrics_->active_transfers().Increment();
    }
    ~ActiveTransfer() {
        if (metrics_) metrics_->active_transfers().Decrement();
    }

    ActiveTransfer(const ActiveTransfer&) = delete;
    ActiveTransfer& operator=(const ActiveTransfer&) = delete;

private:
    TransferMetrics* metrics_;
};

}  // namespace s3xfer
