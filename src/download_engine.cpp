#include "s3xfer/transfer/download_engine.hpp"
#include "s3xfer/core/log.hpp"
#include "s3xfer/core/retry_policy.hpp"
#include "s3xfer/metrics.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <optional>
#include <thread>
#include <unistd.h>

namespace s3xfer::transfer {

namespace fs = std::filesystem;

namespace {

template <typename StoreResult>
TransferResult failed(const StoreResult& r, const std::string& context) {
    return make_error<TransferResult>(r.error_kind, context + ": " + r.error_message);
}

// pwrite until everything is written
bool write_all_at(int fd, const uint8_t* data, size_t size, uint64_t offset) {
    while (size > 0) {
        ssize_t n = ::pwrite(fd, data, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
        offset += static_cast<uint64_t>(n);
    }
    return true;
}

/// `<target>.s3xfer-part`, removed on destruction unless committed.
class PartialFile {
public:
    explicit PartialFile(fs::path target)
        : target_(std::move(target))
        , path_(target_.string() + constants::PARTIAL_DOWNLOAD_SUFFIX) {}

    ~PartialFile() {
        if (fd_ >= 0) ::close(fd_);
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    bool open(std::string& error) {
        fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            error = "cannot create " + path_.string() + ": " + std::strerror(errno);
            return false;
        }
        return true;
    }

    int fd() const { return fd_; }

    bool commit(std::string& error) {
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            error = "cannot close " + path_.string() + ": " + std::strerror(errno);
            return false;
        }
        std::error_code ec;
        fs::rename(path_, target_, ec);
        if (ec) {
            error = "cannot rename " + path_.string() + " to " + target_.string() + ": " + ec.message();
            return false;
        }
        committed_ = true;
        return true;
    }

private:
    fs::path target_;
    fs::path path_;
    int fd_ = -1;
    bool committed_ = false;
};

}  // namespace

DownloadEngine::DownloadEngine(const storage::ObjectStore& store, TransferMetrics* metrics)
    : store_(store), metrics_(metrics) {}

fs::path DownloadEngine::target_path(const CloudPath& source, const LocalPath& destination) {
    fs::path target(destination.path);
    std::error_code ec;
    if (destination.is_directory_form() || fs::is_directory(target, ec)) {
        target /= source.basename();
    }
    return target;
}

TransferResult DownloadEngine::download(const CloudPath& source, const LocalPath& destination,
                                        const TransferOptions& options,
                                        const CancellationToken& cancel) {
    if (source.bucket.empty() || source.is_directory()) {
        return make_error<TransferResult>(ErrorKind::InvalidPath,
            "download source must name an object: " + PathResolver::to_uri(source));
    }

    ActiveTransfer active(metrics_);
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->download_duration());

    auto record = [&](TransferResult result) {
        if (metrics_) metrics_->record_download(result.success, result.bytes_transferred);
        return result;
    };

    auto head = with_retry<storage::HeadResult>(options.retry, cancel, [&] {
        return store_.head(source.bucket, source.key);
    });
    if (!head.success) {
        return record(failed(head, "head " + PathResolver::to_uri(source)));
    }

    fs::path target = target_path(source, destination);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return record(make_error<TransferResult>(ErrorKind::Io,
                "cannot create " + target.parent_path().string() + ": " + ec.message()));
        }
    }

    PartialFile partial(target);
    std::string error;
    if (!partial.open(error)) {
        return record(make_error<TransferResult>(ErrorKind::Io, error));
    }

    auto strategy = choose_download_strategy(head.metadata.size, options);
    TransferResult result;
    if (auto* ranged = std::get_if<Ranged>(&strategy)) {
        log_debug("download %s: %zu ranges", PathResolver::to_uri(source).c_str(), ranged->plan.size());
        result = download_ranged(source, head.metadata, ranged->plan, partial.fd(), options, cancel);
        result.parts = static_cast<uint32_t>(ranged->plan.size());
    } else {
        log_debug("download %s: single stream", PathResolver::to_uri(source).c_str());
        result = download_single(source, head.metadata, partial.fd(), options, cancel);
        result.parts = 1;
    }
    if (!result.success) {
        return record(std::move(result));
    }

    if (!partial.commit(error)) {
        return record(make_error<TransferResult>(ErrorKind::Io, error));
    }

    result.strategy = strategy_name(strategy);
    result.metadata = head.metadata;
    result.bytes_transferred = head.metadata.size;
    return record(std::move(result));
}

TransferResult DownloadEngine::download_single(const CloudPath& source,
                                               const storage::ObjectMetadata& meta, int fd,
                                               const TransferOptions& options,
                                               const CancellationToken& cancel) {
    auto get = with_retry<storage::GetResult>(options.retry, cancel, [&] {
        // Each attempt restarts from the beginning of the file
        if (::ftruncate(fd, 0) != 0) {
            return make_error<storage::GetResult>(ErrorKind::Io,
                std::string("cannot truncate partial file: ") + std::strerror(errno));
        }
        uint64_t cursor = 0;
        int write_errno = 0;
        bool stopped = false;

        storage::GetOptions get_options;
        if (!meta.etag.empty()) get_options.if_match = meta.etag;
        get_options.timeout = options.request_timeout;
        get_options.sink = [&](const uint8_t* data, size_t size) {
            if (cancel.cancelled()) {
                stopped = true;
                return false;
            }
            if (!write_all_at(fd, data, size, cursor)) {
                write_errno = errno;
                return false;
            }
            cursor += size;
            return true;
        };

        auto r = store_.get(source.bucket, source.key, get_options);
        if (write_errno != 0) {
            return make_error<storage::GetResult>(ErrorKind::Io,
                std::string("write failed: ") + std::strerror(write_errno));
        }
        if (stopped) {
            return make_error<storage::GetResult>(ErrorKind::Aborted, "cancelled");
        }
        if (r.success && cursor != meta.size) {
            return make_error<storage::GetResult>(ErrorKind::NetworkFailure,
                "short read: " + std::to_string(cursor) + " of " + std::to_string(meta.size) + " bytes");
        }
        return r;
    });
    if (!get.success) {
        return failed(get, "get " + PathResolver::to_uri(source));
    }
    return TransferResult::ok({});
}

TransferResult DownloadEngine::download_ranged(const CloudPath& source,
                                               const storage::ObjectMetadata& meta,
                                               const RangePlan& plan, int fd,
                                               const TransferOptions& options,
                                               const CancellationToken& cancel) {
    ConcurrencyThrottle throttle(options.concurrency, options.throttle_error_burst,
                                 options.throttle_recovery);

    // Range-local token: a failing range stops its siblings only
    CancellationToken local = cancel.child();

    std::atomic<size_t> next{0};
    std::mutex error_mutex;
    std::optional<TransferResult> first_error;

    auto worker = [&] {
        while (!local.cancelled()) {
            size_t index = next.fetch_add(1);
            if (index >= plan.size()) return;
            const ByteRange range = plan[index];

            auto get = with_retry<storage::GetResult>(
                options.retry, local,
                [&] {
                    auto slot = throttle.acquire(local);
                    if (!slot) {
                        return make_error<storage::GetResult>(ErrorKind::Aborted, "cancelled");
                    }
                    if (observer_) observer_(*slot);

                    uint64_t cursor = 0;
                    int write_errno = 0;
                    bool stopped = false;
                    storage::GetOptions get_options;
                    get_options.range_start = range.start;
                    get_options.range_end = range.end;
                    if (!meta.etag.empty()) get_options.if_match = meta.etag;
                    get_options.timeout = options.request_timeout;
                    get_options.sink = [&](const uint8_t* data, size_t size) {
                        // A failed sibling or an outside cancel ends the stream
                        if (local.cancelled()) {
                            stopped = true;
                            return false;
                        }
                        if (!write_all_at(fd, data, size, range.start + cursor)) {
                            write_errno = errno;
                            return false;
                        }
                        cursor += size;
                        return true;
                    };

                    auto r = store_.get(source.bucket, source.key, get_options);
                    if (write_errno != 0) {
                        r = make_error<storage::GetResult>(ErrorKind::Io,
                            std::string("write failed: ") + std::strerror(write_errno));
                    } else if (stopped) {
                        r = make_error<storage::GetResult>(ErrorKind::Aborted, "cancelled");
                    } else if (r.success && cursor != range.length()) {
                        r = make_error<storage::GetResult>(ErrorKind::NetworkFailure,
                            "short range read: " + std::to_string(cursor) + " of " +
                            std::to_string(range.length()) + " bytes");
                    }

                    if (throttle.release(r.success, r.error_kind) && metrics_) {
                        metrics_->throttle_reductions_total().Increment();
                    }
                    return r;
                },
                [&](uint32_t attempt, ErrorKind kind, const std::string& message) {
                    if (metrics_) metrics_->range_retries_total().Increment();
                    log_debug("range %llu-%llu of %s attempt %u failed (%s): %s",
                              static_cast<unsigned long long>(range.start),
                              static_cast<unsigned long long>(range.end),
                              source.key.c_str(), attempt, error_kind_name(kind), message.c_str());
                });

            if (!get.success) {
                if (get.error_kind != ErrorKind::Aborted) {
                    std::lock_guard lock(error_mutex);
                    if (!first_error) {
                        first_error = failed(get, "range " + std::to_string(range.start) + "-" +
                                                      std::to_string(range.end) + " of " +
                                                      PathResolver::to_uri(source));
                    }
                }
                local.cancel();
                return;
            }
        }
    };

    size_t worker_count = std::max<size_t>(1, std::min(options.concurrency, plan.size()));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (first_error) return std::move(*first_error);
    if (local.cancelled()) {
        return make_error<TransferResult>(ErrorKind::Aborted, "download cancelled");
    }
    return TransferResult::ok({});
}

}  // namespace s3xfer::transfer
