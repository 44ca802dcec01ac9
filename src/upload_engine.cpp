#include "s3xfer/transfer/upload_engine.hpp"
#include "s3xfer/core/log.hpp"
#include "s3xfer/core/retry_policy.hpp"
#include "s3xfer/metrics.hpp"
#include "s3xfer/session_journal.hpp"
#include "s3xfer/transfer/strategy.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <thread>

namespace s3xfer::transfer {

namespace fs = std::filesystem;

namespace {

template <typename StoreResult>
TransferResult failed(const StoreResult& r, const std::string& context) {
    return make_error<TransferResult>(r.error_kind, context + ": " + r.error_message);
}

bool read_file(const fs::path& path, std::vector<uint8_t>& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    ifs.seekg(0, std::ios::end);
    auto size = ifs.tellg();
    if (size < 0) return false;
    ifs.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(size));
    if (size > 0) {
        ifs.read(reinterpret_cast<char*>(out.data()), size);
    }
    return static_cast<bool>(ifs) || ifs.eof();
}

}  // namespace

UploadEngine::UploadEngine(storage::ObjectStore& store, SessionJournal* journal,
                           TransferMetrics* metrics)
    : store_(store), journal_(journal), metrics_(metrics) {}

TransferResult UploadEngine::upload(const LocalPath& source, const CloudPath& destination,
                                    const TransferOptions& options,
                                    const CancellationToken& cancel) {
    if (destination.bucket.empty() || destination.is_directory()) {
        return make_error<TransferResult>(ErrorKind::InvalidPath,
            "upload destination must name an object: " + PathResolver::to_uri(destination));
    }

    fs::path src(source.path);
    std::error_code ec;
    auto status = fs::status(src, ec);
    if (!fs::exists(status)) {
        return make_error<TransferResult>(ErrorKind::NotFound, "source not found: " + source.path);
    }
    if (!fs::is_regular_file(status)) {
        return make_error<TransferResult>(ErrorKind::InvalidPath, "source is not a file: " + source.path);
    }
    uint64_t size = fs::file_size(src, ec);
    if (ec) {
        return make_error<TransferResult>(ErrorKind::Io,
            "cannot stat " + source.path + ": " + ec.message());
    }

    storage::PutOptions put_options;
    put_options.content_type = options.content_type.empty()
        ? storage::guess_content_type(src.filename().string())
        : options.content_type;
    put_options.metadata = options.metadata;
    put_options.timeout = options.request_timeout;

    ActiveTransfer active(metrics_);
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    auto strategy = choose_upload_strategy(size, options);
    TransferResult result;
    if (auto* multipart = std::get_if<Multipart>(&strategy)) {
        log_debug("upload %s -> %s: multipart, %u parts of %llu bytes",
                  source.path.c_str(), PathResolver::to_uri(destination).c_str(),
                  multipart->part_count, static_cast<unsigned long long>(multipart->part_size));
        result = upload_multipart(src, size, multipart->part_size, multipart->part_count,
                                  destination, options, put_options, cancel);
    } else {
        log_debug("upload %s -> %s: single part, %llu bytes",
                  source.path.c_str(), PathResolver::to_uri(destination).c_str(),
                  static_cast<unsigned long long>(size));
        result = upload_single(src, size, destination, options, put_options, cancel);
    }

    if (metrics_) metrics_->record_upload(result.success, result.bytes_transferred);
    return result;
}

TransferResult UploadEngine::upload_single(const fs::path& source, uint64_t size,
                                           const CloudPath& destination,
                                           const TransferOptions& options,
                                           const storage::PutOptions& put_options,
                                           const CancellationToken& cancel) {
    std::vector<uint8_t> data;
    if (!read_file(source, data) || data.size() != size) {
        return make_error<TransferResult>(ErrorKind::Io, "cannot read " + source.string());
    }

    auto put = with_retry<storage::PutResult>(
        options.retry.with_attempts(options.single_put_attempts), cancel,
        [&] { return store_.put(destination.bucket, destination.key, data, put_options); },
        [&](uint32_t attempt, ErrorKind kind, const std::string& message) {
            log_debug("put %s attempt %u failed (%s): %s", destination.key.c_str(), attempt,
                      error_kind_name(kind), message.c_str());
        });
    if (!put.success) {
        return failed(put, "put " + PathResolver::to_uri(destination));
    }

    auto result = TransferResult::ok(strategy_name(UploadStrategy{SinglePart{}}));
    result.bytes_transferred = size;
    result.parts = 1;
    result.metadata.size = size;
    result.metadata.etag = put.etag;
    result.metadata.content_type = put_options.content_type;
    result.metadata.user_metadata = put_options.metadata;
    result.metadata.last_modified = std::chrono::system_clock::now();
    return result;
}

TransferResult UploadEngine::upload_multipart(const fs::path& source, uint64_t size,
                                              uint64_t part_size, uint32_t part_count,
                                              const CloudPath& destination,
                                              const TransferOptions& options,
                                              const storage::PutOptions& put_options,
                                              const CancellationToken& cancel) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return make_error<TransferResult>(ErrorKind::Io, "cannot open " + source.string());
    }

    // Initiation failure leaves nothing to clean up
    auto init = store_.initiate_multipart(destination.bucket, destination.key, put_options);
    if (!init.success) {
        return failed(init, "initiate multipart " + PathResolver::to_uri(destination));
    }

    MultipartSession session;
    session.upload_id = init.upload_id;
    session.bucket = destination.bucket;
    session.key = destination.key;
    if (journal_ && !journal_->record(session)) {
        log_warn("multipart upload %s for %s is not journaled; a crash will leave it behind",
                 session.upload_id.c_str(), PathResolver::to_uri(destination).c_str());
    }

    struct PendingPart {
        uint32_t number = 0;
        std::vector<uint8_t> data;
    };

    const size_t window = std::max<size_t>(options.max_buffered_parts, 1);
    const size_t worker_count = std::max<size_t>(
        1, std::min({options.concurrency, window, static_cast<size_t>(part_count)}));

    // Part-local token so a failing part stops its siblings without
    // cancelling the caller
    CancellationToken local = cancel.child();

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<PendingPart> queue;
    size_t buffered = 0;       // Part buffers alive: queued or uploading
    size_t peak_buffered = 0;
    bool reading_done = false;
    std::optional<TransferResult> first_error;

    auto fail = [&](TransferResult error) {
        {
            std::lock_guard lock(mutex);
            if (!first_error) first_error = std::move(error);
        }
        local.cancel();
        cv.notify_all();
    };

    auto worker = [&] {
        while (true) {
            PendingPart part;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [&] { return !queue.empty() || reading_done; });
                if (queue.empty()) return;
                part = std::move(queue.front());
                queue.pop_front();
            }

            if (!local.cancelled()) {
                auto put = with_retry<storage::PutResult>(
                    options.retry, local,
                    [&] {
                        return store_.upload_part(destination.bucket, destination.key,
                                                  session.upload_id, part.number, part.data,
                                                  options.request_timeout);
                    },
                    [&](uint32_t attempt, ErrorKind kind, const std::string& message) {
                        if (metrics_) metrics_->part_retries_total().Increment();
                        log_debug("part %u of %s attempt %u failed (%s): %s", part.number,
                                  destination.key.c_str(), attempt, error_kind_name(kind),
                                  message.c_str());
                    });
                if (put.success) {
                    std::lock_guard lock(mutex);
                    session.parts.push_back({part.number, put.etag});
                } else if (put.error_kind != ErrorKind::Aborted) {
                    fail(failed(put, "part " + std::to_string(part.number)));
                }
            }

            part.data.clear();
            part.data.shrink_to_fit();
            {
                std::lock_guard lock(mutex);
                --buffered;
            }
            cv.notify_all();
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }

    // Reader: sequential chunks, never more than `window` buffers alive
    for (uint32_t number = 1; number <= part_count; ++number) {
        {
            std::unique_lock lock(mutex);
            while (buffered >= window && !local.cancelled()) {
                cv.wait_for(lock, std::chrono::milliseconds(20));
            }
            if (local.cancelled()) break;
            ++buffered;
            peak_buffered = std::max(peak_buffered, buffered);
        }

        uint64_t offset = static_cast<uint64_t>(number - 1) * part_size;
        size_t length = static_cast<size_t>(std::min(part_size, size - offset));
        PendingPart part;
        part.number = number;
        part.data.resize(length);
        input.read(reinterpret_cast<char*>(part.data.data()), static_cast<std::streamsize>(length));
        if (static_cast<size_t>(input.gcount()) != length) {
            {
                std::lock_guard lock(mutex);
                --buffered;
            }
            fail(make_error<TransferResult>(ErrorKind::Io,
                "short read from " + source.string() + " at offset " + std::to_string(offset)));
            break;
        }

        {
            std::lock_guard lock(mutex);
            queue.push_back(std::move(part));
        }
        cv.notify_all();
    }

    {
        std::lock_guard lock(mutex);
        reading_done = true;
    }
    cv.notify_all();
    for (auto& t : workers) {
        t.join();
    }

    if (first_error || local.cancelled() || session.parts.size() != part_count) {
        TransferResult result = first_error
            ? std::move(*first_error)
            : make_error<TransferResult>(ErrorKind::Aborted, "upload cancelled");
        result.peak_buffered_parts = peak_buffered;
        abort_session(session, result);
        return result;
    }

    std::sort(session.parts.begin(), session.parts.end(),
              [](const storage::CompletedPart& a, const storage::CompletedPart& b) {
                  return a.part_number < b.part_number;
              });

    auto complete = with_retry<storage::PutResult>(options.retry, cancel, [&] {
        return store_.complete_multipart(destination.bucket, destination.key,
                                         session.upload_id, session.parts);
    });
    if (!complete.success) {
        auto result = failed(complete, "complete multipart " + PathResolver::to_uri(destination));
        result.peak_buffered_parts = peak_buffered;
        abort_session(session, result);
        return result;
    }

    if (journal_ && !journal_->remove(session.upload_id)) {
        log_warn("stale journal row for completed upload %s", session.upload_id.c_str());
    }

    auto result = TransferResult::ok(strategy_name(UploadStrategy{Multipart{}}));
    result.bytes_transferred = size;
    result.parts = part_count;
    result.peak_buffered_parts = peak_buffered;
    result.metadata.size = size;
    result.metadata.etag = complete.etag;
    result.metadata.content_type = put_options.content_type;
    result.metadata.user_metadata = put_options.metadata;
    result.metadata.last_modified = std::chrono::system_clock::now();
    return result;
}

void UploadEngine::abort_session(const MultipartSession& session, TransferResult& result) {
    auto abort = store_.abort_multipart(session.bucket, session.key, session.upload_id);
    if (abort.success) {
        if (metrics_) metrics_->multipart_aborts_total().Increment();
        if (journal_ && !journal_->remove(session.upload_id)) {
            log_warn("stale journal row for aborted upload %s", session.upload_id.c_str());
        }
        log_debug("aborted multipart upload %s for %s", session.upload_id.c_str(), session.key.c_str());
        return;
    }

    // The journal row stays so a later recovery can retry the abort
    if (metrics_) metrics_->multipart_abort_failures_total().Increment();
    log_warn("cannot abort multipart upload %s for %s/%s: %s", session.upload_id.c_str(),
             session.bucket.c_str(), session.key.c_str(), abort.error_message.c_str());
    result.error_message += "; abort failed: " + abort.error_message;
}

}  // namespace s3xfer::transfer
