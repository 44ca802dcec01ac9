#include "s3xfer/transfer/batch_coordinator.hpp"
#include "s3xfer/core/log.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <thread>

namespace s3xfer::transfer {

namespace {

BatchReport length_mismatch(size_t sources, size_t destinations) {
    BatchReport report;
    std::string message = "batch has " + std::to_string(sources) + " sources but " +
                          std::to_string(destinations) + " destinations";
    auto result = make_error<TransferResult>(ErrorKind::InvalidPath, message);
    report.results.push_back(std::move(result));
    report.result_indices.push_back(0);
    report.errors.push_back({0, std::move(message)});
    return report;
}

}  // namespace

BatchCoordinator::BatchCoordinator(CopyOrchestrator& orchestrator)
    : orchestrator_(orchestrator) {}

BatchReport BatchCoordinator::run_indexed(size_t count, size_t concurrency, bool fail_fast,
                                          const IndexedTask& task,
                                          const CancellationToken& cancel) {
    CancellationToken batch = cancel.child();
    std::vector<std::optional<TransferResult>> slots(count);

    std::mutex claim_mutex;
    size_t next = 0;

    auto worker = [&] {
        while (true) {
            size_t index;
            bool skip = false;
            {
                // Claiming and the cancel check happen together, so once the
                // batch trips no further item can start
                std::lock_guard lock(claim_mutex);
                if (next >= count) return;
                if (batch.cancelled()) {
                    if (fail_fast) return;
                    skip = true;
                }
                index = next++;
            }

            TransferResult result = skip
                ? make_error<TransferResult>(ErrorKind::Aborted, "batch cancelled")
                : task(index, batch);

            if (!result.success && fail_fast) {
                batch.cancel();
            }
            slots[index] = std::move(result);
        }
    };

    size_t worker_count = std::max<size_t>(1, std::min(concurrency, count));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count && i < count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    BatchReport report;
    report.aborted = fail_fast && batch.cancelled();
    bool all_ok = true;
    for (size_t i = 0; i < count; ++i) {
        if (!slots[i]) {
            all_ok = false;
            continue;
        }
        if (!slots[i]->success) {
            all_ok = false;
            report.errors.push_back({i, slots[i]->error_message});
        }
        report.results.push_back(std::move(*slots[i]));
        report.result_indices.push_back(i);
    }
    report.success = all_ok && !report.aborted;

    if (!report.success) {
        log_debug("batch: %zu of %zu items started, %zu failed%s", report.results.size(), count,
                  report.errors.size(), report.aborted ? ", aborted" : "");
    }
    return report;
}

BatchReport BatchCoordinator::run_batch(const std::vector<TransferRequest>& requests,
                                        size_t concurrency, bool fail_fast,
                                        const CancellationToken& cancel) {
    return run_indexed(requests.size(), concurrency, fail_fast,
        [&](size_t index, const CancellationToken& token) {
            const auto& request = requests[index];
            return orchestrator_.copy(request.source, request.destination, request.options, token);
        },
        cancel);
}

BatchReport BatchCoordinator::batch_upload(const std::vector<LocalPath>& sources,
                                           const std::vector<CloudPath>& destinations,
                                           const TransferOptions& options,
                                           const CancellationToken& cancel) {
    if (sources.size() != destinations.size()) {
        return length_mismatch(sources.size(), destinations.size());
    }
    std::vector<TransferRequest> requests;
    requests.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        requests.push_back({sources[i], destinations[i], options});
    }
    return run_batch(requests, options.concurrency, options.fail_fast, cancel);
}

BatchReport BatchCoordinator::batch_download(const std::vector<CloudPath>& sources,
                                             const std::vector<LocalPath>& destinations,
                                             const TransferOptions& options,
                                             const CancellationToken& cancel) {
    if (sources.size() != destinations.size()) {
        return length_mismatch(sources.size(), destinations.size());
    }
    std::vector<TransferRequest> requests;
    requests.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        requests.push_back({sources[i], destinations[i], options});
    }
    return run_batch(requests, options.concurrency, options.fail_fast, cancel);
}

}  // namespace s3xfer::transfer
