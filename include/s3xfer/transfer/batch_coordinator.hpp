#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/transfer/copy_orchestrator.hpp"
#include "s3xfer/transfer/types.hpp"

#include <functional>
#include <vector>

namespace s3xfer::transfer {

/// One unit of batch work. Receives its input index and the batch token,
/// which it must observe at its checkpoints.
using IndexedTask = std::function<TransferResult(size_t index, const CancellationToken& cancel)>;

/// Runs independent transfers on a bounded worker pool.
///
/// Items start in index order. With fail-fast, the first failure trips the
/// batch token: nothing new starts, running items wind down at their next
/// checkpoint, and the report holds only the items that started. Without
/// it, every item runs and the report has one result per input.
class BatchCoordinator {
public:
    explicit BatchCoordinator(CopyOrchestrator& orchestrator);

    BatchReport run_batch(const std::vector<TransferRequest>& requests, size_t concurrency,
                          bool fail_fast, const CancellationToken& cancel = {});

    /// sources[i] -> destinations[i]; mismatched lengths fail before any work.
    BatchReport batch_upload(const std::vector<LocalPath>& sources,
                             const std::vector<CloudPath>& destinations,
                             const TransferOptions& options,
                             const CancellationToken& cancel = {});

    BatchReport batch_download(const std::vector<CloudPath>& sources,
                               const std::vector<LocalPath>& destinations,
                               const TransferOptions& options,
                               const CancellationToken& cancel = {});

    /// The worker pool itself, shared with directory copy.
    static BatchReport run_indexed(size_t count, size_t concurrency, bool fail_fast,
                                   const IndexedTask& task,
                                   const CancellationToken& cancel = {});

private:
    CopyOrchestrator& orchestrator_;
};

}  // namespace s3xfer::transfer
