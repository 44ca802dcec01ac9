#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/concurrency_throttle.hpp"
#include "s3xfer/transfer/path_resolver.hpp"
#include "s3xfer/transfer/strategy.hpp"
#include "s3xfer/transfer/types.hpp"

#include <filesystem>
#include <functional>

namespace s3xfer {
class TransferMetrics;
}

namespace s3xfer::transfer {

/// Remote object -> local file.
///
/// Objects up to the download threshold are streamed in one GET. Larger
/// ones are split into ranges fetched by a worker set gated by a
/// ConcurrencyThrottle. Bytes land in `<dest>.s3xfer-part` and the file
/// is renamed into place only when every range succeeded.
class DownloadEngine {
public:
    /// Invoked each time a range call is dispatched, with the throttle
    /// state at that moment.
    using DispatchObserver = std::function<void(const ConcurrencyThrottle::Dispatch&)>;

    explicit DownloadEngine(const storage::ObjectStore& store, TransferMetrics* metrics = nullptr);

    TransferResult download(const CloudPath& source, const LocalPath& destination,
                            const TransferOptions& options,
                            const CancellationToken& cancel = {});

    void set_dispatch_observer(DispatchObserver observer) { observer_ = std::move(observer); }

    /// Where a download of `source` to `destination` ends up: the
    /// source basename is appended when the destination names a directory.
    static std::filesystem::path target_path(const CloudPath& source, const LocalPath& destination);

private:
    TransferResult download_single(const CloudPath& source, const storage::ObjectMetadata& meta,
                                   int fd, const TransferOptions& options,
                                   const CancellationToken& cancel);

    TransferResult download_ranged(const CloudPath& source, const storage::ObjectMetadata& meta,
                                   const RangePlan& plan, int fd,
                                   const TransferOptions& options,
                                   const CancellationToken& cancel);

    const storage::ObjectStore& store_;
    TransferMetrics* metrics_;
    DispatchObserver observer_;
};

}  // namespace s3xfer::transfer
