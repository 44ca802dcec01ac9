#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/download_engine.hpp"
#include "s3xfer/transfer/path_resolver.hpp"
#include "s3xfer/transfer/types.hpp"
#include "s3xfer/transfer/upload_engine.hpp"

namespace s3xfer {
class TransferMetrics;
}

namespace s3xfer::transfer {

/// Copy of one object between any two of {local, remote}.
///
///   local  -> remote   UploadEngine
///   remote -> local    DownloadEngine
///   local  -> local    filesystem copy
///   remote -> remote   server-side copy, falling back to download into a
///                      private temp file and upload from it
///
/// A destination ending in '/' receives the source basename.
class CopyOrchestrator {
public:
    CopyOrchestrator(storage::ObjectStore& store, UploadEngine& uploader,
                     DownloadEngine& downloader, TransferMetrics* metrics = nullptr);

    TransferResult copy(const ResolvedPath& source, const ResolvedPath& destination,
                        const TransferOptions& options,
                        const CancellationToken& cancel = {});

    TransferResult copy_remote(const CloudPath& source, const CloudPath& destination,
                               const TransferOptions& options,
                               const CancellationToken& cancel = {});

private:
    TransferResult copy_two_phase(const CloudPath& source, const storage::ObjectMetadata& meta,
                                  const CloudPath& destination, const TransferOptions& options,
                                  const CancellationToken& cancel);

    TransferResult copy_local(const LocalPath& source, const LocalPath& destination);

    storage::ObjectStore& store_;
    UploadEngine& uploader_;
    DownloadEngine& downloader_;
    TransferMetrics* metrics_;
};

}  // namespace s3xfer::transfer
