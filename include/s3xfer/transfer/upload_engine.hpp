#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/path_resolver.hpp"
#include "s3xfer/transfer/types.hpp"

#include <filesystem>

namespace s3xfer {
class SessionJournal;
class TransferMetrics;
}  // namespace s3xfer

namespace s3xfer::transfer {

/// Local file -> remote object.
///
/// Files up to the multipart threshold go up in one put. Larger files use
/// the multipart protocol: a reader thread fills at most
/// `max_buffered_parts` part buffers, workers upload them with retry, and
/// the session is completed with the parts sorted by number. Any failure
/// or cancellation aborts the session.
class UploadEngine {
public:
    /// `journal` and `metrics` may be null.
    UploadEngine(storage::ObjectStore& store,
                 SessionJournal* journal = nullptr,
                 TransferMetrics* metrics = nullptr);

    TransferResult upload(const LocalPath& source, const CloudPath& destination,
                          const TransferOptions& options,
                          const CancellationToken& cancel = {});

private:
    TransferResult upload_single(const std::filesystem::path& source, uint64_t size,
                                 const CloudPath& destination, const TransferOptions& options,
                                 const storage::PutOptions& put_options,
                                 const CancellationToken& cancel);

    TransferResult upload_multipart(const std::filesystem::path& source, uint64_t size,
                                    uint64_t part_size, uint32_t part_count,
                                    const CloudPath& destination, const TransferOptions& options,
                                    const storage::PutOptions& put_options,
                                    const CancellationToken& cancel);

    /// Abort `session`, folding an abort failure into `result`.
    void abort_session(const MultipartSession& session, TransferResult& result);

    storage::ObjectStore& store_;
    SessionJournal* journal_;
    TransferMetrics* metrics_;
};

}  // namespace s3xfer::transfer
