#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/batch_coordinator.hpp"
#include "s3xfer/transfer/copy_orchestrator.hpp"
#include "s3xfer/transfer/directory_service.hpp"
#include "s3xfer/transfer/download_engine.hpp"
#include "s3xfer/transfer/path_resolver.hpp"
#include "s3xfer/transfer/types.hpp"
#include "s3xfer/transfer/upload_engine.hpp"

#include <map>
#include <string>
#include <vector>

namespace s3xfer {
class SessionJournal;
class TransferMetrics;
}  // namespace s3xfer

namespace s3xfer::transfer {

struct BytesResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::vector<uint8_t> data;
    storage::ObjectMetadata metadata;
};

struct InfoResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    ObjectInfo info;
};

struct PresignRequest {
    std::string path;
    storage::PresignMethod method = storage::PresignMethod::Get;
    uint32_t expires_seconds = 3600;
    std::string content_type;
    std::map<std::string, std::string> metadata;
    std::map<std::string, std::string> response_headers;
};

/// Entry point over raw path strings.
///
/// Paths are resolved against the default bucket; a malformed path comes
/// back as an InvalidPath result, never as an exception. The service keeps
/// no per-call state: every method can be called from any thread.
class TransferService {
public:
    TransferService(storage::ObjectStore& store, std::string default_bucket,
                    TransferOptions defaults = {},
                    SessionJournal* journal = nullptr,
                    TransferMetrics* metrics = nullptr);

    const TransferOptions& defaults() const { return defaults_; }
    const PathResolver& resolver() const { return resolver_; }

    /// Cancel everything in flight on this service.
    void cancel() { cancel_.cancel(); }

    TransferResult upload(const std::string& source, const std::string& destination);
    TransferResult upload(const std::string& source, const std::string& destination,
                          const TransferOptions& options);

    TransferResult download(const std::string& source, const std::string& destination);
    TransferResult download(const std::string& source, const std::string& destination,
                            const TransferOptions& options);

    BatchReport batch_upload(const std::vector<std::string>& sources,
                             const std::vector<std::string>& destinations,
                             size_t concurrency, bool fail_fast);
    BatchReport batch_download(const std::vector<std::string>& sources,
                               const std::vector<std::string>& destinations,
                               size_t concurrency, bool fail_fast);

    TransferResult copy(const std::string& source, const std::string& destination);
    TransferResult copy(const std::string& source, const std::string& destination,
                        const TransferOptions& options);

    TransferResult remove(const std::string& path);

    BytesResult get_bytes(const std::string& path);

    InfoResult object_info(const std::string& path);

    storage::PresignResult presign(const PresignRequest& request);

    TransferResult directory_create(const std::string& prefix);
    ExistsResult directory_exists(const std::string& prefix);
    DirectoryDeleteResult directory_remove(const std::string& prefix);
    ListingResult directory_list(const std::string& prefix, const ListRequest& request);
    DirectoryCopyResult directory_copy(const std::string& source, const std::string& destination,
                                       bool recurse);

private:
    template <typename Result>
    static Result invalid_path(const std::exception& e) {
        return make_error<Result>(ErrorKind::InvalidPath, e.what());
    }

    BatchReport run_pairs(const std::vector<std::string>& sources,
                          const std::vector<std::string>& destinations,
                          size_t concurrency, bool fail_fast, bool uploading);

    storage::ObjectStore& store_;
    PathResolver resolver_;
    TransferOptions defaults_;
    CancellationToken cancel_;

    UploadEngine uploader_;
    DownloadEngine downloader_;
    CopyOrchestrator orchestrator_;
    BatchCoordinator batches_;
    DirectoryService directories_;
};

}  // namespace s3xfer::transfer
