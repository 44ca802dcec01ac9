#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/core/error.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/copy_orchestrator.hpp"
#include "s3xfer/transfer/path_resolver.hpp"
#include "s3xfer/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace s3xfer::transfer {

enum class EntryType { Files, Directories, All };

enum class ListFormat {
    Full,      // s3://bucket/key
    Relative,  // Name relative to the listed prefix
    Key,       // Bucket-relative key
    Detailed   // Size, last-modified and URI
};

struct ListRequest {
    bool recurse = false;
    std::string filter;  // Glob on the entry basename; empty matches all
    EntryType type = EntryType::All;
    ListFormat format = ListFormat::Full;
};

struct DirectoryEntry {
    std::string display;   // Rendered in the requested format
    std::string key;
    std::string relative;  // key minus the listed prefix
    bool is_directory = false;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
};

struct ListingResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::vector<DirectoryEntry> entries;
};

struct ExistsResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    bool exists = false;
};

struct DirectoryDeleteResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    size_t deleted = 0;
    std::vector<std::string> failed_keys;
};

struct DirectoryCopyResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    size_t copied = 0;
    std::vector<BatchError> errors;
    std::vector<std::string> failed_keys;  // Source keys or relative local paths
};

struct AggregateResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    ObjectInfo info;
};

/// Directories over a flat key space.
///
/// A directory is a key prefix ending in '/'. It exists when a zero-length
/// placeholder object with that exact key exists, or when any object lives
/// under the prefix.
class DirectoryService {
public:
    DirectoryService(storage::ObjectStore& store, CopyOrchestrator& orchestrator);

    /// Write the placeholder unless it is already there.
    TransferResult create(const CloudPath& prefix, const TransferOptions& options,
                          const CancellationToken& cancel = {});

    ExistsResult exists(const CloudPath& prefix, const TransferOptions& options,
                        const CancellationToken& cancel = {});

    ListingResult list(const CloudPath& prefix, const ListRequest& request,
                       const TransferOptions& options, const CancellationToken& cancel = {});

    /// Delete every key under the prefix, placeholder included. Each delete
    /// request is retried as a whole; keys the store rejects individually
    /// are reported in failed_keys.
    DirectoryDeleteResult remove(const CloudPath& prefix, const TransferOptions& options,
                                 const CancellationToken& cancel = {});

    /// Copy the objects under `source` to `destination`, keeping their
    /// paths relative to the source prefix. Either side may be local.
    DirectoryCopyResult copy(const ResolvedPath& source, const ResolvedPath& destination,
                             bool recurse, const TransferOptions& options,
                             const CancellationToken& cancel = {});

    /// Object count, total size and newest modification under the prefix.
    AggregateResult aggregate(const CloudPath& prefix, const TransferOptions& options,
                              const CancellationToken& cancel = {});

    /// Render one entry in the given format.
    static std::string format_entry(const CloudPath& prefix, const DirectoryEntry& entry,
                                    ListFormat format);

private:
    /// Page through every listing entry under `prefix`, retrying each page.
    template <typename Visitor>
    storage::ListResult for_each_entry(const std::string& bucket, const std::string& prefix,
                                       const std::string& delimiter,
                                       const TransferOptions& options,
                                       const CancellationToken& cancel, Visitor&& visit);

    storage::ObjectStore& store_;
    CopyOrchestrator& orchestrator_;
};

}  // namespace s3xfer::transfer
