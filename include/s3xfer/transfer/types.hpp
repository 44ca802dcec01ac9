#pragma once

#include "s3xfer/core/constants.hpp"
#include "s3xfer/core/error.hpp"
#include "s3xfer/core/retry_policy.hpp"
#include "s3xfer/storage/object_store.hpp"
#include "s3xfer/transfer/path_resolver.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace s3xfer::transfer {

/// Tuning for one transfer. Owned by the caller, read-only to the engines.
struct TransferOptions {
    size_t concurrency = constants::DEFAULT_CONCURRENCY;
    bool fail_fast = true;

    // Upload
    uint64_t upload_multipart_threshold = constants::DEFAULT_UPLOAD_MULTIPART_THRESHOLD;
    uint64_t part_size = constants::DEFAULT_PART_SIZE;
    uint64_t min_part_size = constants::MIN_PART_SIZE;  // Store minimum, lowered only in tests
    size_t max_buffered_parts = constants::DEFAULT_MAX_BUFFERED_PARTS;
    uint32_t single_put_attempts = constants::DEFAULT_SINGLE_PUT_ATTEMPTS;

    // Download
    uint64_t download_multipart_threshold = constants::DEFAULT_DOWNLOAD_MULTIPART_THRESHOLD;
    uint64_t download_chunk_size = constants::DEFAULT_DOWNLOAD_CHUNK_SIZE;
    size_t throttle_error_burst = constants::DEFAULT_THROTTLE_ERROR_BURST;
    size_t throttle_recovery = constants::DEFAULT_THROTTLE_RECOVERY_SUCCESSES;

    // Per network call; 0 = store default
    std::chrono::milliseconds request_timeout{0};
    RetryPolicy retry;

    // Object attributes on upload. Empty content type = guess from extension.
    std::string content_type;
    std::map<std::string, std::string> metadata;

    // Where two-phase copies stage data. Empty = system temp directory.
    std::string temp_dir;
};

/// Terminal outcome of one transfer, delete or copy.
struct TransferResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;

    storage::ObjectMetadata metadata;  // Of the written object, when known
    uint64_t bytes_transferred = 0;
    uint32_t parts = 0;                // Parts or ranges used; 1 for single-shot
    std::string strategy;              // "single-part", "multipart", "ranged", ...
    size_t peak_buffered_parts = 0;    // Multipart uploads only

    bool error() const { return !success; }

    static TransferResult ok(std::string strategy) {
        TransferResult result;
        result.success = true;
        result.strategy = std::move(strategy);
        return result;
    }
};

/// A live multipart upload. Every initiated session ends in exactly one of
/// complete or abort.
struct MultipartSession {
    std::string upload_id;
    std::string bucket;
    std::string key;
    std::vector<storage::CompletedPart> parts;
};

struct TransferRequest {
    ResolvedPath source;
    ResolvedPath destination;
    TransferOptions options;
};

struct BatchError {
    size_t index = 0;
    std::string message;
};

/// Aggregate of a batch run.
///
/// With fail-fast, `results` holds only the items that started (in input
/// order, see `result_indices`) and `aborted` is set once the batch was
/// tripped. Without it, there is one result per input item.
struct BatchReport {
    bool success = false;
    bool aborted = false;
    std::vector<TransferResult> results;
    std::vector<size_t> result_indices;
    std::vector<BatchError> errors;
};

/// Object metadata, or an aggregate when the path names a directory.
struct ObjectInfo {
    bool is_directory = false;

    // Object form
    uint64_t size = 0;
    std::string content_type;
    std::string etag;
    std::chrono::system_clock::time_point last_modified;
    std::map<std::string, std::string> user_metadata;

    // Directory form
    uint64_t object_count = 0;
    uint64_t total_size = 0;
    std::chrono::system_clock::time_point last_modified_latest;
};

}  // namespace s3xfer::transfer
