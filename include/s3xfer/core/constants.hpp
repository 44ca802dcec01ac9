#pragma once

#include <cstddef>
#include <cstdint>

namespace s3xfer::constants {

constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * KiB;
constexpr uint64_t GiB = 1024 * MiB;

// Multipart protocol limits of the S3 API
constexpr uint64_t MIN_PART_SIZE = 5 * MiB;
constexpr uint64_t MAX_PART_SIZE = 5 * GiB;
constexpr uint32_t MAX_PART_COUNT = 10000;
constexpr uint64_t MAX_SERVER_SIDE_COPY_SIZE = 5 * GiB;

// Transfer defaults
constexpr uint64_t DEFAULT_UPLOAD_MULTIPART_THRESHOLD = 25 * MiB;
constexpr uint64_t DEFAULT_DOWNLOAD_MULTIPART_THRESHOLD = 25 * MiB;
constexpr uint64_t DEFAULT_PART_SIZE = 16 * MiB;
constexpr uint64_t DEFAULT_DOWNLOAD_CHUNK_SIZE = 16 * MiB;
constexpr size_t DEFAULT_CONCURRENCY = 8;
constexpr size_t DEFAULT_MAX_BUFFERED_PARTS = 4;
constexpr uint32_t DEFAULT_SINGLE_PUT_ATTEMPTS = 3;

// Download throttling
constexpr size_t DEFAULT_THROTTLE_ERROR_BURST = 3;
constexpr size_t DEFAULT_THROTTLE_RECOVERY_SUCCESSES = 4;

// Listing and deletion page sizes
constexpr uint32_t LIST_PAGE_SIZE = 1000;
constexpr size_t DELETE_BATCH_SIZE = 1000;

// Presigned URL expiry bounds (SigV4 maximum is 7 days)
constexpr uint32_t MIN_PRESIGN_EXPIRY_SECS = 1;
constexpr uint32_t MAX_PRESIGN_EXPIRY_SECS = 604800;

constexpr const char* REMOTE_SCHEME = "s3://";
constexpr char PATH_SEPARATOR = '/';

// Suffix for in-progress download files
constexpr const char* PARTIAL_DOWNLOAD_SUFFIX = ".s3xfer-part";

}  // namespace s3xfer::constants
