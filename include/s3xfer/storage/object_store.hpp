#pragma once

#include "s3xfer/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace s3xfer::storage {

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
    std::map<std::string, std::string> user_metadata;
};

// Every store result carries the same failure triple plus the HTTP status
// the store answered with (0 when no response was received).
struct HeadResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    ObjectMetadata metadata;
};

struct GetResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    std::vector<uint8_t> data;     // Empty when streamed to GetOptions::sink
    uint64_t bytes_received = 0;
    ObjectMetadata metadata;
};

struct PutResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    std::string etag;
};

// Result of operations with no payload (remove, abort)
struct OpResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
};

// Result of a multi-key delete. A request-level failure (throttling, a
// dropped connection) clears `success`; keys the store rejected one by one
// land in `failed_keys` of a successful request.
struct BatchDeleteResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    std::vector<std::string> failed_keys;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
    bool is_directory = false;  // Common prefix collapsed by the delimiter
};

struct ListResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
};

// Receives streamed object bytes. Return false to abort the read.
using DataSink = std::function<bool(const uint8_t* data, size_t size)>;

struct PutOptions {
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> metadata;
    std::chrono::milliseconds timeout{0};  // 0 = store default
};

struct GetOptions {
    std::optional<uint64_t> range_start;
    std::optional<uint64_t> range_end;     // Exclusive
    std::optional<std::string> if_match;   // ETag condition
    std::chrono::milliseconds timeout{0};
    DataSink sink;
};

struct ListOptions {
    std::string prefix;
    std::string delimiter;  // Empty = flat listing
    uint32_t max_keys = 1000;
    std::string continuation_token;
    std::chrono::milliseconds timeout{0};
};

struct MultipartInitResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    std::string upload_id;
};

struct CompletedPart {
    uint32_t part_number = 0;
    std::string etag;
};

struct MultipartUploadInfo {
    std::string key;
    std::string upload_id;
    std::chrono::system_clock::time_point initiated;
};

struct MultipartListResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    std::vector<MultipartUploadInfo> uploads;
};

enum class PresignMethod { Get, Put };

struct PresignOptions {
    PresignMethod method = PresignMethod::Get;
    uint32_t expires_secs = 3600;
    std::string content_type;
    std::map<std::string, std::string> metadata;
    // response-* overrides, e.g. {"content-disposition", "attachment"}
    std::map<std::string, std::string> response_headers;
};

struct PresignResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    std::string url;
};

// Abstract interface to a bucket/key object store.
// Implementations must be safe to call from many threads at once.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Get the store type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Get object metadata without downloading content
    virtual HeadResult head(const std::string& bucket, const std::string& key) const = 0;

    // Read object content, whole or a byte range
    virtual GetResult get(const std::string& bucket, const std::string& key,
                          const GetOptions& options = {}) const = 0;

    // Write object content in one request
    virtual PutResult put(const std::string& bucket, const std::string& key,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    // Multipart protocol
    virtual MultipartInitResult initiate_multipart(const std::string& bucket,
                                                   const std::string& key,
                                                   const PutOptions& options = {}) = 0;
    virtual PutResult upload_part(const std::string& bucket, const std::string& key,
                                  const std::string& upload_id, uint32_t part_number,
                                  std::span<const uint8_t> data,
                                  std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) = 0;
    virtual PutResult complete_multipart(const std::string& bucket, const std::string& key,
                                         const std::string& upload_id,
                                         const std::vector<CompletedPart>& parts) = 0;
    virtual OpResult abort_multipart(const std::string& bucket, const std::string& key,
                                     const std::string& upload_id) = 0;
    virtual MultipartListResult list_multipart_uploads(const std::string& bucket,
                                                       const std::string& prefix = "") const = 0;

    // Server-side copy (metadata is copied with the object)
    virtual PutResult copy_object(const std::string& source_bucket, const std::string& source_key,
                                  const std::string& dest_bucket, const std::string& dest_key) = 0;

    // Delete an object. Deleting a missing key succeeds.
    virtual OpResult remove(const std::string& bucket, const std::string& key) = 0;

    // Delete multiple objects in one request
    virtual BatchDeleteResult remove_batch(const std::string& bucket,
                                           const std::vector<std::string>& keys) = 0;

    // List one page of objects with prefix, sorted by key
    virtual ListResult list(const std::string& bucket, const ListOptions& options = {}) const = 0;

    virtual PresignResult presign(const std::string& bucket, const std::string& key,
                                  const PresignOptions& options = {}) const = 0;
};

struct S3StoreConfig {
    std::string region = "us-east-1";
    std::string endpoint;         // Empty for AWS, custom for MinIO/etc
    std::string access_key;
    std::string secret_key;
    std::string session_token;    // STS/temporary credentials
    bool use_path_style = false;  // For MinIO compatibility
    bool verify_ssl = true;
    bool unsigned_payload = false;  // Skip SHA-256 payload hashing on PUTs
    uint32_t connect_timeout_secs = 10;
    uint32_t request_timeout_secs = 60;
};

// Factory for creating object stores from configuration
class ObjectStoreFactory {
public:
    // Create a store from a type name and a configuration map.
    // Throws std::runtime_error on an unknown type or missing parameter.
    static std::unique_ptr<ObjectStore> create(
        const std::string& type,
        const std::map<std::string, std::string>& config);

    // Buckets are directories under root_path
    static std::unique_ptr<ObjectStore> create_local(
        const std::filesystem::path& root_path);

    static std::unique_ptr<ObjectStore> create_s3(const S3StoreConfig& config);
};

// Guess a Content-Type from a file name extension
std::string guess_content_type(const std::string& filename);

}  // namespace s3xfer::storage
