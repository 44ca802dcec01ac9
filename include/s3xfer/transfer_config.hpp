#pragma once

#include "s3xfer/transfer/directory_service.hpp"
#include "s3xfer/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace s3xfer {

/// Object store selection, handed to ObjectStoreFactory.
struct StoreConfig {
    std::string type = "s3";  // "s3" or "local"
    std::map<std::string, std::string> params;

    bool empty() const { return type.empty(); }

    /// Validate required fields for this store type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for one s3xfer invocation.
struct TransferConfig {
    StoreConfig store;
    std::string default_bucket;

    // Transfer tuning
    size_t concurrency = constants::DEFAULT_CONCURRENCY;
    bool fail_fast = true;
    uint64_t upload_multipart_threshold = constants::DEFAULT_UPLOAD_MULTIPART_THRESHOLD;
    uint64_t download_multipart_threshold = constants::DEFAULT_DOWNLOAD_MULTIPART_THRESHOLD;
    uint64_t part_size = constants::DEFAULT_PART_SIZE;
    uint64_t download_chunk_size = constants::DEFAULT_DOWNLOAD_CHUNK_SIZE;
    size_t max_buffered_parts = constants::DEFAULT_MAX_BUFFERED_PARTS;
    uint32_t single_put_attempts = constants::DEFAULT_SINGLE_PUT_ATTEMPTS;
    size_t throttle_error_burst = constants::DEFAULT_THROTTLE_ERROR_BURST;
    size_t throttle_recovery = constants::DEFAULT_THROTTLE_RECOVERY_SUCCESSES;
    uint64_t request_timeout_ms = 0;
    std::string temp_dir;

    // Retry policy
    uint32_t retry_max_attempts = 4;
    uint64_t retry_base_delay_ms = 200;
    uint64_t retry_max_delay_ms = 10000;
    double retry_multiplier = 2.0;
    double retry_jitter = 0.2;

    // Object attributes on upload
    std::string content_type;
    std::map<std::string, std::string> metadata;

    // Command options
    bool recursive = false;
    std::string list_filter;
    transfer::EntryType list_type = transfer::EntryType::All;
    transfer::ListFormat list_format = transfer::ListFormat::Full;
    uint32_t presign_expires_secs = 3600;
    std::string presign_method = "GET";

    // Multipart session journal (SQLite); empty disables it
    std::filesystem::path journal_path;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    bool verbose = false;
    std::filesystem::path log_file;

    // Subcommand and its arguments
    std::string command;
    std::vector<std::string> args;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<TransferConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill unset credentials and bucket from the environment.
    void apply_environment();

    /// Fill in defaults that depend on other fields.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Engine options derived from this configuration.
    transfer::TransferOptions to_transfer_options() const;
};

}  // namespace s3xfer
