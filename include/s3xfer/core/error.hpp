#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace s3xfer {

// Classification of every failure surfaced by the store and the engines.
enum class ErrorKind {
    None,
    InvalidPath,          // Malformed or unresolvable path
    NotFound,             // Object or prefix absent
    AccessDenied,
    NetworkFailure,       // Connection-level error, throttling, 5xx
    Timeout,              // Per-call timeout
    IntegrityFailure,     // Reserved
    Aborted,              // Fail-fast cancellation
    PartialBatchFailure,  // Aggregate of item failures
    Io,                   // Local filesystem error
    Unknown
};

const char* error_kind_name(ErrorKind kind);

// Transient kinds are retried under RetryPolicy; everything else is fatal.
bool is_retryable(ErrorKind kind);

// Connection exhaustion signal used by the download throttle.
bool is_connection_error(ErrorKind kind);

// Map an HTTP status code from the object store onto an ErrorKind.
ErrorKind error_kind_from_http_status(int status);

// Same, refined by the <Code> of an S3 error body. S3 reports some
// transient conditions (RequestTimeout, RequestTimeTooSkewed) as 400 or 403.
ErrorKind error_kind_from_s3_error(int status, const std::string& code);

// Thrown by PathResolver for malformed remote URIs.
class InvalidPathError : public std::invalid_argument {
public:
    explicit InvalidPathError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Build a failed result of any result struct carrying the
// success / error_kind / error_message triple.
template <typename Result>
Result make_error(ErrorKind kind, std::string message) {
    Result result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = std::move(message);
    return result;
}

}  // namespace s3xfer
