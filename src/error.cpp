#include "s3xfer/core/error.hpp"

namespace s3xfer {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidPath: return "invalid_path";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::AccessDenied: return "access_denied";
        case ErrorKind::NetworkFailure: return "network_failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::IntegrityFailure: return "integrity_failure";
        case ErrorKind::Aborted: return "aborted";
        case ErrorKind::PartialBatchFailure: return "partial_batch_failure";
        case ErrorKind::Io: return "io";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::NetworkFailure || kind == ErrorKind::Timeout;
}

bool is_connection_error(ErrorKind kind) {
    return kind == ErrorKind::NetworkFailure || kind == ErrorKind::Timeout;
}

ErrorKind error_kind_from_http_status(int status) {
    if (status >= 200 && status < 300) return ErrorKind::None;
    switch (status) {
        case 401:
        case 403:
            return ErrorKind::AccessDenied;
        case 404:
            return ErrorKind::NotFound;
        case 408:
            return ErrorKind::Timeout;
        case 429:  // SlowDown
            return ErrorKind::NetworkFailure;
        default:
            break;
    }
    if (status >= 500 && status < 600) return ErrorKind::NetworkFailure;
    return ErrorKind::Unknown;
}

ErrorKind error_kind_from_s3_error(int status, const std::string& code) {
    if (code == "RequestTimeout") return ErrorKind::Timeout;
    // Signed with a stale clock; the next attempt signs again
    if (code == "RequestTimeTooSkewed") return ErrorKind::NetworkFailure;
    if (code == "SlowDown" || code == "InternalError") return ErrorKind::NetworkFailure;
    if (code == "NoSuchKey" || code == "NoSuchBucket" || code == "NoSuchUpload") {
        return ErrorKind::NotFound;
    }
    return error_kind_from_http_status(status);
}

}  // namespace s3xfer
