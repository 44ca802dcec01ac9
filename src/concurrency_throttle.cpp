#include "s3xfer/transfer/concurrency_throttle.hpp"
#include "s3xfer/core/log.hpp"

#include <algorithm>
#include <chrono>

namespace s3xfer::transfer {

ConcurrencyThrottle::ConcurrencyThrottle(size_t max_limit, size_t error_burst, size_t recovery)
    : max_limit_(std::max<size_t>(max_limit, 1))
    , error_burst_(std::max<size_t>(error_burst, 1))
    , recovery_(std::max<size_t>(recovery, 1))
    , limit_(max_limit_) {}

ConcurrencyThrottle::Dispatch ConcurrencyThrottle::grant_locked() {
    ++in_flight_;
    return Dispatch{in_flight_, limit_};
}

std::optional<ConcurrencyThrottle::Dispatch> ConcurrencyThrottle::acquire(const CancellationToken& cancel) {
    std::unique_lock lock(mutex_);
    while (in_flight_ >= limit_) {
        if (cancel.cancelled()) return std::nullopt;
        // Cancellation does not notify the cv, so wake up periodically
        cv_.wait_for(lock, std::chrono::milliseconds(20));
    }
    if (cancel.cancelled()) return std::nullopt;
    return grant_locked();
}

std::optional<ConcurrencyThrottle::Dispatch> ConcurrencyThrottle::try_acquire() {
    std::lock_guard lock(mutex_);
    if (in_flight_ >= limit_) return std::nullopt;
    return grant_locked();
}

bool ConcurrencyThrottle::release(bool success, ErrorKind kind) {
    bool reduced = false;
    {
        std::lock_guard lock(mutex_);
        if (in_flight_ > 0) --in_flight_;

        if (success) {
            error_streak_ = 0;
            if (++success_streak_ >= recovery_) {
                success_streak_ = 0;
                if (limit_ < max_limit_) {
                    ++limit_;
                    log_debug("throttle: limit raised to %zu", limit_);
                }
            }
        } else if (is_connection_error(kind)) {
            success_streak_ = 0;
            if (++error_streak_ >= error_burst_) {
                error_streak_ = 0;
                size_t halved = std::max<size_t>(limit_ / 2, 1);
                if (halved < limit_) {
                    limit_ = halved;
                    ++reductions_;
                    reduced = true;
                    log_debug("throttle: limit reduced to %zu", limit_);
                }
            }
        } else {
            success_streak_ = 0;
        }
    }
    cv_.notify_all();
    return reduced;
}

size_t ConcurrencyThrottle::limit() const {
    std::lock_guard lock(mutex_);
    return limit_;
}

size_t ConcurrencyThrottle::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

size_t ConcurrencyThrottle::reductions() const {
    std::lock_guard lock(mutex_);
    return reductions_;
}

}  // namespace s3xfer::transfer
