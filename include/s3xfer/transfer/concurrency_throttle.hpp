#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/core/error.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace s3xfer::transfer {

/// Adaptive limit on concurrent ranged reads.
///
/// A burst of `error_burst` consecutive connection errors (since the last
/// success or the last reduction) halves the limit, never below 1.
/// `recovery` consecutive successes raise it by one, up to `max_limit`.
/// A new slot is granted only while in_flight < limit, so after a reduction
/// the ranges already running drain before anything new is dispatched.
class ConcurrencyThrottle {
public:
    /// State observed at the moment a slot was granted
    struct Dispatch {
        size_t in_flight = 0;  // Including the slot just granted
        size_t limit = 0;
    };

    ConcurrencyThrottle(size_t max_limit, size_t error_burst, size_t recovery);

    /// Block until a slot is free. Returns nullopt if `cancel` fires first.
    std::optional<Dispatch> acquire(const CancellationToken& cancel);

    /// Non-blocking variant of acquire().
    std::optional<Dispatch> try_acquire();

    /// Return a slot with the outcome of the call it covered.
    /// Returns true when this outcome reduced the limit.
    bool release(bool success, ErrorKind kind = ErrorKind::None);

    size_t limit() const;
    size_t in_flight() const;
    size_t max_limit() const { return max_limit_; }
    size_t reductions() const;

private:
    Dispatch grant_locked();

    const size_t max_limit_;
    const size_t error_burst_;
    const size_t recovery_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t limit_;
    size_t in_flight_ = 0;
    size_t error_streak_ = 0;
    size_t success_streak_ = 0;
    size_t reductions_ = 0;
};

}  // namespace s3xfer::transfer
