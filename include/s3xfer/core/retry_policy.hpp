#pragma once

#include "s3xfer/core/cancellation.hpp"
#include "s3xfer/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace s3xfer {

/// Bounded exponential backoff with jitter.
///
/// Shared by single puts, part uploads, range downloads, server-side copies
/// and directory-copy items so that every path retries the same way.
/// `max_attempts` counts the first try: 1 means no retry.
struct RetryPolicy {
    uint32_t max_attempts = 4;
    std::chrono::milliseconds base_delay{200};
    double multiplier = 2.0;
    double jitter = 0.2;                       // +/- fraction of the delay
    std::chrono::milliseconds max_delay{10000};

    /// Delay before retry number `retry` (1-based), jitter excluded.
    std::chrono::milliseconds nominal_delay(uint32_t retry) const;

    /// Delay before retry number `retry` with jitter applied.
    std::chrono::milliseconds delay_for(uint32_t retry) const;

    /// Same policy with a different attempt budget.
    RetryPolicy with_attempts(uint32_t attempts) const {
        RetryPolicy p = *this;
        p.max_attempts = attempts;
        return p;
    }
};

/// Called after each failed attempt that will be retried.
using RetryObserver =
    std::function<void(uint32_t attempt, ErrorKind kind, const std::string& message)>;

/// Run `op` until it succeeds, fails with a fatal error, exhausts the
/// attempt budget or `cancel` fires. `Result` is any struct with
/// success / error_kind / error_message.
template <typename Result, typename Op>
Result with_retry(const RetryPolicy& policy, const CancellationToken& cancel,
                  Op&& op, const RetryObserver& on_retry = nullptr) {
    uint32_t attempt = 0;
    const uint32_t budget = policy.max_attempts == 0 ? 1 : policy.max_attempts;
    while (true) {
        if (cancel.cancelled()) {
            return make_error<Result>(ErrorKind::Aborted, "cancelled");
        }
        ++attempt;
        Result result = op();
        if (result.success || !is_retryable(result.error_kind) || attempt >= budget) {
            return result;
        }
        if (on_retry) on_retry(attempt, result.error_kind, result.error_message);
        if (!cancel.sleep_for(policy.delay_for(attempt))) {
            return make_error<Result>(ErrorKind::Aborted, "cancelled");
        }
    }
}

}  // namespace s3xfer
