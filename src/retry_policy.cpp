#include "s3xfer/core/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace s3xfer {

namespace {

std::mt19937& thread_rng() {
    thread_local std::mt19937 rng{std::random_device{}()};
    return rng;
}

}  // namespace

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    // Sleep in short slices so a cancel is observed promptly
    constexpr auto slice = std::chrono::milliseconds(20);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
    return false;
}

std::chrono::milliseconds RetryPolicy::nominal_delay(uint32_t retry) const {
    if (retry == 0) return std::chrono::milliseconds(0);
    double delay = static_cast<double>(base_delay.count()) *
                   std::pow(multiplier, static_cast<double>(retry - 1));
    double cap = static_cast<double>(max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t retry) const {
    auto nominal = nominal_delay(retry);
    if (jitter <= 0.0 || nominal.count() == 0) return nominal;

    double j = std::min(jitter, 1.0);
    std::uniform_real_distribution<double> dist(1.0 - j, 1.0 + j);
    double delay = static_cast<double>(nominal.count()) * dist(thread_rng());
    delay = std::min(delay, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace s3xfer
