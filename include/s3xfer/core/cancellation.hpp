#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace s3xfer {

/// Cooperative cancellation flag shared between a group of tasks.
///
/// Copies share state. A child token observes its own flag and every
/// ancestor's flag, so cancelling a batch also cancels the ranges of a
/// download running inside it, while a failing download can cancel its
/// own ranges without touching the batch.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() const { state_->flag.store(true, std::memory_order_release); }

    bool cancelled() const {
        for (const State* s = state_.get(); s; s = s->parent.get()) {
            if (s->flag.load(std::memory_order_acquire)) return true;
        }
        return false;
    }

    CancellationToken child() const {
        CancellationToken token;
        token.state_->parent = state_;
        return token;
    }

    /// Sleep for `duration`, waking early when cancelled.
    /// Returns false if the token was cancelled.
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> flag{false};
        std::shared_ptr<State> parent;
    };

    std::shared_ptr<State> state_;
};

}  // namespace s3xfer
