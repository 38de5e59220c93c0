#pragma once

#include <atomic>
#include <chrono>

namespace ctxopt {

/// Deadline plus an explicit cancel flag, shared by the interpreter, the SDK
/// filesystem walks and the git subprocess wait loop of one execution.
/// Once the deadline passes the token latches into the cancelled state.
class CancellationToken {
public:
    using clock = std::chrono::steady_clock;

    /// A token that never expires on its own.
    CancellationToken() : deadline_(clock::time_point::max()) {}

    explicit CancellationToken(std::chrono::milliseconds timeout)
        : deadline_(clock::now() + timeout) {}

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        if (cancelled_.load(std::memory_order_relaxed)) return true;
        if (clock::now() >= deadline_) {
            cancelled_.store(true, std::memory_order_relaxed);
            return true;
        }
        return false;
    }

    [[nodiscard]] auto deadline() const noexcept -> clock::time_point { return deadline_; }

    /// Time left before the deadline, zero once cancelled.
    [[nodiscard]] auto remaining() const noexcept -> std::chrono::milliseconds {
        if (is_cancelled()) return std::chrono::milliseconds{0};
        if (deadline_ == clock::time_point::max()) return std::chrono::milliseconds::max();
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - clock::now());
    }

private:
    clock::time_point deadline_;
    mutable std::atomic<bool> cancelled_{false};
};

} // namespace ctxopt
