/**
 * Cooperative cancellation for long-running fetch loops
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace ohlcv_ingest {
namespace common {

/**
 * Shared cancel flag with an optional deadline.
 * Waits performed through the token wake up as soon as cancel() is called.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(Clock::time_point deadline) : deadline_(deadline) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Request cancellation and wake every waiter
    void cancel();

    // True once cancel() was called or the deadline has passed
    bool isCancelled() const;

    void setDeadline(Clock::time_point deadline);

    // Sleep for up to `duration`; returns false if cancelled before or during the wait
    bool waitFor(std::chrono::milliseconds duration) const;

    // Throws CancelledError naming `what` when cancelled
    void throwIfCancelled(const std::string& what) const;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace common
} // namespace ohlcv_ingest
