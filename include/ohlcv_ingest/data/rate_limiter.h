/**
 * Minimum-spacing request limiter shared by every pipeline hitting one exchange
 */

#pragma once

#include <chrono>
#include <mutex>

#include "ohlcv_ingest/common/cancellation.h"

namespace ohlcv_ingest {
namespace data {

class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::chrono::milliseconds min_spacing);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Block until the next request slot. Slots are handed out in call order and
     * are at least min_spacing apart. Throws CancelledError if the token fires first.
     */
    void acquire(const common::CancellationToken& token);

    std::chrono::milliseconds minSpacing() const { return min_spacing_; }

    // Number of slots handed out so far
    size_t acquired() const;

private:
    const std::chrono::milliseconds min_spacing_;
    mutable std::mutex mutex_;
    Clock::time_point next_slot_;
    size_t acquired_ = 0;
};

} // namespace data
} // namespace ohlcv_ingest
