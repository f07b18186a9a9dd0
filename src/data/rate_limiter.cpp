/**
 * Rate limiter implementation
 */

#include "ohlcv_ingest/data/rate_limiter.h"
#include "ohlcv_ingest/common/errors.h"

namespace ohlcv_ingest {
namespace data {

RateLimiter::RateLimiter(std::chrono::milliseconds min_spacing)
    : min_spacing_(min_spacing),
      next_slot_(Clock::time_point::min()) {
}

void RateLimiter::acquire(const common::CancellationToken& token) {
    token.throwIfCancelled("waiting for request slot");

    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        slot = next_slot_ > now ? next_slot_ : now;
        next_slot_ = slot + min_spacing_;
        ++acquired_;
    }

    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(slot - Clock::now());
    if (wait.count() > 0 && !token.waitFor(wait)) {
        throw CancelledError("Cancelled: waiting for request slot");
    }
}

size_t RateLimiter::acquired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquired_;
}

} // namespace data
} // namespace ohlcv_ingest
