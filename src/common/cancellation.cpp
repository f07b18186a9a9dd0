/**
 * Cancellation token implementation
 */

#include "ohlcv_ingest/common/cancellation.h"
#include "ohlcv_ingest/common/errors.h"

namespace ohlcv_ingest {
namespace common {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
    if (cancelled_.load()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

void CancellationToken::setDeadline(Clock::time_point deadline) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = deadline;
    }
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);

    auto wake_at = Clock::now() + duration;
    if (deadline_.has_value() && *deadline_ < wake_at) {
        wake_at = *deadline_;
    }

    cv_.wait_until(lock, wake_at, [this]() { return cancelled_.load(); });

    if (cancelled_.load()) {
        return false;
    }
    return !(deadline_.has_value() && Clock::now() >= *deadline_);
}

void CancellationToken::throwIfCancelled(const std::string& what) const {
    if (isCancelled()) {
        throw CancelledError("Cancelled: " + what);
    }
}

} // namespace common
} // namespace ohlcv_ingest
