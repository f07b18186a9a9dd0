/**
 * Fetcher: one bounded page of raw bars with rate limiting and retry
 */

#pragma once

#include <string>
#include <cstdint>

#include "ohlcv_ingest/common/cancellation.h"
#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/exchange_client.h"
#include "ohlcv_ingest/data/rate_limiter.h"

namespace ohlcv_ingest {
namespace data {

// "15min" -> "15m", "1h" -> "1h"; unknown labels pass through with a warning
std::string toTimeframe(const std::string& interval);

class Fetcher {
public:
    Fetcher(ExchangeClient& client, RateLimiter& limiter, const common::ApiConfig& api_config);

    /**
     * Fetch one page of raw bars with since_ms <= timestamp <= end_ms.
     * The page's next_cursor is set when more rows may follow inside the window.
     *
     * RateLimitError is retried with backoff base * 2^attempt seconds and rethrown once
     * api.retries attempts are used up. Other errors propagate unchanged.
     * Throws CancelledError if the token fires while waiting.
     */
    FetchPage fetch(const std::string& symbol, const std::string& interval,
                    int64_t since_ms, int64_t end_ms,
                    const common::CancellationToken& token);

    const std::string& exchangeId() const { return exchange_id_; }

private:
    ExchangeClient& client_;
    RateLimiter& limiter_;
    common::ApiConfig api_config_;
    std::string exchange_id_;
};

} // namespace data
} // namespace ohlcv_ingest
