/**
 * Exchange client interface
 */

#pragma once

#include <string>
#include <memory>
#include <optional>
#include <cstdint>

#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/bar.h"

namespace ohlcv_ingest {
namespace data {

// One page of raw bars and where the next page starts
struct FetchPage {
    BarSeries rows;
    std::optional<int64_t> next_cursor;   // Set when more rows may follow
};

// Exchange client interface
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    // Exchange identifier used in the output layout, e.g. "okx"
    virtual std::string exchangeId() const = 0;

    /**
     * Fetch up to `limit` bars with timestamp >= since_ms, oldest first.
     * `timeframe` is the unified token ("1m", "15m", "1h", "1d").
     * Throws RateLimitError, TransientNetworkError or ExchangeError.
     */
    virtual FetchPage fetchWindow(const std::string& symbol,
                                  const std::string& timeframe,
                                  int64_t since_ms,
                                  int limit) = 0;
};

// Factory function to create the configured exchange client
std::unique_ptr<ExchangeClient> createExchangeClient(const common::Config& config);

} // namespace data
} // namespace ohlcv_ingest
