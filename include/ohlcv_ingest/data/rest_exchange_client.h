/**
 * REST client for exchange candle history
 */

#pragma once

#include <string>
#include <memory>

#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/exchange_client.h"

namespace ohlcv_ingest {
namespace data {

/**
 * OKX v5 candle history over libcurl.
 * Maps HTTP 429 and code 50011 to RateLimitError, transport failures and 5xx to
 * TransientNetworkError, and any other API error to ExchangeError.
 */
class RestExchangeClient : public ExchangeClient {
public:
    explicit RestExchangeClient(const common::Config& config);
    ~RestExchangeClient() override;

    std::string exchangeId() const override;

    FetchPage fetchWindow(const std::string& symbol,
                          const std::string& timeframe,
                          int64_t since_ms,
                          int limit) override;

    // Parse a candles response body into bars (exposed for tests)
    static BarSeries parseCandlesResponse(const std::string& body,
                                          const std::string& symbol,
                                          const std::string& timeframe);

    // "BTC/USDT" -> "BTC-USDT", with "-SWAP" appended for swap markets
    static std::string toInstrumentId(const std::string& symbol, const std::string& market_type);

    // Unified timeframe -> OKX bar parameter ("1h" -> "1H")
    static std::string toExchangeBar(const std::string& timeframe);

private:
    // Implementation details
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace data
} // namespace ohlcv_ingest
