/**
 * Fetcher implementation
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_map>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/data/fetcher.h"

namespace ohlcv_ingest {
namespace data {

std::string toTimeframe(const std::string& interval) {
    static const std::unordered_map<std::string, std::string> timeframes = {
        {"1min", "1m"}, {"3min", "3m"}, {"5min", "5m"}, {"15min", "15m"}, {"30min", "30m"},
        {"1h", "1h"}, {"2h", "2h"}, {"4h", "4h"}, {"1d", "1d"}, {"1w", "1w"}
    };

    auto it = timeframes.find(interval);
    if (it != timeframes.end()) {
        return it->second;
    }

    LOG_WARNING("Unknown interval " + interval + ", passing it to the exchange unchanged");
    return interval;
}

Fetcher::Fetcher(ExchangeClient& client, RateLimiter& limiter, const common::ApiConfig& api_config)
    : client_(client),
      limiter_(limiter),
      api_config_(api_config),
      exchange_id_(client.exchangeId()) {
}

FetchPage Fetcher::fetch(const std::string& symbol, const std::string& interval,
                         int64_t since_ms, int64_t end_ms,
                         const common::CancellationToken& token) {
    const std::string timeframe = toTimeframe(interval);
    const int attempts = std::max(1, api_config_.retries);

    FetchPage page;
    for (int attempt = 0; ; ++attempt) {
        token.throwIfCancelled("fetching " + symbol);
        limiter_.acquire(token);

        try {
            page = client_.fetchWindow(symbol, timeframe, since_ms, api_config_.page_limit);
            break;
        } catch (const RateLimitError& e) {
            if (attempt >= attempts - 1) {
                LOG_ERROR("Rate limit retries exhausted for " + symbol + ": " + e.what());
                throw;
            }

            auto delay = std::chrono::milliseconds(static_cast<int64_t>(
                api_config_.backoff_base_seconds * std::pow(2.0, attempt) * 1000.0));
            LOG_WARNING("Rate limited fetching " + symbol + " (attempt " + std::to_string(attempt + 1) +
                        "/" + std::to_string(attempts) + "), backing off " +
                        std::to_string(delay.count()) + " ms");

            if (!token.waitFor(delay)) {
                throw CancelledError("Cancelled: backing off for " + symbol);
            }
        }
    }

    auto& bars = page.rows.bars;
    const bool full_page = static_cast<int>(bars.size()) >= api_config_.page_limit;
    const int64_t last_ts = bars.empty() ? since_ms : bars.back().timestamp;

    // A full page implies more rows after the last one returned
    if (!page.next_cursor && full_page && !bars.empty()) {
        page.next_cursor = last_ts + 1;
    }

    bars.erase(std::remove_if(bars.begin(), bars.end(),
                              [since_ms, end_ms](const Bar& bar) {
                                  return bar.timestamp < since_ms || bar.timestamp > end_ms;
                              }),
               bars.end());

    if (page.next_cursor && (*page.next_cursor > end_ms || *page.next_cursor <= since_ms)) {
        page.next_cursor.reset();
    }

    if (page.rows.symbol.empty()) {
        page.rows.symbol = symbol;
    }
    page.rows.interval = interval;

    LOG_DEBUG("Fetched page of " + std::to_string(bars.size()) + " rows for " + symbol + " " + interval +
              " from " + common::formatIsoTimestamp(since_ms));
    return page;
}

} // namespace data
} // namespace ohlcv_ingest
