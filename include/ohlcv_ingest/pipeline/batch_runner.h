/**
 * Batch runner: many symbols, bounded concurrency, one shared rate limiter
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <string>
#include <vector>
#include <cstdint>

#include "ohlcv_ingest/common/cancellation.h"
#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/exchange_client.h"
#include "ohlcv_ingest/data/rate_limiter.h"
#include "ohlcv_ingest/pipeline/ingestion_pipeline.h"

namespace ohlcv_ingest {
namespace pipeline {

struct SymbolOutcome {
    std::string symbol;
    bool success = false;
    std::optional<PipelineResult> result;
    std::string error;               // what() of the failure, empty on success
};

struct BatchSummary {
    std::vector<SymbolOutcome> outcomes;   // Same order as the input symbols
    bool aborted = false;

    size_t succeeded() const;
    size_t failed() const;
};

class BatchRunner {
public:
    BatchRunner(const common::Config& config, data::ExchangeClient& client);

    /**
     * Run one pipeline per symbol over [start_ms, end_ms] with at most
     * collection.max_workers in flight. A failed symbol is recorded and skipped;
     * with collection.fail_fast the remaining symbols are cancelled instead.
     */
    BatchSummary run(const std::vector<std::string>& symbols, int64_t start_ms, int64_t end_ms);

    // Cancel every running pipeline and skip the ones not yet started; this is permanent
    void cancel();

    data::RateLimiter& rateLimiter() { return limiter_; }

private:
    SymbolOutcome runSymbol(const std::string& symbol, int64_t start_ms, int64_t end_ms);

    void registerToken(common::CancellationToken* token);
    void unregisterToken(common::CancellationToken* token);

    const common::Config& config_;
    data::ExchangeClient& client_;
    data::RateLimiter limiter_;

    std::atomic<bool> cancelled_{false};
    std::mutex tokens_mutex_;
    std::set<common::CancellationToken*> active_tokens_;
};

/**
 * Batch window from collection.start/end: end defaults to now, start to one day
 * before end. Throws ConfigError if start is after end.
 */
std::pair<int64_t, int64_t> resolveWindow(const common::CollectionConfig& config);

} // namespace pipeline
} // namespace ohlcv_ingest
