/**
 * Ingestion pipeline for one (symbol, interval, window)
 */

#pragma once

#include <string>
#include <cstdint>

#include "ohlcv_ingest/common/cancellation.h"
#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/bar.h"
#include "ohlcv_ingest/data/exchange_client.h"
#include "ohlcv_ingest/data/fetcher.h"
#include "ohlcv_ingest/data/rate_limiter.h"
#include "ohlcv_ingest/storage/manifest.h"
#include "ohlcv_ingest/storage/partitioned_store.h"
#include "ohlcv_ingest/validation/validation_report.h"
#include "ohlcv_ingest/validation/validator.h"

namespace ohlcv_ingest {
namespace pipeline {

struct PipelineResult {
    std::string symbol;
    storage::Manifest manifest;
    validation::ValidationReport report;
    size_t pages_fetched = 0;
    int collections = 0;          // Window collection attempts used
};

/**
 * Fetch -> normalize -> validate -> repair gaps -> flag outliers -> store.
 * Stages run sequentially on one thread; the client and limiter may be shared
 * with other pipelines.
 */
class IngestionPipeline {
public:
    IngestionPipeline(const common::Config& config, data::ExchangeClient& client, data::RateLimiter& limiter);

    /**
     * Run every stage for `symbol` over [start_ms, end_ms]. Returns the manifest
     * written; every stage error propagates. Nothing is written once the token
     * has been cancelled.
     */
    PipelineResult run(const std::string& symbol, int64_t start_ms, int64_t end_ms,
                       const common::CancellationToken& token);

    /**
     * Page through the window and clip to [start_ms, end_ms]. The whole window is
     * collected again, up to max_collector_count times, after a TransientNetworkError
     * or when fewer than check_data_length rows arrive.
     */
    data::BarSeries collect(const std::string& symbol, int64_t start_ms, int64_t end_ms,
                            const common::CancellationToken& token);

private:
    data::BarSeries paginate(const std::string& symbol, int64_t start_ms, int64_t end_ms,
                             const common::CancellationToken& token, size_t& pages);

    common::ApiConfig api_config_;
    common::ValidationConfig validation_config_;
    common::CollectionConfig collection_config_;

    data::Fetcher fetcher_;
    validation::Validator validator_;
    storage::PartitionedStore store_;

    size_t last_pages_ = 0;
    int last_collections_ = 0;
};

} // namespace pipeline
} // namespace ohlcv_ingest
