/**
 * Ingestion pipeline implementation
 */

#include <algorithm>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/data/normalizer.h"
#include "ohlcv_ingest/pipeline/ingestion_pipeline.h"
#include "ohlcv_ingest/validation/gap_repairer.h"
#include "ohlcv_ingest/validation/outlier_flagger.h"

namespace ohlcv_ingest {
namespace pipeline {

IngestionPipeline::IngestionPipeline(const common::Config& config, data::ExchangeClient& client,
                                     data::RateLimiter& limiter)
    : api_config_(config.getApiConfig()),
      validation_config_(config.getValidationConfig()),
      collection_config_(config.getCollectionConfig()),
      fetcher_(client, limiter, config.getApiConfig()),
      validator_(config.getValidationConfig()),
      store_(config.getStorageConfig(), client.exchangeId()) {
}

PipelineResult IngestionPipeline::run(const std::string& symbol, int64_t start_ms, int64_t end_ms,
                                      const common::CancellationToken& token) {
    const std::string& interval = collection_config_.interval;
    LOG_INFO("Ingesting " + symbol + " " + interval + " from " + common::formatIsoTimestamp(start_ms) +
             " to " + common::formatIsoTimestamp(end_ms));

    PipelineResult result;
    result.symbol = symbol;

    data::BarSeries raw = collect(symbol, start_ms, end_ms, token);
    result.pages_fetched = last_pages_;
    result.collections = last_collections_;

    data::BarSeries normalized = data::normalize(raw);

    validation::ValidationResult validated = validator_.validate(normalized);

    validation::RepairResult repaired = validation::repair(
        validated.bars, common::intervalToDuration(interval), validation_config_.gap_fill.short_gap_minutes);

    validation::OutlierResult flagged = validation::flag(repaired.bars, validation_config_.outliers);

    auto& report = validated.report;
    report.gaps_detected = repaired.gaps_detected;
    report.filled_rows = repaired.filled_rows;
    report.valid_rows += repaired.filled_rows;
    report.outliers_detected = flagged.outliers_detected;
    report.forced_outliers = flagged.forced_outliers;
    result.report = report;

    token.throwIfCancelled("before writing " + symbol);
    result.manifest = store_.write(flagged.bars, report);

    LOG_INFO("Finished " + symbol + ": " + std::to_string(result.manifest.row_count) + " rows, " +
             std::to_string(report.gaps_detected) + " gaps, " +
             std::to_string(report.outliers_detected) + " outliers");
    return result;
}

data::BarSeries IngestionPipeline::collect(const std::string& symbol, int64_t start_ms, int64_t end_ms,
                                           const common::CancellationToken& token) {
    const int max_collections = std::max(1, collection_config_.max_collector_count);
    last_pages_ = 0;

    for (int collection = 1; ; ++collection) {
        last_collections_ = collection;

        data::BarSeries series;
        try {
            series = paginate(symbol, start_ms, end_ms, token, last_pages_);
        } catch (const TransientNetworkError& e) {
            if (collection >= max_collections) {
                LOG_ERROR("Giving up on " + symbol + " after " + std::to_string(collection) +
                          " collections: " + e.what());
                throw;
            }
            LOG_WARNING("Network error collecting " + symbol + ", collecting again: " + e.what());
            continue;
        }

        const size_t expected = static_cast<size_t>(std::max(0, collection_config_.check_data_length));
        if (expected > 0 && series.size() < expected && collection < max_collections) {
            LOG_WARNING("Collected " + std::to_string(series.size()) + " rows for " + symbol +
                        ", expected at least " + std::to_string(expected) + ", collecting again");
            continue;
        }

        return series;
    }
}

data::BarSeries IngestionPipeline::paginate(const std::string& symbol, int64_t start_ms, int64_t end_ms,
                                            const common::CancellationToken& token, size_t& pages) {
    data::BarSeries series;
    series.symbol = symbol;
    series.interval = collection_config_.interval;
    bool have_columns = false;

    int64_t cursor = start_ms;
    while (cursor <= end_ms) {
        token.throwIfCancelled("paging " + symbol);

        data::FetchPage page = fetcher_.fetch(symbol, collection_config_.interval, cursor, end_ms, token);
        ++pages;

        if (!page.rows.empty()) {
            // A column counts as present only if every page carried it
            if (!have_columns) {
                series.columns = page.rows.columns;
                have_columns = true;
            } else {
                for (auto it = series.columns.begin(); it != series.columns.end();) {
                    if (page.rows.columns.count(*it) == 0) {
                        it = series.columns.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
            series.bars.insert(series.bars.end(), page.rows.bars.begin(), page.rows.bars.end());
        }

        if (!page.next_cursor || *page.next_cursor <= cursor) {
            break;
        }
        cursor = *page.next_cursor;
    }

    if (!have_columns) {
        series.columns = data::BarSeries::withAllColumns(symbol, series.interval).columns;
    }

    // Clip to the window
    series.bars.erase(std::remove_if(series.bars.begin(), series.bars.end(),
                                     [start_ms, end_ms](const data::Bar& bar) {
                                         return bar.timestamp < start_ms || bar.timestamp > end_ms;
                                     }),
                      series.bars.end());

    LOG_INFO("Collected " + std::to_string(series.size()) + " raw rows for " + symbol + " in " +
             std::to_string(pages) + " pages");
    return series;
}

} // namespace pipeline
} // namespace ohlcv_ingest
