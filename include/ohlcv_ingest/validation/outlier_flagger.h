/**
 * OutlierFlagger: price-jump and volume-spike heuristics
 */

#pragma once

#include <cstddef>

#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/bar.h"

namespace ohlcv_ingest {
namespace validation {

struct OutlierResult {
    data::BarSeries bars;
    size_t outliers_detected = 0;   // Every flagged row, forced ones included
    size_t forced_outliers = 0;
};

/**
 * Flag row t when |close_t / close_{t-1} - 1| > price_jump, or when volume_t exceeds
 * volume_spike times the mean volume of the rolling_window rows ending at t.
 * Rows without a full window are never flagged on volume.
 *
 * If forced_minimum > 0 and fewer rows were flagged, unflagged rows are drawn with
 * std::mt19937(forced_seed) until the minimum is met.
 */
OutlierResult flag(const data::BarSeries& series, const common::ValidationConfig::Outliers& settings);

} // namespace validation
} // namespace ohlcv_ingest
