/**
 * GapRepairer: fill short timing gaps and count the long ones
 */

#pragma once

#include <chrono>
#include <cstddef>

#include "ohlcv_ingest/data/bar.h"

namespace ohlcv_ingest {
namespace validation {

struct RepairResult {
    data::BarSeries bars;
    size_t gaps_detected = 0;     // Missing intervals in gaps too long to fill
    size_t filled_rows = 0;
};

/**
 * Walk consecutive timestamps of a normalized series. A gap covering k missing
 * intervals is filled when k * interval <= short_gap_minutes: each missing slot gets a
 * copy of the previous bar's prices with zero volume and is_filled set. Longer gaps
 * are left in place and add k to gaps_detected.
 */
RepairResult repair(const data::BarSeries& series,
                    std::chrono::milliseconds expected_interval,
                    int short_gap_minutes);

} // namespace validation
} // namespace ohlcv_ingest
