/**
 * Normalizer: canonical ordering of raw bars
 */

#pragma once

#include "ohlcv_ingest/data/bar.h"

namespace ohlcv_ingest {
namespace data {

/**
 * Sort ascending by timestamp and drop duplicate timestamps, keeping the row that
 * appeared first in the input. Idempotent; empty input gives empty output.
 */
BarSeries normalize(const BarSeries& rows);

} // namespace data
} // namespace ohlcv_ingest
