/**
 * Gap repair implementation
 */

#include <cmath>
#include <stdexcept>

#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/validation/gap_repairer.h"

namespace ohlcv_ingest {
namespace validation {

RepairResult repair(const data::BarSeries& series,
                    std::chrono::milliseconds expected_interval,
                    int short_gap_minutes) {
    const int64_t step = expected_interval.count();
    if (step <= 0) {
        throw std::invalid_argument("Expected interval must be positive");
    }

    RepairResult result;
    result.bars.symbol = series.symbol;
    result.bars.interval = series.interval;
    result.bars.columns = series.columns;
    result.bars.bars.reserve(series.size());

    // Deltas within 1% of the interval are treated as on schedule
    const int64_t tolerance = step / 100;
    const double step_minutes = static_cast<double>(step) / common::MILLISECONDS_PER_MINUTE;

    for (size_t i = 0; i < series.bars.size(); ++i) {
        const auto& bar = series.bars[i];

        if (i > 0) {
            const auto& prev = series.bars[i - 1];
            const int64_t delta = bar.timestamp - prev.timestamp;

            if (delta > step + tolerance) {
                const int64_t missing_steps =
                    std::llround(static_cast<double>(delta) / static_cast<double>(step)) - 1;

                if (missing_steps > 0) {
                    if (missing_steps * step_minutes <= short_gap_minutes) {
                        for (int64_t k = 1; k <= missing_steps; ++k) {
                            data::Bar fill = prev;
                            fill.timestamp = prev.timestamp + k * step;
                            fill.volume = 0.0;
                            fill.is_filled = true;
                            fill.is_outlier = false;
                            result.bars.bars.push_back(fill);
                        }
                        result.filled_rows += static_cast<size_t>(missing_steps);
                    } else {
                        result.gaps_detected += static_cast<size_t>(missing_steps);
                        LOG_DEBUG("Long gap of " + std::to_string(missing_steps) + " intervals in " +
                                  series.symbol + " after " + common::formatIsoTimestamp(prev.timestamp));
                    }
                }
            }
        }

        result.bars.bars.push_back(bar);
    }

    LOG_INFO("Gap repair for " + series.symbol + ": filled " + std::to_string(result.filled_rows) +
             " rows, " + std::to_string(result.gaps_detected) + " intervals left missing");
    return result;
}

} // namespace validation
} // namespace ohlcv_ingest
