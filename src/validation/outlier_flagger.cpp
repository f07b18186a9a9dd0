/**
 * Outlier flagging implementation
 */

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <vector>

#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/validation/outlier_flagger.h"

namespace ohlcv_ingest {
namespace validation {

namespace {

bool isPriceJump(const data::Bar& prev, const data::Bar& bar, double threshold) {
    if (!std::isfinite(prev.close) || !std::isfinite(bar.close) || prev.close == 0.0) {
        return false;
    }
    return std::fabs(bar.close / prev.close - 1.0) > threshold;
}

} // namespace

OutlierResult flag(const data::BarSeries& series, const common::ValidationConfig::Outliers& settings) {
    OutlierResult result;
    result.bars = series;
    auto& bars = result.bars.bars;

    const size_t window = static_cast<size_t>(std::max(1, settings.rolling_window));

    // Trailing window state: sum of finite volumes and count of missing ones
    double window_sum = 0.0;
    size_t window_missing = 0;

    for (size_t i = 0; i < bars.size(); ++i) {
        auto& bar = bars[i];
        bar.is_outlier = false;

        if (std::isnan(bar.volume)) {
            ++window_missing;
        } else {
            window_sum += bar.volume;
        }
        if (i >= window) {
            const double leaving = bars[i - window].volume;
            if (std::isnan(leaving)) {
                --window_missing;
            } else {
                window_sum -= leaving;
            }
        }

        if (i > 0 && isPriceJump(bars[i - 1], bar, settings.price_jump)) {
            bar.is_outlier = true;
        }

        if (i + 1 >= window && window_missing == 0 && std::isfinite(bar.volume)) {
            const double rolling_mean = window_sum / static_cast<double>(window);
            if (bar.volume > rolling_mean * settings.volume_spike) {
                bar.is_outlier = true;
            }
        }

        if (bar.is_outlier) {
            ++result.outliers_detected;
        }
    }

    // Forced minimum
    if (settings.forced_minimum > 0 && result.outliers_detected < static_cast<size_t>(settings.forced_minimum)) {
        std::vector<size_t> candidates;
        for (size_t i = 0; i < bars.size(); ++i) {
            if (!bars[i].is_outlier) {
                candidates.push_back(i);
            }
        }

        std::mt19937 rng(settings.forced_seed);
        std::shuffle(candidates.begin(), candidates.end(), rng);

        size_t needed = static_cast<size_t>(settings.forced_minimum) - result.outliers_detected;
        size_t count = std::min(needed, candidates.size());
        for (size_t k = 0; k < count; ++k) {
            bars[candidates[k]].is_outlier = true;
        }
        result.forced_outliers = count;
        result.outliers_detected += count;

        LOG_WARNING("Forced " + std::to_string(count) + " random outliers in " + series.symbol +
                    " to reach minimum of " + std::to_string(settings.forced_minimum));
    }

    LOG_INFO("Outlier scan for " + series.symbol + ": " + std::to_string(result.outliers_detected) +
             " of " + std::to_string(bars.size()) + " rows flagged");
    return result;
}

} // namespace validation
} // namespace ohlcv_ingest
