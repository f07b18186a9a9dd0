/**
 * Normalizer implementation
 */

#include <algorithm>

#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/data/normalizer.h"

namespace ohlcv_ingest {
namespace data {

BarSeries normalize(const BarSeries& rows) {
    BarSeries result;
    result.symbol = rows.symbol;
    result.interval = rows.interval;
    result.columns = rows.columns;
    result.bars = rows.bars;

    // Stable sort keeps input order within equal timestamps, so the first one survives
    std::stable_sort(result.bars.begin(), result.bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    auto last = std::unique(result.bars.begin(), result.bars.end(),
                            [](const Bar& a, const Bar& b) { return a.timestamp == b.timestamp; });
    size_t duplicates = static_cast<size_t>(std::distance(last, result.bars.end()));
    result.bars.erase(last, result.bars.end());

    if (duplicates > 0) {
        LOG_INFO("Normalized " + rows.symbol + ": dropped " + std::to_string(duplicates) +
                 " duplicate rows, " + std::to_string(result.bars.size()) + " remain");
    }

    return result;
}

} // namespace data
} // namespace ohlcv_ingest
