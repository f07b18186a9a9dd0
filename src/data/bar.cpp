/**
 * Bar data implementation
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "ohlcv_ingest/data/bar.h"

namespace ohlcv_ingest {
namespace data {

const std::vector<std::string> REQUIRED_COLUMNS = {"open", "high", "low", "close", "volume"};

namespace {

bool sameValue(double a, double b) {
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

} // namespace

double Bar::column(const std::string& name) const {
    if (name == "open") return open;
    if (name == "high") return high;
    if (name == "low") return low;
    if (name == "close") return close;
    if (name == "volume") return volume;
    throw std::out_of_range("Unknown bar column: " + name);
}

bool Bar::isComplete() const {
    return std::isfinite(open) && std::isfinite(high) && std::isfinite(low) &&
           std::isfinite(close) && std::isfinite(volume);
}

bool Bar::isConsistent() const {
    if (!isComplete()) {
        return false;
    }
    return high >= std::max({open, close, low}) &&
           low <= std::min({open, close, high}) &&
           volume >= 0.0;
}

bool operator==(const Bar& lhs, const Bar& rhs) {
    return lhs.symbol == rhs.symbol &&
           lhs.timestamp == rhs.timestamp &&
           sameValue(lhs.open, rhs.open) &&
           sameValue(lhs.high, rhs.high) &&
           sameValue(lhs.low, rhs.low) &&
           sameValue(lhs.close, rhs.close) &&
           sameValue(lhs.volume, rhs.volume) &&
           lhs.is_filled == rhs.is_filled &&
           lhs.is_outlier == rhs.is_outlier &&
           lhs.ohlc_valid == rhs.ohlc_valid;
}

bool operator!=(const Bar& lhs, const Bar& rhs) {
    return !(lhs == rhs);
}

std::vector<std::string> BarSeries::missingColumns() const {
    std::vector<std::string> missing;
    for (const auto& name : REQUIRED_COLUMNS) {
        if (columns.find(name) == columns.end()) {
            missing.push_back(name);
        }
    }
    return missing;
}

BarSeries BarSeries::withAllColumns(const std::string& symbol, const std::string& interval) {
    BarSeries series;
    series.symbol = symbol;
    series.interval = interval;
    series.columns.insert("timestamp");
    series.columns.insert(REQUIRED_COLUMNS.begin(), REQUIRED_COLUMNS.end());
    return series;
}

bool operator==(const BarSeries& lhs, const BarSeries& rhs) {
    return lhs.symbol == rhs.symbol &&
           lhs.interval == rhs.interval &&
           lhs.columns == rhs.columns &&
           lhs.bars == rhs.bars;
}

} // namespace data
} // namespace ohlcv_ingest
