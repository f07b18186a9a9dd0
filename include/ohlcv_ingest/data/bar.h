/**
 * Bar data structures
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <limits>
#include <cstdint>

namespace ohlcv_ingest {
namespace data {

// Column names every OHLCV batch must carry
extern const std::vector<std::string> REQUIRED_COLUMNS;

// Missing value marker for raw rows
constexpr double MISSING_VALUE = std::numeric_limits<double>::quiet_NaN();

// One OHLCV observation
struct Bar {
    std::string symbol;
    int64_t timestamp = 0;        // Epoch milliseconds, UTC
    double open = MISSING_VALUE;
    double high = MISSING_VALUE;
    double low = MISSING_VALUE;
    double close = MISSING_VALUE;
    double volume = MISSING_VALUE;

    // Stage annotations
    bool is_filled = false;       // Synthesized or forward-filled
    bool is_outlier = false;      // Flagged by the outlier stage
    bool ohlc_valid = true;       // Advisory OHLC consistency

    // Value of a named OHLCV column
    double column(const std::string& name) const;

    // True when all five OHLCV fields are finite
    bool isComplete() const;

    // high/low envelope the open and close, and volume is non-negative
    bool isConsistent() const;
};

// Equality over every field; NaN compares equal to NaN
bool operator==(const Bar& lhs, const Bar& rhs);
bool operator!=(const Bar& lhs, const Bar& rhs);

/**
 * An ordered batch of bars for one (symbol, interval) and the columns its source provided.
 */
struct BarSeries {
    std::string symbol;
    std::string interval;
    std::set<std::string> columns;
    std::vector<Bar> bars;

    bool empty() const { return bars.empty(); }
    size_t size() const { return bars.size(); }

    // Columns from REQUIRED_COLUMNS that are not in `columns`
    std::vector<std::string> missingColumns() const;

    // Empty series for (symbol, interval) carrying every required column
    static BarSeries withAllColumns(const std::string& symbol, const std::string& interval);
};

bool operator==(const BarSeries& lhs, const BarSeries& rhs);

} // namespace data
} // namespace ohlcv_ingest
