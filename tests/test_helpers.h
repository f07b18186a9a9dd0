/**
 * Shared fixtures for the test suite
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include <unistd.h>

#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/data/bar.h"

namespace ohlcv_ingest {
namespace test_support {

// 2024-03-01T00:00:00Z
constexpr int64_t T0 = 1709251200000;
constexpr int64_t ONE_MINUTE = common::MILLISECONDS_PER_MINUTE;
constexpr int64_t FIFTEEN_MINUTES = 15 * common::MILLISECONDS_PER_MINUTE;

inline data::Bar makeBar(const std::string& symbol, int64_t timestamp, double close, double volume = 100.0) {
    data::Bar bar;
    bar.symbol = symbol;
    bar.timestamp = timestamp;
    bar.open = close;
    bar.high = close + 1.0;
    bar.low = close - 1.0;
    bar.close = close;
    bar.volume = volume;
    return bar;
}

// n evenly spaced bars at a flat price of 100
inline data::BarSeries makeSeries(const std::string& symbol, const std::string& interval,
                                  int64_t start, int64_t step, size_t n) {
    data::BarSeries series = data::BarSeries::withAllColumns(symbol, interval);
    for (size_t i = 0; i < n; ++i) {
        series.bars.push_back(makeBar(symbol, start + static_cast<int64_t>(i) * step, 100.0));
    }
    return series;
}

// Fresh directory under the system temp dir, removed on destruction
class ScopedTempDir {
public:
    ScopedTempDir() {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "ohlcv_ingest_" + std::to_string(::getpid()) + "_" +
                           std::to_string(counter.fetch_add(1)) + "_" +
                           (info ? std::string(info->name()) : std::string("fixture"));
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace test_support
} // namespace ohlcv_ingest
