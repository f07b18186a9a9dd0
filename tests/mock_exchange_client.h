/**
 * In-memory exchange client with scripted failures
 */

#pragma once

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/data/exchange_client.h"

namespace ohlcv_ingest {
namespace test_support {

class MockExchangeClient : public data::ExchangeClient {
public:
    explicit MockExchangeClient(std::string id = "mock") : id_(std::move(id)) {}

    std::string exchangeId() const override { return id_; }

    // Rows served for a symbol, in any order; `columns` overrides the reported schema
    void setBars(const std::string& symbol, std::vector<data::Bar> bars) {
        std::lock_guard<std::mutex> lock(mutex_);
        bars_[symbol] = std::move(bars);
    }

    void setColumns(const std::string& symbol, std::set<std::string> columns) {
        std::lock_guard<std::mutex> lock(mutex_);
        columns_[symbol] = std::move(columns);
    }

    // The next `times` requests throw RateLimitError
    void failWithRateLimit(int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        rate_limit_failures_ = times;
    }

    // The next `times` requests throw TransientNetworkError
    void failWithNetworkError(int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        network_failures_ = times;
    }

    // Every request for `symbol` throws ExchangeError
    void rejectSymbol(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejected_.insert(symbol);
    }

    data::FetchPage fetchWindow(const std::string& symbol, const std::string& timeframe,
                          int64_t since_ms, int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({symbol, timeframe, since_ms, limit});

        if (rate_limit_failures_ > 0) {
            --rate_limit_failures_;
            throw RateLimitError("mock rate limit");
        }
        if (network_failures_ > 0) {
            --network_failures_;
            throw TransientNetworkError("mock connection reset");
        }
        if (rejected_.count(symbol)) {
            throw ExchangeError("mock unknown instrument " + symbol);
        }

        data::FetchPage page;
        page.rows = data::BarSeries::withAllColumns(symbol, timeframe);
        auto columns = columns_.find(symbol);
        if (columns != columns_.end()) {
            page.rows.columns = columns->second;
        }

        auto it = bars_.find(symbol);
        if (it == bars_.end()) {
            return page;
        }

        std::vector<data::Bar> sorted = it->second;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const data::Bar& a, const data::Bar& b) { return a.timestamp < b.timestamp; });
        for (const auto& bar : sorted) {
            if (bar.timestamp >= since_ms && static_cast<int>(page.rows.bars.size()) < limit) {
                page.rows.bars.push_back(bar);
            }
        }
        return page;
    }

    struct Request {
        std::string symbol;
        std::string timeframe;
        int64_t since_ms;
        int limit;
    };

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t requestCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

private:
    std::string id_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<data::Bar>> bars_;
    std::map<std::string, std::set<std::string>> columns_;
    std::set<std::string> rejected_;
    int rate_limit_failures_ = 0;
    int network_failures_ = 0;
    std::vector<Request> requests_;
};

} // namespace test_support
} // namespace ohlcv_ingest
