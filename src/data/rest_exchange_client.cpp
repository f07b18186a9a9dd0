/**
 * REST exchange client implementation
 */

#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/data/rest_exchange_client.h"

using json = nlohmann::json;

namespace ohlcv_ingest {
namespace data {

namespace {

// OKX answers with this code when the request rate is exceeded
const char* const OKX_RATE_LIMIT_CODE = "50011";

// Column order of an OKX candle row
const std::vector<std::string> CANDLE_COLUMNS = {"timestamp", "open", "high", "low", "close", "volume"};

// Callback function for CURL
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

double parseNumber(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return MISSING_VALUE;
        }
        size_t consumed = 0;
        double number = 0.0;
        try {
            number = std::stod(text, &consumed);
        } catch (const std::exception& e) {
            throw ExchangeError("Malformed candle value \"" + text + "\": " + e.what());
        }
        if (consumed != text.size()) {
            throw ExchangeError("Malformed candle value \"" + text + "\"");
        }
        return number;
    }
    return MISSING_VALUE;
}

int64_t parseTimestamp(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        size_t consumed = 0;
        long long timestamp = 0;
        try {
            timestamp = std::stoll(text, &consumed);
        } catch (const std::exception& e) {
            throw ExchangeError("Malformed candle timestamp \"" + text + "\": " + e.what());
        }
        if (consumed != text.size()) {
            throw ExchangeError("Malformed candle timestamp \"" + text + "\"");
        }
        return static_cast<int64_t>(timestamp);
    }
    throw ExchangeError("Candle row without a usable timestamp: " + value.dump());
}

} // namespace

// Implementation class
class RestExchangeClient::Impl {
public:
    explicit Impl(const common::Config& config)
        : exchange_(config.getExchangeConfig()),
          api_(config.getApiConfig()) {

        // Initialize CURL
        curl_global_init(CURL_GLOBAL_ALL);

        if (exchange_.base_url.empty()) {
            exchange_.base_url = "https://www.okx.com";
        }
    }

    ~Impl() {
        curl_global_cleanup();
    }

    std::string exchangeId() const {
        return exchange_.id;
    }

    FetchPage fetchWindow(const std::string& symbol, const std::string& timeframe,
                          int64_t since_ms, int limit) {
        // history-candles returns rows strictly older than `after`, newest first
        int64_t step = common::intervalToDuration(timeframe).count();
        int64_t window_end = since_ms + step * limit;

        std::ostringstream url;
        url << exchange_.base_url << "/api/v5/market/history-candles"
            << "?instId=" << toInstrumentId(symbol, exchange_.market_type)
            << "&bar=" << toExchangeBar(timeframe)
            << "&after=" << window_end
            << "&limit=" << limit;

        std::string body = makeRequest(url.str());

        FetchPage page;
        page.rows = parseCandlesResponse(body, symbol, timeframe);

        // Keep the requested window only
        auto& bars = page.rows.bars;
        bars.erase(std::remove_if(bars.begin(), bars.end(),
                                  [since_ms](const Bar& bar) { return bar.timestamp < since_ms; }),
                   bars.end());

        // The exchange has nothing newer than the present
        if (window_end <= common::nowMillis()) {
            page.next_cursor = window_end;
        }

        LOG_DEBUG("Fetched " + std::to_string(bars.size()) + " candles for " + symbol +
                  " " + timeframe + " since " + common::formatIsoTimestamp(since_ms));
        return page;
    }

private:
    common::ExchangeConfig exchange_;
    common::ApiConfig api_;

    std::string makeRequest(const std::string& url) {
        // Set up CURL
        CURL* curl = curl_easy_init();
        if (!curl) {
            throw TransientNetworkError("Failed to initialize CURL");
        }

        std::string response_data;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(api_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        // Perform request
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            curl_easy_cleanup(curl);
            throw TransientNetworkError("CURL request failed: " + std::string(curl_easy_strerror(res)));
        }

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        // Clean up
        curl_easy_cleanup(curl);

        if (http_code == 429) {
            throw RateLimitError("HTTP 429 from " + exchange_.id);
        }
        if (http_code >= 500) {
            throw TransientNetworkError("HTTP " + std::to_string(http_code) + " from " + exchange_.id);
        }
        if (http_code >= 400) {
            throw ExchangeError("HTTP " + std::to_string(http_code) + " from " + exchange_.id + ": " + response_data);
        }

        return response_data;
    }
};

RestExchangeClient::RestExchangeClient(const common::Config& config)
    : impl_(std::make_unique<Impl>(config)) {
}

RestExchangeClient::~RestExchangeClient() = default;

std::string RestExchangeClient::exchangeId() const {
    return impl_->exchangeId();
}

FetchPage RestExchangeClient::fetchWindow(const std::string& symbol, const std::string& timeframe,
                                          int64_t since_ms, int limit) {
    return impl_->fetchWindow(symbol, timeframe, since_ms, limit);
}

BarSeries RestExchangeClient::parseCandlesResponse(const std::string& body,
                                                   const std::string& symbol,
                                                   const std::string& timeframe) {
    json response_json;
    try {
        response_json = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ExchangeError("Malformed candles response: " + std::string(e.what()));
    }

    // Check status
    std::string code = response_json.value("code", std::string("0"));
    if (code == OKX_RATE_LIMIT_CODE) {
        throw RateLimitError("Rate limited: " + response_json.value("msg", std::string()));
    }
    if (code != "0") {
        throw ExchangeError("API error " + code + ": " + response_json.value("msg", std::string()));
    }

    BarSeries series;
    series.symbol = symbol;
    series.interval = timeframe;

    const json& rows = response_json.contains("data") ? response_json["data"] : json::array();
    if (!rows.is_array()) {
        throw ExchangeError("Candles response without a data array");
    }

    // An empty page carries no evidence of missing columns
    if (rows.empty()) {
        series.columns.insert(CANDLE_COLUMNS.begin(), CANDLE_COLUMNS.end());
        return series;
    }

    for (const auto& row : rows) {
        Bar bar;
        bar.symbol = symbol;

        if (row.is_array()) {
            // [ts, o, h, l, c, vol, ...]
            if (row.empty()) {
                continue;
            }
            bar.timestamp = parseTimestamp(row[0]);
            for (size_t i = 1; i < CANDLE_COLUMNS.size() && i < row.size(); ++i) {
                series.columns.insert(CANDLE_COLUMNS[i]);
            }
            if (row.size() > 1) bar.open = parseNumber(row[1]);
            if (row.size() > 2) bar.high = parseNumber(row[2]);
            if (row.size() > 3) bar.low = parseNumber(row[3]);
            if (row.size() > 4) bar.close = parseNumber(row[4]);
            if (row.size() > 5) bar.volume = parseNumber(row[5]);
        } else if (row.is_object()) {
            // Keyed rows from generic providers
            if (row.contains("timestamp")) {
                bar.timestamp = parseTimestamp(row["timestamp"]);
            } else if (row.contains("ts")) {
                bar.timestamp = parseTimestamp(row["ts"]);
            } else {
                throw ExchangeError("Candle row without a timestamp: " + row.dump());
            }
            for (size_t i = 1; i < CANDLE_COLUMNS.size(); ++i) {
                const auto& name = CANDLE_COLUMNS[i];
                if (!row.contains(name)) {
                    continue;
                }
                series.columns.insert(name);
                double value = parseNumber(row[name]);
                if (name == "open") bar.open = value;
                else if (name == "high") bar.high = value;
                else if (name == "low") bar.low = value;
                else if (name == "close") bar.close = value;
                else bar.volume = value;
            }
        } else {
            throw ExchangeError("Unexpected candle row: " + row.dump());
        }

        series.columns.insert("timestamp");
        series.bars.push_back(std::move(bar));
    }

    // Oldest first
    std::reverse(series.bars.begin(), series.bars.end());
    std::stable_sort(series.bars.begin(), series.bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    return series;
}

std::string RestExchangeClient::toInstrumentId(const std::string& symbol, const std::string& market_type) {
    std::string inst_id = symbol;
    std::replace(inst_id.begin(), inst_id.end(), '/', '-');

    // Drop a ccxt settle suffix such as ":USDT"
    auto colon = inst_id.find(':');
    if (colon != std::string::npos) {
        inst_id.erase(colon);
    }

    if (market_type == "swap") {
        inst_id += "-SWAP";
    }
    return inst_id;
}

std::string RestExchangeClient::toExchangeBar(const std::string& timeframe) {
    std::string bar = timeframe;
    if (!bar.empty()) {
        char& unit = bar.back();
        if (unit == 'h' || unit == 'd' || unit == 'w') {
            unit = static_cast<char>(unit - 'a' + 'A');
        }
    }
    return bar;
}

// Factory function to create exchange client
std::unique_ptr<ExchangeClient> createExchangeClient(const common::Config& config) {
    const auto& exchange = config.getExchangeConfig();
    if (exchange.id != "okx") {
        LOG_WARNING("Exchange " + exchange.id + " has no dedicated client, using the OKX candle protocol");
    }
    return std::make_unique<RestExchangeClient>(config);
}

} // namespace data
} // namespace ohlcv_ingest
