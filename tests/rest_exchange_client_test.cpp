/**
 * Tests for OKX candle response parsing and parameter mapping
 */

#include <cmath>
#include <gtest/gtest.h>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/data/rest_exchange_client.h"
#include "test_helpers.h"

using namespace ohlcv_ingest;
using data::RestExchangeClient;
using test_support::T0;
using test_support::FIFTEEN_MINUTES;

TEST(RestExchangeClientTest, ParsesNewestFirstRowsIntoAscendingBars) {
    std::string body = R"({"code":"0","msg":"","data":[
        [")" + std::to_string(T0 + FIFTEEN_MINUTES) + R"(","101.5","102","101","101.8","12.5","1270","1270","1"],
        [")" + std::to_string(T0) + R"(","100","101.9","99.5","101.5","8","800","800","1"]
    ]})";

    auto series = RestExchangeClient::parseCandlesResponse(body, "BTC/USDT", "15m");

    ASSERT_EQ(series.size(), 2u);
    EXPECT_TRUE(series.missingColumns().empty());
    EXPECT_EQ(series.bars[0].timestamp, T0);
    EXPECT_EQ(series.bars[1].timestamp, T0 + FIFTEEN_MINUTES);
    EXPECT_EQ(series.bars[0].symbol, "BTC/USDT");
    EXPECT_DOUBLE_EQ(series.bars[0].open, 100.0);
    EXPECT_DOUBLE_EQ(series.bars[0].high, 101.9);
    EXPECT_DOUBLE_EQ(series.bars[0].low, 99.5);
    EXPECT_DOUBLE_EQ(series.bars[1].close, 101.8);
    EXPECT_DOUBLE_EQ(series.bars[1].volume, 12.5);
}

TEST(RestExchangeClientTest, EmptyStringsBecomeMissingValues) {
    std::string body = R"({"code":"0","data":[[")" + std::to_string(T0) + R"(","100","101","99","","5"]]})";

    auto series = RestExchangeClient::parseCandlesResponse(body, "BTC/USDT", "15m");

    ASSERT_EQ(series.size(), 1u);
    EXPECT_TRUE(std::isnan(series.bars[0].close));
    EXPECT_FALSE(series.bars[0].isComplete());
}

TEST(RestExchangeClientTest, ShortRowsReportMissingColumns) {
    std::string body = R"({"code":"0","data":[[")" + std::to_string(T0) + R"(","100","101","99","100"]]})";

    auto series = RestExchangeClient::parseCandlesResponse(body, "BTC/USDT", "15m");

    EXPECT_EQ(series.missingColumns(), std::vector<std::string>{"volume"});
}

TEST(RestExchangeClientTest, KeyedRowsAreAccepted) {
    std::string body = R"({"code":"0","data":[{"ts":)" + std::to_string(T0) +
                       R"(,"open":1,"high":2,"low":0.5,"close":1.5}]})";

    auto series = RestExchangeClient::parseCandlesResponse(body, "BTC/USDT", "15m");

    ASSERT_EQ(series.size(), 1u);
    EXPECT_DOUBLE_EQ(series.bars[0].close, 1.5);
    EXPECT_EQ(series.missingColumns(), std::vector<std::string>{"volume"});
}

TEST(RestExchangeClientTest, EmptyDataCarriesFullSchema) {
    auto series = RestExchangeClient::parseCandlesResponse(R"({"code":"0","data":[]})", "BTC/USDT", "15m");
    EXPECT_TRUE(series.empty());
    EXPECT_TRUE(series.missingColumns().empty());
}

TEST(RestExchangeClientTest, MapsErrorCodes) {
    EXPECT_THROW(RestExchangeClient::parseCandlesResponse(R"({"code":"50011","msg":"Too Many Requests"})",
                                                          "BTC/USDT", "15m"),
                 RateLimitError);
    EXPECT_THROW(RestExchangeClient::parseCandlesResponse(R"({"code":"51001","msg":"Instrument ID does not exist"})",
                                                          "BTC/USDT", "15m"),
                 ExchangeError);
    EXPECT_THROW(RestExchangeClient::parseCandlesResponse("<html>", "BTC/USDT", "15m"), ExchangeError);
}

TEST(RestExchangeClientTest, MalformedNumbersRaiseExchangeError) {
    std::string bad_price = R"({"code":"0","data":[[")" + std::to_string(T0) + R"(","100","abc","99","100","5"]]})";
    std::string bad_timestamp = R"({"code":"0","data":[["17x","100","101","99","100","5"]]})";
    std::string out_of_range = R"({"code":"0","data":[["99999999999999999999999","100","101","99","100","5"]]})";

    EXPECT_THROW(RestExchangeClient::parseCandlesResponse(bad_price, "BTC/USDT", "15m"), ExchangeError);
    EXPECT_THROW(RestExchangeClient::parseCandlesResponse(bad_timestamp, "BTC/USDT", "15m"), ExchangeError);
    EXPECT_THROW(RestExchangeClient::parseCandlesResponse(out_of_range, "BTC/USDT", "15m"), ExchangeError);
}

TEST(RestExchangeClientTest, InstrumentAndBarMapping) {
    EXPECT_EQ(RestExchangeClient::toInstrumentId("BTC/USDT", "spot"), "BTC-USDT");
    EXPECT_EQ(RestExchangeClient::toInstrumentId("BTC/USDT:USDT", "swap"), "BTC-USDT-SWAP");
    EXPECT_EQ(RestExchangeClient::toExchangeBar("15m"), "15m");
    EXPECT_EQ(RestExchangeClient::toExchangeBar("1h"), "1H");
    EXPECT_EQ(RestExchangeClient::toExchangeBar("4h"), "4H");
    EXPECT_EQ(RestExchangeClient::toExchangeBar("1d"), "1D");
    EXPECT_EQ(RestExchangeClient::toExchangeBar("1w"), "1W");
}
