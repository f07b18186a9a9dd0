/**
 * Tests for multi-symbol batches
 */

#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/pipeline/batch_runner.h"
#include "mock_exchange_client.h"
#include "test_helpers.h"

using namespace ohlcv_ingest;
using test_support::FIFTEEN_MINUTES;
using test_support::MockExchangeClient;
using test_support::T0;
namespace fs = std::filesystem;

namespace {

class BatchRunnerTest : public ::testing::Test {
protected:
    common::Config makeConfig(int max_workers, bool fail_fast, int deadline_seconds = 0,
                              double backoff_base_seconds = 0.001) const {
        return common::Config::fromString(
            "api: { rate_limit: 1, retries: 2, backoff_base_seconds: " + std::to_string(backoff_base_seconds) +
            ", page_limit: 50 }\n"
            "validation: { outliers: { rolling_window: 24 } }\n"
            "storage: { root: \"" + dir_.str() + "\" }\n"
            "collection:\n"
            "  interval: 15min\n"
            "  max_workers: " + std::to_string(max_workers) + "\n"
            "  fail_fast: " + (fail_fast ? "true" : "false") + "\n"
            "  deadline_seconds: " + std::to_string(deadline_seconds) + "\n");
    }

    void serve(const std::string& symbol) {
        client_.setBars(symbol, test_support::makeSeries(symbol, "15min", T0, FIFTEEN_MINUTES, 96).bars);
    }

    bool manifestExists(const std::string& symbol_dir) const {
        return fs::exists(dir_.path() / "mock" / symbol_dir / "15min" / "manifest.json");
    }

    int64_t windowEnd() const { return T0 + 95 * FIFTEEN_MINUTES; }

    test_support::ScopedTempDir dir_;
    MockExchangeClient client_;
};

} // namespace

TEST_F(BatchRunnerTest, RunsEverySymbolConcurrently) {
    std::vector<std::string> symbols = {"AAA/USDT", "BBB/USDT", "CCC/USDT", "DDD/USDT"};
    for (const auto& symbol : symbols) {
        serve(symbol);
    }
    auto config = makeConfig(3, false);
    pipeline::BatchRunner runner(config, client_);

    auto summary = runner.run(symbols, T0, windowEnd());

    EXPECT_FALSE(summary.aborted);
    EXPECT_EQ(summary.succeeded(), 4u);
    ASSERT_EQ(summary.outcomes.size(), 4u);
    for (size_t i = 0; i < symbols.size(); ++i) {
        EXPECT_EQ(summary.outcomes[i].symbol, symbols[i]);
        ASSERT_TRUE(summary.outcomes[i].result.has_value());
        EXPECT_EQ(summary.outcomes[i].result->manifest.row_count, 96u);
    }
    EXPECT_TRUE(manifestExists("CCC-USDT"));

    // Every request went through the shared limiter
    EXPECT_EQ(runner.rateLimiter().acquired(), client_.requestCount());
}

TEST_F(BatchRunnerTest, FailedSymbolIsSkipped) {
    serve("AAA/USDT");
    serve("CCC/USDT");
    client_.rejectSymbol("BBB/USDT");
    auto config = makeConfig(2, false);
    pipeline::BatchRunner runner(config, client_);

    auto summary = runner.run({"AAA/USDT", "BBB/USDT", "CCC/USDT"}, T0, windowEnd());

    EXPECT_FALSE(summary.aborted);
    EXPECT_EQ(summary.succeeded(), 2u);
    EXPECT_EQ(summary.failed(), 1u);
    EXPECT_FALSE(summary.outcomes[1].success);
    EXPECT_NE(summary.outcomes[1].error.find("BBB/USDT"), std::string::npos);
    EXPECT_FALSE(manifestExists("BBB-USDT"));
    EXPECT_TRUE(manifestExists("CCC-USDT"));
}

TEST_F(BatchRunnerTest, FailFastAbortsRemainingSymbols) {
    client_.rejectSymbol("AAA/USDT");
    serve("BBB/USDT");
    serve("CCC/USDT");
    auto config = makeConfig(1, true);
    pipeline::BatchRunner runner(config, client_);

    auto summary = runner.run({"AAA/USDT", "BBB/USDT", "CCC/USDT"}, T0, windowEnd());

    EXPECT_TRUE(summary.aborted);
    EXPECT_EQ(summary.succeeded(), 0u);
    EXPECT_EQ(summary.failed(), 3u);
    EXPECT_FALSE(manifestExists("BBB-USDT"));
    EXPECT_FALSE(manifestExists("CCC-USDT"));
}

TEST_F(BatchRunnerTest, DeadlineCancelsSlowSymbol) {
    serve("AAA/USDT");
    client_.failWithRateLimit(1);
    auto config = makeConfig(1, false, 1, 30.0);
    pipeline::BatchRunner runner(config, client_);

    auto start = std::chrono::steady_clock::now();
    auto summary = runner.run({"AAA/USDT"}, T0, windowEnd());
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start);

    ASSERT_EQ(summary.outcomes.size(), 1u);
    EXPECT_FALSE(summary.outcomes[0].success);
    EXPECT_NE(summary.outcomes[0].error.find("Cancelled"), std::string::npos);
    EXPECT_LT(elapsed.count(), 10);
    EXPECT_FALSE(manifestExists("AAA-USDT"));
}

TEST_F(BatchRunnerTest, CancelBeforeRunSkipsEverything) {
    serve("AAA/USDT");
    auto config = makeConfig(1, false);
    pipeline::BatchRunner runner(config, client_);
    runner.cancel();

    auto summary = runner.run({"AAA/USDT"}, T0, windowEnd());

    EXPECT_TRUE(summary.aborted);
    EXPECT_EQ(summary.failed(), 1u);
    EXPECT_EQ(client_.requestCount(), 0u);
}

TEST(ResolveWindowTest, DefaultsAndOrdering) {
    common::CollectionConfig config;
    config.start = "2024-03-01";
    config.end = "2024-03-02T00:00:00Z";
    auto window = pipeline::resolveWindow(config);
    EXPECT_EQ(window.first, T0);
    EXPECT_EQ(window.second, T0 + common::MILLISECONDS_PER_DAY);

    config.start.clear();
    window = pipeline::resolveWindow(config);
    EXPECT_EQ(window.first, T0);

    config.start = "2024-03-05";
    EXPECT_THROW(pipeline::resolveWindow(config), ConfigError);
}
