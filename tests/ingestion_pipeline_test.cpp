/**
 * End-to-end tests for one symbol through every stage
 */

#include <cmath>
#include <filesystem>
#include <gtest/gtest.h>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/pipeline/ingestion_pipeline.h"
#include "mock_exchange_client.h"
#include "test_helpers.h"

using namespace ohlcv_ingest;
using test_support::FIFTEEN_MINUTES;
using test_support::MockExchangeClient;
using test_support::T0;
namespace fs = std::filesystem;

namespace {

const std::string SYMBOL = "BTC/USDT";

class IngestionPipelineTest : public ::testing::Test {
protected:
    IngestionPipelineTest()
        : limiter_(std::chrono::milliseconds(0)) {
        bars_ = test_support::makeSeries(SYMBOL, "15min", T0, FIFTEEN_MINUTES, 96).bars;
    }

    common::Config makeConfig(int max_collector_count = 2, int check_data_length = 0) const {
        return common::Config::fromString(
            "exchange: { id: mock }\n"
            "api: { rate_limit: 0, retries: 3, backoff_base_seconds: 0.001, page_limit: 10 }\n"
            "validation:\n"
            "  missing_threshold: 0.05\n"
            "  gap_fill: { short_gap_minutes: 30 }\n"
            "  outliers: { price_jump: 0.1, volume_spike: 5.0, rolling_window: 24 }\n"
            "storage: { root: \"" + dir_.str() + "\" }\n"
            "collection:\n"
            "  interval: 15min\n"
            "  max_collector_count: " + std::to_string(max_collector_count) + "\n"
            "  check_data_length: " + std::to_string(check_data_length) + "\n");
    }

    pipeline::PipelineResult runPipeline(const common::Config& config) {
        client_.setBars(SYMBOL, bars_);
        pipeline::IngestionPipeline pipeline(config, client_, limiter_);
        return pipeline.run(SYMBOL, T0, windowEnd(), token_);
    }

    int64_t windowEnd() const { return T0 + 95 * FIFTEEN_MINUTES; }

    fs::path seriesDirectory() const { return dir_.path() / "mock" / "BTC-USDT" / "15min"; }

    test_support::ScopedTempDir dir_;
    MockExchangeClient client_;
    data::RateLimiter limiter_;
    common::CancellationToken token_;
    std::vector<data::Bar> bars_;
};

} // namespace

TEST_F(IngestionPipelineTest, DayOfBarsWithMissingClosesAndSpikes) {
    bars_[10].close = data::MISSING_VALUE;
    bars_[30].close = data::MISSING_VALUE;
    bars_[50].close = data::MISSING_VALUE;
    bars_[40].close = 130.0;
    bars_[40].high = 131.0;
    bars_[60].volume = 1000.0;

    auto result = runPipeline(makeConfig());

    EXPECT_EQ(result.report.total_rows, 96u);
    EXPECT_EQ(result.report.valid_rows, 96u);
    EXPECT_GE(result.report.outliers_detected, 2u);
    EXPECT_EQ(result.report.gaps_detected, 0u);
    EXPECT_EQ(result.report.missing_by_column.at("close"), 3u);
    EXPECT_EQ(result.manifest.row_count, 96u);
    EXPECT_EQ(result.pages_fetched, 10u);

    auto partition = storage::PartitionedStore::readPartition(seriesDirectory() / "2024-03-01.csv");
    ASSERT_EQ(partition.size(), 96u);
    EXPECT_TRUE(partition.bars[40].is_outlier);
    EXPECT_TRUE(partition.bars[60].is_outlier);
    EXPECT_DOUBLE_EQ(partition.bars[10].close, 100.0);
    EXPECT_TRUE(partition.bars[10].is_filled);
    EXPECT_TRUE(partition.bars[30].is_filled);
    EXPECT_TRUE(partition.bars[50].is_filled);
    EXPECT_FALSE(partition.bars[11].is_filled);
    EXPECT_TRUE(fs::exists(seriesDirectory() / "manifest.json"));
}

TEST_F(IngestionPipelineTest, ShortGapIsFilledAndPersistedWithProvenance) {
    bars_.erase(bars_.begin() + 20);

    auto result = runPipeline(makeConfig());

    EXPECT_EQ(result.report.filled_rows, 1u);
    EXPECT_EQ(result.report.gaps_detected, 0u);
    EXPECT_EQ(result.manifest.row_count, 96u);

    auto partition = storage::PartitionedStore::readPartition(seriesDirectory() / "2024-03-01.csv");
    ASSERT_EQ(partition.size(), 96u);
    EXPECT_TRUE(partition.bars[20].is_filled);
    EXPECT_DOUBLE_EQ(partition.bars[20].volume, 0.0);
}

TEST_F(IngestionPipelineTest, LongGapIsCountedNotFilled) {
    bars_.erase(bars_.begin() + 20, bars_.begin() + 24);

    auto result = runPipeline(makeConfig());

    EXPECT_EQ(result.report.gaps_detected, 4u);
    EXPECT_EQ(result.report.filled_rows, 0u);
    EXPECT_EQ(result.manifest.row_count, 92u);
}

TEST_F(IngestionPipelineTest, DuplicatesAndOutOfWindowRowsAreDropped) {
    bars_.push_back(test_support::makeBar(SYMBOL, T0 + 5 * FIFTEEN_MINUTES, 999.0));
    bars_.push_back(test_support::makeBar(SYMBOL, T0 + 96 * FIFTEEN_MINUTES, 100.0));

    auto result = runPipeline(makeConfig());

    EXPECT_EQ(result.manifest.row_count, 96u);
    auto partition = storage::PartitionedStore::readPartition(seriesDirectory() / "2024-03-01.csv");
    EXPECT_DOUBLE_EQ(partition.bars[5].close, 100.0);
}

TEST_F(IngestionPipelineTest, NetworkErrorTriggersRecollection) {
    client_.failWithNetworkError(1);

    auto result = runPipeline(makeConfig());

    EXPECT_EQ(result.collections, 2);
    EXPECT_EQ(result.manifest.row_count, 96u);
}

TEST_F(IngestionPipelineTest, PersistentNetworkErrorFailsWithoutWriting) {
    client_.failWithNetworkError(10);

    EXPECT_THROW(runPipeline(makeConfig()), TransientNetworkError);
    EXPECT_FALSE(fs::exists(seriesDirectory() / "manifest.json"));
}

TEST_F(IngestionPipelineTest, ShortCollectionIsRepeated) {
    auto config = makeConfig(3, 200);

    auto result = runPipeline(config);

    EXPECT_EQ(result.collections, 3);
    EXPECT_EQ(result.manifest.row_count, 96u);
}

TEST_F(IngestionPipelineTest, SchemaErrorWritesNothing) {
    client_.setColumns(SYMBOL, {"timestamp", "open", "high", "low", "close"});

    EXPECT_THROW(runPipeline(makeConfig()), SchemaError);
    EXPECT_FALSE(fs::exists(seriesDirectory()));
}

TEST_F(IngestionPipelineTest, QualityThresholdErrorWritesNothing) {
    for (int i = 0; i < 10; ++i) {
        bars_[i * 9].volume = data::MISSING_VALUE;
    }

    EXPECT_THROW(runPipeline(makeConfig()), QualityThresholdError);
    EXPECT_FALSE(fs::exists(seriesDirectory()));
}

TEST_F(IngestionPipelineTest, EmptyWindowIsEmptyDataError) {
    bars_.clear();
    EXPECT_THROW(runPipeline(makeConfig()), EmptyDataError);
}

TEST_F(IngestionPipelineTest, CancelledPipelineWritesNothing) {
    token_.cancel();

    EXPECT_THROW(runPipeline(makeConfig()), CancelledError);
    EXPECT_EQ(client_.requestCount(), 0u);
    EXPECT_FALSE(fs::exists(seriesDirectory()));
}
