/**
 * Batch runner implementation
 */

#include <algorithm>
#include <chrono>
#include <future>
#include <utility>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/pipeline/batch_runner.h"

namespace ohlcv_ingest {
namespace pipeline {

size_t BatchSummary::succeeded() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [](const SymbolOutcome& o) { return o.success; }));
}

size_t BatchSummary::failed() const {
    return outcomes.size() - succeeded();
}

BatchRunner::BatchRunner(const common::Config& config, data::ExchangeClient& client)
    : config_(config),
      client_(client),
      limiter_(std::chrono::milliseconds(config.getApiConfig().rate_limit_ms)) {
}

BatchSummary BatchRunner::run(const std::vector<std::string>& symbols, int64_t start_ms, int64_t end_ms) {
    const auto& collection = config_.getCollectionConfig();
    const size_t workers = std::min(symbols.size(), static_cast<size_t>(std::max(1, collection.max_workers)));

    BatchSummary summary;
    summary.outcomes.resize(symbols.size());

    LOG_INFO("Starting batch of " + std::to_string(symbols.size()) + " symbols with " +
             std::to_string(workers) + " workers");

    // Each worker pulls the next symbol index until the list is exhausted
    std::atomic<size_t> next_index{0};
    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&]() {
            for (;;) {
                size_t index = next_index.fetch_add(1);
                if (index >= symbols.size()) {
                    return;
                }

                const std::string& symbol = symbols[index];
                if (cancelled_.load()) {
                    SymbolOutcome skipped;
                    skipped.symbol = symbol;
                    skipped.error = "Cancelled: batch aborted before " + symbol + " started";
                    summary.outcomes[index] = std::move(skipped);
                    continue;
                }

                SymbolOutcome outcome = runSymbol(symbol, start_ms, end_ms);
                if (!outcome.success && collection.fail_fast) {
                    LOG_ERROR("Aborting batch after failure of " + symbol);
                    cancel();
                }
                summary.outcomes[index] = std::move(outcome);
            }
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

    summary.aborted = cancelled_.load();

    LOG_INFO("Batch finished: " + std::to_string(summary.succeeded()) + " succeeded, " +
             std::to_string(summary.failed()) + " failed" + (summary.aborted ? " (aborted)" : ""));
    return summary;
}

SymbolOutcome BatchRunner::runSymbol(const std::string& symbol, int64_t start_ms, int64_t end_ms) {
    SymbolOutcome outcome;
    outcome.symbol = symbol;

    common::CancellationToken token;
    const int deadline_seconds = config_.getCollectionConfig().deadline_seconds;
    if (deadline_seconds > 0) {
        token.setDeadline(common::CancellationToken::Clock::now() + std::chrono::seconds(deadline_seconds));
    }

    registerToken(&token);
    try {
        IngestionPipeline pipeline(config_, client_, limiter_);
        outcome.result = pipeline.run(symbol, start_ms, end_ms, token);
        outcome.success = true;
    } catch (const PipelineError& e) {
        outcome.error = e.what();
        LOG_ERROR("Symbol " + symbol + " failed: " + outcome.error);
    } catch (const std::exception& e) {
        outcome.error = std::string("Unexpected error: ") + e.what();
        LOG_ERROR("Symbol " + symbol + " failed: " + outcome.error);
    }
    unregisterToken(&token);

    return outcome;
}

void BatchRunner::cancel() {
    cancelled_ = true;

    std::lock_guard<std::mutex> lock(tokens_mutex_);
    for (auto* token : active_tokens_) {
        token->cancel();
    }
}

void BatchRunner::registerToken(common::CancellationToken* token) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    active_tokens_.insert(token);
    if (cancelled_.load()) {
        token->cancel();
    }
}

void BatchRunner::unregisterToken(common::CancellationToken* token) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    active_tokens_.erase(token);
}

std::pair<int64_t, int64_t> resolveWindow(const common::CollectionConfig& config) {
    int64_t end_ms = config.end.empty() ? common::nowMillis() : common::parseIsoTimestamp(config.end);
    int64_t start_ms = config.start.empty() ? end_ms - common::MILLISECONDS_PER_DAY
                                            : common::parseIsoTimestamp(config.start);
    if (start_ms > end_ms) {
        throw ConfigError("Collection start " + config.start + " is after end " + config.end);
    }
    return {start_ms, end_ms};
}

} // namespace pipeline
} // namespace ohlcv_ingest
