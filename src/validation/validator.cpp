/**
 * Validator implementation
 */

#include <cmath>
#include <sstream>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/validation/validator.h"

namespace ohlcv_ingest {
namespace validation {

namespace {

// Ratios are compared with this slack so that k/n == threshold passes
constexpr double RATIO_EPSILON = 1e-12;

double& columnRef(data::Bar& bar, const std::string& name) {
    if (name == "open") return bar.open;
    if (name == "high") return bar.high;
    if (name == "low") return bar.low;
    if (name == "close") return bar.close;
    return bar.volume;
}

} // namespace

Validator::Validator(const common::ValidationConfig& config)
    : config_(config) {
}

ValidationResult Validator::validate(const data::BarSeries& series) const {
    ValidationResult result;
    auto& report = result.report;

    // Schema
    auto missing_columns = series.missingColumns();
    if (!missing_columns.empty()) {
        std::ostringstream names;
        for (size_t i = 0; i < missing_columns.size(); ++i) {
            names << (i ? ", " : "") << missing_columns[i];
        }
        LOG_ERROR("Schema check failed for " + series.symbol + ": missing " + names.str());
        throw SchemaError("Missing required columns for " + series.symbol + ": " + names.str());
    }

    report.total_rows = series.size();
    for (const auto& name : data::REQUIRED_COLUMNS) {
        report.missing_by_column[name] = 0;
    }

    result.bars.symbol = series.symbol;
    result.bars.interval = series.interval;
    result.bars.columns = series.columns;

    if (series.empty()) {
        return result;
    }

    // Raw completeness, before anything is filled
    for (const auto& name : data::REQUIRED_COLUMNS) {
        size_t count = 0;
        for (const auto& bar : series.bars) {
            if (std::isnan(bar.column(name))) {
                ++count;
            }
        }
        report.missing_by_column[name] = count;

        double ratio = static_cast<double>(count) / static_cast<double>(series.size());
        if (ratio > config_.missing_threshold + RATIO_EPSILON) {
            std::ostringstream msg;
            msg << "Missing ratio " << ratio << " in column " << name << " of " << series.symbol
                << " exceeds threshold " << config_.missing_threshold;
            LOG_ERROR(msg.str());
            throw QualityThresholdError(msg.str(), name, ratio);
        }
    }

    // Forward fill from the previous row; leading gaps stay missing
    std::vector<data::Bar> filled = series.bars;
    for (const auto& name : data::REQUIRED_COLUMNS) {
        double last = data::MISSING_VALUE;
        for (auto& bar : filled) {
            double& value = columnRef(bar, name);
            if (std::isnan(value)) {
                value = last;
                if (!std::isnan(last)) {
                    bar.is_filled = true;
                }
            } else {
                last = value;
            }
        }
    }

    // OHLC consistency
    result.bars.bars.reserve(filled.size());
    for (auto& bar : filled) {
        const bool complete = bar.isComplete();
        bar.ohlc_valid = !complete || bar.isConsistent();

        if (!bar.ohlc_valid) {
            ++report.ohlc_violations;
            if (config_.strict_ohlc) {
                LOG_DEBUG("Dropping inconsistent bar of " + series.symbol + " at " + std::to_string(bar.timestamp));
                continue;
            }
        }

        if (complete) {
            ++report.valid_rows;
        }
        result.bars.bars.push_back(bar);
    }

    if (report.ohlc_violations > 0) {
        LOG_WARNING(std::to_string(report.ohlc_violations) + " OHLC inconsistencies in " + series.symbol +
                    (config_.strict_ohlc ? " (dropped)" : " (advisory)"));
    }

    LOG_INFO("Validated " + series.symbol + ": " + std::to_string(report.total_rows) + " rows, " +
             std::to_string(report.valid_rows) + " valid");
    return result;
}

} // namespace validation
} // namespace ohlcv_ingest
