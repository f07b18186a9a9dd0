/**
 * Validator: schema, missing-value and OHLC consistency checks
 */

#pragma once

#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/bar.h"
#include "ohlcv_ingest/validation/validation_report.h"

namespace ohlcv_ingest {
namespace validation {

struct ValidationResult {
    data::BarSeries bars;
    ValidationReport report;
};

class Validator {
public:
    explicit Validator(const common::ValidationConfig& config);

    /**
     * Check a normalized batch against the raw completeness rules, then forward-fill
     * the remaining missing values and annotate OHLC consistency.
     *
     * Throws SchemaError when a required column is absent and QualityThresholdError
     * when a column's missing ratio exceeds missing_threshold. A ratio equal to the
     * threshold passes.
     */
    ValidationResult validate(const data::BarSeries& series) const;

private:
    common::ValidationConfig config_;
};

} // namespace validation
} // namespace ohlcv_ingest
