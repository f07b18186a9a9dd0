/**
 * Per-batch data quality summary
 */

#pragma once

#include <map>
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace ohlcv_ingest {
namespace validation {

struct ValidationReport {
    size_t total_rows = 0;
    size_t valid_rows = 0;
    size_t outliers_detected = 0;
    size_t gaps_detected = 0;                      // Missing expected intervals left unfilled
    std::map<std::string, size_t> missing_by_column;

    size_t ohlc_violations = 0;                    // Advisory unless strict_ohlc
    size_t filled_rows = 0;                        // Synthesized by gap repair
    size_t forced_outliers = 0;                    // Padded by the forced-minimum fallback
};

void to_json(nlohmann::json& j, const ValidationReport& report);
void from_json(const nlohmann::json& j, ValidationReport& report);

} // namespace validation
} // namespace ohlcv_ingest
