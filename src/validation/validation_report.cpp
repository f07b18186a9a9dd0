/**
 * Validation report serialization
 */

#include "ohlcv_ingest/validation/validation_report.h"

namespace ohlcv_ingest {
namespace validation {

void to_json(nlohmann::json& j, const ValidationReport& report) {
    j = nlohmann::json{
        {"total_rows", report.total_rows},
        {"valid_rows", report.valid_rows},
        {"outliers_detected", report.outliers_detected},
        {"gaps_detected", report.gaps_detected},
        {"missing_by_column", report.missing_by_column},
        {"ohlc_violations", report.ohlc_violations},
        {"filled_rows", report.filled_rows},
        {"forced_outliers", report.forced_outliers}
    };
}

void from_json(const nlohmann::json& j, ValidationReport& report) {
    report.total_rows = j.value("total_rows", size_t{0});
    report.valid_rows = j.value("valid_rows", size_t{0});
    report.outliers_detected = j.value("outliers_detected", size_t{0});
    report.gaps_detected = j.value("gaps_detected", size_t{0});
    report.missing_by_column = j.value("missing_by_column", std::map<std::string, size_t>{});
    report.ohlc_violations = j.value("ohlc_violations", size_t{0});
    report.filled_rows = j.value("filled_rows", size_t{0});
    report.forced_outliers = j.value("forced_outliers", size_t{0});
}

} // namespace validation
} // namespace ohlcv_ingest
