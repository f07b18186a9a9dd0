/**
 * Manifest describing one (symbol, interval) write
 */

#pragma once

#include <map>
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

#include "ohlcv_ingest/validation/validation_report.h"

namespace ohlcv_ingest {
namespace storage {

struct Manifest {
    std::string exchange_id;
    std::string symbol;
    std::string interval;
    std::string start_timestamp;     // ISO-8601 UTC
    std::string end_timestamp;
    std::string fetch_timestamp;
    std::string version;
    size_t row_count = 0;

    std::map<std::string, size_t> partitions;   // Date -> rows written
    validation::ValidationReport validation;
};

void to_json(nlohmann::json& j, const Manifest& manifest);
void from_json(const nlohmann::json& j, Manifest& manifest);

} // namespace storage
} // namespace ohlcv_ingest
