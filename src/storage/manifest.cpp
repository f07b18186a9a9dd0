/**
 * Manifest serialization
 */

#include "ohlcv_ingest/storage/manifest.h"

namespace ohlcv_ingest {
namespace storage {

void to_json(nlohmann::json& j, const Manifest& manifest) {
    j = nlohmann::json{
        {"exchange_id", manifest.exchange_id},
        {"symbol", manifest.symbol},
        {"interval", manifest.interval},
        {"start_timestamp", manifest.start_timestamp},
        {"end_timestamp", manifest.end_timestamp},
        {"fetch_timestamp", manifest.fetch_timestamp},
        {"version", manifest.version},
        {"row_count", manifest.row_count},
        {"partitions", manifest.partitions},
        {"validation", manifest.validation}
    };
}

void from_json(const nlohmann::json& j, Manifest& manifest) {
    j.at("exchange_id").get_to(manifest.exchange_id);
    j.at("symbol").get_to(manifest.symbol);
    j.at("interval").get_to(manifest.interval);
    j.at("start_timestamp").get_to(manifest.start_timestamp);
    j.at("end_timestamp").get_to(manifest.end_timestamp);
    j.at("fetch_timestamp").get_to(manifest.fetch_timestamp);
    j.at("version").get_to(manifest.version);
    j.at("row_count").get_to(manifest.row_count);

    manifest.partitions = j.value("partitions", std::map<std::string, size_t>{});
    if (j.contains("validation")) {
        j.at("validation").get_to(manifest.validation);
    }
}

} // namespace storage
} // namespace ohlcv_ingest
