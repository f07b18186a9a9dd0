/**
 * Date-partitioned bar storage with a per-series manifest
 */

#pragma once

#include <filesystem>
#include <string>

#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/data/bar.h"
#include "ohlcv_ingest/storage/manifest.h"
#include "ohlcv_ingest/validation/validation_report.h"

namespace ohlcv_ingest {
namespace storage {

/**
 * Layout: {root}/{exchange}/{symbol with '/' as '-'}/{interval}/{YYYY-MM-DD}.csv
 * plus manifest.json in the same directory.
 *
 * Every file goes to "<name>.tmp" first and is renamed over the target, so readers
 * only ever see complete files.
 */
class PartitionedStore {
public:
    PartitionedStore(const common::StorageConfig& config, std::string exchange_id);

    /**
     * Write bars grouped by UTC date, replacing only the dates present, then rewrite
     * the manifest. Throws EmptyDataError for an empty series and IOError on any
     * filesystem failure.
     */
    Manifest write(const data::BarSeries& series, const validation::ValidationReport& report);

    // Directory holding the partitions and manifest of a (symbol, interval)
    std::filesystem::path seriesDirectory(const std::string& symbol, const std::string& interval) const;

    std::filesystem::path partitionPath(const std::string& symbol, const std::string& interval,
                                        const std::string& date) const;

    // Read a partition file back; throws IOError if it cannot be read
    static data::BarSeries readPartition(const std::filesystem::path& path);

    Manifest readManifest(const std::string& symbol, const std::string& interval) const;

    static const char* const MANIFEST_FILE;

private:
    common::StorageConfig config_;
    std::string exchange_id_;
};

// Write `content` to path.tmp and rename it over path; throws IOError
void writeFileAtomically(const std::filesystem::path& path, const std::string& content);

} // namespace storage
} // namespace ohlcv_ingest
