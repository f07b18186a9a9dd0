/**
 * Partitioned store implementation
 */

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/storage/partitioned_store.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ohlcv_ingest {
namespace storage {

const char* const PartitionedStore::MANIFEST_FILE = "manifest.json";

namespace {

const char* const CSV_HEADER = "timestamp,symbol,open,high,low,close,volume,is_filled,is_outlier";

void writeNumber(std::ostream& out, double value) {
    if (std::isfinite(value)) {
        out << value;
    }
}

double readNumber(const std::string& field) {
    if (field.empty()) {
        return data::MISSING_VALUE;
    }
    return std::stod(field);
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    // Trailing empty field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

std::string symbolDirectory(const std::string& symbol) {
    std::string dir = symbol;
    std::replace(dir.begin(), dir.end(), '/', '-');
    return dir;
}

} // namespace

void writeFileAtomically(const fs::path& path, const std::string& content) {
    fs::path tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file) {
            throw IOError("Cannot open " + tmp_path.string() + " for writing");
        }
        file << content;
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            throw IOError("Failed writing " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw IOError("Cannot move " + tmp_path.string() + " to " + path.string() + ": " + ec.message());
    }
}

PartitionedStore::PartitionedStore(const common::StorageConfig& config, std::string exchange_id)
    : config_(config),
      exchange_id_(std::move(exchange_id)) {
}

fs::path PartitionedStore::seriesDirectory(const std::string& symbol, const std::string& interval) const {
    return fs::path(config_.root) / exchange_id_ / symbolDirectory(symbol) / interval;
}

fs::path PartitionedStore::partitionPath(const std::string& symbol, const std::string& interval,
                                         const std::string& date) const {
    return seriesDirectory(symbol, interval) / (date + ".csv");
}

Manifest PartitionedStore::write(const data::BarSeries& series, const validation::ValidationReport& report) {
    if (series.empty()) {
        throw EmptyDataError("No bars to write for " + series.symbol + " " + series.interval);
    }

    const fs::path directory = seriesDirectory(series.symbol, series.interval);
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw IOError("Cannot create " + directory.string() + ": " + ec.message());
    }

    // Group by UTC calendar date
    std::map<std::string, std::vector<const data::Bar*>> by_date;
    for (const auto& bar : series.bars) {
        by_date[common::formatDate(bar.timestamp)].push_back(&bar);
    }

    Manifest manifest;
    manifest.exchange_id = exchange_id_;
    manifest.symbol = series.symbol;
    manifest.interval = series.interval;
    manifest.version = config_.manifest_version;
    manifest.validation = report;

    for (const auto& entry : by_date) {
        std::ostringstream out;
        out << std::setprecision(std::numeric_limits<double>::max_digits10);
        out << CSV_HEADER << '\n';
        for (const auto* bar : entry.second) {
            out << common::formatIsoTimestamp(bar->timestamp) << ',' << bar->symbol << ',';
            writeNumber(out, bar->open);
            out << ',';
            writeNumber(out, bar->high);
            out << ',';
            writeNumber(out, bar->low);
            out << ',';
            writeNumber(out, bar->close);
            out << ',';
            writeNumber(out, bar->volume);
            out << ',' << (bar->is_filled ? "true" : "false")
                << ',' << (bar->is_outlier ? "true" : "false") << '\n';
        }

        const fs::path path = directory / (entry.first + ".csv");
        writeFileAtomically(path, out.str());
        manifest.partitions[entry.first] = entry.second.size();

        LOG_DEBUG("Wrote " + std::to_string(entry.second.size()) + " rows to " + path.string());
    }

    manifest.row_count = series.size();
    manifest.start_timestamp = common::formatIsoTimestamp(series.bars.front().timestamp);
    manifest.end_timestamp = common::formatIsoTimestamp(series.bars.back().timestamp);
    manifest.fetch_timestamp = common::formatIsoTimestamp(common::nowMillis());

    // Manifest last, once every partition is in place
    writeFileAtomically(directory / MANIFEST_FILE, json(manifest).dump(2));

    LOG_INFO("Stored " + std::to_string(manifest.row_count) + " rows of " + series.symbol + " " +
             series.interval + " in " + std::to_string(manifest.partitions.size()) +
             " partitions under " + directory.string());
    return manifest;
}

data::BarSeries PartitionedStore::readPartition(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open partition " + path.string());
    }

    std::string line;
    if (!std::getline(file, line) || line != CSV_HEADER) {
        throw IOError("Unexpected partition header in " + path.string());
    }

    data::BarSeries series = data::BarSeries::withAllColumns("", path.parent_path().filename().string());
    size_t line_number = 1;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }

        auto fields = splitCsvLine(line);
        if (fields.size() != 9) {
            throw IOError("Malformed row " + std::to_string(line_number) + " in " + path.string());
        }

        data::Bar bar;
        try {
            bar.timestamp = common::parseIsoTimestamp(fields[0]);
            bar.symbol = fields[1];
            bar.open = readNumber(fields[2]);
            bar.high = readNumber(fields[3]);
            bar.low = readNumber(fields[4]);
            bar.close = readNumber(fields[5]);
            bar.volume = readNumber(fields[6]);
        } catch (const std::exception& e) {
            throw IOError("Malformed row " + std::to_string(line_number) + " in " + path.string() +
                          ": " + e.what());
        }
        bar.is_filled = fields[7] == "true";
        bar.is_outlier = fields[8] == "true";

        if (series.symbol.empty()) {
            series.symbol = bar.symbol;
        }
        series.bars.push_back(bar);
    }

    return series;
}

Manifest PartitionedStore::readManifest(const std::string& symbol, const std::string& interval) const {
    const fs::path path = seriesDirectory(symbol, interval) / MANIFEST_FILE;
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open manifest " + path.string());
    }

    try {
        return json::parse(file).get<Manifest>();
    } catch (const json::exception& e) {
        throw IOError("Malformed manifest " + path.string() + ": " + e.what());
    }
}

} // namespace storage
} // namespace ohlcv_ingest
