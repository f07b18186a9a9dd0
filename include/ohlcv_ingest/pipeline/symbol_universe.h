/**
 * Symbol universe: which symbols a batch collects
 */

#pragma once

#include <string>
#include <vector>

#include "ohlcv_ingest/common/config.h"

namespace ohlcv_ingest {
namespace pipeline {

/**
 * Read symbols from a file. ".json" holds a list or {"symbols": [...]},
 * anything else is one symbol per line ('#' starts a comment).
 * Throws ConfigError if the file cannot be read or parsed.
 */
std::vector<std::string> loadSymbolFile(const std::string& path);

/**
 * collection.symbols plus the contents of collection.symbol_file, de-duplicated and
 * sorted. Throws ConfigError if the result is empty.
 */
std::vector<std::string> resolveSymbols(const common::CollectionConfig& config);

} // namespace pipeline
} // namespace ohlcv_ingest
