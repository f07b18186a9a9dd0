/**
 * Symbol universe implementation
 */

#include <algorithm>
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>

#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/pipeline/symbol_universe.h"

using json = nlohmann::json;

namespace ohlcv_ingest {
namespace pipeline {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<std::string> loadSymbolFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open symbol file " + path);
    }

    std::vector<std::string> symbols;
    if (endsWith(path, ".json")) {
        try {
            json doc = json::parse(file);
            const json& list = doc.is_object() ? doc.at("symbols") : doc;
            symbols = list.get<std::vector<std::string>>();
        } catch (const json::exception& e) {
            throw ConfigError("Error loading symbol file " + path + ": " + std::string(e.what()));
        }
    } else {
        std::string line;
        while (std::getline(file, line)) {
            auto comment = line.find('#');
            if (comment != std::string::npos) {
                line.erase(comment);
            }
            line = trim(line);
            if (!line.empty()) {
                symbols.push_back(line);
            }
        }
    }

    LOG_INFO("Loaded " + std::to_string(symbols.size()) + " symbols from " + path);
    return symbols;
}

std::vector<std::string> resolveSymbols(const common::CollectionConfig& config) {
    std::set<std::string> unique;
    for (const auto& symbol : config.symbols) {
        auto trimmed = trim(symbol);
        if (!trimmed.empty()) {
            unique.insert(trimmed);
        }
    }

    if (!config.symbol_file.empty()) {
        for (const auto& symbol : loadSymbolFile(config.symbol_file)) {
            unique.insert(trim(symbol));
        }
    }
    unique.erase("");

    if (unique.empty()) {
        throw ConfigError("No symbols configured");
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

} // namespace pipeline
} // namespace ohlcv_ingest
