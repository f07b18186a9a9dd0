/**
 * Configuration management implementation
 */

#include <chrono>
#include <regex>
#include <stdexcept>
#include <cstdlib>

#include <yaml-cpp/yaml.h>
#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"

namespace ohlcv_ingest {
namespace common {

Config::Config(const std::string& config_path) {
    try {
        load(YAML::LoadFile(config_path));
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError("Error loading pipeline config " + config_path + ": " + std::string(e.what()));
    }

    validate();

    LOG_INFO("Configuration loaded from " + config_path);
}

Config Config::fromString(const std::string& yaml_text) {
    Config config;
    try {
        config.load(YAML::Load(yaml_text));
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError("Error parsing pipeline config: " + std::string(e.what()));
    }

    config.validate();
    return config;
}

void Config::setWindow(const std::string& start, const std::string& end) {
    if (!start.empty()) {
        collection_config_.start = start;
    }
    if (!end.empty()) {
        collection_config_.end = end;
    }
    validate();
}

void Config::applyLogging() const {
    g_logger.setLevel(logging_config_.level);
    g_logger.setFlushInterval(std::chrono::milliseconds(logging_config_.flush_interval_ms));
    if (!logging_config_.file.empty()) {
        g_logger.setFile(logging_config_.file);
    }
}

void Config::load(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigError("Pipeline config must be a YAML mapping");
    }

    // Parse exchange section
    if (root["exchange"]) {
        auto ex = root["exchange"];
        exchange_config_.id = ex["id"].as<std::string>(exchange_config_.id);
        exchange_config_.base_url = expandEnvVars(ex["base_url"].as<std::string>(exchange_config_.base_url));
        exchange_config_.market_type = ex["market_type"].as<std::string>(exchange_config_.market_type);
    }

    // Parse API section
    if (root["api"]) {
        auto api = root["api"];
        api_config_.rate_limit_ms = api["rate_limit"].as<int>(api_config_.rate_limit_ms);
        api_config_.retries = api["retries"].as<int>(api_config_.retries);
        api_config_.backoff_base_seconds = api["backoff_base_seconds"].as<double>(api_config_.backoff_base_seconds);
        api_config_.page_limit = api["page_limit"].as<int>(api_config_.page_limit);
        api_config_.timeout_ms = api["timeout_ms"].as<int>(api_config_.timeout_ms);
    }

    // Parse validation section
    if (root["validation"]) {
        auto val = root["validation"];
        validation_config_.missing_threshold = val["missing_threshold"].as<double>(validation_config_.missing_threshold);
        validation_config_.strict_ohlc = val["strict_ohlc"].as<bool>(validation_config_.strict_ohlc);

        if (val["gap_fill"]) {
            validation_config_.gap_fill.short_gap_minutes =
                val["gap_fill"]["short_gap_minutes"].as<int>(validation_config_.gap_fill.short_gap_minutes);
        }

        if (val["outliers"]) {
            auto out = val["outliers"];
            auto& outliers = validation_config_.outliers;
            outliers.price_jump = out["price_jump"].as<double>(outliers.price_jump);
            outliers.volume_spike = out["volume_spike"].as<double>(outliers.volume_spike);
            outliers.rolling_window = out["rolling_window"].as<int>(outliers.rolling_window);
            outliers.forced_minimum = out["forced_minimum"].as<int>(outliers.forced_minimum);
            outliers.forced_seed = out["forced_seed"].as<uint32_t>(outliers.forced_seed);
        }
    }

    // Parse storage section
    if (root["storage"]) {
        auto st = root["storage"];
        storage_config_.root = expandEnvVars(st["root"].as<std::string>(storage_config_.root));
        storage_config_.manifest_version = st["manifest_version"].as<std::string>(storage_config_.manifest_version);
    }

    // Parse collection section
    if (root["collection"]) {
        auto col = root["collection"];
        collection_config_.interval = col["interval"].as<std::string>(collection_config_.interval);
        collection_config_.symbol_file = expandEnvVars(col["symbol_file"].as<std::string>(""));
        collection_config_.start = col["start"].as<std::string>("");
        collection_config_.end = col["end"].as<std::string>("");
        collection_config_.max_workers = col["max_workers"].as<int>(collection_config_.max_workers);
        collection_config_.max_collector_count = col["max_collector_count"].as<int>(collection_config_.max_collector_count);
        collection_config_.check_data_length = col["check_data_length"].as<int>(collection_config_.check_data_length);
        collection_config_.fail_fast = col["fail_fast"].as<bool>(collection_config_.fail_fast);
        collection_config_.deadline_seconds = col["deadline_seconds"].as<int>(collection_config_.deadline_seconds);

        // Parse symbols
        if (col["symbols"]) {
            for (const auto& symbol : col["symbols"]) {
                collection_config_.symbols.push_back(symbol.as<std::string>());
            }
        }
    }

    // Parse logging section
    if (root["logging"]) {
        auto log = root["logging"];
        logging_config_.level = log["level"].as<std::string>(logging_config_.level);
        logging_config_.file = expandEnvVars(log["file"].as<std::string>(logging_config_.file));
        logging_config_.flush_interval_ms = log["flush_interval_ms"].as<int>(logging_config_.flush_interval_ms);
    }
}

void Config::validate() const {
    if (exchange_config_.id.empty()) {
        throw ConfigError("Exchange id must be specified");
    }

    // Validate API config
    if (api_config_.rate_limit_ms < 0) {
        throw ConfigError("api.rate_limit must not be negative");
    }
    if (api_config_.retries < 1) {
        throw ConfigError("api.retries must be at least 1");
    }
    if (api_config_.backoff_base_seconds < 0.0) {
        throw ConfigError("api.backoff_base_seconds must not be negative");
    }
    if (api_config_.page_limit <= 0) {
        throw ConfigError("api.page_limit must be positive");
    }

    // Validate thresholds
    if (validation_config_.missing_threshold < 0.0 || validation_config_.missing_threshold > 1.0) {
        throw ConfigError("validation.missing_threshold must be within [0, 1]");
    }
    if (validation_config_.gap_fill.short_gap_minutes < 0) {
        throw ConfigError("validation.gap_fill.short_gap_minutes must not be negative");
    }
    if (validation_config_.outliers.price_jump <= 0.0) {
        throw ConfigError("validation.outliers.price_jump must be positive");
    }
    if (validation_config_.outliers.volume_spike <= 0.0) {
        throw ConfigError("validation.outliers.volume_spike must be positive");
    }
    if (validation_config_.outliers.rolling_window < 1) {
        throw ConfigError("validation.outliers.rolling_window must be at least 1");
    }
    if (validation_config_.outliers.forced_minimum < 0) {
        throw ConfigError("validation.outliers.forced_minimum must not be negative");
    }

    if (storage_config_.root.empty()) {
        throw ConfigError("storage.root must be specified");
    }

    // Validate collection config
    try {
        intervalToDuration(collection_config_.interval);
        if (!collection_config_.start.empty()) {
            parseIsoTimestamp(collection_config_.start);
        }
        if (!collection_config_.end.empty()) {
            parseIsoTimestamp(collection_config_.end);
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid collection settings: " + std::string(e.what()));
    }
    if (collection_config_.max_workers < 1) {
        throw ConfigError("collection.max_workers must be at least 1");
    }
    if (collection_config_.max_collector_count < 1) {
        throw ConfigError("collection.max_collector_count must be at least 1");
    }
    if (collection_config_.deadline_seconds < 0) {
        throw ConfigError("collection.deadline_seconds must not be negative");
    }
}

std::string Config::expandEnvVars(const std::string& value) {
    // If the value doesn't contain any environment variables, return it as is
    if (value.find("${") == std::string::npos) {
        return value;
    }

    std::string result = value;
    std::regex env_var_pattern("\\$\\{([^}]+)\\}");

    std::smatch match;
    while (std::regex_search(result, match, env_var_pattern)) {
        std::string env_var_name = match[1].str();
        const char* env_var_value = std::getenv(env_var_name.c_str());
        if (!env_var_value) {
            LOG_WARNING("Environment variable " + env_var_name + " is not set");
        }

        std::string replacement = env_var_value ? env_var_value : "";
        result.replace(match.position(0), match.length(0), replacement);
    }

    return result;
}

} // namespace common
} // namespace ohlcv_ingest
