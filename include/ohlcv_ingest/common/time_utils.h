/**
 * UTC time helpers (epoch milliseconds <-> ISO-8601)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ohlcv_ingest {
namespace common {

// Time conversion constants
constexpr int64_t MILLISECONDS_PER_SECOND = 1000;
constexpr int64_t MILLISECONDS_PER_MINUTE = 60 * MILLISECONDS_PER_SECOND;
constexpr int64_t MILLISECONDS_PER_HOUR = 60 * MILLISECONDS_PER_MINUTE;
constexpr int64_t MILLISECONDS_PER_DAY = 24 * MILLISECONDS_PER_HOUR;

// Current wall-clock time in epoch milliseconds
int64_t nowMillis();

/**
 * Parse an ISO-8601 instant into epoch milliseconds.
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DDTHH:MM:SS[.fff]"
 * followed by an optional "Z" or "+HH:MM"/"-HH:MM" offset. Naive values are UTC.
 * Throws std::invalid_argument on malformed input.
 */
int64_t parseIsoTimestamp(const std::string& text);

// "2024-03-01T12:15:00.000Z"
std::string formatIsoTimestamp(int64_t epoch_ms);

// UTC calendar date, "2024-03-01"
std::string formatDate(int64_t epoch_ms);

// Start of the UTC day containing epoch_ms
int64_t floorToDay(int64_t epoch_ms);

/**
 * Nominal spacing of an interval label: "1min", "15min", "1h", "4h", "1d", "1w".
 * Also accepts the exchange-style short forms "15m", "1H", "1D".
 * Throws std::invalid_argument for anything else.
 */
std::chrono::milliseconds intervalToDuration(const std::string& interval);

} // namespace common
} // namespace ohlcv_ingest
