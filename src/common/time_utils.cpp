/**
 * UTC time helpers implementation
 */

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "ohlcv_ingest/common/time_utils.h"

namespace ohlcv_ingest {
namespace common {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int parseDigits(const std::string& text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        throw std::invalid_argument("Truncated timestamp: " + text);
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Malformed timestamp: " + text);
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

void expectChar(const std::string& text, size_t pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

std::tm toUtcTm(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(floorDiv(epoch_ms, MILLISECONDS_PER_SECOND));
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);
    return tm_utc;
}

} // namespace

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t parseIsoTimestamp(const std::string& text) {
    // Date part
    int year = parseDigits(text, 0, 4);
    expectChar(text, 4, '-');
    int month = parseDigits(text, 5, 2);
    expectChar(text, 7, '-');
    int day = parseDigits(text, 8, 2);

    if (month < 1 || month > 12 || day < 1 || day > 31) {
        throw std::invalid_argument("Date out of range: " + text);
    }

    int64_t result = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * MILLISECONDS_PER_DAY;
    if (text.size() == 10) {
        return result;
    }

    // Time part
    if (text[10] != 'T' && text[10] != ' ') {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
    int hour = parseDigits(text, 11, 2);
    expectChar(text, 13, ':');
    int minute = parseDigits(text, 14, 2);
    size_t pos = 16;
    int second = 0;
    if (pos < text.size() && text[pos] == ':') {
        second = parseDigits(text, pos + 1, 2);
        pos += 3;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument("Time out of range: " + text);
    }
    result += hour * MILLISECONDS_PER_HOUR + minute * MILLISECONDS_PER_MINUTE + second * MILLISECONDS_PER_SECOND;

    // Fractional seconds, millisecond precision
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t millis = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Malformed fraction: " + text);
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
        result += millis;
    }

    // Zone designator
    if (pos == text.size()) {
        return result;
    }
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
        return result;
    }
    if (text[pos] == '+' || text[pos] == '-') {
        int sign = text[pos] == '+' ? 1 : -1;
        int offset_hours = parseDigits(text, pos + 1, 2);
        size_t minute_pos = pos + 3;
        if (minute_pos < text.size() && text[minute_pos] == ':') {
            ++minute_pos;
        }
        int offset_minutes = parseDigits(text, minute_pos, 2);
        if (minute_pos + 2 != text.size()) {
            throw std::invalid_argument("Trailing characters in timestamp: " + text);
        }
        return result - sign * (offset_hours * MILLISECONDS_PER_HOUR + offset_minutes * MILLISECONDS_PER_MINUTE);
    }

    throw std::invalid_argument("Malformed zone designator: " + text);
}

std::string formatIsoTimestamp(int64_t epoch_ms) {
    std::tm tm_utc = toUtcTm(epoch_ms);
    int64_t millis = epoch_ms - floorDiv(epoch_ms, MILLISECONDS_PER_SECOND) * MILLISECONDS_PER_SECOND;

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << millis << "Z";
    return ss.str();
}

std::string formatDate(int64_t epoch_ms) {
    std::tm tm_utc = toUtcTm(epoch_ms);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d");
    return ss.str();
}

int64_t floorToDay(int64_t epoch_ms) {
    return floorDiv(epoch_ms, MILLISECONDS_PER_DAY) * MILLISECONDS_PER_DAY;
}

std::chrono::milliseconds intervalToDuration(const std::string& interval) {
    static const std::unordered_map<std::string, int64_t> durations = {
        {"1min", MILLISECONDS_PER_MINUTE},
        {"3min", 3 * MILLISECONDS_PER_MINUTE},
        {"5min", 5 * MILLISECONDS_PER_MINUTE},
        {"15min", 15 * MILLISECONDS_PER_MINUTE},
        {"30min", 30 * MILLISECONDS_PER_MINUTE},
        {"1h", MILLISECONDS_PER_HOUR},
        {"2h", 2 * MILLISECONDS_PER_HOUR},
        {"4h", 4 * MILLISECONDS_PER_HOUR},
        {"1d", MILLISECONDS_PER_DAY},
        {"1w", 7 * MILLISECONDS_PER_DAY},
        {"1m", MILLISECONDS_PER_MINUTE},
        {"3m", 3 * MILLISECONDS_PER_MINUTE},
        {"5m", 5 * MILLISECONDS_PER_MINUTE},
        {"15m", 15 * MILLISECONDS_PER_MINUTE},
        {"30m", 30 * MILLISECONDS_PER_MINUTE},
        {"1H", MILLISECONDS_PER_HOUR},
        {"2H", 2 * MILLISECONDS_PER_HOUR},
        {"4H", 4 * MILLISECONDS_PER_HOUR},
        {"1D", MILLISECONDS_PER_DAY},
        {"1W", 7 * MILLISECONDS_PER_DAY},
    };

    auto it = durations.find(interval);
    if (it == durations.end()) {
        throw std::invalid_argument("Unsupported interval: " + interval);
    }
    return std::chrono::milliseconds(it->second);
}

} // namespace common
} // namespace ohlcv_ingest
