/**
 * Ring-buffer logging for the ingestion pipeline
 */

#pragma once

#include <string>
#include <fstream>
#include <thread>
#include <atomic>
#include <array>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

namespace ohlcv_ingest {
namespace common {

// Log levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Log entry structure (pre-allocated)
struct LogEntry {
    uint64_t timestamp;       // Nanoseconds since epoch
    LogLevel level;
    uint32_t thread_id;
    char message[1024];       // Fixed-size message buffer
    std::atomic<size_t> sequence{0};  // index + 1 once published, index + BUFFER_SIZE once free
};

// Buffered logger with a background flush thread
class Logger {
public:
    explicit Logger(const std::string& name, LogLevel level = LogLevel::INFO);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Log a message; the message is copied into the ring buffer
    void log(LogLevel level, const std::string& message);

    // Redirect output to another file (directories are created)
    void setFile(const std::string& path);

    // Set log level
    void setLevel(const std::string& level_str);
    void setLevel(LogLevel level);
    LogLevel level() const { return level_.load(); }

    // Set background flush period
    void setFlushInterval(std::chrono::milliseconds interval);

    // Flush pending entries to disk
    void flush();

    // Entries discarded because the buffer was full
    uint64_t dropped() const { return dropped_.load(); }

    // Convert log level string to enum (unknown strings map to INFO)
    static LogLevel stringToLogLevel(const std::string& level_str);

    // Convert log level to string
    static const char* logLevelToString(LogLevel level);

    static constexpr size_t BUFFER_SIZE = 8192;

private:
    std::array<LogEntry, BUFFER_SIZE> buffer_;
    std::atomic<size_t> write_index_{0};
    size_t read_index_{0};
    std::atomic<uint64_t> dropped_{0};

    std::string name_;
    std::atomic<LogLevel> level_;

    // Output file, guarded by file_mutex_
    std::ofstream file_;
    std::mutex file_mutex_;

    // Background thread for flushing
    std::thread flush_thread_;
    std::atomic<bool> running_{true};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::atomic<int64_t> flush_interval_ms_{1000};

    void flushThreadFunc();
    void writePending();

    static uint64_t getCurrentNanoTime();
};

// Global logger instance
extern Logger g_logger;

// Convenience macros
#define LOG_DEBUG(message) ::ohlcv_ingest::common::g_logger.log(::ohlcv_ingest::common::LogLevel::DEBUG, message)
#define LOG_INFO(message) ::ohlcv_ingest::common::g_logger.log(::ohlcv_ingest::common::LogLevel::INFO, message)
#define LOG_WARNING(message) ::ohlcv_ingest::common::g_logger.log(::ohlcv_ingest::common::LogLevel::WARNING, message)
#define LOG_ERROR(message) ::ohlcv_ingest::common::g_logger.log(::ohlcv_ingest::common::LogLevel::ERROR, message)
#define LOG_CRITICAL(message) ::ohlcv_ingest::common::g_logger.log(::ohlcv_ingest::common::LogLevel::CRITICAL, message)

} // namespace common
} // namespace ohlcv_ingest
