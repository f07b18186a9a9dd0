/**
 * Ring-buffer logging implementation
 */

#include <chrono>
#include <thread>
#include <fstream>
#include <iostream>
#include <string>
#include <cstring>
#include <cctype>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include "ohlcv_ingest/common/logging.h"

namespace ohlcv_ingest {
namespace common {

// Global logger instance
Logger g_logger("ohlcv_ingest");

Logger::Logger(const std::string& name, LogLevel level)
    : name_(name),
      level_(level) {

    for (size_t i = 0; i < BUFFER_SIZE; ++i) {
        buffer_[i].sequence.store(i, std::memory_order_relaxed);
    }

    // Open log file
    file_.open(name + ".log", std::ios::out | std::ios::app);

    // Start flush thread
    flush_thread_ = std::thread(&Logger::flushThreadFunc, this);
}

Logger::~Logger() {
    // Stop flush thread
    running_ = false;
    wake_cv_.notify_all();

    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }

    // Flush remaining logs
    flush();

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    // Skip if level is below current level
    if (level < level_.load()) {
        return;
    }

    // Claim a free slot; a slot the flusher has not drained yet is never overwritten
    LogEntry* entry = nullptr;
    size_t position = write_index_.load(std::memory_order_relaxed);
    while (true) {
        LogEntry& candidate = buffer_[position % BUFFER_SIZE];
        size_t sequence = candidate.sequence.load(std::memory_order_acquire);
        auto diff = static_cast<std::ptrdiff_t>(sequence) - static_cast<std::ptrdiff_t>(position);

        if (diff == 0) {
            if (write_index_.compare_exchange_weak(position, position + 1, std::memory_order_relaxed)) {
                entry = &candidate;
                break;
            }
        } else if (diff < 0) {
            // Buffer full
            dropped_.fetch_add(1, std::memory_order_relaxed);
            break;
        } else {
            position = write_index_.load(std::memory_order_relaxed);
        }
    }

    if (entry) {
        entry->timestamp = getCurrentNanoTime();
        entry->level = level;
        entry->thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

        // Copy message (truncate if too long)
        std::strncpy(entry->message, message.c_str(), sizeof(entry->message) - 1);
        entry->message[sizeof(entry->message) - 1] = '\0';

        entry->sequence.store(position + 1, std::memory_order_release);
    }

    if (level >= LogLevel::ERROR) {
        std::cerr << "[" << logLevelToString(level) << "] " << message << std::endl;
    }
}

void Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(file_mutex_);

    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << file_path.parent_path()
                      << ": " << ec.message() << std::endl;
            return;
        }
    }

    std::ofstream next(path, std::ios::out | std::ios::app);
    if (!next.is_open()) {
        std::cerr << "Cannot open log file " << path << std::endl;
        return;
    }

    if (file_.is_open()) {
        file_.close();
    }
    file_ = std::move(next);
}

void Logger::setLevel(const std::string& level_str) {
    level_ = stringToLogLevel(level_str);
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

void Logger::setFlushInterval(std::chrono::milliseconds interval) {
    flush_interval_ms_ = interval.count() > 0 ? interval.count() : 1000;
    wake_cv_.notify_all();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    writePending();
}

void Logger::writePending() {
    if (!file_.is_open()) {
        return;
    }

    while (true) {
        LogEntry& entry = buffer_[read_index_ % BUFFER_SIZE];

        // Writer has not published yet
        if (entry.sequence.load(std::memory_order_acquire) != read_index_ + 1) {
            break;
        }

        // Format timestamp
        auto ns = std::chrono::nanoseconds(entry.timestamp);
        auto time_point = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(ns));
        std::time_t time_t = std::chrono::system_clock::to_time_t(time_point);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ns).count() % 1000;

        std::tm tm_utc{};
        gmtime_r(&time_t, &tm_utc);

        file_ << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms
              << " [" << logLevelToString(entry.level) << "] "
              << "[" << entry.thread_id << "] "
              << entry.message << '\n';

        entry.sequence.store(read_index_ + BUFFER_SIZE, std::memory_order_release);
        ++read_index_;
    }

    file_.flush();
}

LogLevel Logger::stringToLogLevel(const std::string& level_str) {
    std::string upper;
    upper.reserve(level_str.size());
    for (char c : level_str) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "DEBUG") {
        return LogLevel::DEBUG;
    } else if (upper == "INFO") {
        return LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        return LogLevel::WARNING;
    } else if (upper == "ERROR") {
        return LogLevel::ERROR;
    } else if (upper == "CRITICAL") {
        return LogLevel::CRITICAL;
    } else {
        return LogLevel::INFO;  // Default to INFO
    }
}

const char* Logger::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

void Logger::flushThreadFunc() {
    while (running_) {
        flush();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(flush_interval_ms_.load()),
                          [this]() { return !running_.load(); });
    }
}

uint64_t Logger::getCurrentNanoTime() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count();
}

} // namespace common
} // namespace ohlcv_ingest
