/**
 * Exception taxonomy for the ingestion pipeline
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ohlcv_ingest {

// Base class for every error the pipeline raises on purpose
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

// Exchange asked us to slow down; retried by the fetcher
class RateLimitError : public PipelineError {
public:
    explicit RateLimitError(const std::string& message) : PipelineError(message) {}
};

// Transport failure or 5xx; the window may be collected again
class TransientNetworkError : public PipelineError {
public:
    explicit TransientNetworkError(const std::string& message) : PipelineError(message) {}
};

// Exchange answered with an error that retrying will not fix
class ExchangeError : public PipelineError {
public:
    explicit ExchangeError(const std::string& message) : PipelineError(message) {}
};

// Required columns absent from the batch
class SchemaError : public PipelineError {
public:
    explicit SchemaError(const std::string& message) : PipelineError(message) {}
};

// Missing-value ratio above the configured threshold
class QualityThresholdError : public PipelineError {
public:
    QualityThresholdError(const std::string& message, std::string column, double ratio)
        : PipelineError(message), column_(std::move(column)), ratio_(ratio) {}

    const std::string& column() const { return column_; }
    double ratio() const { return ratio_; }

private:
    std::string column_;
    double ratio_;
};

// Nothing to write
class EmptyDataError : public PipelineError {
public:
    explicit EmptyDataError(const std::string& message) : PipelineError(message) {}
};

// Filesystem failure while persisting
class IOError : public PipelineError {
public:
    explicit IOError(const std::string& message) : PipelineError(message) {}
};

// Caller cancelled the batch or its deadline passed
class CancelledError : public PipelineError {
public:
    explicit CancelledError(const std::string& message) : PipelineError(message) {}
};

// Invalid or unreadable configuration
class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& message) : PipelineError(message) {}
};

} // namespace ohlcv_ingest
