// Crossfeed - Error Taxonomy

#pragma once

#include <stdexcept>
#include <string>

namespace crossfeed {

// Base for every error raised by the oracle core
class OracleError : public std::runtime_error {
public:
    explicit OracleError(const std::string& msg) : std::runtime_error(msg) {}
};

// Network or asset missing from the endpoint registry
class FeedNotFoundError : public OracleError {
public:
    explicit FeedNotFoundError(const std::string& msg) : OracleError(msg) {}
};

// Connection failure, timeout or malformed response from a price source
class SourceUnavailableError : public OracleError {
public:
    explicit SourceUnavailableError(const std::string& msg) : OracleError(msg) {}
};

// Non-positive or stale price; the sample is dropped before comparison
class InvalidSampleError : public OracleError {
public:
    explicit InvalidSampleError(const std::string& msg) : OracleError(msg) {}
};

// Unreadable or inconsistent configuration, fatal at startup
class ConfigError : public OracleError {
public:
    explicit ConfigError(const std::string& msg) : OracleError(msg) {}
};

}  // namespace crossfeed
