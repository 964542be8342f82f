#pragma once
#include <stdexcept>
#include <string>

// Chain RPC or price source failure. Retried on the next poll tick.
class TransientUpstreamError : public std::runtime_error {
public:
    explicit TransientUpstreamError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed event or query filter. Never retried.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// SQLite failure or use of a closed store.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid configuration. Fatal at startup.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};
