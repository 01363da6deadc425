#pragma once

#include <stdexcept>

// Bad or missing configuration. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection refused, timeout, malformed or non-2xx response.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Filesystem failure on a single operation.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or rejected upload. Maps to HTTP 400.
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
