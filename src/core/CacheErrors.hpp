#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Malformed caller input: empty key, negative TTL, bad configuration.
// Never retried.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Backend could not be reached or the connection broke mid-command.
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message)
        : std::runtime_error(message) {}

    virtual bool retryable() const noexcept { return true; }
};

// No pooled connection became available within the wait timeout.
class PoolExhaustedError : public ConnectionError {
public:
    explicit PoolExhaustedError(const std::string& message)
        : ConnectionError(message) {}
};

// The backend answered with a protocol level error reply.
class CacheBackendError : public std::runtime_error {
public:
    explicit CacheBackendError(const std::string& message)
        : std::runtime_error(message) {}

    bool retryable() const noexcept { return false; }
};

#endif // CACHEERRORS_HPP
