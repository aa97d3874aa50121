#pragma once

#include <stdexcept>
#include <string>

// Invalid or conflicting service configuration. Fatal to the call, not to the process.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Lookup of a service name that was never registered.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message) : std::runtime_error(message) {}
};
