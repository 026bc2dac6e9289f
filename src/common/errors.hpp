#pragma once

#include <stdexcept>
#include <string>

namespace auditray {

// Malformed configuration value, e.g. an icon theme with invalid characters.
class ValidationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A single advisory check failed. Never escapes the coordinator.
class CheckerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The configuration file exists but cannot be used. Fatal at startup.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace auditray
