#pragma once

#include <stdexcept>
#include <string>

namespace logship {

// Invalid initialization arguments or configuration input.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A log file that does not exist or does not follow the naming convention.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace logship
