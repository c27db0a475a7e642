#pragma once

#include <stdexcept>
#include <string>

namespace match {

// Malformed or missing input. Raised before any scoring runs.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Thrown by require_ok() when an allocate/release result is not a success.
class CapacityError : public std::runtime_error {
public:
    explicit CapacityError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace match
