#pragma once

#include <stdexcept>
#include <string>

namespace libgpcov {

// Input or output extents disagree (sliced column counts, paired row counts, ...).
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(const std::string& message) : std::invalid_argument(message) {}
};

// A requested feature is disabled or not implemented for the given settings.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// A kernel or parameter was constructed in a state it can never evaluate from.
class InvariantViolation : public std::invalid_argument {
public:
    explicit InvariantViolation(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace libgpcov
