#pragma once

#include <stdexcept>
#include <string>

namespace noisedet {

// Malformed or missing request fields. Raised before any storage or
// subprocess access.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Anything that goes wrong while resolving the object or running the tool.
class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace noisedet
