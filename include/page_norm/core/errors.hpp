#pragma once

#include <stdexcept>
#include <string>

namespace page_norm {

class PageNormError : public std::runtime_error {
public:
    explicit PageNormError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PageNormError {
public:
    explicit ConfigError(const std::string& message)
        : PageNormError("Config error: " + message) {}
};

class ValidationError : public PageNormError {
public:
    explicit ValidationError(const std::string& message)
        : PageNormError("Validation error: " + message) {}
};

class IOError : public PageNormError {
public:
    explicit IOError(const std::string& message)
        : PageNormError("I/O error: " + message) {}
};

// Output directory or encoder failure. Fatal to the whole run.
class OutputError : public IOError {
public:
    explicit OutputError(const std::string& message)
        : IOError("Output error: " + message) {}
};

class DecodeError : public PageNormError {
public:
    explicit DecodeError(const std::string& message)
        : PageNormError("Decode error: " + message) {}
};

class MissingEstimateError : public PageNormError {
public:
    explicit MissingEstimateError(const std::string& page_id)
        : PageNormError("Missing bounds estimate for page: " + page_id) {}
};

class ComputationError : public PageNormError {
public:
    explicit ComputationError(const std::string& message)
        : PageNormError("Computation error: " + message) {}
};

// Short machine-readable kind used in failure records and events.
inline std::string error_kind(const std::exception& e) {
    if (dynamic_cast<const MissingEstimateError*>(&e)) return "MissingEstimateError";
    if (dynamic_cast<const DecodeError*>(&e)) return "DecodeError";
    if (dynamic_cast<const ComputationError*>(&e)) return "ComputationError";
    if (dynamic_cast<const OutputError*>(&e)) return "OutputError";
    if (dynamic_cast<const IOError*>(&e)) return "IOError";
    if (dynamic_cast<const ValidationError*>(&e)) return "ValidationError";
    if (dynamic_cast<const ConfigError*>(&e)) return "ConfigError";
    return "Error";
}

} // namespace page_norm
