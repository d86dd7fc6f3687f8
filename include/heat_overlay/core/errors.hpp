#pragma once

#include <stdexcept>
#include <string>

namespace heat_overlay {

class HeatOverlayError : public std::runtime_error {
public:
    explicit HeatOverlayError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public HeatOverlayError {
public:
    explicit ConfigError(const std::string& message)
        : HeatOverlayError("Config error: " + message) {}
};

class ValidationError : public HeatOverlayError {
public:
    explicit ValidationError(const std::string& message)
        : HeatOverlayError("Validation error: " + message) {}
};

// Input rejected before decoding because it exceeds the configured byte limit.
class InputTooLargeError : public ValidationError {
public:
    explicit InputTooLargeError(const std::string& message)
        : ValidationError(message) {}
};

class IOError : public HeatOverlayError {
public:
    explicit IOError(const std::string& message)
        : HeatOverlayError("I/O error: " + message) {}
};

// Stage contract violated by the caller (shape, channel or size mismatch).
class PipelineError : public HeatOverlayError {
public:
    explicit PipelineError(const std::string& message)
        : HeatOverlayError("Pipeline error: " + message) {}
};

} // namespace heat_overlay
