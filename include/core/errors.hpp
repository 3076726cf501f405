#pragma once

#include <stdexcept>
#include <string>

namespace apollo::core {

/**
 * Error categories raised by the buffer and analysis core
 */
enum class ErrorCode {
    IndexOutOfRange,        // Channel or sample index beyond the bound range
    ShapeMismatch,          // Channels of unequal length, or frame count mismatch
    InvalidConfiguration,   // Non-positive or non-finite sample rate
    InvalidBufferLength     // Zero-length transform requested
};

const char* errorCodeToString(ErrorCode code);

/**
 * Base class for all analysis core errors. Raised synchronously at the
 * offending call and never recovered inside the core.
 */
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode getCode() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class IndexOutOfRangeError : public AnalysisError {
public:
    explicit IndexOutOfRangeError(const std::string& message)
        : AnalysisError(ErrorCode::IndexOutOfRange, message) {}
};

class ShapeMismatchError : public AnalysisError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : AnalysisError(ErrorCode::ShapeMismatch, message) {}
};

class InvalidConfigurationError : public AnalysisError {
public:
    explicit InvalidConfigurationError(const std::string& message)
        : AnalysisError(ErrorCode::InvalidConfiguration, message) {}
};

class InvalidBufferLengthError : public AnalysisError {
public:
    explicit InvalidBufferLengthError(const std::string& message)
        : AnalysisError(ErrorCode::InvalidBufferLength, message) {}
};

} // namespace apollo::core
