#pragma once

#include <stdexcept>
#include <string>

namespace flypath {

class FlypathError : public std::runtime_error {
public:
    explicit FlypathError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public FlypathError {
public:
    explicit ConfigError(const std::string& message)
        : FlypathError("Config error: " + message) {}
};

class ValidationError : public FlypathError {
public:
    explicit ValidationError(const std::string& message)
        : FlypathError("Validation error: " + message) {}
};

class IOError : public FlypathError {
public:
    explicit IOError(const std::string& message)
        : FlypathError("I/O error: " + message) {}
};

class InvalidImageError : public FlypathError {
public:
    explicit InvalidImageError(const std::string& message)
        : FlypathError("Invalid image: " + message) {}
};

class ScoringError : public FlypathError {
public:
    explicit ScoringError(const std::string& message)
        : FlypathError("Scoring error: " + message) {}
};

class RenderError : public FlypathError {
public:
    explicit RenderError(const std::string& message)
        : FlypathError("Render error: " + message) {}
};

class EncodingError : public FlypathError {
public:
    explicit EncodingError(const std::string& message)
        : FlypathError("Encoding error: " + message) {}
};

} // namespace flypath
