#pragma once

#include <stdexcept>
#include <string>

namespace skydome {

class SkydomeError : public std::runtime_error {
public:
    explicit SkydomeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SkydomeError {
public:
    explicit ConfigError(const std::string& message)
        : SkydomeError("Config error: " + message) {}
};

class ValidationError : public SkydomeError {
public:
    explicit ValidationError(const std::string& message)
        : SkydomeError("Validation error: " + message) {}
};

class IOError : public SkydomeError {
public:
    explicit IOError(const std::string& message)
        : SkydomeError("I/O error: " + message) {}
};

// Manifest, photo or mask file absent, or a manifest record lacks a field.
class InputMissingError : public IOError {
public:
    explicit InputMissingError(const std::string& message)
        : IOError("Input missing: " + message) {}
};

// Image or JSON content cannot be parsed.
class DecodeError : public IOError {
public:
    explicit DecodeError(const std::string& message)
        : IOError("Decode failure: " + message) {}
};

// An output artifact cannot be written.
class SerializationError : public IOError {
public:
    explicit SerializationError(const std::string& message)
        : IOError("Serialization failure: " + message) {}
};

class PhotoProcessingError : public SkydomeError {
public:
    PhotoProcessingError(int index, const std::string& message)
        : SkydomeError("Photo " + std::to_string(index) + " failed: " + message) {}
};

class BatchFatalError : public SkydomeError {
public:
    explicit BatchFatalError(const std::string& message)
        : SkydomeError("Batch fatal: " + message) {}
};

} // namespace skydome
