#pragma once

#include <stdexcept>
#include <string>

namespace matchwatch {

// Missing or invalid startup configuration. The only fatal error class.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Transport or protocol failure talking to the remote state service.
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Screen grab or frame preprocessing failure.
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Request failure or timeout talking to the image classifier.
class ClassifierError : public std::runtime_error {
public:
    explicit ClassifierError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace matchwatch
