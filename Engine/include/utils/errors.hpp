/**
 * @file errors.hpp
 * @brief Exception taxonomy shared by every engine component
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Coalesce {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Invalid component configuration. Thrown from constructors only.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg) : Error("configuration: " + msg) {}
};

/// Invalid identifiers, names or call arguments.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& msg) : Error("validation: " + msg) {}
};

/// A hard resource cap was hit. Never raised for values below the cap.
class SafetyLimitExceeded : public Error {
public:
    SafetyLimitExceeded(const std::string& limit_name, const std::string& msg)
        : Error("safety limit " + limit_name + " exceeded: " + msg), limit_name_(limit_name) {}

    const std::string& limit_name() const noexcept { return limit_name_; }

private:
    std::string limit_name_;
};

/// Failure reported by a Store implementation.
class StorageError : public Error {
public:
    explicit StorageError(const std::string& msg) : Error("storage: " + msg) {}
};

} // namespace Coalesce
