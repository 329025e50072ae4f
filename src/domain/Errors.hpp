/**
 * @file Errors.hpp
 * @brief Error taxonomy shared by the classification and migration core.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace tidyfile::domain {

/**
 * @enum ErrorKind
 * @brief Failure category carried by outcome records.
 */
enum class ErrorKind {
    None,
    IO,                    ///< Missing file, permission denied, failed copy.
    Backend,               ///< Summarizer unreachable or timed out.
    ClassificationFailure, ///< No directory matched at any depth.
    Collision,             ///< Target rename candidates exhausted.
    LogCorruption,         ///< Malformed session or result document.
    Timeout,               ///< Per-file processing deadline exceeded.
    Cancelled              ///< Stop requested before the file was started.
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::IO: return "io";
        case ErrorKind::Backend: return "backend";
        case ErrorKind::ClassificationFailure: return "classification_failure";
        case ErrorKind::Collision: return "collision";
        case ErrorKind::LogCorruption: return "log_corruption";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "none";
}

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& what) : std::runtime_error(what) {}
};

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& what) : std::runtime_error(what) {}
};

class ClassificationFailure : public std::runtime_error {
public:
    explicit ClassificationFailure(const std::string& what) : std::runtime_error(what) {}
};

class CollisionError : public std::runtime_error {
public:
    explicit CollisionError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Raised when an on-disk document exists but cannot be parsed. */
class LogCorruption : public std::runtime_error {
public:
    explicit LogCorruption(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tidyfile::domain
