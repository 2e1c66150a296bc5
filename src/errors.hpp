#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace kushn {

enum class ErrorKind {
    Io,
    GlobPattern,
    Traversal,
    Serialization
};

const char* to_string(ErrorKind kind);

// Base of every failure the library reports. `path` is empty when the
// failure is not tied to a filesystem location.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, std::string path = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& path() const noexcept { return path_; }

private:
    ErrorKind kind_;
    std::string path_;
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message, std::string path = {})
        : Error(ErrorKind::Io, message, std::move(path)) {}
};

class PatternError : public Error {
public:
    PatternError(const std::string& pattern, const std::string& reason);

    const std::string& pattern() const noexcept { return path(); }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

class TraversalError : public Error {
public:
    explicit TraversalError(const std::string& message, std::string path = {})
        : Error(ErrorKind::Traversal, message, std::move(path)) {}
};

class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& message)
        : Error(ErrorKind::Serialization, message) {}
};

} // namespace kushn
