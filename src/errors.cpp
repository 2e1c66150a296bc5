#include "errors.hpp"

namespace kushn {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:            return "I/O error";
        case ErrorKind::GlobPattern:   return "Invalid glob pattern";
        case ErrorKind::Traversal:     return "Directory traversal error";
        case ErrorKind::Serialization: return "Serialization error";
    }
    return "Error";
}

Error::Error(ErrorKind kind, const std::string& message, std::string path)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message)
    , kind_(kind)
    , path_(std::move(path))
{
}

PatternError::PatternError(const std::string& pattern, const std::string& reason)
    : Error(ErrorKind::GlobPattern, "'" + pattern + "': " + reason, pattern)
    , reason_(reason)
{
}

} // namespace kushn
