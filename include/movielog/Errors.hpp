#pragma once

#include <stdexcept>
#include <string>

namespace movielog {

// Base of every error the core raises.
class MovieLogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed document. path() is empty when the text did not come from a file.
class ParseError : public MovieLogError {
public:
    explicit ParseError(const std::string& message, std::string path = "")
        : MovieLogError(path.empty() ? message : path + ": " + message),
          path_(std::move(path)),
          detail_(message) {}

    const std::string& path() const { return path_; }
    const std::string& detail() const { return detail_; }

private:
    std::string path_;
    std::string detail_;
};

class NotFound : public MovieLogError {
public:
    using MovieLogError::MovieLogError;
};

class NoMatch : public MovieLogError {
public:
    using MovieLogError::MovieLogError;
};

class SchemaInvariantViolation : public MovieLogError {
public:
    using MovieLogError::MovieLogError;
};

class ExternalServiceError : public MovieLogError {
public:
    using MovieLogError::MovieLogError;
};

// Filesystem write or remove failed.
class StorageError : public MovieLogError {
public:
    using MovieLogError::MovieLogError;
};

} // namespace movielog
