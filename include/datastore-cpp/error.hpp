/// @file error.hpp
/// @brief Error types for the datastore-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace datastore_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_path,        ///< A path string is malformed.
    circular_reference,  ///< A container is its own ancestor.
    type_mismatch,       ///< A path step expects a container or an index it did not get.
    not_found,           ///< A file or directory does not exist.
    json_decode,         ///< A document could not be decoded as JSON.
    path_traversal,      ///< A file lies outside the configured base directory.
    file_too_large,      ///< A file exceeds the configured size limit.
    io_error,            ///< Reading or writing a file failed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_path:       return "invalid_path";
        case ErrorKind::circular_reference: return "circular_reference";
        case ErrorKind::type_mismatch:      return "type_mismatch";
        case ErrorKind::not_found:          return "not_found";
        case ErrorKind::json_decode:        return "json_decode";
        case ErrorKind::path_traversal:     return "path_traversal";
        case ErrorKind::file_too_large:     return "file_too_large";
        case ErrorKind::io_error:           return "io_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Base class of every exception thrown by the library.
///
/// `what()` is the error message; `error()` exposes the category.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// A path string is empty, whitespace-only, or has an empty segment.
class InvalidPathError : public Exception {
public:
    explicit InvalidPathError(std::string msg)
        : Exception{Error{ErrorKind::invalid_path, std::move(msg)}} {}
};

/// A container was reached again through one of its own descendants.
class CircularReferenceError : public Exception {
public:
    explicit CircularReferenceError(std::string msg)
        : Exception{Error{ErrorKind::circular_reference, std::move(msg)}} {}
};

/// A write could not descend through an existing node.
class TypeMismatchError : public Exception {
public:
    explicit TypeMismatchError(std::string msg)
        : Exception{Error{ErrorKind::type_mismatch, std::move(msg)}} {}
};

// -- Loader-tier errors -------------------------------------------------------

class NotFoundError : public Exception {
public:
    explicit NotFoundError(std::string msg)
        : Exception{Error{ErrorKind::not_found, std::move(msg)}} {}
};

class JsonDecodeError : public Exception {
public:
    explicit JsonDecodeError(std::string msg)
        : Exception{Error{ErrorKind::json_decode, std::move(msg)}} {}
};

class PathTraversalError : public Exception {
public:
    explicit PathTraversalError(std::string msg)
        : Exception{Error{ErrorKind::path_traversal, std::move(msg)}} {}
};

class FileTooLargeError : public Exception {
public:
    explicit FileTooLargeError(std::string msg)
        : Exception{Error{ErrorKind::file_too_large, std::move(msg)}} {}
};

class IoError : public Exception {
public:
    explicit IoError(std::string msg)
        : Exception{Error{ErrorKind::io_error, std::move(msg)}} {}
};

}  // namespace datastore_cpp
