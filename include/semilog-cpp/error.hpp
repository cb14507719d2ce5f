/// @file error.hpp
/// @brief Error types for the semilog-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace semilog_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    encoding_error,     ///< An entity could not be encoded.
    decoding_error,     ///< Persisted bytes are malformed or corrupt.
    storage_error,      ///< The replication substrate failed to read or write.
    invalid_device,     ///< A device id does not fit the identifier scheme.
    invalid_config,     ///< A configuration file or value is invalid.
    invalid_operation,  ///< An operation is invalid in the current context.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::encoding_error:    return "encoding_error";
        case ErrorKind::decoding_error:    return "decoding_error";
        case ErrorKind::storage_error:     return "storage_error";
        case ErrorKind::invalid_device:    return "invalid_device";
        case ErrorKind::invalid_config:    return "invalid_config";
        case ErrorKind::invalid_operation: return "invalid_operation";
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

/// Exception carrying an Error; thrown by operations that abort.
///
/// what() returns "<kind>: <message>".
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    /// The structured error.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace semilog_cpp
