/// @file error.hpp
/// @brief Error types for the bimcollab library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace bimcollab {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    session_not_found,    ///< The session id does not refer to a known session.
    user_not_in_session,  ///< The user is not a member of the session.
    permission_denied,    ///< The user's role lacks the required capability.
    conflict_not_found,   ///< The conflict id is unknown or already resolved.
    invalid_config,       ///< An engine configuration value is malformed.
    engine_stopped,       ///< The engine no longer accepts changes.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::session_not_found:   return "session_not_found";
        case ErrorKind::user_not_in_session: return "user_not_in_session";
        case ErrorKind::permission_denied:   return "permission_denied";
        case ErrorKind::conflict_not_found:  return "conflict_not_found";
        case ErrorKind::invalid_config:      return "invalid_config";
        case ErrorKind::engine_stopped:      return "engine_stopped";
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

/// Exception thrown by every failing Engine operation.
///
/// what() returns the message; the structured Error is available
/// through error() and kind().
class CollabError : public std::runtime_error {
public:
    explicit CollabError(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    CollabError(ErrorKind kind, std::string message)
        : CollabError{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace bimcollab
