/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes of the tick ledger and a lightweight Error value
 * type carrying the code, a human-readable message, and the source location
 * where the error was raised.  Errors crossing a layer boundary are wrapped
 * with that layer's context; the code is never rewritten on the way up.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_CORE_ERROR_HPP
    #define TKL_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace tkl::core {

/**
 * @brief Project-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kAlreadyExists,
    kOutOfRange,
    kIoError,
    kTimeout,
    kCancelled,
    kCorruptedData,

    kSerializationFailed,
    kDeserializationFailed,
    kUnknownMessageType,

    kTransactionFailed,
    kBackendUnavailable,

    kInternalError,
};

/// @brief Stable lowercase name of an error code (for logs).
[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /// @brief True if this error reports a key that was never written.
    [[nodiscard]] bool isNotFound() const { return _code == ErrorCode::kNotFound; }

    /**
     * @brief Prefix the message with @p context, keeping code and origin.
     *
     * The wrapped message reads "context: original message".
     */
    [[nodiscard]] Error wrap(std::string_view context) const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

/// @brief Wrap @p error with @p context and return it as an unexpected.
[[nodiscard]] inline auto wrapError(const Error &error, std::string_view context)
{
    return std::unexpected<Error>(error.wrap(context));
}

} // namespace tkl::core

#endif // TKL_CORE_ERROR_HPP
