/**
 * @file Error.cpp
 * @brief Error code names and context wrapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "tkl/core/Error.hpp"

namespace tkl::core {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                  return "none";
        case ErrorCode::kInvalidArgument:       return "invalid_argument";
        case ErrorCode::kInvalidState:          return "invalid_state";
        case ErrorCode::kNotFound:              return "not_found";
        case ErrorCode::kAlreadyExists:         return "already_exists";
        case ErrorCode::kOutOfRange:            return "out_of_range";
        case ErrorCode::kIoError:               return "io_error";
        case ErrorCode::kTimeout:               return "timeout";
        case ErrorCode::kCancelled:             return "cancelled";
        case ErrorCode::kCorruptedData:         return "corrupted_data";
        case ErrorCode::kSerializationFailed:   return "serialization_failed";
        case ErrorCode::kDeserializationFailed: return "deserialization_failed";
        case ErrorCode::kUnknownMessageType:    return "unknown_message_type";
        case ErrorCode::kTransactionFailed:     return "transaction_failed";
        case ErrorCode::kBackendUnavailable:    return "backend_unavailable";
        case ErrorCode::kInternalError:         return "internal_error";
    }
    return "unknown";
}

Error Error::wrap(std::string_view context) const
{
    if (context.empty())
        return *this;

    std::string message;
    message.reserve(context.size() + 2 + _message.size());
    message.append(context);
    message.append(": ");
    message.append(_message);
    return Error{_code, std::move(message), _location};
}

} // namespace tkl::core
