/**
 * @file IMessageType.hpp
 * @brief Message type descriptor: identity plus payload codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_MESSAGE_IMESSAGETYPE_HPP
    #define TKL_MESSAGE_IMESSAGETYPE_HPP

#include <tkl/txpool/Types.hpp>
#include <tkl/core/Types.hpp>
#include <tkl/core/Expected.hpp>

#include <any>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tkl::message {

using txpool::MessageId;

// /////////////////////////////////////////////////////////////////////////////
/// @class IMessageType
/// @brief Capability pair {encode, decode} for one message type.
///
/// Payloads travel type-erased in a std::any whose dynamic type is owned by
/// the descriptor; codecs are resolved by MessageId lookup, never by
/// inspecting the payload.
// /////////////////////////////////////////////////////////////////////////////
class IMessageType
{
public:
    virtual ~IMessageType() = default;

    /// @brief Identifier assigned at registration (0 until registered).
    [[nodiscard]] virtual MessageId id() const noexcept = 0;

    /// @brief Assigns the identifier; fails if one was already assigned.
    [[nodiscard]] virtual core::Expected<void> setId(MessageId id) = 0;

    /// @brief Short name, e.g. "move".
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    /// @brief Group the message belongs to, e.g. "game".
    [[nodiscard]] virtual const std::string& group() const noexcept = 0;

    /// @brief "<group>.<name>".
    [[nodiscard]] std::string fullName() const { return group() + "." + name(); }

    /// @brief Encodes a payload of this type; kSerializationFailed otherwise.
    [[nodiscard]] virtual core::Expected<core::Bytes> encode(const std::any& payload) const = 0;

    /// @brief Decodes bytes produced by encode(); kDeserializationFailed on
    ///        malformed or trailing input.
    [[nodiscard]] virtual core::Expected<std::any> decode(std::span<const core::byte> bytes) const = 0;

    /// @brief Payload equality; false if either side is not of this type.
    [[nodiscard]] virtual bool equal(const std::any& lhs, const std::any& rhs) const = 0;
};

/// @brief Ordered set of descriptors handed to the tick protocol.
using MessageTypeList = std::vector<std::shared_ptr<const IMessageType>>;

} // namespace tkl::message

#endif // TKL_MESSAGE_IMESSAGETYPE_HPP
