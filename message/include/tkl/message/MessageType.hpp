/**
 * @file MessageType.hpp
 * @brief IMessageType implementation for a concrete payload type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_MESSAGE_MESSAGETYPE_HPP
    #define TKL_MESSAGE_MESSAGETYPE_HPP

#include <tkl/message/IMessageType.hpp>
#include <tkl/serial/Bitstream.hpp>
#include <tkl/core/Concepts.hpp>

#include <concepts>
#include <utility>

namespace tkl::message {

/**
 * @brief A payload that can travel through the journal: default
 *        constructible, equality comparable, and serializable to a
 *        serial::Bitstream.
 */
template <typename T>
concept MessagePayload = core::SerializableTo<T, serial::Bitstream>
                      && std::equality_comparable<T>
                      && std::copy_constructible<T>;

// /////////////////////////////////////////////////////////////////////////////
/// @class MessageType
/// @brief Descriptor binding a payload type @p T to its wire codec.
// /////////////////////////////////////////////////////////////////////////////
template <MessagePayload T>
class MessageType final : public IMessageType
{
public:
    using Payload = T;

    MessageType(std::string group, std::string name)
        : _group{std::move(group)}
        , _name{std::move(name)}
    {}

    [[nodiscard]] MessageId id() const noexcept override { return _id; }

    [[nodiscard]] core::Expected<void> setId(MessageId id) override
    {
        if (_id != 0)
        {
            return core::makeError(core::ErrorCode::kAlreadyExists,
                                   "message " + fullName() + " already has id " + std::to_string(_id));
        }
        _id = id;
        return {};
    }

    [[nodiscard]] const std::string& name() const noexcept override { return _name; }
    [[nodiscard]] const std::string& group() const noexcept override { return _group; }

    [[nodiscard]] core::Expected<core::Bytes> encode(const std::any& payload) const override
    {
        const T* typed = std::any_cast<T>(&payload);
        if (typed == nullptr)
        {
            return core::makeError(core::ErrorCode::kSerializationFailed,
                                   "payload is not a " + fullName() + " message");
        }
        return encodeTyped(*typed);
    }

    [[nodiscard]] core::Expected<core::Bytes> encodeTyped(const T& payload) const
    {
        serial::Bitstream stream;
        auto written = payload.serialize(stream);
        if (!written)
        {
            return core::makeError(core::ErrorCode::kSerializationFailed,
                                   "failed to encode " + fullName() + ": " + written.error().message());
        }
        return stream.takeBytes();
    }

    [[nodiscard]] core::Expected<std::any> decode(std::span<const core::byte> bytes) const override
    {
        auto typed = decodeTyped(bytes);
        if (!typed)
        {
            return std::unexpected(std::move(typed.error()));
        }
        return std::any{std::move(*typed)};
    }

    [[nodiscard]] core::Expected<T> decodeTyped(std::span<const core::byte> bytes) const
    {
        serial::Bitstream stream{bytes};
        T payload{};
        auto read = payload.deserialize(stream);
        if (!read)
        {
            return core::makeError(core::ErrorCode::kDeserializationFailed,
                                   "failed to decode " + fullName() + ": " + read.error().message());
        }
        if (!stream.exhausted())
        {
            return core::makeError(core::ErrorCode::kDeserializationFailed,
                                   "failed to decode " + fullName() + ": " +
                                   std::to_string(stream.bitsRemaining() / 8) + " trailing bytes");
        }
        return payload;
    }

    [[nodiscard]] bool equal(const std::any& lhs, const std::any& rhs) const override
    {
        const T* a = std::any_cast<T>(&lhs);
        const T* b = std::any_cast<T>(&rhs);
        return a != nullptr && b != nullptr && *a == *b;
    }

private:
    std::string _group;
    std::string _name;
    MessageId   _id{0};
};

} // namespace tkl::message

#endif // TKL_MESSAGE_MESSAGETYPE_HPP
