/**
 * @file MessageRegistry.hpp
 * @brief Registry of message types known to the simulation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_MESSAGE_MESSAGEREGISTRY_HPP
    #define TKL_MESSAGE_MESSAGEREGISTRY_HPP

#include <tkl/message/MessageType.hpp>
#include <tkl/message/IMessageType.hpp>
#include <tkl/core/Expected.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tkl::message {

// /////////////////////////////////////////////////////////////////////////////
/// @class MessageRegistry
/// @brief Assigns MessageIds (1, 2, ...) in registration order and resolves
///        descriptors by id or by full name.
///
/// Ids are positional: a process that registers the same messages in the
/// same order gets the same ids, which is what lets a recovering process
/// decode the journal written by the crashed one.
// /////////////////////////////////////////////////////////////////////////////
class MessageRegistry
{
public:
    MessageRegistry();
    ~MessageRegistry();

    MessageRegistry(const MessageRegistry&) = delete;
    MessageRegistry& operator=(const MessageRegistry&) = delete;

    /**
     * @brief Registers @p type and assigns its id.
     * @return The assigned id; kAlreadyExists on a duplicate full name or an
     *         already-registered descriptor, kInvalidArgument on null.
     */
    [[nodiscard]] core::Expected<MessageId> registerMessage(std::shared_ptr<IMessageType> type);

    /** @brief Creates and registers a MessageType<T>. */
    template <MessagePayload T>
    [[nodiscard]] core::Expected<std::shared_ptr<const MessageType<T>>> create(
        std::string group, std::string name)
    {
        auto type = std::make_shared<MessageType<T>>(std::move(group), std::move(name));
        TKL_TRY_VOID(registerMessage(type));
        return std::shared_ptr<const MessageType<T>>{std::move(type)};
    }

    /** @brief Descriptor for @p id; kUnknownMessageType if absent. */
    [[nodiscard]] core::Expected<std::shared_ptr<const IMessageType>> findById(MessageId id) const;

    /** @brief Descriptor for "<group>.<name>"; kUnknownMessageType if absent. */
    [[nodiscard]] core::Expected<std::shared_ptr<const IMessageType>> findByName(
        std::string_view fullName) const;

    /** @brief Every registered descriptor, in registration order. */
    [[nodiscard]] const MessageTypeList& messages() const noexcept;

    [[nodiscard]] core::usize size() const noexcept;

private:
    MessageTypeList                                       _messages;
    std::unordered_map<MessageId, core::usize>            _byId;
    std::unordered_map<std::string, core::usize>          _byName;
};

} // namespace tkl::message

#endif // TKL_MESSAGE_MESSAGEREGISTRY_HPP
