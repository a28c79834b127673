/**
 * @file MessageRegistry.cpp
 * @brief MessageRegistry implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/message/MessageRegistry.hpp>
#include <tkl/core/Log.hpp>

namespace tkl::message {

MessageRegistry::MessageRegistry() = default;
MessageRegistry::~MessageRegistry() = default;

core::Expected<MessageId> MessageRegistry::registerMessage(std::shared_ptr<IMessageType> type)
{
    if (!type)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "cannot register a null message type");
    }

    std::string fullName = type->fullName();
    if (_byName.contains(fullName))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "message " + fullName + " is already registered");
    }

    const auto id = static_cast<MessageId>(_messages.size() + 1);
    TKL_TRY_VOID(type->setId(id));

    const core::usize index = _messages.size();
    _messages.push_back(std::move(type));
    _byId.emplace(id, index);
    _byName.emplace(fullName, index);

    core::Log::debug("message", "registered " + fullName + " as id " + std::to_string(id));
    return id;
}

core::Expected<std::shared_ptr<const IMessageType>> MessageRegistry::findById(MessageId id) const
{
    auto it = _byId.find(id);
    if (it == _byId.end())
    {
        return core::makeError(core::ErrorCode::kUnknownMessageType,
                               "no message registered with id " + std::to_string(id));
    }
    return _messages[it->second];
}

core::Expected<std::shared_ptr<const IMessageType>> MessageRegistry::findByName(
    std::string_view fullName) const
{
    auto it = _byName.find(std::string{fullName});
    if (it == _byName.end())
    {
        return core::makeError(core::ErrorCode::kUnknownMessageType,
                               "no message registered as " + std::string{fullName});
    }
    return _messages[it->second];
}

const MessageTypeList& MessageRegistry::messages() const noexcept { return _messages; }

core::usize MessageRegistry::size() const noexcept { return _messages.size(); }

} // namespace tkl::message
