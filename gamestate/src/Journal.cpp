/**
 * @file Journal.cpp
 * @brief Pending-transaction journal codec.
 *
 * Wire layout: u32 entry count, then each PendingTransaction in order.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/gamestate/Journal.hpp>
#include <tkl/serial/Bitstream.hpp>

#include <string>
#include <unordered_map>

namespace tkl::gamestate::journal {

namespace {

std::unordered_map<txpool::MessageId, const message::IMessageType*> indexById(
    const message::MessageTypeList& messages)
{
    std::unordered_map<txpool::MessageId, const message::IMessageType*> index;
    index.reserve(messages.size());
    for (const auto& type : messages)
    {
        index.emplace(type->id(), type.get());
    }
    return index;
}

} // namespace

core::Expected<std::vector<PendingTransaction>> collect(
    const message::MessageTypeList& messages, const txpool::TxPool& pool)
{
    const auto index = indexById(messages);
    for (auto id : pool.typeIds())
    {
        if (!index.contains(id))
        {
            return core::makeError(core::ErrorCode::kUnknownMessageType,
                                   "pool holds transactions of unregistered message type " +
                                   std::to_string(id));
        }
    }

    std::vector<PendingTransaction> entries;
    entries.reserve(pool.amountOfTxs());
    for (const auto& type : messages)
    {
        for (const auto& txData : pool.forType(type->id()))
        {
            auto bytes = type->encode(txData.msg);
            if (!bytes)
            {
                return core::wrapError(bytes.error(), "failed to encode " + type->fullName());
            }
            entries.emplace_back(type->id(), txData.txHash, std::move(*bytes), txData.tx);
        }
    }
    return entries;
}

core::Expected<core::Bytes> encode(std::span<const PendingTransaction> entries)
{
    serial::Bitstream stream;
    stream.writeU32(static_cast<core::u32>(entries.size()));
    for (const auto& entry : entries)
    {
        auto written = entry.serialize(stream);
        if (!written)
        {
            return core::makeError(core::ErrorCode::kSerializationFailed,
                                   "failed to serialize pending transaction: " + written.error().message());
        }
    }
    return stream.takeBytes();
}

core::Expected<std::vector<PendingTransaction>> decode(std::span<const core::byte> bytes)
{
    serial::Bitstream stream{bytes};

    auto count = stream.readU32();
    if (!count)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               "failed to read journal length: " + count.error().message());
    }

    std::vector<PendingTransaction> entries;
    for (core::u32 i = 0; i < *count; ++i)
    {
        PendingTransaction entry;
        auto read = entry.deserialize(stream);
        if (!read)
        {
            return core::makeError(core::ErrorCode::kDeserializationFailed,
                                   "failed to read journal entry " + std::to_string(i) + ": " +
                                   read.error().message());
        }
        entries.push_back(std::move(entry));
    }

    if (!stream.exhausted())
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               "journal has " + std::to_string(stream.bitsRemaining() / 8) +
                               " trailing bytes");
    }
    return entries;
}

core::Expected<txpool::TxPool> rebuild(
    const message::MessageTypeList& messages, std::span<const PendingTransaction> entries)
{
    const auto index = indexById(messages);

    txpool::TxPool pool;
    for (const auto& entry : entries)
    {
        const auto it = index.find(entry.typeId);
        if (it == index.end())
        {
            return core::makeError(core::ErrorCode::kUnknownMessageType,
                                   "message type descriptor not found for id " +
                                   std::to_string(entry.typeId));
        }

        auto payload = it->second->decode(entry.data);
        if (!payload)
        {
            return core::wrapError(payload.error(), "failed to decode " + it->second->fullName());
        }

        if (entry.tx && entry.tx->hash() != entry.txHash)
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                                   "journal hash " + entry.txHash + " does not match its transaction");
        }

        pool.addTransaction(entry.typeId, std::move(*payload), entry.tx);
    }
    return pool;
}

} // namespace tkl::gamestate::journal
