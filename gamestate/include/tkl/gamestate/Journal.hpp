/**
 * @file Journal.hpp
 * @brief Pending-transaction journal codec.
 *
 * The journal is the single durable record of the transactions a tick was
 * started with.  Entries are grouped by message type, in the order of the
 * message type list, and keep submission order within a type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef TKL_GAMESTATE_JOURNAL_HPP
    #define TKL_GAMESTATE_JOURNAL_HPP

#include <tkl/gamestate/PendingTransaction.hpp>
#include <tkl/message/IMessageType.hpp>
#include <tkl/txpool/TxPool.hpp>
#include <tkl/core/Expected.hpp>

#include <span>
#include <vector>

namespace tkl::gamestate::journal {

/**
 * @brief Flattens @p pool into journal entries, encoding every payload
 *        with its own message type.
 *
 * Fails with kUnknownMessageType if the pool holds a type id absent from
 * @p messages, and with the encoder's error if a payload cannot be encoded.
 */
[[nodiscard]] core::Expected<std::vector<PendingTransaction>> collect(
    const message::MessageTypeList& messages, const txpool::TxPool& pool);

/** @brief Serializes the entry sequence as one value. */
[[nodiscard]] core::Expected<core::Bytes> encode(std::span<const PendingTransaction> entries);

/** @brief Inverse of encode(); kDeserializationFailed on malformed input. */
[[nodiscard]] core::Expected<std::vector<PendingTransaction>> decode(std::span<const core::byte> bytes);

/**
 * @brief Decodes each entry's payload with its message type and rebuilds
 *        the pool, preserving journal order.
 *
 * An entry whose type id is not in @p messages is fatal
 * (kUnknownMessageType): the type was removed or renamed since the journal
 * was written.
 */
[[nodiscard]] core::Expected<txpool::TxPool> rebuild(
    const message::MessageTypeList& messages, std::span<const PendingTransaction> entries);

} // namespace tkl::gamestate::journal

#endif // TKL_GAMESTATE_JOURNAL_HPP
