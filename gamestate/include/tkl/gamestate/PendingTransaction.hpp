/**
 * @file PendingTransaction.hpp
 * @brief One journal entry: an encoded message and the transaction that
 *        carried it.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef TKL_GAMESTATE_PENDINGTRANSACTION_HPP
    #define TKL_GAMESTATE_PENDINGTRANSACTION_HPP

#include <tkl/txpool/SignedTransaction.hpp>
#include <tkl/txpool/Types.hpp>
#include <tkl/serial/ISerializable.hpp>
#include <tkl/core/Types.hpp>

#include <memory>

namespace tkl::gamestate {

/**
 * @class PendingTransaction
 * @brief Journal entry written by StartNextTick and read back by Recover.
 *
 * @c data holds the payload exactly as produced by the message type's own
 * encoder.  @c tx may be null for messages injected without a signed
 * envelope.
 */
class PendingTransaction final : public serial::ISerializable
{
public:
    PendingTransaction() = default;
    PendingTransaction(txpool::MessageId typeId, txpool::TxHash txHash, core::Bytes data,
                       std::shared_ptr<const txpool::SignedTransaction> tx);

    [[nodiscard]] core::Expected<void> serialize(serial::Bitstream& stream) const override;
    [[nodiscard]] core::Expected<void> deserialize(serial::Bitstream& stream) override;

    [[nodiscard]] bool operator==(const PendingTransaction& other) const noexcept;

    txpool::MessageId                                typeId{0};
    txpool::TxHash                                   txHash;
    core::Bytes                                      data;
    std::shared_ptr<const txpool::SignedTransaction> tx;
};

} // namespace tkl::gamestate

#endif // TKL_GAMESTATE_PENDINGTRANSACTION_HPP
