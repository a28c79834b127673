/**
 * @file PendingTransaction.cpp
 * @brief PendingTransaction serialization.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/gamestate/PendingTransaction.hpp>
#include <tkl/serial/Bitstream.hpp>

#include <utility>

namespace tkl::gamestate {

PendingTransaction::PendingTransaction(txpool::MessageId typeId_, txpool::TxHash txHash_,
                                       core::Bytes data_,
                                       std::shared_ptr<const txpool::SignedTransaction> tx_)
    : typeId{typeId_}
    , txHash{std::move(txHash_)}
    , data{std::move(data_)}
    , tx{std::move(tx_)}
{}

core::Expected<void> PendingTransaction::serialize(serial::Bitstream& stream) const
{
    stream.writeU32(typeId);
    stream.writeString(txHash);
    stream.writeBytes(data);
    stream.writeBool(tx != nullptr);
    if (tx)
    {
        TKL_TRY_VOID(tx->serialize(stream));
    }
    return {};
}

core::Expected<void> PendingTransaction::deserialize(serial::Bitstream& stream)
{
    typeId = TKL_TRY(stream.readU32());
    txHash = TKL_TRY(stream.readString());
    data   = TKL_TRY(stream.readBytes());

    const bool hasTx = TKL_TRY(stream.readBool());
    if (!hasTx)
    {
        tx.reset();
        return {};
    }

    auto decoded = std::make_shared<txpool::SignedTransaction>();
    TKL_TRY_VOID(decoded->deserialize(stream));
    tx = std::move(decoded);
    return {};
}

bool PendingTransaction::operator==(const PendingTransaction& other) const noexcept
{
    if (typeId != other.typeId || txHash != other.txHash || data != other.data)
    {
        return false;
    }
    if (!tx || !other.tx)
    {
        return tx == other.tx;
    }
    return *tx == *other.tx;
}

} // namespace tkl::gamestate
