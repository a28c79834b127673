/**
 * @file TxPool.hpp
 * @brief Per-tick pool of submitted transactions, grouped by message type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_TXPOOL_TXPOOL_HPP
    #define TKL_TXPOOL_TXPOOL_HPP

#include <tkl/txpool/SignedTransaction.hpp>
#include <tkl/txpool/Types.hpp>
#include <tkl/core/Types.hpp>

#include <any>
#include <memory>
#include <span>
#include <unordered_map>
#include <vector>

namespace tkl::txpool {

/** @brief One submitted transaction: decoded payload plus its envelope. */
struct TxData
{
    MessageId                                id{0};
    std::any                                 msg;
    TxHash                                   txHash;
    std::shared_ptr<const SignedTransaction> tx;
};

/**
 * @class TxPool
 * @brief Multi-map MessageId -> ordered transactions for one tick.
 *
 * Insertion order is preserved per message type.  The pool is a plain value
 * type; callers that share it between threads guard it themselves.
 */
class TxPool
{
public:
    TxPool();
    ~TxPool();

    TxPool(TxPool&&) noexcept;
    TxPool& operator=(TxPool&&) noexcept;
    TxPool(const TxPool&) = delete;
    TxPool& operator=(const TxPool&) = delete;

    /**
     * @brief Appends a transaction under @p id.
     * @param msg Decoded payload (its dynamic type belongs to @p id).
     * @param tx  Source envelope; may be null for system-generated input.
     * @return The transaction hash (empty if @p tx is null).
     */
    TxHash addTransaction(MessageId id, std::any msg,
                          std::shared_ptr<const SignedTransaction> tx);

    /** @brief Transactions submitted under @p id, in submission order. */
    [[nodiscard]] std::span<const TxData> forType(MessageId id) const noexcept;

    /** @brief Message types present, in order of their first submission. */
    [[nodiscard]] const std::vector<MessageId>& typeIds() const noexcept;

    /** @brief Total number of transactions across all types. */
    [[nodiscard]] core::usize amountOfTxs() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    /**
     * @brief Moves the current contents into a new pool and leaves this one
     *        empty.
     */
    [[nodiscard]] TxPool copyTransactions();

private:
    std::unordered_map<MessageId, std::vector<TxData>> _byType;
    std::vector<MessageId>                             _order;
    core::usize                                        _count{0};
};

} // namespace tkl::txpool

#endif // TKL_TXPOOL_TXPOOL_HPP
