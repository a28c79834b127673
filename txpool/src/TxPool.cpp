/**
 * @file TxPool.cpp
 * @brief TxPool implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/txpool/TxPool.hpp>

#include <utility>

namespace tkl::txpool {

TxPool::TxPool() = default;
TxPool::~TxPool() = default;
TxPool::TxPool(TxPool&&) noexcept = default;
TxPool& TxPool::operator=(TxPool&&) noexcept = default;

TxHash TxPool::addTransaction(MessageId id, std::any msg,
                              std::shared_ptr<const SignedTransaction> tx)
{
    TxHash hash = tx ? tx->hash() : TxHash{};

    auto [it, inserted] = _byType.try_emplace(id);
    if (inserted)
    {
        _order.push_back(id);
    }
    it->second.push_back(TxData{id, std::move(msg), hash, std::move(tx)});
    ++_count;
    return hash;
}

std::span<const TxData> TxPool::forType(MessageId id) const noexcept
{
    const auto it = _byType.find(id);
    if (it == _byType.end())
    {
        return {};
    }
    return it->second;
}

const std::vector<MessageId>& TxPool::typeIds() const noexcept
{
    return _order;
}

core::usize TxPool::amountOfTxs() const noexcept
{
    return _count;
}

bool TxPool::empty() const noexcept
{
    return _count == 0;
}

TxPool TxPool::copyTransactions()
{
    TxPool out;
    out._byType = std::move(_byType);
    out._order  = std::move(_order);
    out._count  = std::exchange(_count, 0);
    _byType.clear();
    _order.clear();
    return out;
}

} // namespace tkl::txpool
