/**
 * @file WorldContext.hpp
 * @brief What a system sees while a tick is simulated.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_ENGINE_WORLDCONTEXT_HPP
    #define TKL_ENGINE_WORLDCONTEXT_HPP

#include <tkl/gamestate/EntityCommandBuffer.hpp>
#include <tkl/message/MessageType.hpp>
#include <tkl/txpool/TxPool.hpp>
#include <tkl/core/Types.hpp>

#include <any>
#include <memory>
#include <string_view>
#include <vector>

namespace tkl::engine {

/**
 * @struct TxMessage
 * @brief A decoded message together with the transaction that carried it.
 */
template <typename T>
struct TxMessage
{
    T                                                msg;
    txpool::TxHash                                   hash;
    std::shared_ptr<const txpool::SignedTransaction> tx;
};

/**
 * @class WorldContext
 * @brief Per-tick view handed to every system.
 *
 * Valid only for the duration of the system call it is passed to.
 */
class WorldContext
{
public:
    WorldContext(core::u64 tick, const txpool::TxPool& pool,
                 gamestate::EntityCommandBuffer& buffer, std::string_view namespaceName) noexcept
        : _tick{tick}
        , _pool{pool}
        , _buffer{buffer}
        , _namespaceName{namespaceName}
    {}

    /** @brief Number of the tick being simulated. */
    [[nodiscard]] core::u64 currentTick() const noexcept { return _tick; }

    [[nodiscard]] std::string_view namespaceName() const noexcept { return _namespaceName; }

    [[nodiscard]] const txpool::TxPool& pool() const noexcept { return _pool; }

    [[nodiscard]] gamestate::EntityCommandBuffer& commandBuffer() noexcept { return _buffer; }

    /** @brief Messages of @p type queued for this tick, in submission order. */
    template <message::MessagePayload T>
    [[nodiscard]] std::vector<TxMessage<T>> messagesOf(const message::MessageType<T>& type) const
    {
        std::vector<TxMessage<T>> out;
        for (const auto& txData : _pool.forType(type.id()))
        {
            if (const T* payload = std::any_cast<T>(&txData.msg))
            {
                out.push_back(TxMessage<T>{*payload, txData.txHash, txData.tx});
            }
        }
        return out;
    }

private:
    core::u64                       _tick;
    const txpool::TxPool&           _pool;
    gamestate::EntityCommandBuffer& _buffer;
    std::string_view                _namespaceName;
};

} // namespace tkl::engine

#endif // TKL_ENGINE_WORLDCONTEXT_HPP
