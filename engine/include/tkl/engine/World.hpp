/**
 * @file World.hpp
 * @brief Tick-driven world: registered messages and systems over an
 *        entity command buffer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_ENGINE_WORLD_HPP
    #define TKL_ENGINE_WORLD_HPP

#include <tkl/engine/WorldContext.hpp>
#include <tkl/gamestate/EntityCommandBuffer.hpp>
#include <tkl/message/MessageRegistry.hpp>
#include <tkl/storage/IStorage.hpp>
#include <tkl/txpool/TxPool.hpp>
#include <tkl/core/Expected.hpp>
#include <tkl/core/NonCopyable.hpp>

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tkl::engine {

/** @brief A system mutates game state from the tick's messages. */
using System = std::function<core::Expected<void>(WorldContext&)>;

/**
 * @class World
 * @brief Runs ticks: journal the queued transactions, run every system in
 *        registration order, flush the mutations.
 *
 * Messages and systems are registered before init(); init() recovers an
 * interrupted tick if the storage holds one.  A tick whose system fails is
 * left in flight and is recovered and simulated again before the next one.
 */
class World final : public core::NonCopyable<World>
{
public:
    /** @brief World over a storage it does not own. */
    [[nodiscard]] static core::Expected<std::unique_ptr<World>> create(
        storage::IStorage& storage, std::string namespaceName);

    /** @brief World owning its storage. */
    [[nodiscard]] static core::Expected<std::unique_ptr<World>> create(
        std::unique_ptr<storage::IStorage> storage, std::string namespaceName);

    ~World();

    /** @brief Registers a message type; only before init(). */
    template <message::MessagePayload T>
    [[nodiscard]] core::Expected<std::shared_ptr<const message::MessageType<T>>> registerMessage(
        std::string group, std::string name)
    {
        if (_initialised)
        {
            return core::makeError(core::ErrorCode::kInvalidState,
                                   "messages must be registered before the world starts");
        }
        return _messages.create<T>(std::move(group), std::move(name));
    }

    /** @brief Appends a system; only before init(). */
    [[nodiscard]] core::Expected<void> addSystem(std::string name, System system);

    /**
     * @brief Reads the tick counters and recovers an interrupted tick.
     *
     * Fails with kCorruptedData if the counters violate
     * end <= start <= end + 1.
     */
    [[nodiscard]] core::Expected<void> init();

    /**
     * @brief Queues a message for the next tick.
     * @return The transaction hash (empty when @p tx is null).
     */
    [[nodiscard]] core::Expected<txpool::TxHash> addTransaction(
        txpool::MessageId id, std::any payload,
        std::shared_ptr<const txpool::SignedTransaction> tx = nullptr);

    /** @brief Simulates one tick. */
    [[nodiscard]] core::Expected<void> doTick();

    /** @brief Number of finalized ticks. */
    [[nodiscard]] core::u64 currentTick() const noexcept { return _currentTick; }

    [[nodiscard]] bool isInitialised() const noexcept { return _initialised; }

    /** @brief True while a started tick awaits recovery. */
    [[nodiscard]] bool hasTickInFlight() const noexcept { return _inFlight; }

    [[nodiscard]] core::usize queuedTransactions() const noexcept { return _pool.amountOfTxs(); }

    [[nodiscard]] const std::string& namespaceName() const noexcept { return _namespaceName; }

    [[nodiscard]] const message::MessageRegistry& messages() const noexcept { return _messages; }

    [[nodiscard]] gamestate::EntityCommandBuffer& commandBuffer() noexcept { return *_buffer; }

    [[nodiscard]] storage::IStorage& storage() noexcept { return *_storage; }

private:
    World(std::unique_ptr<storage::IStorage> owned, storage::IStorage& storage,
          std::string namespaceName);

    core::Expected<void> runSystems(core::u64 tick, const txpool::TxPool& pool);
    core::Expected<void> recoverInFlight();

    std::unique_ptr<storage::IStorage>              _ownedStorage;
    storage::IStorage*                              _storage;
    std::string                                     _namespaceName;
    message::MessageRegistry                        _messages;
    std::unique_ptr<gamestate::EntityCommandBuffer> _buffer;
    std::vector<std::pair<std::string, System>>     _systems;
    txpool::TxPool                                  _pool;
    core::u64                                       _currentTick{0};
    bool                                            _initialised{false};
    bool                                            _inFlight{false};
};

} // namespace tkl::engine

#endif // TKL_ENGINE_WORLD_HPP
