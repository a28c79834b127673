/**
 * @file World.cpp
 * @brief World implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/engine/World.hpp>
#include <tkl/core/Log.hpp>

#include <string>

namespace tkl::engine {

namespace {

constexpr const char* kTag = "world";

} // namespace

World::World(std::unique_ptr<storage::IStorage> owned, storage::IStorage& storage,
             std::string namespaceName)
    : _ownedStorage{std::move(owned)}
    , _storage{&storage}
    , _namespaceName{std::move(namespaceName)}
{}

World::~World() = default;

core::Expected<std::unique_ptr<World>> World::create(storage::IStorage& storage,
                                                     std::string namespaceName)
{
    std::unique_ptr<World> world{new World{nullptr, storage, std::move(namespaceName)}};

    auto buffer = gamestate::EntityCommandBuffer::create(storage);
    if (!buffer)
    {
        return core::wrapError(buffer.error(), "failed to create command buffer");
    }
    world->_buffer = std::move(*buffer);
    return world;
}

core::Expected<std::unique_ptr<World>> World::create(std::unique_ptr<storage::IStorage> storage,
                                                     std::string namespaceName)
{
    if (!storage)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "world needs a storage");
    }
    storage::IStorage& ref = *storage;
    std::unique_ptr<World> world{new World{std::move(storage), ref, std::move(namespaceName)}};

    auto buffer = gamestate::EntityCommandBuffer::create(ref);
    if (!buffer)
    {
        return core::wrapError(buffer.error(), "failed to create command buffer");
    }
    world->_buffer = std::move(*buffer);
    return world;
}

core::Expected<void> World::addSystem(std::string name, System system)
{
    if (_initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "systems must be added before the world starts");
    }
    if (!system)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "system " + name + " is empty");
    }
    _systems.emplace_back(std::move(name), std::move(system));
    return {};
}

core::Expected<void> World::init()
{
    if (_initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "world is already initialised");
    }

    auto ticks = _buffer->getTickNumbers();
    if (!ticks)
    {
        return core::wrapError(ticks.error(), "failed to read tick numbers");
    }
    if (ticks->end > ticks->start || ticks->start > ticks->end + 1)
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
                               "tick counters out of order: start " + std::to_string(ticks->start) +
                               ", end " + std::to_string(ticks->end));
    }

    _currentTick = ticks->end;
    _inFlight    = ticks->inFlight();
    _initialised = true;

    core::Log::info(kTag, _namespaceName + ": " + std::to_string(_messages.size()) + " messages, " +
                          std::to_string(_systems.size()) + " systems, tick " +
                          std::to_string(_currentTick) + " on " + _storage->name() + " storage");

    if (_inFlight)
    {
        TKL_TRY_VOID(recoverInFlight());
    }
    return {};
}

core::Expected<txpool::TxHash> World::addTransaction(
    txpool::MessageId id, std::any payload, std::shared_ptr<const txpool::SignedTransaction> tx)
{
    auto type = _messages.findById(id);
    if (!type)
    {
        return std::unexpected(std::move(type.error()));
    }
    // Reject payloads the journal could not encode before they reach a tick.
    if (auto encoded = (*type)->encode(payload); !encoded)
    {
        return std::unexpected(std::move(encoded.error()));
    }
    return _pool.addTransaction(id, std::move(payload), std::move(tx));
}

core::Expected<void> World::doTick()
{
    if (!_initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "world is not initialised");
    }
    if (_inFlight)
    {
        TKL_TRY_VOID(recoverInFlight());
    }

    if (auto started = _buffer->startNextTick(_messages.messages(), _pool); !started)
    {
        return core::wrapError(started.error(), "failed to start tick " + std::to_string(_currentTick));
    }
    _inFlight = true;

    const txpool::TxPool pool = _pool.copyTransactions();
    TKL_TRY_VOID(runSystems(_currentTick, pool));

    if (auto finalized = _buffer->finalizeTick(); !finalized)
    {
        return core::wrapError(finalized.error(), "failed to finalize tick " + std::to_string(_currentTick));
    }
    _inFlight = false;
    ++_currentTick;
    return {};
}

core::Expected<void> World::runSystems(core::u64 tick, const txpool::TxPool& pool)
{
    WorldContext ctx{tick, pool, *_buffer, _namespaceName};
    for (auto& [name, system] : _systems)
    {
        if (auto result = system(ctx); !result)
        {
            core::Log::error(kTag, "system " + name + " failed at tick " + std::to_string(tick) +
                                   ": " + result.error().message());
            return core::wrapError(result.error(), "system " + name);
        }
    }
    return {};
}

core::Expected<void> World::recoverInFlight()
{
    core::Log::warn(kTag, "tick " + std::to_string(_currentTick) + " was interrupted, recovering");

    auto pool = _buffer->recover(_messages.messages());
    if (!pool)
    {
        return core::wrapError(pool.error(), "failed to recover tick " + std::to_string(_currentTick));
    }

    TKL_TRY_VOID(runSystems(_currentTick, *pool));

    if (auto finalized = _buffer->finalizeTick(); !finalized)
    {
        return core::wrapError(finalized.error(), "failed to finalize recovered tick " +
                                                  std::to_string(_currentTick));
    }

    core::Log::info(kTag, "recovered tick " + std::to_string(_currentTick) + " with " +
                          std::to_string(pool->amountOfTxs()) + " transactions");
    _inFlight = false;
    ++_currentTick;
    return {};
}

} // namespace tkl::engine
