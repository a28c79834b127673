/**
 * @file EntityCommandBuffer.hpp
 * @brief Tick-synchronized, crash-recoverable command buffer between the
 *        simulation and a transactional key-value storage.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef TKL_GAMESTATE_ENTITYCOMMANDBUFFER_HPP
    #define TKL_GAMESTATE_ENTITYCOMMANDBUFFER_HPP

#include <tkl/gamestate/Archetype.hpp>
#include <tkl/gamestate/Types.hpp>
#include <tkl/message/IMessageType.hpp>
#include <tkl/storage/IStorage.hpp>
#include <tkl/txpool/TxPool.hpp>
#include <tkl/core/Expected.hpp>
#include <tkl/core/NonCopyable.hpp>

#include <memory>
#include <span>
#include <vector>

namespace tkl::gamestate {

/**
 * @class EntityCommandBuffer
 * @brief Owns the tick protocol and the in-memory entity/component
 *        mutation set.
 *
 * Tick protocol:
 * @code
 *   getTickNumbers()              -- at startup
 *   recover(messages)             -- only if start != end
 *   startNextTick(messages, pool) -- journal + ++start, one transaction
 *   ... record mutations ...
 *   finalizeTick()                -- mutations + ++end, one transaction
 * @endcode
 *
 * Mutations stay in memory until finalizeTick() and are flushed as one
 * unit; reads go through the pending set before reaching storage.
 * The buffer borrows the storage, which must outlive it.  Single writer:
 * none of the methods are thread-safe.
 */
class EntityCommandBuffer final : public core::NonCopyable<EntityCommandBuffer>
{
public:
    /**
     * @brief Creates a buffer over @p storage and loads the archetype table.
     * @return The buffer, or the storage error that prevented loading.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<EntityCommandBuffer>> create(
        storage::IStorage& storage);

    ~EntityCommandBuffer();

    // --------------------------------------------------------------------- //
    //  Tick protocol                                                         //
    // --------------------------------------------------------------------- //

    /** @brief Reads (start, end); an absent counter reads as 0. */
    [[nodiscard]] core::Expected<TickNumbers> getTickNumbers();

    /**
     * @brief Journals @p pool and increments the start counter atomically.
     *
     * Entries are grouped by type in the order of @p messages.  Fails with
     * kInvalidState if a tick is already in flight.  On any failure nothing
     * is committed.
     */
    [[nodiscard]] core::Expected<void> startNextTick(
        const message::MessageTypeList& messages, const txpool::TxPool& pool);

    /**
     * @brief Flushes the mutation set and increments the end counter
     *        atomically.
     *
     * Fails with kInvalidState if no tick is in flight.  On failure the
     * mutation set is kept so the call can be retried.
     */
    [[nodiscard]] core::Expected<void> finalizeTick();

    /**
     * @brief Rebuilds the pool given to the last startNextTick() from the
     *        journal.
     *
     * An unknown message type in the journal is fatal (kUnknownMessageType).
     */
    [[nodiscard]] core::Expected<txpool::TxPool> recover(const message::MessageTypeList& messages);

    // --------------------------------------------------------------------- //
    //  Mutations                                                             //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<EntityId> createEntity(std::span<const ComponentValue> components);

    [[nodiscard]] core::Expected<std::vector<EntityId>> createManyEntities(
        core::usize count, std::span<const ComponentValue> components);

    /** @brief Overwrites a component the entity already has (kNotFound otherwise). */
    [[nodiscard]] core::Expected<void> setComponent(
        EntityId entity, ComponentId component, std::span<const core::byte> value);

    /** @brief Pending write, then pending delete, then storage. */
    [[nodiscard]] core::Expected<core::Bytes> getComponent(EntityId entity, ComponentId component);

    /** @brief Adds a component and moves the entity to the wider archetype. */
    [[nodiscard]] core::Expected<void> addComponent(
        EntityId entity, ComponentId component, std::span<const core::byte> value);

    /** @brief Removes a component; removing the last one is rejected. */
    [[nodiscard]] core::Expected<void> removeComponent(EntityId entity, ComponentId component);

    [[nodiscard]] core::Expected<void> removeEntity(EntityId entity);

    // --------------------------------------------------------------------- //
    //  Archetypes                                                            //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<ArchetypeId> archetypeFor(EntityId entity);

    [[nodiscard]] core::Expected<Archetype> archetype(ArchetypeId id) const;

    [[nodiscard]] core::Expected<std::vector<EntityId>> entitiesIn(ArchetypeId id);

    [[nodiscard]] core::usize archetypeCount() const noexcept;

    // --------------------------------------------------------------------- //
    //  Pending set                                                           //
    // --------------------------------------------------------------------- //

    /** @brief Drops every pending mutation and reloads archetypes from storage. */
    [[nodiscard]] core::Expected<void> discardPending();

    /** @brief Number of commands the next finalizeTick() would queue before
     *         the end-tick increment. */
    [[nodiscard]] core::usize pendingMutationCount() const noexcept;

    /** @brief Entity mappings, active lists and id counter held in memory. */
    [[nodiscard]] core::usize cachedEntryCount() const noexcept;

private:
    explicit EntityCommandBuffer(storage::IStorage& storage);

    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tkl::gamestate

#endif // TKL_GAMESTATE_ENTITYCOMMANDBUFFER_HPP
