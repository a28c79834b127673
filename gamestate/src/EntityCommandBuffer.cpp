/**
 * @file EntityCommandBuffer.cpp
 * @brief EntityCommandBuffer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/gamestate/EntityCommandBuffer.hpp>
#include <tkl/gamestate/Journal.hpp>
#include <tkl/gamestate/Keys.hpp>
#include <tkl/serial/Bitstream.hpp>
#include <tkl/core/Log.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace tkl::gamestate {

namespace {

constexpr const char* kTag = "ecb";

/// @brief Wraps @p error with @p context, logs it, and returns it.
core::Unexpected fail(const core::Error& error, std::string_view context)
{
    core::Error wrapped = error.wrap(context);
    core::Log::error(kTag, wrapped.message());
    return core::Unexpected{std::move(wrapped)};
}

core::Bytes encodeEntityIds(std::span<const EntityId> ids)
{
    serial::Bitstream stream;
    stream.writeU32(static_cast<core::u32>(ids.size()));
    for (auto id : ids)
    {
        stream.writeU64(id);
    }
    return stream.takeBytes();
}

core::Expected<std::vector<EntityId>> decodeEntityIds(std::span<const core::byte> bytes)
{
    serial::Bitstream stream{bytes};
    const core::u32 count = TKL_TRY(stream.readU32());

    std::vector<EntityId> ids;
    for (core::u32 i = 0; i < count; ++i)
    {
        ids.push_back(TKL_TRY(stream.readU64()));
    }
    return ids;
}

core::Bytes encodeArchetypes(std::span<const Archetype> archetypes)
{
    serial::Bitstream stream;
    stream.writeU32(static_cast<core::u32>(archetypes.size()));
    for (const auto& archetype : archetypes)
    {
        stream.writeU64(archetype.bits());
    }
    return stream.takeBytes();
}

core::Expected<std::vector<Archetype>> decodeArchetypes(std::span<const core::byte> bytes)
{
    serial::Bitstream stream{bytes};
    const core::u32 count = TKL_TRY(stream.readU32());

    std::vector<Archetype> archetypes;
    for (core::u32 i = 0; i < count; ++i)
    {
        archetypes.push_back(Archetype::fromBits(TKL_TRY(stream.readU64())));
    }
    return archetypes;
}

/// @brief Reads a u64 counter, mapping an absent key to 0.
core::Expected<core::u64> readCounter(storage::IStorage& storage, std::string_view key)
{
    auto value = storage.getUInt64(key);
    if (value)
    {
        return *value;
    }
    if (value.error().isNotFound())
    {
        return core::u64{0};
    }
    return std::unexpected(std::move(value.error()));
}

} // namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct EntityCommandBuffer::Impl
{
    struct ActiveList
    {
        std::vector<EntityId> ids;
        bool                  modified{false};
    };

    explicit Impl(storage::IStorage& storage) : backend{storage} {}

    storage::IStorage& backend;

    std::vector<Archetype>   archetypes;
    std::vector<ArchetypeId> pendingArchIds;

    std::optional<EntityId> nextEntityId;
    bool                    nextEntityIdDirty{false};

    std::map<EntityId, std::optional<ArchetypeId>> entityArch;
    std::set<EntityId>                             entityArchDirty;

    std::map<ArchetypeId, ActiveList> active;

    std::map<std::string, core::Bytes, std::less<>> writes;
    std::set<std::string, std::less<>>              deletes;

    core::Expected<void> loadArchetypes()
    {
        archetypes.clear();
        pendingArchIds.clear();

        auto bytes = backend.getBytes(keys::kArchetypes);
        if (!bytes)
        {
            if (bytes.error().isNotFound())
            {
                return {};
            }
            return fail(bytes.error(), "failed to load archetypes");
        }

        auto decoded = decodeArchetypes(*bytes);
        if (!decoded)
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                                   "archetype table is malformed: " + decoded.error().message());
        }
        archetypes = std::move(*decoded);
        return {};
    }

    void clearCaches()
    {
        pendingArchIds.clear();
        nextEntityId.reset();
        nextEntityIdDirty = false;
        entityArch.clear();
        entityArchDirty.clear();
        active.clear();
        writes.clear();
        deletes.clear();
    }

    /// @brief Id of @p archetype, registering it as pending if new.
    ArchetypeId archetypeIdFor(const Archetype& archetype)
    {
        const auto it = std::find(archetypes.begin(), archetypes.end(), archetype);
        if (it != archetypes.end())
        {
            return static_cast<ArchetypeId>(std::distance(archetypes.begin(), it));
        }
        const auto id = static_cast<ArchetypeId>(archetypes.size());
        archetypes.push_back(archetype);
        pendingArchIds.push_back(id);
        core::Log::debug(kTag, "new archetype " + std::to_string(id) + " with " +
                               std::to_string(archetype.count()) + " components");
        return id;
    }

    core::Expected<EntityId> allocateEntityId()
    {
        if (!nextEntityId)
        {
            auto loaded = readCounter(backend, keys::kNextEntityId);
            if (!loaded)
            {
                return fail(loaded.error(), "failed to get next entity id");
            }
            nextEntityId = *loaded;
        }
        const EntityId id = (*nextEntityId)++;
        nextEntityIdDirty = true;
        return id;
    }

    core::Expected<ArchetypeId> lookupArchetype(EntityId entity)
    {
        if (const auto it = entityArch.find(entity); it != entityArch.end())
        {
            if (!it->second)
            {
                return core::makeError(core::ErrorCode::kNotFound,
                                       "entity " + std::to_string(entity) + " does not exist");
            }
            return *it->second;
        }

        auto stored = backend.getUInt64(keys::entityArchetype(entity));
        if (!stored)
        {
            if (stored.error().isNotFound())
            {
                return core::makeError(core::ErrorCode::kNotFound,
                                       "entity " + std::to_string(entity) + " does not exist");
            }
            return fail(stored.error(), "failed to get archetype for entity " + std::to_string(entity));
        }
        if (*stored >= archetypes.size())
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                                   "entity " + std::to_string(entity) + " maps to unknown archetype " +
                                   std::to_string(*stored));
        }

        const auto id = static_cast<ArchetypeId>(*stored);
        entityArch.emplace(entity, id);
        return id;
    }

    core::Expected<ActiveList*> activeList(ArchetypeId id)
    {
        if (const auto it = active.find(id); it != active.end())
        {
            return &it->second;
        }

        ActiveList list;
        auto bytes = backend.getBytes(keys::activeEntities(id));
        if (bytes)
        {
            auto ids = decodeEntityIds(*bytes);
            if (!ids)
            {
                return core::makeError(core::ErrorCode::kCorruptedData,
                                       "active entity list of archetype " + std::to_string(id) +
                                       " is malformed: " + ids.error().message());
            }
            list.ids = std::move(*ids);
        }
        else if (!bytes.error().isNotFound())
        {
            return fail(bytes.error(), "failed to get active entities of archetype " + std::to_string(id));
        }

        return &active.emplace(id, std::move(list)).first->second;
    }

    core::Expected<void> moveEntity(EntityId entity, ArchetypeId from, ArchetypeId to)
    {
        ActiveList* source = TKL_TRY(activeList(from));
        std::erase(source->ids, entity);
        source->modified = true;

        ActiveList* target = TKL_TRY(activeList(to));
        target->ids.push_back(entity);
        target->modified = true;

        entityArch[entity] = to;
        entityArchDirty.insert(entity);
        return {};
    }

    void queueWrite(std::string key, std::span<const core::byte> value)
    {
        deletes.erase(key);
        writes.insert_or_assign(std::move(key), core::Bytes(value.begin(), value.end()));
    }

    void queueDelete(std::string key)
    {
        if (auto it = writes.find(key); it != writes.end())
        {
            writes.erase(it);
        }
        deletes.insert(std::move(key));
    }

    core::Expected<void> validate(std::span<const ComponentValue> components) const
    {
        if (components.empty())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "an entity needs at least one component");
        }
        Archetype seen;
        for (const auto& component : components)
        {
            if (!Archetype::isValidComponent(component.id))
            {
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "component id " + std::to_string(component.id) + " is out of range");
            }
            if (seen.has(component.id))
            {
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "component id " + std::to_string(component.id) + " given twice");
            }
            seen.add(component.id);
        }
        return {};
    }

    core::Expected<EntityId> create(std::span<const ComponentValue> components, ArchetypeId archId)
    {
        const EntityId entity = TKL_TRY(allocateEntityId());

        ActiveList* list = TKL_TRY(activeList(archId));
        list->ids.push_back(entity);
        list->modified = true;

        entityArch[entity] = archId;
        entityArchDirty.insert(entity);

        for (const auto& component : components)
        {
            queueWrite(keys::componentValue(component.id, entity), component.value);
        }
        return entity;
    }

    core::usize pendingCount() const noexcept
    {
        const auto modifiedLists = static_cast<core::usize>(std::count_if(
            active.begin(), active.end(), [](const auto& entry) { return entry.second.modified; }));

        return entityArchDirty.size() + (nextEntityIdDirty ? 1u : 0u) + writes.size() +
               deletes.size() + modifiedLists + (pendingArchIds.empty() ? 0u : 1u);
    }

    /// @brief Queues every pending mutation into @p pipe, in flush order.
    core::Expected<void> flush(storage::IPipeline& pipe) const
    {
        for (auto entity : entityArchDirty)
        {
            const auto& archId = entityArch.at(entity);
            if (archId)
            {
                TKL_TRY_VOID(pipe.setUInt64(keys::entityArchetype(entity), *archId));
            }
            else
            {
                TKL_TRY_VOID(pipe.remove(keys::entityArchetype(entity)));
            }
        }

        if (nextEntityIdDirty)
        {
            TKL_TRY_VOID(pipe.setUInt64(keys::kNextEntityId, *nextEntityId));
        }

        for (const auto& [key, value] : writes)
        {
            TKL_TRY_VOID(pipe.setBytes(key, value));
        }
        for (const auto& key : deletes)
        {
            TKL_TRY_VOID(pipe.remove(key));
        }

        for (const auto& [archId, list] : active)
        {
            if (list.modified)
            {
                TKL_TRY_VOID(pipe.setBytes(keys::activeEntities(archId), encodeEntityIds(list.ids)));
            }
        }

        if (!pendingArchIds.empty())
        {
            TKL_TRY_VOID(pipe.setBytes(keys::kArchetypes, encodeArchetypes(archetypes)));
        }
        return {};
    }

};

// ========================================================================== //
//  Lifecycle                                                                 //
// ========================================================================== //

EntityCommandBuffer::EntityCommandBuffer(storage::IStorage& storage)
    : _impl{std::make_unique<Impl>(storage)}
{}

EntityCommandBuffer::~EntityCommandBuffer() = default;

core::Expected<std::unique_ptr<EntityCommandBuffer>> EntityCommandBuffer::create(
    storage::IStorage& storage)
{
    std::unique_ptr<EntityCommandBuffer> buffer{new EntityCommandBuffer{storage}};
    TKL_TRY_VOID(buffer->_impl->loadArchetypes());
    core::Log::debug(kTag, "command buffer over " + std::string{storage.name()} + " storage, " +
                           std::to_string(buffer->archetypeCount()) + " archetypes");
    return buffer;
}

// ========================================================================== //
//  Tick protocol                                                             //
// ========================================================================== //

core::Expected<TickNumbers> EntityCommandBuffer::getTickNumbers()
{
    auto start = readCounter(_impl->backend, keys::kStartTick);
    if (!start)
    {
        return fail(start.error(), "failed to get start tick");
    }
    auto end = readCounter(_impl->backend, keys::kEndTick);
    if (!end)
    {
        return fail(end.error(), "failed to get end tick");
    }
    return TickNumbers{*start, *end};
}

core::Expected<void> EntityCommandBuffer::startNextTick(
    const message::MessageTypeList& messages, const txpool::TxPool& pool)
{
    const TickNumbers ticks = TKL_TRY(getTickNumbers());
    if (ticks.inFlight())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "tick " + std::to_string(ticks.end) + " is still in flight");
    }

    auto entries = journal::collect(messages, pool);
    if (!entries)
    {
        return fail(entries.error(), "failed to collect pending transactions");
    }
    auto bytes = journal::encode(*entries);
    if (!bytes)
    {
        return fail(bytes.error(), "failed to encode pending transactions");
    }

    auto pipe = _impl->backend.startTransaction();
    if (!pipe)
    {
        return fail(pipe.error(), "failed to start transaction");
    }
    if (auto r = (*pipe)->setBytes(keys::kPendingTransactions, *bytes); !r)
    {
        return fail(r.error(), "failed to set pending transaction");
    }
    if (auto r = (*pipe)->increment(keys::kStartTick); !r)
    {
        return fail(r.error(), "failed to increment start tick key");
    }
    if (auto r = (*pipe)->commit(); !r)
    {
        return fail(r.error(), "failed to end transaction");
    }

    core::Log::debug(kTag, "started tick " + std::to_string(ticks.start) + " with " +
                           std::to_string(entries->size()) + " transactions");
    return {};
}

core::Expected<void> EntityCommandBuffer::finalizeTick()
{
    const TickNumbers ticks = TKL_TRY(getTickNumbers());
    if (!ticks.inFlight())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "no tick in flight to finalize (tick " + std::to_string(ticks.end) + ")");
    }

    auto pipe = _impl->backend.startTransaction();
    if (!pipe)
    {
        return fail(pipe.error(), "failed to start transaction");
    }
    if (auto r = _impl->flush(**pipe); !r)
    {
        return fail(r.error(), "failed to make storage commands pipe");
    }
    const core::usize commands = (*pipe)->queuedCount();
    if (auto r = (*pipe)->increment(keys::kEndTick); !r)
    {
        return fail(r.error(), "failed to increment end tick key");
    }
    if (auto r = (*pipe)->commit(); !r)
    {
        return fail(r.error(), "failed to end transaction");
    }

    // Storage now holds everything; only the archetype table stays cached.
    _impl->clearCaches();
    core::Log::debug(kTag, "finalized tick " + std::to_string(ticks.end) + " with " +
                           std::to_string(commands) + " commands");
    return {};
}

core::Expected<txpool::TxPool> EntityCommandBuffer::recover(const message::MessageTypeList& messages)
{
    auto bytes = _impl->backend.getBytes(keys::kPendingTransactions);
    if (!bytes)
    {
        if (!bytes.error().isNotFound())
        {
            return fail(bytes.error(), "failed to get pending transactions");
        }
        // No tick was ever started: nothing to replay.
        TKL_TRY_VOID(discardPending());
        core::Log::debug(kTag, "no pending transactions to recover");
        return txpool::TxPool{};
    }
    auto entries = journal::decode(*bytes);
    if (!entries)
    {
        return fail(entries.error(), "failed to decode pending transactions");
    }
    auto pool = journal::rebuild(messages, *entries);
    if (!pool)
    {
        return fail(pool.error(), "failed to recover pending transactions");
    }

    // The recovered tick is simulated again from scratch.
    TKL_TRY_VOID(discardPending());

    core::Log::debug(kTag, "recovered " + std::to_string(pool->amountOfTxs()) + " transactions");
    return pool;
}

// ========================================================================== //
//  Mutations                                                                 //
// ========================================================================== //

core::Expected<EntityId> EntityCommandBuffer::createEntity(std::span<const ComponentValue> components)
{
    TKL_TRY_VOID(_impl->validate(components));

    std::vector<ComponentId> ids;
    ids.reserve(components.size());
    for (const auto& component : components)
    {
        ids.push_back(component.id);
    }
    const ArchetypeId archId = _impl->archetypeIdFor(Archetype{ids});
    return _impl->create(components, archId);
}

core::Expected<std::vector<EntityId>> EntityCommandBuffer::createManyEntities(
    core::usize count, std::span<const ComponentValue> components)
{
    TKL_TRY_VOID(_impl->validate(components));

    std::vector<ComponentId> ids;
    for (const auto& component : components)
    {
        ids.push_back(component.id);
    }
    const ArchetypeId archId = _impl->archetypeIdFor(Archetype{ids});

    std::vector<EntityId> entities;
    entities.reserve(count);
    for (core::usize i = 0; i < count; ++i)
    {
        entities.push_back(TKL_TRY(_impl->create(components, archId)));
    }
    return entities;
}

core::Expected<void> EntityCommandBuffer::setComponent(
    EntityId entity, ComponentId component, std::span<const core::byte> value)
{
    const ArchetypeId archId = TKL_TRY(_impl->lookupArchetype(entity));
    if (!_impl->archetypes[archId].has(component))
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "entity " + std::to_string(entity) + " has no component " +
                               std::to_string(component));
    }
    _impl->queueWrite(keys::componentValue(component, entity), value);
    return {};
}

core::Expected<core::Bytes> EntityCommandBuffer::getComponent(EntityId entity, ComponentId component)
{
    const ArchetypeId archId = TKL_TRY(_impl->lookupArchetype(entity));
    if (!_impl->archetypes[archId].has(component))
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "entity " + std::to_string(entity) + " has no component " +
                               std::to_string(component));
    }

    const std::string key = keys::componentValue(component, entity);
    if (const auto it = _impl->writes.find(key); it != _impl->writes.end())
    {
        return it->second;
    }
    if (_impl->deletes.contains(key))
    {
        return core::makeError(core::ErrorCode::kNotFound, key + " is pending deletion");
    }

    auto stored = _impl->backend.getBytes(key);
    if (!stored)
    {
        return core::wrapError(stored.error(), "failed to get component value");
    }
    return std::move(*stored);
}

core::Expected<void> EntityCommandBuffer::addComponent(
    EntityId entity, ComponentId component, std::span<const core::byte> value)
{
    if (!Archetype::isValidComponent(component))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "component id " + std::to_string(component) + " is out of range");
    }

    const ArchetypeId from = TKL_TRY(_impl->lookupArchetype(entity));
    Archetype wider = _impl->archetypes[from];
    if (wider.has(component))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "entity " + std::to_string(entity) + " already has component " +
                               std::to_string(component));
    }
    wider.add(component);

    const ArchetypeId to = _impl->archetypeIdFor(wider);
    TKL_TRY_VOID(_impl->moveEntity(entity, from, to));
    _impl->queueWrite(keys::componentValue(component, entity), value);
    return {};
}

core::Expected<void> EntityCommandBuffer::removeComponent(EntityId entity, ComponentId component)
{
    const ArchetypeId from = TKL_TRY(_impl->lookupArchetype(entity));
    Archetype narrower = _impl->archetypes[from];
    if (!narrower.has(component))
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "entity " + std::to_string(entity) + " has no component " +
                               std::to_string(component));
    }
    if (narrower.count() == 1)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "cannot remove the last component of entity " + std::to_string(entity));
    }
    narrower.remove(component);

    const ArchetypeId to = _impl->archetypeIdFor(narrower);
    TKL_TRY_VOID(_impl->moveEntity(entity, from, to));
    _impl->queueDelete(keys::componentValue(component, entity));
    return {};
}

core::Expected<void> EntityCommandBuffer::removeEntity(EntityId entity)
{
    const ArchetypeId archId = TKL_TRY(_impl->lookupArchetype(entity));

    for (auto component : _impl->archetypes[archId].componentIds())
    {
        _impl->queueDelete(keys::componentValue(component, entity));
    }

    auto* list = TKL_TRY(_impl->activeList(archId));
    std::erase(list->ids, entity);
    list->modified = true;

    _impl->entityArch[entity] = std::nullopt;
    _impl->entityArchDirty.insert(entity);
    return {};
}

// ========================================================================== //
//  Archetypes                                                                //
// ========================================================================== //

core::Expected<ArchetypeId> EntityCommandBuffer::archetypeFor(EntityId entity)
{
    return _impl->lookupArchetype(entity);
}

core::Expected<Archetype> EntityCommandBuffer::archetype(ArchetypeId id) const
{
    if (id >= _impl->archetypes.size())
    {
        return core::makeError(core::ErrorCode::kNotFound, "no archetype " + std::to_string(id));
    }
    return _impl->archetypes[id];
}

core::Expected<std::vector<EntityId>> EntityCommandBuffer::entitiesIn(ArchetypeId id)
{
    if (id >= _impl->archetypes.size())
    {
        return core::makeError(core::ErrorCode::kNotFound, "no archetype " + std::to_string(id));
    }
    const auto* list = TKL_TRY(_impl->activeList(id));
    return list->ids;
}

core::usize EntityCommandBuffer::archetypeCount() const noexcept
{
    return _impl->archetypes.size();
}

// ========================================================================== //
//  Pending set                                                               //
// ========================================================================== //

core::Expected<void> EntityCommandBuffer::discardPending()
{
    _impl->clearCaches();
    return _impl->loadArchetypes();
}

core::usize EntityCommandBuffer::pendingMutationCount() const noexcept
{
    return _impl->pendingCount();
}

core::usize EntityCommandBuffer::cachedEntryCount() const noexcept
{
    return _impl->entityArch.size() + _impl->active.size() + (_impl->nextEntityId ? 1u : 0u);
}

} // namespace tkl::gamestate
