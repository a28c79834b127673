/**
 * @file DemoGame.cpp
 * @brief DemoGame implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "DemoGame.hpp"

#include <tkl/txpool/SignedTransaction.hpp>
#include <tkl/core/Log.hpp>

#include <array>

namespace tkl::server {

namespace {

constexpr core::u64 kSpawnEvery = 5;

core::u64 toWire(core::i64 value) { return static_cast<core::u64>(value); }
core::i64 fromWire(core::u64 value) { return static_cast<core::i64>(value); }

} // namespace

// ========================================================================== //
//  Payloads                                                                  //
// ========================================================================== //

core::Expected<void> Spawn::serialize(serial::Bitstream& stream) const
{
    stream.writeString(name);
    stream.writeU64(toWire(x));
    stream.writeU64(toWire(y));
    return {};
}

core::Expected<void> Spawn::deserialize(serial::Bitstream& stream)
{
    name = TKL_TRY(stream.readString());
    x    = fromWire(TKL_TRY(stream.readU64()));
    y    = fromWire(TKL_TRY(stream.readU64()));
    return {};
}

core::Expected<void> Move::serialize(serial::Bitstream& stream) const
{
    stream.writeU64(entity);
    stream.writeU64(toWire(dx));
    stream.writeU64(toWire(dy));
    return {};
}

core::Expected<void> Move::deserialize(serial::Bitstream& stream)
{
    entity = TKL_TRY(stream.readU64());
    dx     = fromWire(TKL_TRY(stream.readU64()));
    dy     = fromWire(TKL_TRY(stream.readU64()));
    return {};
}

core::Bytes Position::encode() const
{
    serial::Bitstream stream;
    stream.writeU64(toWire(x));
    stream.writeU64(toWire(y));
    return stream.takeBytes();
}

core::Expected<Position> Position::decode(std::span<const core::byte> bytes)
{
    serial::Bitstream stream{bytes};
    Position position;
    position.x = fromWire(TKL_TRY(stream.readU64()));
    position.y = fromWire(TKL_TRY(stream.readU64()));
    return position;
}

// ========================================================================== //
//  DemoGame                                                                  //
// ========================================================================== //

core::Expected<void> DemoGame::setup(engine::World& world)
{
    _spawn = TKL_TRY(world.registerMessage<Spawn>("game", "spawn"));
    _move  = TKL_TRY(world.registerMessage<Move>("game", "move"));

    return world.addSystem("movement", [this](engine::WorldContext& ctx) { return update(ctx); });
}

core::Expected<void> DemoGame::queueBotInput(engine::World& world)
{
    const core::u64 tick = world.currentTick();

    auto sign = [&](const auto& type, const auto& payload)
        -> core::Expected<std::shared_ptr<const txpool::SignedTransaction>> {
        auto body = TKL_TRY(type.encodeTyped(payload));
        return std::make_shared<const txpool::SignedTransaction>(
            "demo-bot", world.namespaceName(), _nonce++, "unsigned", std::move(body));
    };

    if (tick % kSpawnEvery == 0)
    {
        Spawn spawn{"bot-" + std::to_string(tick / kSpawnEvery),
                    static_cast<core::i64>(tick), -static_cast<core::i64>(tick)};
        auto tx = TKL_TRY(sign(*_spawn, spawn));
        TKL_TRY_VOID(world.addTransaction(_spawn->id(), spawn, std::move(tx)));
        return {};
    }

    Move move{tick % (tick / kSpawnEvery + 1), 1, 1};
    auto tx = TKL_TRY(sign(*_move, move));
    TKL_TRY_VOID(world.addTransaction(_move->id(), move, std::move(tx)));
    return {};
}

core::Expected<void> DemoGame::update(engine::WorldContext& ctx) const
{
    auto& buffer = ctx.commandBuffer();

    for (const auto& spawn : ctx.messagesOf(*_spawn))
    {
        const core::Bytes position = Position{spawn.msg.x, spawn.msg.y}.encode();
        const auto* nameData = reinterpret_cast<const core::byte*>(spawn.msg.name.data());

        const std::array<gamestate::ComponentValue, 2> components{{
            {kPositionComponent, position},
            {kNameComponent, std::span<const core::byte>{nameData, spawn.msg.name.size()}},
        }};
        const gamestate::EntityId entity = TKL_TRY(buffer.createEntity(components));
        core::Log::debug("server", "tick " + std::to_string(ctx.currentTick()) + ": spawned " +
                                   spawn.msg.name + " as entity " + std::to_string(entity));
    }

    for (const auto& move : ctx.messagesOf(*_move))
    {
        auto current = buffer.getComponent(move.msg.entity, kPositionComponent);
        if (!current)
        {
            if (current.error().isNotFound())
            {
                core::Log::warn("server", "move ignored: " + current.error().message());
                continue;
            }
            return std::unexpected(std::move(current.error()));
        }

        Position position = TKL_TRY(Position::decode(*current));
        position.x += move.msg.dx;
        position.y += move.msg.dy;
        TKL_TRY_VOID(buffer.setComponent(move.msg.entity, kPositionComponent, position.encode()));
    }
    return {};
}

} // namespace tkl::server
