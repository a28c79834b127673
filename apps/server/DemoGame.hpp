/**
 * @file DemoGame.hpp
 * @brief Minimal game run by the headless server: spawn and move
 *        entities on a grid.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_SERVER_DEMOGAME_HPP
    #define TKL_SERVER_DEMOGAME_HPP

#include <tkl/engine/World.hpp>
#include <tkl/message/MessageType.hpp>
#include <tkl/serial/Bitstream.hpp>
#include <tkl/core/Expected.hpp>

#include <memory>
#include <string>

namespace tkl::server {

inline constexpr gamestate::ComponentId kPositionComponent = 0;
inline constexpr gamestate::ComponentId kNameComponent     = 1;

/** @brief "game.spawn": create a named entity at (x, y). */
struct Spawn
{
    std::string name;
    core::i64   x{0};
    core::i64   y{0};

    [[nodiscard]] core::Expected<void> serialize(serial::Bitstream& stream) const;
    [[nodiscard]] core::Expected<void> deserialize(serial::Bitstream& stream);

    bool operator==(const Spawn&) const = default;
};

/** @brief "game.move": translate an entity by (dx, dy). */
struct Move
{
    gamestate::EntityId entity{0};
    core::i64           dx{0};
    core::i64           dy{0};

    [[nodiscard]] core::Expected<void> serialize(serial::Bitstream& stream) const;
    [[nodiscard]] core::Expected<void> deserialize(serial::Bitstream& stream);

    bool operator==(const Move&) const = default;
};

/** @brief Value of the position component. */
struct Position
{
    core::i64 x{0};
    core::i64 y{0};

    [[nodiscard]] core::Bytes encode() const;
    [[nodiscard]] static core::Expected<Position> decode(std::span<const core::byte> bytes);
};

/**
 * @class DemoGame
 * @brief Registers the demo messages and the movement system, and produces
 *        a deterministic stream of bot input.
 */
class DemoGame
{
public:
    /** @brief Registers messages and systems on @p world. */
    [[nodiscard]] core::Expected<void> setup(engine::World& world);

    /** @brief Queues the bot input for the world's next tick. */
    [[nodiscard]] core::Expected<void> queueBotInput(engine::World& world);

    /** @brief Applies spawns, then moves. */
    [[nodiscard]] core::Expected<void> update(engine::WorldContext& ctx) const;

private:
    std::shared_ptr<const message::MessageType<Spawn>> _spawn;
    std::shared_ptr<const message::MessageType<Move>>  _move;
    core::u64                                          _nonce{0};
};

} // namespace tkl::server

#endif // TKL_SERVER_DEMOGAME_HPP
