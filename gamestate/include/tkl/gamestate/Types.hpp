/**
 * @file Types.hpp
 * @brief Identifier types shared by the command buffer and its callers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef TKL_GAMESTATE_TYPES_HPP
    #define TKL_GAMESTATE_TYPES_HPP

#include <tkl/core/Types.hpp>

#include <span>

namespace tkl::gamestate {

using EntityId    = core::u64;
using ArchetypeId = core::u32;
using ComponentId = core::u16;

/**
 * @struct ComponentValue
 * @brief A component id together with its encoded value.
 */
struct ComponentValue
{
    ComponentId                 id{0};
    std::span<const core::byte> value;
};

/**
 * @struct TickNumbers
 * @brief Durable tick counters: @c end <= @c start <= @c end + 1.
 */
struct TickNumbers
{
    core::u64 start{0};
    core::u64 end{0};

    /** @brief True when a tick was started but never finalized. */
    [[nodiscard]] constexpr bool inFlight() const noexcept { return start != end; }

    [[nodiscard]] constexpr bool operator==(const TickNumbers&) const noexcept = default;
};

} // namespace tkl::gamestate

#endif // TKL_GAMESTATE_TYPES_HPP
