/**
 * @file Archetype.hpp
 * @brief Archetype definition: a unique set of component ids.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef TKL_GAMESTATE_ARCHETYPE_HPP
    #define TKL_GAMESTATE_ARCHETYPE_HPP

#include <tkl/gamestate/Types.hpp>
#include <tkl/core/Types.hpp>

#include <bitset>
#include <span>
#include <vector>

namespace tkl::gamestate {

/**
 * @class Archetype
 * @brief Describes a unique combination of component types.
 *
 * Internally a fixed-size bitset where bit N corresponds to component id N.
 * Entities sharing an Archetype share one active-entity list in storage.
 */
class Archetype final
{
public:
    static constexpr core::usize kMaxComponents = 64;

    using Mask = std::bitset<kMaxComponents>;

    constexpr Archetype() noexcept = default;

    /** @brief Constructs from a list of component ids (all below kMaxComponents). */
    explicit Archetype(std::span<const ComponentId> ids) noexcept;

    /** @brief Rebuilds an archetype from its persisted mask. */
    [[nodiscard]] static Archetype fromBits(core::u64 bits) noexcept;

    void add(ComponentId id) noexcept;
    void remove(ComponentId id) noexcept;

    [[nodiscard]] bool has(ComponentId id) const noexcept;

    /** @brief Tests whether this archetype is a superset of @p other. */
    [[nodiscard]] bool contains(const Archetype& other) const noexcept;

    [[nodiscard]] const Mask& mask() const noexcept;

    /** @brief Mask as stored under ECB:ARCHETYPES. */
    [[nodiscard]] core::u64 bits() const noexcept;

    /** @brief Number of component types in this archetype. */
    [[nodiscard]] core::usize count() const noexcept;

    /** @brief Component ids in ascending order. */
    [[nodiscard]] std::vector<ComponentId> componentIds() const;

    [[nodiscard]] bool operator==(const Archetype& other) const noexcept;

    /** @brief True if @p id fits in the mask. */
    [[nodiscard]] static constexpr bool isValidComponent(ComponentId id) noexcept
    {
        return static_cast<core::usize>(id) < kMaxComponents;
    }

private:
    Mask _mask{};
};

} // namespace tkl::gamestate

#include "Archetype.inl"

#endif // TKL_GAMESTATE_ARCHETYPE_HPP
