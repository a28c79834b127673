/**
 * @file Keys.hpp
 * @brief Storage key layout owned by the entity command buffer.
 *
 * Every key lives under the "ECB:" prefix.  Nothing outside the command
 * buffer reads or writes these keys.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef TKL_GAMESTATE_KEYS_HPP
    #define TKL_GAMESTATE_KEYS_HPP

#include <tkl/gamestate/Types.hpp>

#include <string>
#include <string_view>

namespace tkl::gamestate::keys {

inline constexpr std::string_view kPrefix              = "ECB:";
inline constexpr std::string_view kStartTick           = "ECB:START-TICK";
inline constexpr std::string_view kEndTick             = "ECB:END-TICK";
inline constexpr std::string_view kPendingTransactions = "ECB:PENDING-TRANSACTIONS";
inline constexpr std::string_view kNextEntityId        = "ECB:NEXT-ENTITY-ID";
inline constexpr std::string_view kArchetypes          = "ECB:ARCHETYPES";

/** @brief "ECB:ARCHETYPE-ID:ENTITY-ID-<entity>" */
[[nodiscard]] inline std::string entityArchetype(EntityId entity)
{
    return "ECB:ARCHETYPE-ID:ENTITY-ID-" + std::to_string(entity);
}

/** @brief "ECB:ACTIVE-ENTITY-IDS:ARCHETYPE-ID-<archetype>" */
[[nodiscard]] inline std::string activeEntities(ArchetypeId archetype)
{
    return "ECB:ACTIVE-ENTITY-IDS:ARCHETYPE-ID-" + std::to_string(archetype);
}

/** @brief "ECB:COMPONENT-VALUE:TYPE-ID-<component>:ENTITY-ID-<entity>" */
[[nodiscard]] inline std::string componentValue(ComponentId component, EntityId entity)
{
    return "ECB:COMPONENT-VALUE:TYPE-ID-" + std::to_string(component) +
           ":ENTITY-ID-" + std::to_string(entity);
}

} // namespace tkl::gamestate::keys

#endif // TKL_GAMESTATE_KEYS_HPP
