/**
 * @file Archetype.inl
 * @brief Inline implementations for Archetype.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef TKL_GAMESTATE_ARCHETYPE_INL
    #define TKL_GAMESTATE_ARCHETYPE_INL

namespace tkl::gamestate {

inline Archetype::Archetype(std::span<const ComponentId> ids) noexcept
{
    for (auto id : ids)
    {
        _mask.set(static_cast<core::usize>(id));
    }
}

inline Archetype Archetype::fromBits(core::u64 bits) noexcept
{
    Archetype archetype;
    archetype._mask = Mask{bits};
    return archetype;
}

inline void Archetype::add(ComponentId id) noexcept
{
    _mask.set(static_cast<core::usize>(id));
}

inline void Archetype::remove(ComponentId id) noexcept
{
    _mask.reset(static_cast<core::usize>(id));
}

inline bool Archetype::has(ComponentId id) const noexcept
{
    return isValidComponent(id) && _mask.test(static_cast<core::usize>(id));
}

inline bool Archetype::contains(const Archetype& other) const noexcept
{
    return (_mask & other._mask) == other._mask;
}

inline const Archetype::Mask& Archetype::mask() const noexcept
{
    return _mask;
}

inline core::u64 Archetype::bits() const noexcept
{
    return _mask.to_ullong();
}

inline core::usize Archetype::count() const noexcept
{
    return _mask.count();
}

inline std::vector<ComponentId> Archetype::componentIds() const
{
    std::vector<ComponentId> ids;
    ids.reserve(_mask.count());
    for (core::usize i = 0; i < kMaxComponents; ++i)
    {
        if (_mask.test(i))
        {
            ids.push_back(static_cast<ComponentId>(i));
        }
    }
    return ids;
}

inline bool Archetype::operator==(const Archetype& other) const noexcept
{
    return _mask == other._mask;
}

} // namespace tkl::gamestate

#endif // TKL_GAMESTATE_ARCHETYPE_INL
