/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash.
 *
 * Used to derive transaction hashes from the signed fields of a
 * transaction.  The digest only depends on the bytes fed in, so the same
 * transaction hashes identically before a crash and after recovery.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_SERIAL_STATE_HASH_HPP
    #define TKL_SERIAL_STATE_HASH_HPP

    #include <tkl/core/Types.hpp>
    #include <tkl/core/Concepts.hpp>

    #include <span>
    #include <string>
    #include <string_view>

namespace tkl::serial {

/**
 * @brief Incremental FNV-1a hasher.
 */
class StateHash final {
public:
    static constexpr core::u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr core::u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashBytes(std::span<const core::byte> data)
    {
        for (auto b : data)
        {
            _hash ^= static_cast<core::u64>(b);
            _hash *= kPrime;
        }
        return *this;
    }

    /**
     * @brief Feed a string, length first so that adjacent fields cannot
     *        alias ("ab"+"c" vs "a"+"bc").
     */
    StateHash &hashString(std::string_view text)
    {
        combine(static_cast<core::u64>(text.size()));
        return hashBytes({reinterpret_cast<const core::byte *>(text.data()), text.size()});
    }

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Blittable type.
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <core::Blittable T>
    StateHash &combine(const T &value)
    {
        const auto *ptr = reinterpret_cast<const core::byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    /**
     * @brief Finalise and return the current digest.
     * @return 64-bit FNV-1a hash.
     */
    [[nodiscard]] constexpr core::u64 digest() const { return _hash; }

    /// @brief Digest as 16 lowercase hex characters.
    [[nodiscard]] std::string hexDigest() const
    {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out(16, '0');
        core::u64 value = _hash;
        for (int i = 15; i >= 0; --i)
        {
            out[static_cast<core::usize>(i)] = kHex[value & 0xF];
            value >>= 4;
        }
        return out;
    }

    /**
     * @brief Reset the hasher to its initial state.
     */
    constexpr void reset() { _hash = kOffsetBasis; }

private:
    core::u64 _hash = kOffsetBasis;
};

} // namespace tkl::serial

#endif // TKL_SERIAL_STATE_HASH_HPP
