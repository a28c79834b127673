/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic interfaces across the project.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_CORE_CONCEPTS_HPP
    #define TKL_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace tkl::core {

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to feed byte-wise into a hasher.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

/**
 * @brief A value type that writes itself to, and reads itself back from,
 *        a stream of type @p Stream.
 *
 * Both calls must return something testable for success (typically
 * core::Expected<void>).
 */
template <typename T, typename Stream>
concept SerializableTo = std::default_initializable<T> && requires(const T &value, T &out, Stream &stream) {
    { value.serialize(stream).has_value() } -> std::convertible_to<bool>;
    { out.deserialize(stream).has_value() } -> std::convertible_to<bool>;
};

} // namespace tkl::core

#endif // TKL_CORE_CONCEPTS_HPP
