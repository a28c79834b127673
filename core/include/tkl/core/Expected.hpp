/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * TKL_TRY / TKL_TRY_VOID / TKL_TRY_WRAP macros for early-return
 * propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_CORE_EXPECTED_HPP
    #define TKL_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace tkl::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace tkl::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type tkl::core::Expected<U>.
 */
#define TKL_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_tkl_result = (expr);                                       \
        if (!_tkl_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tkl_result.error()));         \
        std::move(_tkl_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type tkl::core::ExpectedVoid.
 */
#define TKL_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_tkl_result = (expr);                                       \
        if (!_tkl_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tkl_result.error()));         \
    } while (false)

/**
 * @brief Like TKL_TRY_VOID, but prefixes the propagated error with
 *        @p context (see core::Error::wrap).
 */
#define TKL_TRY_WRAP(expr, context)                                       \
    do {                                                                    \
        auto &&_tkl_result = (expr);                                       \
        if (!_tkl_result.has_value()) [[unlikely]]                         \
            return std::unexpected(_tkl_result.error().wrap(context));     \
    } while (false)

#endif // TKL_CORE_EXPECTED_HPP
