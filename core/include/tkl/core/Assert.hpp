/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides TKL_ASSERT (debug-only), TKL_VERIFY (always evaluated), and
 * TKL_UNREACHABLE (marks provably dead code paths).  These guard programmer
 * errors only; storage and codec failures travel through core::Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_CORE_ASSERT_HPP
    #define TKL_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace tkl::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[TKL ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace tkl::core::detail

    #ifdef TKL_DEBUG
        #define TKL_ASSERT(cond)                                          \
            do {                                                           \
                if (TKL_UNLIKELY(!(cond)))                                 \
                    ::tkl::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define TKL_ASSERT(cond) ((void)0)
    #endif

    #define TKL_VERIFY(cond)                                              \
        do {                                                               \
            if (TKL_UNLIKELY(!(cond)))                                     \
                ::tkl::core::detail::assertFail(#cond);                    \
        } while (false)

    #define TKL_UNREACHABLE()                                             \
        do {                                                               \
            ::tkl::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // TKL_CORE_ASSERT_HPP
