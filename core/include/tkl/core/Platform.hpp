/**
 * @file Platform.hpp
 * @brief Compiler portability macros.
 *
 * Branch-prediction hint used by the assertion macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_CORE_PLATFORM_HPP
    #define TKL_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define TKL_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define TKL_UNLIKELY(x)     (x)
    #endif

#endif // TKL_CORE_PLATFORM_HPP
