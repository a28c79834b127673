/**
 * @file Types.hpp
 * @brief Identifier types shared by the transaction pool and the message
 *        registry.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_TXPOOL_TYPES_HPP
    #define TKL_TXPOOL_TYPES_HPP

#include <tkl/core/Types.hpp>

#include <string>

namespace tkl::txpool {

/// @brief Identifier of a registered message type (0 is never assigned).
using MessageId = core::u32;

/// @brief Hex digest identifying a signed transaction.
using TxHash = std::string;

} // namespace tkl::txpool

#endif // TKL_TXPOOL_TYPES_HPP
