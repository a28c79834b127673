/**
 * @file IStorage.hpp
 * @brief Transactional key-value backend interface (Strategy pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_STORAGE_ISTORAGE_HPP
    #define TKL_STORAGE_ISTORAGE_HPP

#include <tkl/core/Types.hpp>
#include <tkl/core/Expected.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tkl::storage {

// /////////////////////////////////////////////////////////////////////////////
/// @class IPipeline
/// @brief A batch of write commands committed as one atomic unit.
///
/// Commands are queued locally in call order and reach the backend only on
/// commit(). Either every queued command becomes visible or none does.
/// A pipeline is single-use: queuing or committing after commit() fails
/// with kInvalidState.
// /////////////////////////////////////////////////////////////////////////////
class IPipeline
{
public:
    virtual ~IPipeline() = default;

    /// @brief Queues an overwrite of @p key with @p value.
    [[nodiscard]] virtual core::Expected<void> setBytes(
        std::string_view key, std::span<const core::byte> value) = 0;

    /// @brief Queues an overwrite of @p key with an integer value.
    [[nodiscard]] virtual core::Expected<void> setUInt64(
        std::string_view key, core::u64 value) = 0;

    /// @brief Queues an atomic +1 of an integer key (absent counts as 0).
    [[nodiscard]] virtual core::Expected<void> increment(std::string_view key) = 0;

    /// @brief Queues the deletion of @p key (absent keys are ignored).
    [[nodiscard]] virtual core::Expected<void> remove(std::string_view key) = 0;

    /// @brief Applies every queued command, all-or-nothing.
    [[nodiscard]] virtual core::Expected<void> commit() = 0;

    /// @brief Number of commands queued so far.
    [[nodiscard]] virtual core::usize queuedCount() const noexcept = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IStorage
/// @brief Primitive storage consumed by the entity command buffer.
///
/// Concrete implementations:
///   - @c MemoryStorage - in-process map, with fault injection for tests.
///   - @c FileStorage   - durable single-file image, atomically replaced.
///
/// Reads of a key that was never written fail with ErrorCode::kNotFound,
/// which callers must tell apart from a stored zero.
// /////////////////////////////////////////////////////////////////////////////
class IStorage
{
public:
    virtual ~IStorage() = default;

    [[nodiscard]] virtual core::Expected<core::u64> getUInt64(std::string_view key) = 0;
    [[nodiscard]] virtual core::Expected<core::Bytes> getBytes(std::string_view key) = 0;

    [[nodiscard]] virtual core::Expected<void> setBytes(
        std::string_view key, std::span<const core::byte> value) = 0;
    [[nodiscard]] virtual core::Expected<void> setUInt64(
        std::string_view key, core::u64 value) = 0;

    /// @brief Atomic +1; returns the new value.
    [[nodiscard]] virtual core::Expected<core::u64> increment(std::string_view key) = 0;

    [[nodiscard]] virtual core::Expected<void> remove(std::string_view key) = 0;

    /// @brief Lists every key starting with @p prefix, sorted.
    [[nodiscard]] virtual core::Expected<std::vector<std::string>> keys(
        std::string_view prefix) = 0;

    /// @brief Opens a new pipelined transaction.
    [[nodiscard]] virtual core::Expected<std::unique_ptr<IPipeline>> startTransaction() = 0;

    /// @brief Returns a human-readable name for this backend.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace tkl::storage

#endif // TKL_STORAGE_ISTORAGE_HPP
