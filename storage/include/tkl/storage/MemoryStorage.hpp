/**
 * @file MemoryStorage.hpp
 * @brief In-process transactional key-value store.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_STORAGE_MEMORYSTORAGE_HPP
    #define TKL_STORAGE_MEMORYSTORAGE_HPP

#include <tkl/storage/IStorage.hpp>
#include <tkl/core/NonCopyable.hpp>

#include <memory>

namespace tkl::storage {

// /////////////////////////////////////////////////////////////////////////////
/// @class MemoryStorage
/// @brief Map-backed IStorage; contents live as long as the instance.
///
/// Supports fault injection so callers can observe how they behave when the
/// backend rejects a read or a commit: the injected failure is consumed by
/// the next matching call and leaves the contents untouched.
// /////////////////////////////////////////////////////////////////////////////
class MemoryStorage final : public IStorage, public core::NonCopyable<MemoryStorage>
{
public:
    MemoryStorage();
    ~MemoryStorage() override;

    [[nodiscard]] core::Expected<core::u64> getUInt64(std::string_view key) override;
    [[nodiscard]] core::Expected<core::Bytes> getBytes(std::string_view key) override;
    [[nodiscard]] core::Expected<void> setBytes(
        std::string_view key, std::span<const core::byte> value) override;
    [[nodiscard]] core::Expected<void> setUInt64(std::string_view key, core::u64 value) override;
    [[nodiscard]] core::Expected<core::u64> increment(std::string_view key) override;
    [[nodiscard]] core::Expected<void> remove(std::string_view key) override;
    [[nodiscard]] core::Expected<std::vector<std::string>> keys(std::string_view prefix) override;
    [[nodiscard]] core::Expected<std::unique_ptr<IPipeline>> startTransaction() override;
    [[nodiscard]] const char* name() const noexcept override { return "memory"; }

    // --------------------------------------------------------------------- //
    //  Fault injection                                                       //
    // --------------------------------------------------------------------- //

    /// @brief Makes the next pipeline commit fail with @p code.
    void failNextCommit(core::ErrorCode code = core::ErrorCode::kTransactionFailed);

    /// @brief Makes the next read (getUInt64/getBytes) fail with @p code.
    void failNextRead(core::ErrorCode code = core::ErrorCode::kBackendUnavailable);

    /// @brief Number of pipelines successfully committed.
    [[nodiscard]] core::usize committedPipelines() const noexcept;

    /// @brief Number of stored keys.
    [[nodiscard]] core::usize size() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> _impl;
};

} // namespace tkl::storage

#endif // TKL_STORAGE_MEMORYSTORAGE_HPP
