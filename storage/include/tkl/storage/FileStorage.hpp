/**
 * @file FileStorage.hpp
 * @brief Durable single-file transactional key-value store.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_STORAGE_FILESTORAGE_HPP
    #define TKL_STORAGE_FILESTORAGE_HPP

#include <tkl/storage/IStorage.hpp>
#include <tkl/core/NonCopyable.hpp>

#include <filesystem>
#include <memory>

namespace tkl::storage {

// /////////////////////////////////////////////////////////////////////////////
/// @class FileStorage
/// @brief IStorage persisted as one image file inside a data directory.
///
/// Every write (immediate or a pipeline commit) serialises the full image to
/// a temporary file, fsyncs it and renames it over the live file.  A crash at
/// any point therefore leaves either the previous or the new image on disk,
/// never a mix of the two.  The image carries a checksum verified at open.
// /////////////////////////////////////////////////////////////////////////////
class FileStorage final : public IStorage, public core::NonCopyable<FileStorage>
{
public:
    /// @brief Name of the image file inside the data directory.
    static constexpr const char* kImageFileName = "ledger.tkl";

    /**
     * @brief Opens (creating if needed) the store rooted at @p directory.
     * @return The store, or kIoError / kCorruptedData.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<FileStorage>> open(
        const std::filesystem::path& directory);

    ~FileStorage() override;

    [[nodiscard]] core::Expected<core::u64> getUInt64(std::string_view key) override;
    [[nodiscard]] core::Expected<core::Bytes> getBytes(std::string_view key) override;
    [[nodiscard]] core::Expected<void> setBytes(
        std::string_view key, std::span<const core::byte> value) override;
    [[nodiscard]] core::Expected<void> setUInt64(std::string_view key, core::u64 value) override;
    [[nodiscard]] core::Expected<core::u64> increment(std::string_view key) override;
    [[nodiscard]] core::Expected<void> remove(std::string_view key) override;
    [[nodiscard]] core::Expected<std::vector<std::string>> keys(std::string_view prefix) override;
    [[nodiscard]] core::Expected<std::unique_ptr<IPipeline>> startTransaction() override;
    [[nodiscard]] const char* name() const noexcept override { return "file"; }

    /// @brief Writes whose image was replaced but whose directory entry
    ///        could not be synced.
    [[nodiscard]] core::usize directorySyncFailures() const noexcept;

    /// @brief Path of the live image file.
    [[nodiscard]] const std::filesystem::path& imagePath() const noexcept;

private:
    FileStorage();

    struct Impl;
    std::shared_ptr<Impl> _impl;
};

} // namespace tkl::storage

#endif // TKL_STORAGE_FILESTORAGE_HPP
