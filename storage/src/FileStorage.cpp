/**
 * @file FileStorage.cpp
 * @brief FileStorage implementation (POSIX write + fsync + rename).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/storage/FileStorage.hpp>
#include <tkl/serial/Bitstream.hpp>
#include <tkl/serial/StateHash.hpp>
#include <tkl/core/Log.hpp>

#include "KeyValueImage.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace tkl::storage {

namespace {

constexpr core::u32 kImageMagic   = 0x544B4C53; // "TKLS"
constexpr core::u16 kImageVersion = 1;

core::Bytes encodeImage(const detail::Image& image)
{
    serial::Bitstream stream;
    stream.writeU32(kImageMagic);
    stream.writeU16(kImageVersion);
    stream.writeU32(static_cast<core::u32>(image.size()));
    for (const auto& [key, value] : image)
    {
        stream.writeString(key);
        stream.writeBytes(value);
    }

    serial::StateHash hasher;
    hasher.hashBytes(stream.data());
    stream.writeU64(hasher.digest());
    return stream.takeBytes();
}

core::Expected<detail::Image> decodeImage(std::span<const core::byte> raw)
{
    constexpr core::usize kChecksumSize = sizeof(core::u64);
    if (raw.size() < kChecksumSize)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "image shorter than its checksum");
    }

    const auto body = raw.first(raw.size() - kChecksumSize);
    serial::Bitstream trailer{raw.last(kChecksumSize)};
    const core::u64 stored = TKL_TRY(trailer.readU64());

    serial::StateHash hasher;
    hasher.hashBytes(body);
    if (hasher.digest() != stored)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "image checksum mismatch");
    }

    serial::Bitstream stream{body};
    const core::u32 magic   = TKL_TRY(stream.readU32());
    const core::u16 version = TKL_TRY(stream.readU16());
    if (magic != kImageMagic || version != kImageVersion)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "unrecognised image header");
    }

    const core::u32 count = TKL_TRY(stream.readU32());
    detail::Image image;
    for (core::u32 i = 0; i < count; ++i)
    {
        std::string key   = TKL_TRY(stream.readString());
        core::Bytes value = TKL_TRY(stream.readBytes());
        image.insert_or_assign(std::move(key), std::move(value));
    }
    return image;
}

core::Expected<void> errnoError(std::string_view what, const std::filesystem::path& path)
{
    return core::makeError(core::ErrorCode::kIoError,
                           std::string(what) + " '" + path.string() + "': " + std::strerror(errno));
}

core::Expected<void> writeFileSynced(const std::filesystem::path& path,
                                     std::span<const core::byte> bytes)
{
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0)
        return errnoError("open", path);

    const auto* cursor = reinterpret_cast<const char*>(bytes.data());
    core::usize left = bytes.size();
    while (left > 0)
    {
        const ssize_t n = ::write(fd, cursor, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            auto err = errnoError("write", path);
            ::close(fd);
            return err;
        }
        cursor += n;
        left -= static_cast<core::usize>(n);
    }

    if (::fsync(fd) != 0)
    {
        auto err = errnoError("fsync", path);
        ::close(fd);
        return err;
    }
    if (::close(fd) != 0)
        return errnoError("close", path);
    return {};
}

core::Expected<void> syncDirectory(const std::filesystem::path& directory)
{
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return errnoError("open directory", directory);
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0)
        return errnoError("fsync directory", directory);
    return {};
}

} // anonymous namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct FileStorage::Impl
{
    std::mutex            mutex;
    std::filesystem::path directory;
    std::filesystem::path imagePath;
    std::filesystem::path tempPath;
    detail::Image         image;
    core::usize           directorySyncFailures{0};

    /// @pre mutex held.  Replaces the on-disk image with @p next, then
    ///      adopts it in memory; if the rename fails nothing changes.
    core::Expected<void> persist(detail::Image&& next)
    {
        const core::Bytes bytes = encodeImage(next);
        TKL_TRY_WRAP(writeFileSynced(tempPath, bytes), "failed to write image");

        std::error_code ec;
        std::filesystem::rename(tempPath, imagePath, ec);
        if (ec)
        {
            return core::makeError(core::ErrorCode::kIoError,
                                   "failed to replace image: " + ec.message());
        }
        // The new image is live from here on; reporting the commit as failed
        // would make the caller apply it a second time.
        image = std::move(next);

        if (auto synced = syncDirectory(directory); !synced)
        {
            ++directorySyncFailures;
            core::Log::warn("storage", "image replaced but data directory not synced: " +
                                       synced.error().message());
        }
        return {};
    }

    core::Expected<void> commit(std::vector<detail::Command>&& commands)
    {
        std::lock_guard lock{mutex};
        detail::Image next = image;
        TKL_TRY_VOID(detail::applyAll(next, commands));
        return persist(std::move(next));
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

FileStorage::FileStorage()
    : _impl{std::make_shared<Impl>()}
{}

FileStorage::~FileStorage() = default;

core::Expected<std::unique_ptr<FileStorage>> FileStorage::open(
    const std::filesystem::path& directory)
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               "failed to create data directory '" + directory.string() +
                               "': " + ec.message());
    }

    std::unique_ptr<FileStorage> storage{new FileStorage()};
    auto& impl     = *storage->_impl;
    impl.directory = directory;
    impl.imagePath = directory / kImageFileName;
    impl.tempPath  = directory / (std::string(kImageFileName) + ".tmp");

    if (std::filesystem::exists(impl.imagePath, ec))
    {
        std::ifstream in{impl.imagePath, std::ios::binary};
        if (!in)
        {
            return core::makeError(core::ErrorCode::kIoError,
                                   "failed to open image '" + impl.imagePath.string() + "'");
        }
        const std::vector<char> raw{std::istreambuf_iterator<char>(in),
                                    std::istreambuf_iterator<char>()};
        auto image = decodeImage({reinterpret_cast<const core::byte*>(raw.data()), raw.size()});
        if (!image)
        {
            return core::wrapError(image.error(), "failed to load '" + impl.imagePath.string() + "'");
        }
        impl.image = std::move(*image);
        core::Log::info("storage", "file: loaded " + std::to_string(impl.image.size()) +
                                   " keys from " + impl.imagePath.string());
    }
    else
    {
        core::Log::info("storage", "file: new store at " + impl.imagePath.string());
    }

    // A leftover temporary file is an interrupted write; the live image wins.
    std::filesystem::remove(impl.tempPath, ec);
    return storage;
}

core::Expected<core::u64> FileStorage::getUInt64(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    const core::Bytes raw = TKL_TRY(detail::read(_impl->image, key));
    return detail::decodeUInt64(raw, key);
}

core::Expected<core::Bytes> FileStorage::getBytes(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    return detail::read(_impl->image, key);
}

core::Expected<void> FileStorage::setBytes(std::string_view key,
                                           std::span<const core::byte> value)
{
    std::lock_guard lock{_impl->mutex};
    detail::Image next = _impl->image;
    next.insert_or_assign(std::string(key), core::Bytes(value.begin(), value.end()));
    return _impl->persist(std::move(next));
}

core::Expected<void> FileStorage::setUInt64(std::string_view key, core::u64 value)
{
    std::lock_guard lock{_impl->mutex};
    detail::Image next = _impl->image;
    next.insert_or_assign(std::string(key), detail::encodeUInt64(value));
    return _impl->persist(std::move(next));
}

core::Expected<core::u64> FileStorage::increment(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    detail::Image next = _impl->image;
    const core::u64 value = TKL_TRY(detail::incrementIn(next, key));
    TKL_TRY_VOID(_impl->persist(std::move(next)));
    return value;
}

core::Expected<void> FileStorage::remove(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    if (_impl->image.find(key) == _impl->image.end())
        return {};
    detail::Image next = _impl->image;
    next.erase(next.find(key));
    return _impl->persist(std::move(next));
}

core::Expected<std::vector<std::string>> FileStorage::keys(std::string_view prefix)
{
    std::lock_guard lock{_impl->mutex};
    return detail::keysWithPrefix(_impl->image, prefix);
}

core::Expected<std::unique_ptr<IPipeline>> FileStorage::startTransaction()
{
    std::weak_ptr<Impl> weak = _impl;
    return std::make_unique<detail::BufferedPipeline>(
        [weak](std::vector<detail::Command>&& commands) -> core::Expected<void> {
            auto impl = weak.lock();
            if (!impl)
            {
                return core::makeError(core::ErrorCode::kBackendUnavailable,
                                       "file storage closed before commit");
            }
            return impl->commit(std::move(commands));
        });
}

core::usize FileStorage::directorySyncFailures() const noexcept
{
    std::lock_guard lock{_impl->mutex};
    return _impl->directorySyncFailures;
}

const std::filesystem::path& FileStorage::imagePath() const noexcept
{
    return _impl->imagePath;
}

} // namespace tkl::storage
