/**
 * @file MemoryStorage.cpp
 * @brief MemoryStorage implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/storage/MemoryStorage.hpp>
#include <tkl/core/Log.hpp>

#include "KeyValueImage.hpp"

#include <mutex>
#include <optional>

namespace tkl::storage {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct MemoryStorage::Impl
{
    std::mutex                     mutex;
    detail::Image                  image;
    std::optional<core::ErrorCode> commitFault;
    std::optional<core::ErrorCode> readFault;
    core::usize                    committed{0};

    /// @pre mutex held.
    core::Expected<void> takeReadFault()
    {
        if (!readFault)
            return {};
        const auto code = *readFault;
        readFault.reset();
        return core::makeError(code, "injected read failure");
    }

    core::Expected<void> commit(std::vector<detail::Command>&& commands)
    {
        std::lock_guard lock{mutex};
        if (commitFault)
        {
            const auto code = *commitFault;
            commitFault.reset();
            return core::makeError(code, "injected commit failure");
        }

        TKL_TRY_VOID(detail::applyAll(image, commands));
        ++committed;
        return {};
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

MemoryStorage::MemoryStorage()
    : _impl{std::make_shared<Impl>()}
{}

MemoryStorage::~MemoryStorage() = default;

core::Expected<core::u64> MemoryStorage::getUInt64(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    TKL_TRY_VOID(_impl->takeReadFault());
    const core::Bytes raw = TKL_TRY(detail::read(_impl->image, key));
    return detail::decodeUInt64(raw, key);
}

core::Expected<core::Bytes> MemoryStorage::getBytes(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    TKL_TRY_VOID(_impl->takeReadFault());
    return detail::read(_impl->image, key);
}

core::Expected<void> MemoryStorage::setBytes(std::string_view key,
                                             std::span<const core::byte> value)
{
    std::lock_guard lock{_impl->mutex};
    _impl->image.insert_or_assign(std::string(key), core::Bytes(value.begin(), value.end()));
    return {};
}

core::Expected<void> MemoryStorage::setUInt64(std::string_view key, core::u64 value)
{
    std::lock_guard lock{_impl->mutex};
    _impl->image.insert_or_assign(std::string(key), detail::encodeUInt64(value));
    return {};
}

core::Expected<core::u64> MemoryStorage::increment(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    return detail::incrementIn(_impl->image, key);
}

core::Expected<void> MemoryStorage::remove(std::string_view key)
{
    std::lock_guard lock{_impl->mutex};
    if (const auto it = _impl->image.find(key); it != _impl->image.end())
        _impl->image.erase(it);
    return {};
}

core::Expected<std::vector<std::string>> MemoryStorage::keys(std::string_view prefix)
{
    std::lock_guard lock{_impl->mutex};
    return detail::keysWithPrefix(_impl->image, prefix);
}

core::Expected<std::unique_ptr<IPipeline>> MemoryStorage::startTransaction()
{
    std::weak_ptr<Impl> weak = _impl;
    return std::make_unique<detail::BufferedPipeline>(
        [weak](std::vector<detail::Command>&& commands) -> core::Expected<void> {
            auto impl = weak.lock();
            if (!impl)
            {
                return core::makeError(core::ErrorCode::kBackendUnavailable,
                                       "memory storage destroyed before commit");
            }
            return impl->commit(std::move(commands));
        });
}

void MemoryStorage::failNextCommit(core::ErrorCode code)
{
    std::lock_guard lock{_impl->mutex};
    _impl->commitFault = code;
    core::Log::debug("storage", "memory: next commit will fail");
}

void MemoryStorage::failNextRead(core::ErrorCode code)
{
    std::lock_guard lock{_impl->mutex};
    _impl->readFault = code;
    core::Log::debug("storage", "memory: next read will fail");
}

core::usize MemoryStorage::committedPipelines() const noexcept
{
    std::lock_guard lock{_impl->mutex};
    return _impl->committed;
}

core::usize MemoryStorage::size() const noexcept
{
    std::lock_guard lock{_impl->mutex};
    return _impl->image.size();
}

} // namespace tkl::storage
