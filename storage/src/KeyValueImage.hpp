/**
 * @file KeyValueImage.hpp
 * @brief Shared key/value image and buffered pipeline used by the backends.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_STORAGE_KEYVALUEIMAGE_HPP
    #define TKL_STORAGE_KEYVALUEIMAGE_HPP

#include <tkl/storage/IStorage.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tkl::storage::detail {

/// @brief Ordered key -> value map; integer values are stored as decimal text.
using Image = std::map<std::string, core::Bytes, std::less<>>;

/// @brief One queued pipeline command.
struct Command
{
    enum class Kind : core::u8
    {
        kSet,
        kIncrement,
        kRemove
    };

    Kind        kind{Kind::kSet};
    std::string key;
    core::Bytes value;
};

/// @brief Encodes an integer the way it is stored (decimal text).
[[nodiscard]] core::Bytes encodeUInt64(core::u64 value);

/// @brief Parses a stored integer; kCorruptedData if @p raw is not one.
[[nodiscard]] core::Expected<core::u64> decodeUInt64(
    std::span<const core::byte> raw, std::string_view key);

/// @brief Looks up @p key; kNotFound if absent.
[[nodiscard]] core::Expected<core::Bytes> read(const Image& image, std::string_view key);

/// @brief +1 on @p key in place, returning the new value.
[[nodiscard]] core::Expected<core::u64> incrementIn(Image& image, std::string_view key);

/**
 * @brief Applies @p commands to @p image all-or-nothing.
 *
 * Commands are first replayed, in order, onto an overlay of the touched
 * keys; the image is only modified once every command has succeeded.
 */
[[nodiscard]] core::Expected<void> applyAll(Image& image, std::span<const Command> commands);

/// @brief Keys of @p image starting with @p prefix, in order.
[[nodiscard]] std::vector<std::string> keysWithPrefix(const Image& image, std::string_view prefix);

// /////////////////////////////////////////////////////////////////////////////
/// @class BufferedPipeline
/// @brief IPipeline that queues commands and hands them to its backend's
///        commit function in one call.
// /////////////////////////////////////////////////////////////////////////////
class BufferedPipeline final : public IPipeline
{
public:
    using CommitFn = std::function<core::Expected<void>(std::vector<Command>&&)>;

    explicit BufferedPipeline(CommitFn commitFn);
    ~BufferedPipeline() override;

    [[nodiscard]] core::Expected<void> setBytes(
        std::string_view key, std::span<const core::byte> value) override;
    [[nodiscard]] core::Expected<void> setUInt64(std::string_view key, core::u64 value) override;
    [[nodiscard]] core::Expected<void> increment(std::string_view key) override;
    [[nodiscard]] core::Expected<void> remove(std::string_view key) override;
    [[nodiscard]] core::Expected<void> commit() override;
    [[nodiscard]] core::usize queuedCount() const noexcept override;

private:
    [[nodiscard]] core::Expected<void> enqueue(Command command);

    CommitFn             _commitFn;
    std::vector<Command> _commands;
    bool                 _done{false};
};

} // namespace tkl::storage::detail

#endif // TKL_STORAGE_KEYVALUEIMAGE_HPP
