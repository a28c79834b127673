/**
 * @file KeyValueImage.cpp
 * @brief Key/value image helpers and BufferedPipeline implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "KeyValueImage.hpp"

#include <charconv>
#include <iterator>
#include <limits>
#include <utility>

namespace tkl::storage::detail {

core::Bytes encodeUInt64(core::u64 value)
{
    char text[24];
    const auto [end, ec] = std::to_chars(std::begin(text), std::end(text), value);
    (void)ec;
    const auto* first = reinterpret_cast<const core::byte*>(text);
    return core::Bytes(first, first + (end - text));
}

core::Expected<core::u64> decodeUInt64(std::span<const core::byte> raw, std::string_view key)
{
    const auto* first = reinterpret_cast<const char*>(raw.data());
    const auto* last  = first + raw.size();

    core::u64 value = 0;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (raw.empty() || ec != std::errc{} || ptr != last)
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
                               "value at key '" + std::string(key) + "' is not an unsigned integer");
    }
    return value;
}

core::Expected<core::Bytes> read(const Image& image, std::string_view key)
{
    const auto it = image.find(key);
    if (it == image.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "key '" + std::string(key) + "' not found");
    }
    return it->second;
}

core::Expected<core::u64> incrementIn(Image& image, std::string_view key)
{
    core::u64 current = 0;
    const auto it = image.find(key);
    if (it != image.end())
    {
        current = TKL_TRY(decodeUInt64(it->second, key));
    }
    if (current == std::numeric_limits<core::u64>::max())
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "increment of key '" + std::string(key) + "' would overflow");
    }

    ++current;
    image.insert_or_assign(std::string(key), encodeUInt64(current));
    return current;
}

core::Expected<void> applyAll(Image& image, std::span<const Command> commands)
{
    // nullopt marks a key removed by an earlier command of the same batch.
    std::map<std::string, std::optional<core::Bytes>, std::less<>> overlay;

    auto lookup = [&](const std::string& key) -> const core::Bytes* {
        if (const auto it = overlay.find(key); it != overlay.end())
            return it->second ? &*it->second : nullptr;
        if (const auto it = image.find(key); it != image.end())
            return &it->second;
        return nullptr;
    };

    for (const auto& command : commands)
    {
        switch (command.kind)
        {
            case Command::Kind::kSet:
                overlay.insert_or_assign(command.key, command.value);
                break;

            case Command::Kind::kRemove:
                overlay.insert_or_assign(command.key, std::nullopt);
                break;

            case Command::Kind::kIncrement:
            {
                core::u64 current = 0;
                if (const core::Bytes* existing = lookup(command.key))
                {
                    current = TKL_TRY(decodeUInt64(*existing, command.key));
                }
                if (current == std::numeric_limits<core::u64>::max())
                {
                    return core::makeError(core::ErrorCode::kOutOfRange,
                                           "increment of key '" + command.key + "' would overflow");
                }
                overlay.insert_or_assign(command.key, encodeUInt64(current + 1));
                break;
            }
        }
    }

    for (auto& [key, value] : overlay)
    {
        if (value)
            image.insert_or_assign(key, std::move(*value));
        else
            image.erase(key);
    }
    return {};
}

std::vector<std::string> keysWithPrefix(const Image& image, std::string_view prefix)
{
    std::vector<std::string> out;
    for (auto it = image.lower_bound(prefix); it != image.end(); ++it)
    {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
            break;
        out.push_back(it->first);
    }
    return out;
}

// -------------------------------------------------------------------------- //
//  BufferedPipeline                                                          //
// -------------------------------------------------------------------------- //

BufferedPipeline::BufferedPipeline(CommitFn commitFn)
    : _commitFn{std::move(commitFn)}
{}

BufferedPipeline::~BufferedPipeline() = default;

core::Expected<void> BufferedPipeline::enqueue(Command command)
{
    if (_done)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "pipeline already committed");
    }
    _commands.push_back(std::move(command));
    return {};
}

core::Expected<void> BufferedPipeline::setBytes(std::string_view key,
                                                std::span<const core::byte> value)
{
    return enqueue({Command::Kind::kSet, std::string(key), core::Bytes(value.begin(), value.end())});
}

core::Expected<void> BufferedPipeline::setUInt64(std::string_view key, core::u64 value)
{
    return enqueue({Command::Kind::kSet, std::string(key), encodeUInt64(value)});
}

core::Expected<void> BufferedPipeline::increment(std::string_view key)
{
    return enqueue({Command::Kind::kIncrement, std::string(key), {}});
}

core::Expected<void> BufferedPipeline::remove(std::string_view key)
{
    return enqueue({Command::Kind::kRemove, std::string(key), {}});
}

core::Expected<void> BufferedPipeline::commit()
{
    if (_done)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "pipeline already committed");
    }
    _done = true;
    return _commitFn(std::move(_commands));
}

core::usize BufferedPipeline::queuedCount() const noexcept
{
    return _commands.size();
}

} // namespace tkl::storage::detail
