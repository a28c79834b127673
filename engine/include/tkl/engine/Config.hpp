/**
 * @file Config.hpp
 * @brief World configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_ENGINE_CONFIG_HPP
    #define TKL_ENGINE_CONFIG_HPP

#include <tkl/core/Types.hpp>
#include <tkl/core/Log.hpp>

#include <string>

namespace tkl::engine {

/** @brief Which storage backend the engine opens. */
enum class StorageKind : core::u8
{
    kMemory = 0,
    kFile
};

/** @brief Immutable engine configuration. */
class Config
{
public:
    static constexpr core::u32 kDefaultTickRate = 10;

    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& tickRate(core::u32 hz) noexcept;
        Builder& storageKind(StorageKind kind) noexcept;
        Builder& dataDirectory(std::string path);
        Builder& namespaceName(std::string name);
        Builder& logLevel(core::LogLevel level) noexcept;

        /// @brief Stop after @p n ticks; 0 runs until stopped.
        Builder& maxTicks(core::u64 n) noexcept;

        [[nodiscard]] Config build() const;

    private:
        core::u32      _tickRate{kDefaultTickRate};
        StorageKind    _storageKind{StorageKind::kFile};
        std::string    _dataDirectory{"data"};
        std::string    _namespaceName{"world-1"};
        core::LogLevel _logLevel{core::LogLevel::kInfo};
        core::u64      _maxTicks{0};
    };

    [[nodiscard]] core::u32          tickRate()      const noexcept { return _tickRate; }
    [[nodiscard]] StorageKind        storageKind()   const noexcept { return _storageKind; }
    [[nodiscard]] const std::string& dataDirectory() const noexcept { return _dataDirectory; }
    [[nodiscard]] const std::string& namespaceName() const noexcept { return _namespaceName; }
    [[nodiscard]] core::LogLevel     logLevel()      const noexcept { return _logLevel; }
    [[nodiscard]] core::u64          maxTicks()      const noexcept { return _maxTicks; }

private:
    friend class Builder;

    core::u32      _tickRate{kDefaultTickRate};
    StorageKind    _storageKind{StorageKind::kFile};
    std::string    _dataDirectory{"data"};
    std::string    _namespaceName{"world-1"};
    core::LogLevel _logLevel{core::LogLevel::kInfo};
    core::u64      _maxTicks{0};
};

} // namespace tkl::engine

#endif // TKL_ENGINE_CONFIG_HPP
