/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/engine/Config.hpp>

#include <utility>

namespace tkl::engine {

Config::Builder& Config::Builder::tickRate(core::u32 hz) noexcept
{
    _tickRate = hz;
    return *this;
}

Config::Builder& Config::Builder::storageKind(StorageKind kind) noexcept
{
    _storageKind = kind;
    return *this;
}

Config::Builder& Config::Builder::dataDirectory(std::string path)
{
    _dataDirectory = std::move(path);
    return *this;
}

Config::Builder& Config::Builder::namespaceName(std::string name)
{
    _namespaceName = std::move(name);
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config::Builder& Config::Builder::maxTicks(core::u64 n) noexcept
{
    _maxTicks = n;
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg._tickRate      = _tickRate;
    cfg._storageKind   = _storageKind;
    cfg._dataDirectory = _dataDirectory;
    cfg._namespaceName = _namespaceName;
    cfg._logLevel      = _logLevel;
    cfg._maxTicks      = _maxTicks;
    return cfg;
}

} // namespace tkl::engine
