/**
 * @file Engine.cpp
 * @brief Engine façade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/engine/Engine.hpp>
#include <tkl/engine/GameLoop.hpp>
#include <tkl/storage/FileStorage.hpp>
#include <tkl/storage/MemoryStorage.hpp>
#include <tkl/core/Assert.hpp>
#include <tkl/core/Log.hpp>

#include <string>

namespace tkl::engine {

namespace {

core::Expected<std::unique_ptr<storage::IStorage>> openStorage(const Config& config)
{
    switch (config.storageKind())
    {
    case StorageKind::kMemory:
        return std::make_unique<storage::MemoryStorage>();
    case StorageKind::kFile:
    {
        if (config.dataDirectory().empty())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "file storage needs a data directory");
        }
        auto file = storage::FileStorage::open(config.dataDirectory());
        if (!file)
        {
            return std::unexpected(std::move(file.error()));
        }
        return std::unique_ptr<storage::IStorage>{std::move(*file)};
    }
    }
    TKL_UNREACHABLE();
}

} // namespace

struct Engine::Impl
{
    Config   config;
    GameLoop loop;

    std::unique_ptr<World> world;

    bool initialised{false};

    explicit Impl(Config cfg)
        : config{std::move(cfg)}
        , loop{config}
    {
    }
};

Engine::Engine(Config config)
    : _impl{std::make_unique<Impl>(std::move(config))}
{
}

Engine::~Engine()
{
    if (_impl && _impl->initialised)
    {
        shutdown();
    }
}

core::Expected<void> Engine::init(const SetupFn& setup)
{
    if (_impl->initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "engine is already initialised");
    }
    if (_impl->config.tickRate() == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "tick rate must be positive");
    }

    core::Log::setMinLevel(_impl->config.logLevel());
    core::Log::info("engine", "init: namespace " + _impl->config.namespaceName() + ", " +
                              std::to_string(_impl->config.tickRate()) + " Hz");

    auto storage = openStorage(_impl->config);
    if (!storage)
    {
        core::Log::error("engine", "failed to open storage: " + storage.error().message());
        return core::wrapError(storage.error(), "failed to open storage");
    }

    auto world = World::create(std::move(*storage), _impl->config.namespaceName());
    if (!world)
    {
        return std::unexpected(std::move(world.error()));
    }
    _impl->world = std::move(*world);

    if (setup)
    {
        TKL_TRY_WRAP(setup(*_impl->world), "game setup failed");
    }
    TKL_TRY_VOID(_impl->world->init());

    _impl->initialised = true;
    core::Log::info("engine", "init: done at tick " + std::to_string(_impl->world->currentTick()));
    return {};
}

core::Expected<void> Engine::run(const TickHook& beforeTick)
{
    if (!_impl->initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "engine is not initialised");
    }

    World& world = *_impl->world;
    return _impl->loop.run([&world, &beforeTick]() -> core::Expected<void> {
        if (beforeTick)
        {
            TKL_TRY_VOID(beforeTick(world));
        }
        return world.doTick();
    });
}

core::u64 Engine::ticksRun() const noexcept
{
    return _impl->loop.tickCount();
}

void Engine::requestShutdown() noexcept
{
    _impl->loop.requestStop();
}

void Engine::shutdown()
{
    if (!_impl->initialised)
    {
        return;
    }

    core::Log::info("engine", "shutdown at tick " + std::to_string(_impl->world->currentTick()));
    _impl->world.reset();
    _impl->initialised = false;
}

World& Engine::world() noexcept
{
    TKL_ASSERT(_impl->world);
    return *_impl->world;
}

const Config& Engine::config() const noexcept
{
    return _impl->config;
}

} // namespace tkl::engine
