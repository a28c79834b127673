/**
 * @file Engine.hpp
 * @brief Top-level engine façade (Façade pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_ENGINE_ENGINE_HPP
    #define TKL_ENGINE_ENGINE_HPP

#include <tkl/engine/Config.hpp>
#include <tkl/engine/World.hpp>
#include <tkl/core/Types.hpp>
#include <tkl/core/Expected.hpp>

#include <functional>
#include <memory>

namespace tkl::engine {

/** @brief Registers the game's messages and systems on a fresh world. */
using SetupFn = std::function<core::Expected<void>(World&)>;

/** @brief Called before every tick, e.g. to queue input. */
using TickHook = std::function<core::Expected<void>(World&)>;

/**
 * @brief Top-level engine façade.
 *
 * Opens the configured storage, builds the World, lets the game register
 * itself, recovers, then drives ticks with a GameLoop.
 */
class Engine
{
public:
    /// @param config Immutable engine configuration.
    explicit Engine(Config config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Open storage, build the world, run @p setup, recover.
     * @return Success or the first error encountered.
     */
    [[nodiscard]] core::Expected<void> init(const SetupFn& setup);

    /**
     * @brief Run the tick loop (blocks until stop, maxTicks, or an error).
     * @param beforeTick Optional hook run before each tick.
     */
    [[nodiscard]] core::Expected<void> run(const TickHook& beforeTick = {});

    /** @brief Ticks run by the last run(). */
    [[nodiscard]] core::u64 ticksRun() const noexcept;

    /** @brief Request graceful shutdown. */
    void requestShutdown() noexcept;

    /** @brief Release the world and its storage. */
    void shutdown();

    /** @brief The world; only valid after a successful init(). */
    [[nodiscard]] World& world() noexcept;

    /** @brief Access the active configuration. */
    [[nodiscard]] const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tkl::engine

#endif // TKL_ENGINE_ENGINE_HPP
