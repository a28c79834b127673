/**
 * @file GameLoop.hpp
 * @brief Fixed time-step tick driver.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_ENGINE_GAMELOOP_HPP
    #define TKL_ENGINE_GAMELOOP_HPP

#include <tkl/engine/Config.hpp>
#include <tkl/core/Types.hpp>
#include <tkl/core/Expected.hpp>

#include <atomic>
#include <functional>

namespace tkl::engine {

/** @brief Called once per fixed tick. */
using TickCallback = std::function<core::Expected<void>()>;

/** @brief Fixed time-step loop. */
class GameLoop
{
public:
    /// @param config Engine configuration (provides tickRate and maxTicks).
    explicit GameLoop(const Config& config);
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    /**
     * @brief Run until requestStop(), maxTicks, or the first tick error.
     * @return The error that stopped the loop, if any.
     */
    [[nodiscard]] core::Expected<void> run(const TickCallback& onTick);

    /** @brief Request graceful loop termination; safe from another thread. */
    void requestStop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /** @brief Ticks completed since run() was called. */
    [[nodiscard]] core::u64 tickCount() const noexcept;

private:
    core::f64              _fixedDt;
    core::u64              _maxTicks;
    std::atomic<bool>      _running{false};
    std::atomic<core::u64> _tickCount{0};
};

} // namespace tkl::engine

#endif // TKL_ENGINE_GAMELOOP_HPP
