/**
 * @file GameLoop.cpp
 * @brief GameLoop implementation: fixed time-step with accumulator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/engine/GameLoop.hpp>
#include <tkl/core/Assert.hpp>
#include <tkl/core/Log.hpp>

#include <chrono>
#include <string>
#include <thread>

namespace tkl::engine {

GameLoop::GameLoop(const Config& config)
    : _fixedDt{1.0 / static_cast<core::f64>(config.tickRate())}
    , _maxTicks{config.maxTicks()}
{
    TKL_ASSERT(config.tickRate() > 0);
}

GameLoop::~GameLoop() = default;

core::Expected<void> GameLoop::run(const TickCallback& onTick)
{
    TKL_ASSERT(onTick);
    _running = true;
    _tickCount = 0;

    using Clock = std::chrono::steady_clock;
    auto previous = Clock::now();
    core::f64 accumulator = _fixedDt;

    while (_running.load())
    {
        const auto current = Clock::now();
        core::f64 frameTime = std::chrono::duration<core::f64>(current - previous).count();
        previous = current;

        constexpr core::f64 kMaxFrameTime = 0.25;
        if (frameTime > kMaxFrameTime)
        {
            frameTime = kMaxFrameTime;
        }
        accumulator += frameTime;

        while (accumulator >= _fixedDt && _running.load())
        {
            if (auto result = onTick(); !result)
            {
                _running = false;
                core::Log::error("loop", "stopped after " + std::to_string(_tickCount.load()) +
                                         " ticks: " + result.error().message());
                return result;
            }
            accumulator -= _fixedDt;
            ++_tickCount;

            if (_maxTicks != 0 && _tickCount.load() >= _maxTicks)
            {
                _running = false;
            }
        }

        if (_running.load())
        {
            std::this_thread::sleep_for(std::chrono::duration<core::f64>(_fixedDt - accumulator));
        }
    }

    core::Log::info("loop", "stopped after " + std::to_string(_tickCount.load()) + " ticks");
    return {};
}

void GameLoop::requestStop() noexcept
{
    _running = false;
}

bool GameLoop::isRunning() const noexcept
{
    return _running.load();
}

core::u64 GameLoop::tickCount() const noexcept
{
    return _tickCount.load();
}

} // namespace tkl::engine
