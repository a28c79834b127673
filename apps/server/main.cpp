// --- TICKLEDGER HEADLESS SERVER --- //
// File: main.cpp
// Description: Runs the demo game over a durable tick ledger. Restarting
//              against the same data directory resumes, recovering an
//              interrupted tick first.
// Auteur: MasterLaplace

#include "DemoGame.hpp"

#include <tkl/engine/Config.hpp>
#include <tkl/engine/Engine.hpp>
#include <tkl/core/Log.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace {

tkl::engine::Engine* gEngine = nullptr;

void onSignal(int)
{
    if (gEngine != nullptr)
    {
        gEngine->requestShutdown();
    }
}

void printUsage(const char* program)
{
    std::printf("usage: %s [--data-dir <path>] [--memory] [--tick-rate <hz>] [--ticks <n>] "
                "[--namespace <name>] [--verbose]\n",
                program);
}

bool parseUnsigned(const char* text, unsigned long long& out)
{
    char* end = nullptr;
    out = std::strtoull(text, &end, 10);
    return end != text && *end == '\0';
}

} // namespace

int main(int argc, char** argv)
{
    using namespace tkl;

    engine::Config::Builder builder;
    builder.storageKind(engine::StorageKind::kFile);

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        const bool hasValue = i + 1 < argc;
        unsigned long long number = 0;

        if (std::strcmp(arg, "--data-dir") == 0 && hasValue)
        {
            builder.dataDirectory(argv[++i]);
        }
        else if (std::strcmp(arg, "--memory") == 0)
        {
            builder.storageKind(engine::StorageKind::kMemory);
        }
        else if (std::strcmp(arg, "--tick-rate") == 0 && hasValue && parseUnsigned(argv[++i], number) &&
                 number > 0)
        {
            builder.tickRate(static_cast<core::u32>(number));
        }
        else if (std::strcmp(arg, "--ticks") == 0 && hasValue && parseUnsigned(argv[++i], number))
        {
            builder.maxTicks(number);
        }
        else if (std::strcmp(arg, "--namespace") == 0 && hasValue)
        {
            builder.namespaceName(argv[++i]);
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            builder.logLevel(core::LogLevel::kDebug);
        }
        else if (std::strcmp(arg, "--help") == 0)
        {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }
        else
        {
            std::fprintf(stderr, "invalid argument: %s\n", arg);
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    server::DemoGame game;
    engine::Engine engine{builder.build()};

    auto initialised = engine.init([&game](engine::World& world) { return game.setup(world); });
    if (!initialised)
    {
        core::Log::fatal("server", initialised.error().message());
        return EXIT_FAILURE;
    }

    gEngine = &engine;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto ran = engine.run([&game](engine::World& world) { return game.queueBotInput(world); });
    gEngine = nullptr;

    if (!ran)
    {
        core::Log::fatal("server", ran.error().message());
        return EXIT_FAILURE;
    }

    core::Log::info("server", "ran " + std::to_string(engine.ticksRun()) + " ticks, world at tick " +
                              std::to_string(engine.world().currentTick()));
    engine.shutdown();
    return EXIT_SUCCESS;
}
