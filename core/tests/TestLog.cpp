/**
 * @file TestLog.cpp
 * @brief Unit tests for the tkl::core::Log façade.
 */

#include <catch2/catch_test_macros.hpp>

#include <tkl/core/Log.hpp>

#include <string>
#include <vector>

using namespace tkl::core;

namespace {

struct Entry
{
    LogLevel    level;
    std::string tag;
    std::string message;
};

class CaptureLogger final : public ILogger
{
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

/// Restores the default sink and level when a test ends.
struct ScopedLogger
{
    explicit ScopedLogger(ILogger& logger) : previous{Log::minLevel()} { Log::setLogger(&logger); }
    ~ScopedLogger()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(previous);
    }

    LogLevel previous;
};

} // namespace

TEST_CASE("Log routes tagged messages to the installed sink", "[core][log]")
{
    CaptureLogger capture;
    ScopedLogger scope{capture};
    Log::setMinLevel(LogLevel::kDebug);

    Log::info("storage", "opened");
    Log::error("ecb", "commit failed");

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].level == LogLevel::kInfo);
    REQUIRE(capture.entries[0].tag == "storage");
    REQUIRE(capture.entries[0].message == "opened");
    REQUIRE(capture.entries[1].level == LogLevel::kError);
    REQUIRE(capture.entries[1].tag == "ecb");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    CaptureLogger capture;
    ScopedLogger scope{capture};
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("ecb", "started tick 3");
    Log::info("world", "tick 3");
    Log::warn("world", "recovering");

    REQUIRE(capture.entries.size() == 1);
    REQUIRE(capture.entries[0].level == LogLevel::kWarn);
}

TEST_CASE("Untagged messages use the default tag", "[core][log]")
{
    CaptureLogger capture;
    ScopedLogger scope{capture};
    Log::setMinLevel(LogLevel::kDebug);

    Log::info("hello");

    REQUIRE(capture.entries.size() == 1);
    REQUIRE(capture.entries[0].tag == "tkl");
}
