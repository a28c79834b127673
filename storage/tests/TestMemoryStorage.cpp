/**
 * @file TestMemoryStorage.cpp
 * @brief Unit tests for storage::MemoryStorage and its pipelines.
 */

#include <catch2/catch_test_macros.hpp>

#include <tkl/storage/MemoryStorage.hpp>

#include <array>

using namespace tkl;
using namespace tkl::storage;

namespace {

core::Bytes bytesOf(std::string_view text)
{
    const auto* first = reinterpret_cast<const core::byte*>(text.data());
    return core::Bytes(first, first + text.size());
}

} // namespace

TEST_CASE("MemoryStorage reports absent keys as not found", "[storage][memory]")
{
    MemoryStorage storage;

    auto number = storage.getUInt64("ECB:START-TICK");
    REQUIRE_FALSE(number.has_value());
    REQUIRE(number.error().isNotFound());

    auto bytes = storage.getBytes("ECB:PENDING-TRANSACTIONS");
    REQUIRE_FALSE(bytes.has_value());
    REQUIRE(bytes.error().isNotFound());
}

TEST_CASE("MemoryStorage distinguishes a stored zero from an absent key", "[storage][memory]")
{
    MemoryStorage storage;
    REQUIRE(storage.setUInt64("counter", 0).has_value());

    auto value = storage.getUInt64("counter");
    REQUIRE(value.has_value());
    REQUIRE(*value == 0);
}

TEST_CASE("MemoryStorage increments from zero", "[storage][memory]")
{
    MemoryStorage storage;

    REQUIRE(storage.increment("counter").value() == 1);
    REQUIRE(storage.increment("counter").value() == 2);
    REQUIRE(storage.getUInt64("counter").value() == 2);
}

TEST_CASE("MemoryStorage rejects reading bytes as an integer", "[storage][memory]")
{
    MemoryStorage storage;
    REQUIRE(storage.setBytes("blob", bytesOf("not-a-number")).has_value());

    auto value = storage.getUInt64("blob");
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("MemoryStorage lists keys by prefix", "[storage][memory]")
{
    MemoryStorage storage;
    REQUIRE(storage.setUInt64("ECB:START-TICK", 1).has_value());
    REQUIRE(storage.setUInt64("ECB:END-TICK", 1).has_value());
    REQUIRE(storage.setUInt64("OTHER", 1).has_value());

    auto keys = storage.keys("ECB:");
    REQUIRE(keys.has_value());
    REQUIRE(keys->size() == 2);
}

TEST_CASE("Pipeline applies nothing before commit", "[storage][memory][pipeline]")
{
    MemoryStorage storage;
    auto pipe = storage.startTransaction();
    REQUIRE(pipe.has_value());

    REQUIRE((*pipe)->setBytes("journal", bytesOf("entries")).has_value());
    REQUIRE((*pipe)->increment("start").has_value());
    REQUIRE((*pipe)->queuedCount() == 2);
    REQUIRE(storage.size() == 0);

    REQUIRE((*pipe)->commit().has_value());
    REQUIRE(storage.getBytes("journal").value() == bytesOf("entries"));
    REQUIRE(storage.getUInt64("start").value() == 1);
    REQUIRE(storage.committedPipelines() == 1);
}

TEST_CASE("Pipeline commands see earlier commands of the same batch", "[storage][memory][pipeline]")
{
    MemoryStorage storage;
    REQUIRE(storage.setUInt64("gone", 5).has_value());

    auto pipe = storage.startTransaction();
    REQUIRE(pipe.has_value());
    REQUIRE((*pipe)->setUInt64("n", 41).has_value());
    REQUIRE((*pipe)->increment("n").has_value());
    REQUIRE((*pipe)->remove("gone").has_value());
    REQUIRE((*pipe)->commit().has_value());

    REQUIRE(storage.getUInt64("n").value() == 42);
    REQUIRE(storage.getUInt64("gone").error().isNotFound());
}

TEST_CASE("Pipeline is all-or-nothing when a command fails", "[storage][memory][pipeline]")
{
    MemoryStorage storage;
    REQUIRE(storage.setBytes("blob", bytesOf("text")).has_value());

    auto pipe = storage.startTransaction();
    REQUIRE(pipe.has_value());
    REQUIRE((*pipe)->setUInt64("first", 1).has_value());
    REQUIRE((*pipe)->increment("blob").has_value());

    auto committed = (*pipe)->commit();
    REQUIRE_FALSE(committed.has_value());
    REQUIRE(storage.getUInt64("first").error().isNotFound());
    REQUIRE(storage.committedPipelines() == 0);
}

TEST_CASE("Pipeline can only be committed once", "[storage][memory][pipeline]")
{
    MemoryStorage storage;
    auto pipe = storage.startTransaction();
    REQUIRE(pipe.has_value());
    REQUIRE((*pipe)->commit().has_value());

    auto again = (*pipe)->commit();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kInvalidState);

    auto late = (*pipe)->setUInt64("late", 1);
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("Injected commit failure leaves state unchanged", "[storage][memory][fault]")
{
    MemoryStorage storage;
    REQUIRE(storage.setUInt64("start", 3).has_value());
    storage.failNextCommit(core::ErrorCode::kTimeout);

    auto pipe = storage.startTransaction();
    REQUIRE(pipe.has_value());
    REQUIRE((*pipe)->increment("start").has_value());

    auto committed = (*pipe)->commit();
    REQUIRE_FALSE(committed.has_value());
    REQUIRE(committed.error().code() == core::ErrorCode::kTimeout);
    REQUIRE(storage.getUInt64("start").value() == 3);

    auto retry = storage.startTransaction();
    REQUIRE(retry.has_value());
    REQUIRE((*retry)->increment("start").has_value());
    REQUIRE((*retry)->commit().has_value());
    REQUIRE(storage.getUInt64("start").value() == 4);
}

TEST_CASE("Injected read failure is consumed by one read", "[storage][memory][fault]")
{
    MemoryStorage storage;
    REQUIRE(storage.setUInt64("start", 1).has_value());
    storage.failNextRead();

    auto failed = storage.getUInt64("start");
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == core::ErrorCode::kBackendUnavailable);

    REQUIRE(storage.getUInt64("start").value() == 1);
}
