/**
 * @file TestError.cpp
 * @brief Unit tests for tkl::core::Error and the TKL_TRY macros.
 */

#include <catch2/catch_test_macros.hpp>

#include <tkl/core/Expected.hpp>

using namespace tkl::core;

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
    {
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    }
    return value;
}

Expected<int> doubled(int value)
{
    const int parsed = TKL_TRY(parsePositive(value));
    return parsed * 2;
}

Expected<void> checked(int value)
{
    TKL_TRY_WRAP(parsePositive(value), "failed to check value");
    return {};
}

} // namespace

TEST_CASE("Error carries code and message", "[core][error]")
{
    const Error error{ErrorCode::kNotFound, "missing key"};

    REQUIRE(error.code() == ErrorCode::kNotFound);
    REQUIRE(error.message() == "missing key");
    REQUIRE(error.isNotFound());
    REQUIRE(toString(error.code()) == "not_found");
}

TEST_CASE("Error::wrap prefixes context and keeps the code", "[core][error]")
{
    const Error inner{ErrorCode::kTransactionFailed, "commit rejected"};
    const Error outer = inner.wrap("failed to end transaction");

    REQUIRE(outer.code() == ErrorCode::kTransactionFailed);
    REQUIRE(outer.message() == "failed to end transaction: commit rejected");
    REQUIRE_FALSE(outer.isNotFound());
}

TEST_CASE("TKL_TRY yields the value or propagates the error", "[core][error]")
{
    auto ok = doubled(21);
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 42);

    auto failed = doubled(-1);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("TKL_TRY_WRAP adds context on the way up", "[core][error]")
{
    REQUIRE(checked(3).has_value());

    auto failed = checked(0);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(failed.error().message() == "failed to check value: not positive");
}

TEST_CASE("Every error code has a distinct name", "[core][error]")
{
    REQUIRE(toString(ErrorCode::kUnknownMessageType) != toString(ErrorCode::kNotFound));
    REQUIRE(toString(ErrorCode::kCorruptedData) != toString(ErrorCode::kDeserializationFailed));
    REQUIRE_FALSE(toString(ErrorCode::kInternalError).empty());
}
