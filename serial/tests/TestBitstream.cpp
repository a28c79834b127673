/**
 * @file TestBitstream.cpp
 * @brief Unit tests for serial::Bitstream and serial::StateHash.
 */

#include <catch2/catch_test_macros.hpp>

#include <tkl/serial/Bitstream.hpp>
#include <tkl/serial/StateHash.hpp>

#include <array>

using namespace tkl;
using namespace tkl::serial;

TEST_CASE("Bitstream integers are big-endian", "[serial][bitstream]")
{
    Bitstream stream;
    stream.writeU32(0x01020304u);

    const auto bytes = stream.data();
    REQUIRE(bytes.size() == 4);
    REQUIRE(bytes[0] == core::byte{0x01});
    REQUIRE(bytes[3] == core::byte{0x04});
    REQUIRE(stream.bitsWritten() == 32);
}

TEST_CASE("Bitstream reads back mixed fields in order", "[serial][bitstream]")
{
    Bitstream writer;
    writer.writeBool(true);
    writer.writeBits(5, 3);
    writer.writeU16(0xBEEF);
    writer.writeU64(0x0123456789ABCDEFull);
    writer.writeString("persona");

    const core::Bytes bytes = writer.takeBytes();
    Bitstream reader{bytes};

    REQUIRE(reader.readBool().value());
    REQUIRE(reader.readBits(3).value() == 5u);
    REQUIRE(reader.readU16().value() == 0xBEEF);
    REQUIRE(reader.readU64().value() == 0x0123456789ABCDEFull);
    REQUIRE(reader.readString().value() == "persona");
    REQUIRE(reader.exhausted());
}

TEST_CASE("Bitstream length-prefixes byte strings", "[serial][bitstream]")
{
    const std::array<core::byte, 3> payload{core::byte{7}, core::byte{8}, core::byte{9}};

    Bitstream writer;
    writer.writeBytes(payload);
    REQUIRE(writer.data().size() == 4 + payload.size());

    const core::Bytes bytes = writer.takeBytes();
    Bitstream reader{bytes};
    auto read = reader.readBytes();
    REQUIRE(read.has_value());
    REQUIRE(*read == core::Bytes(payload.begin(), payload.end()));
}

TEST_CASE("Bitstream underflow is an out-of-range error", "[serial][bitstream]")
{
    const std::array<core::byte, 2> shortInput{core::byte{0}, core::byte{1}};
    Bitstream reader{shortInput};

    auto read = reader.readU32();
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().code() == core::ErrorCode::kOutOfRange);
}

TEST_CASE("Bitstream rejects a length prefix larger than the input", "[serial][bitstream]")
{
    Bitstream writer;
    writer.writeU32(1000);
    writer.writeU8(1);

    const core::Bytes bytes = writer.takeBytes();
    Bitstream reader{bytes};
    auto read = reader.readBytes();
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().code() == core::ErrorCode::kOutOfRange);
}

TEST_CASE("StateHash separates adjacent strings", "[serial][hash]")
{
    StateHash a;
    a.hashString("ab").hashString("c");

    StateHash b;
    b.hashString("a").hashString("bc");

    REQUIRE(a.digest() != b.digest());
    REQUIRE(a.hexDigest().size() == 16);
}

TEST_CASE("StateHash is deterministic and resettable", "[serial][hash]")
{
    StateHash hash;
    hash.combine(core::u64{42}).hashString("tick");
    const auto first = hash.digest();

    hash.reset();
    hash.combine(core::u64{42}).hashString("tick");
    REQUIRE(hash.digest() == first);
}
