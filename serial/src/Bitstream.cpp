/**
 * @file Bitstream.cpp
 * @brief Bitstream implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/serial/Bitstream.hpp>
#include <tkl/core/Assert.hpp>

#include <limits>
#include <utility>

namespace tkl::serial {

Bitstream::Bitstream() noexcept = default;

Bitstream::Bitstream(std::span<const core::byte> data)
    : buffer_{data.begin(), data.end()}
    , writeBit_{data.size() * 8}
    , readBit_{0}
    , totalBits_{data.size() * 8}
    , readOnly_{true}
{}

Bitstream::~Bitstream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void Bitstream::writeBits(core::u32 value, core::u32 bitCount)
{
    TKL_ASSERT(!readOnly_);
    TKL_ASSERT(bitCount > 0 && bitCount <= 32);

    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::usize byteIdx = writeBit_ >> 3;
        const core::usize bitIdx  = writeBit_ & 7;

        if (byteIdx >= buffer_.size())
        {
            buffer_.push_back(core::byte{0});
        }

        const core::u32 bit = (value >> (bitCount - 1 - i)) & 1u;
        auto& b = buffer_[byteIdx];
        b = static_cast<core::byte>(
            (static_cast<core::u8>(b) & ~(1u << (7 - bitIdx))) |
            (bit << (7 - bitIdx)));

        ++writeBit_;
    }

    totalBits_ = writeBit_;
}

void Bitstream::writeBool(bool value)     { writeBits(value ? 1u : 0u, 1); }
void Bitstream::writeU8(core::u8 value)   { writeBits(value, 8); }
void Bitstream::writeU16(core::u16 value) { writeBits(value, 16); }
void Bitstream::writeU32(core::u32 value) { writeBits(value, 32); }

void Bitstream::writeU64(core::u64 value)
{
    writeU32(static_cast<core::u32>(value >> 32));
    writeU32(static_cast<core::u32>(value & 0xFFFFFFFFu));
}

void Bitstream::writeRawBytes(std::span<const core::byte> bytes)
{
    TKL_ASSERT(!readOnly_);

    if ((writeBit_ & 7) == 0)
    {
        buffer_.resize(writeBit_ >> 3);
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
        writeBit_ += bytes.size() * 8;
        totalBits_ = writeBit_;
        return;
    }

    for (auto b : bytes)
    {
        writeU8(static_cast<core::u8>(b));
    }
}

void Bitstream::writeBytes(std::span<const core::byte> bytes)
{
    TKL_VERIFY(bytes.size() <= std::numeric_limits<core::u32>::max());
    writeU32(static_cast<core::u32>(bytes.size()));
    writeRawBytes(bytes);
}

void Bitstream::writeString(std::string_view text)
{
    writeBytes({reinterpret_cast<const core::byte*>(text.data()), text.size()});
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

core::Expected<core::u32> Bitstream::readBits(core::u32 bitCount)
{
    TKL_ASSERT(bitCount > 0 && bitCount <= 32);

    if (bitCount > bitsRemaining())
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "Bitstream underflow");
    }

    core::u32 result = 0;
    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::usize byteIdx = readBit_ >> 3;
        const core::usize bitIdx  = readBit_ & 7;
        const core::u32 bit = (static_cast<core::u8>(buffer_[byteIdx]) >> (7 - bitIdx)) & 1u;
        result = (result << 1) | bit;
        ++readBit_;
    }

    return result;
}

core::Expected<bool> Bitstream::readBool()
{
    const core::u32 bit = TKL_TRY(readBits(1));
    return bit != 0;
}

core::Expected<core::u8> Bitstream::readU8()
{
    const core::u32 value = TKL_TRY(readBits(8));
    return static_cast<core::u8>(value);
}

core::Expected<core::u16> Bitstream::readU16()
{
    const core::u32 value = TKL_TRY(readBits(16));
    return static_cast<core::u16>(value);
}

core::Expected<core::u32> Bitstream::readU32()
{
    return readBits(32);
}

core::Expected<core::u64> Bitstream::readU64()
{
    const core::u64 high = TKL_TRY(readU32());
    const core::u64 low  = TKL_TRY(readU32());
    return (high << 32) | low;
}

core::Expected<core::Bytes> Bitstream::readRawBytes(core::usize count)
{
    if (count > bitsRemaining() / 8)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "Bitstream underflow: " + std::to_string(count) +
                               " bytes requested");
    }

    core::Bytes out;
    out.reserve(count);

    if ((readBit_ & 7) == 0)
    {
        const auto first = buffer_.begin() + static_cast<core::isize>(readBit_ >> 3);
        out.assign(first, first + static_cast<core::isize>(count));
        readBit_ += count * 8;
        return out;
    }

    for (core::usize i = 0; i < count; ++i)
    {
        const core::u8 value = TKL_TRY(readU8());
        out.push_back(static_cast<core::byte>(value));
    }
    return out;
}

core::Expected<core::Bytes> Bitstream::readBytes()
{
    const core::u32 length = TKL_TRY(readU32());
    return readRawBytes(length);
}

core::Expected<std::string> Bitstream::readString()
{
    const core::Bytes bytes = TKL_TRY(readBytes());
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::usize Bitstream::bitsWritten() const noexcept { return writeBit_; }

core::usize Bitstream::bitsRemaining() const noexcept
{
    return (totalBits_ > readBit_) ? totalBits_ - readBit_ : 0;
}

bool Bitstream::exhausted() const noexcept
{
    return bitsRemaining() < 8;
}

std::span<const core::byte> Bitstream::data() const noexcept { return buffer_; }

core::Bytes Bitstream::takeBytes() noexcept
{
    core::Bytes out = std::move(buffer_);
    buffer_.clear();
    writeBit_  = 0;
    readBit_   = 0;
    totalBits_ = 0;
    return out;
}

void Bitstream::reset() noexcept
{
    readBit_ = 0;
    if (!readOnly_)
    {
        writeBit_ = 0;
        totalBits_ = 0;
        buffer_.clear();
    }
}

} // namespace tkl::serial
