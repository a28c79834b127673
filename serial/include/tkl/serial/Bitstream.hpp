/**
 * @file Bitstream.hpp
 * @brief Bit-level serialization stream for journal and payload encoding.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_SERIAL_BITSTREAM_HPP
    #define TKL_SERIAL_BITSTREAM_HPP

#include <tkl/core/Types.hpp>
#include <tkl/core/Expected.hpp>
#include <tkl/core/NonCopyable.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tkl::serial {

// /////////////////////////////////////////////////////////////////////////////
/// @class Bitstream
/// @brief Compact bit-level read/write stream.
///
/// Packs fields at arbitrary bit widths. All operations are deterministic
/// and endian-safe (values stored big-endian in the bit buffer), so an
/// encoded value is byte-identical across hosts and process restarts.
/// Variable-length fields are prefixed with their byte length as a u32.
// /////////////////////////////////////////////////////////////////////////////
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    /// @brief Constructs an empty writable bitstream.
    Bitstream() noexcept;

    /// @brief Constructs a read-only bitstream over a copy of @p data.
    /// @param data Raw bytes; every bit is readable.
    explicit Bitstream(std::span<const core::byte> data);

    ~Bitstream();

    Bitstream(Bitstream&&) noexcept = default;
    Bitstream& operator=(Bitstream&&) noexcept = default;

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Writes @p bitCount bits from @p value.
    /// @param value    Value to write (only lower @p bitCount bits are used).
    /// @param bitCount Number of bits to write (1-32).
    void writeBits(core::u32 value, core::u32 bitCount);

    /// @brief Writes a boolean (1 bit).
    void writeBool(bool value);

    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);

    /// @brief Writes raw bytes with no length prefix.
    void writeRawBytes(std::span<const core::byte> bytes);

    /// @brief Writes a u32 length prefix followed by @p bytes.
    void writeBytes(std::span<const core::byte> bytes);

    /// @brief Writes a length-prefixed string.
    void writeString(std::string_view text);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    /// @brief Reads @p bitCount bits as an unsigned value.
    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);

    [[nodiscard]] core::Expected<bool>      readBool();
    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::u64> readU64();

    /// @brief Reads exactly @p count raw bytes.
    [[nodiscard]] core::Expected<core::Bytes> readRawBytes(core::usize count);

    /// @brief Reads a u32 length prefix and that many bytes.
    [[nodiscard]] core::Expected<core::Bytes> readBytes();

    /// @brief Reads a length-prefixed string.
    [[nodiscard]] core::Expected<std::string> readString();

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Returns the total number of written bits.
    [[nodiscard]] core::usize bitsWritten() const noexcept;

    /// @brief Returns the number of bits remaining for reading.
    [[nodiscard]] core::usize bitsRemaining() const noexcept;

    /// @brief True once fewer than 8 unread bits remain (trailing padding).
    [[nodiscard]] bool exhausted() const noexcept;

    /// @brief Returns the underlying byte buffer.
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /// @brief Moves the encoded bytes out and resets the stream.
    [[nodiscard]] core::Bytes takeBytes() noexcept;

    /// @brief Resets read/write cursors to the beginning.
    void reset() noexcept;

private:
    std::vector<core::byte> buffer_;
    core::usize             writeBit_{0};
    core::usize             readBit_{0};
    core::usize             totalBits_{0};
    bool                    readOnly_{false};
};

} // namespace tkl::serial

#endif // TKL_SERIAL_BITSTREAM_HPP
