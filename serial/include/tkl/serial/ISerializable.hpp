/**
 * @file ISerializable.hpp
 * @brief Abstract serialization interface.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_SERIAL_ISERIALIZABLE_HPP
    #define TKL_SERIAL_ISERIALIZABLE_HPP

#include <tkl/core/Types.hpp>
#include <tkl/core/Expected.hpp>

namespace tkl::serial {

class Bitstream;

/** @brief Interface for types that support binary serialization. */
class ISerializable
{
public:
    virtual ~ISerializable() = default;

    /**
     * @brief Serialize this object into the bitstream.
     * @param stream Output bitstream.
     * @return Success or error.
     */
    [[nodiscard]] virtual core::Expected<void> serialize(Bitstream& stream) const = 0;

    /**
     * @brief Deserialize this object from the bitstream.
     * @param stream Input bitstream.
     * @return Success or error.
     */
    [[nodiscard]] virtual core::Expected<void> deserialize(Bitstream& stream) = 0;

protected:
    ISerializable() = default;
    ISerializable(const ISerializable&) = default;
    ISerializable& operator=(const ISerializable&) = default;
    ISerializable(ISerializable&&) = default;
    ISerializable& operator=(ISerializable&&) = default;
};

} // namespace tkl::serial

#endif // TKL_SERIAL_ISERIALIZABLE_HPP
