/**
 * @file Fixtures.hpp
 * @brief Message payloads and helpers shared by the gamestate tests.
 */
#pragma once

#ifndef TKL_GAMESTATE_TESTS_FIXTURES_HPP
    #define TKL_GAMESTATE_TESTS_FIXTURES_HPP

#include <tkl/gamestate/EntityCommandBuffer.hpp>
#include <tkl/message/MessageRegistry.hpp>
#include <tkl/storage/MemoryStorage.hpp>
#include <tkl/txpool/SignedTransaction.hpp>

#include <memory>
#include <string>

namespace tkl::test {

struct Transfer
{
    std::string to;
    core::u64   amount{0};

    core::Expected<void> serialize(serial::Bitstream& stream) const
    {
        stream.writeString(to);
        stream.writeU64(amount);
        return {};
    }

    core::Expected<void> deserialize(serial::Bitstream& stream)
    {
        to     = TKL_TRY(stream.readString());
        amount = TKL_TRY(stream.readU64());
        return {};
    }

    bool operator==(const Transfer&) const = default;
};

struct Ping
{
    core::u32 seq{0};

    core::Expected<void> serialize(serial::Bitstream& stream) const
    {
        stream.writeU32(seq);
        return {};
    }

    core::Expected<void> deserialize(serial::Bitstream& stream)
    {
        seq = TKL_TRY(stream.readU32());
        return {};
    }

    bool operator==(const Ping&) const = default;
};

inline std::shared_ptr<const txpool::SignedTransaction> signedBy(const std::string& persona,
                                                                 core::u64 nonce)
{
    return std::make_shared<const txpool::SignedTransaction>(persona, "test-world", nonce, "sig",
                                                             core::Bytes{core::byte{0xAB}});
}

inline core::Bytes bytesOf(std::string_view text)
{
    const auto* first = reinterpret_cast<const core::byte*>(text.data());
    return core::Bytes(first, first + text.size());
}

/// Registry with "test.transfer" (id 1) and "test.ping" (id 2).
struct Messages
{
    Messages()
        : transfer{registry.create<Transfer>("test", "transfer").value()}
        , ping{registry.create<Ping>("test", "ping").value()}
    {}

    message::MessageRegistry                                 registry;
    std::shared_ptr<const message::MessageType<Transfer>>    transfer;
    std::shared_ptr<const message::MessageType<Ping>>        ping;
};

} // namespace tkl::test

#endif // TKL_GAMESTATE_TESTS_FIXTURES_HPP
