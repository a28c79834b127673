/**
 * @file TestTickProtocol.cpp
 * @brief Tick counters, start/finalize, and crash recovery of the
 *        entity command buffer.
 */

#include <catch2/catch_test_macros.hpp>

#include "Fixtures.hpp"

#include <tkl/gamestate/EntityCommandBuffer.hpp>
#include <tkl/gamestate/Journal.hpp>
#include <tkl/gamestate/Keys.hpp>

#include <array>

using namespace tkl;
using namespace tkl::gamestate;
using tkl::test::Messages;
using tkl::test::Ping;
using tkl::test::Transfer;
using tkl::test::signedBy;

namespace {

std::unique_ptr<EntityCommandBuffer> makeBuffer(storage::IStorage& storage)
{
    auto buffer = EntityCommandBuffer::create(storage);
    REQUIRE(buffer.has_value());
    return std::move(*buffer);
}

std::vector<PendingTransaction> storedJournal(storage::IStorage& storage)
{
    auto bytes = storage.getBytes(keys::kPendingTransactions);
    REQUIRE(bytes.has_value());
    auto entries = journal::decode(*bytes);
    REQUIRE(entries.has_value());
    return std::move(*entries);
}

TickNumbers ticksOf(EntityCommandBuffer& buffer)
{
    auto ticks = buffer.getTickNumbers();
    REQUIRE(ticks.has_value());
    return *ticks;
}

} // namespace

TEST_CASE("Fresh store reads tick numbers as zero", "[gamestate][tick]")
{
    storage::MemoryStorage storage;
    auto buffer = makeBuffer(storage);

    REQUIRE(ticksOf(*buffer) == TickNumbers{0, 0});
    REQUIRE(ticksOf(*buffer) == TickNumbers{0, 0});
    REQUIRE(storage.size() == 0);
}

TEST_CASE("StartNextTick journals the pool and bumps start only", "[gamestate][tick]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    txpool::TxPool pool;
    pool.addTransaction(messages.transfer->id(), Transfer{"bob", 10}, signedBy("alice", 1));

    REQUIRE(buffer->startNextTick(messages.registry.messages(), pool).has_value());
    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 0});

    const auto entries = storedJournal(storage);
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].typeId == messages.transfer->id());
    REQUIRE(entries[0].txHash == signedBy("alice", 1)->hash());
}

TEST_CASE("FinalizeTick bumps end only and empties the mutation set", "[gamestate][tick]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    txpool::TxPool pool;
    pool.addTransaction(messages.transfer->id(), Transfer{"bob", 10}, signedBy("alice", 1));
    REQUIRE(buffer->startNextTick(messages.registry.messages(), pool).has_value());

    const std::array<core::byte, 1> hp{core::byte{100}};
    const std::array<ComponentValue, 1> components{{{3, hp}}};
    REQUIRE(buffer->createEntity(components).has_value());
    REQUIRE(buffer->pendingMutationCount() > 0);

    REQUIRE(buffer->finalizeTick().has_value());
    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 1});
    REQUIRE(buffer->pendingMutationCount() == 0);
    REQUIRE(storage.getBytes(keys::componentValue(3, 0)).has_value());
}

TEST_CASE("Recover after a crash rebuilds the in-flight pool", "[gamestate][tick][recover]")
{
    storage::MemoryStorage storage;
    Messages messages;

    const auto tx1 = signedBy("alice", 1);
    const auto tx2 = signedBy("bob", 7);
    {
        auto crashed = makeBuffer(storage);
        txpool::TxPool pool;
        pool.addTransaction(messages.transfer->id(), Transfer{"bob", 10}, tx1);
        pool.addTransaction(messages.ping->id(), Ping{4}, nullptr);
        pool.addTransaction(messages.transfer->id(), Transfer{"carol", 2}, tx2);
        REQUIRE(crashed->startNextTick(messages.registry.messages(), pool).has_value());
        // Simulation never finishes: the buffer is dropped with the tick in flight.
    }

    Messages restarted;
    auto buffer = makeBuffer(storage);
    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 0});

    auto pool = buffer->recover(restarted.registry.messages());
    REQUIRE(pool.has_value());
    REQUIRE(pool->amountOfTxs() == 3);

    const auto transfers = pool->forType(restarted.transfer->id());
    REQUIRE(transfers.size() == 2);
    REQUIRE(std::any_cast<Transfer>(transfers[0].msg) == Transfer{"bob", 10});
    REQUIRE(std::any_cast<Transfer>(transfers[1].msg) == Transfer{"carol", 2});
    REQUIRE(transfers[0].txHash == tx1->hash());
    REQUIRE(*transfers[1].tx == *tx2);

    const auto pings = pool->forType(restarted.ping->id());
    REQUIRE(pings.size() == 1);
    REQUIRE(std::any_cast<Ping>(pings[0].msg) == Ping{4});
    REQUIRE(pings[0].tx == nullptr);
    REQUIRE(pings[0].txHash.empty());

    REQUIRE(buffer->finalizeTick().has_value());
    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 1});
}

TEST_CASE("Recover on a fresh store yields an empty pool", "[gamestate][tick][recover]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);
    REQUIRE(ticksOf(*buffer) == TickNumbers{0, 0});

    auto pool = buffer->recover(messages.registry.messages());
    REQUIRE(pool.has_value());
    REQUIRE(pool->empty());
    REQUIRE(pool->amountOfTxs() == 0);
    REQUIRE(ticksOf(*buffer) == TickNumbers{0, 0});
}

TEST_CASE("Recover still reports a failing journal read", "[gamestate][tick][recover][fault]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    storage.failNextRead(core::ErrorCode::kBackendUnavailable);
    auto pool = buffer->recover(messages.registry.messages());
    REQUIRE_FALSE(pool.has_value());
    REQUIRE(pool.error().code() == core::ErrorCode::kBackendUnavailable);
}

TEST_CASE("An empty pool journals an empty sequence", "[gamestate][tick]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(buffer->startNextTick(messages.registry.messages(), txpool::TxPool{}).has_value());
        REQUIRE(buffer->finalizeTick().has_value());
    }

    REQUIRE(buffer->startNextTick(messages.registry.messages(), txpool::TxPool{}).has_value());
    REQUIRE(ticksOf(*buffer) == TickNumbers{4, 3});
    REQUIRE(storedJournal(storage).empty());

    auto pool = buffer->recover(messages.registry.messages());
    REQUIRE(pool.has_value());
    REQUIRE(pool->empty());
}

TEST_CASE("Journal groups by message type order, then submission order", "[gamestate][tick][journal]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    txpool::TxPool pool;
    pool.addTransaction(messages.ping->id(), Ping{1}, nullptr);
    pool.addTransaction(messages.transfer->id(), Transfer{"a", 1}, nullptr);
    pool.addTransaction(messages.ping->id(), Ping{2}, nullptr);
    pool.addTransaction(messages.transfer->id(), Transfer{"b", 2}, nullptr);

    REQUIRE(buffer->startNextTick(messages.registry.messages(), pool).has_value());

    const auto entries = storedJournal(storage);
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0].typeId == messages.transfer->id());
    REQUIRE(entries[1].typeId == messages.transfer->id());
    REQUIRE(entries[2].typeId == messages.ping->id());
    REQUIRE(entries[3].typeId == messages.ping->id());
    REQUIRE(messages.transfer->decodeTyped(entries[0].data).value() == Transfer{"a", 1});
    REQUIRE(messages.ping->decodeTyped(entries[3].data).value() == Ping{2});
}

TEST_CASE("A tick cannot start while another is in flight", "[gamestate][tick]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    REQUIRE(buffer->startNextTick(messages.registry.messages(), txpool::TxPool{}).has_value());

    auto again = buffer->startNextTick(messages.registry.messages(), txpool::TxPool{});
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kInvalidState);
    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 0});
}

TEST_CASE("Finalize without a started tick is rejected", "[gamestate][tick]")
{
    storage::MemoryStorage storage;
    auto buffer = makeBuffer(storage);

    auto finalized = buffer->finalizeTick();
    REQUIRE_FALSE(finalized.has_value());
    REQUIRE(finalized.error().code() == core::ErrorCode::kInvalidState);
    REQUIRE(ticksOf(*buffer) == TickNumbers{0, 0});
}

TEST_CASE("Failed start commit changes nothing", "[gamestate][tick][fault]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    txpool::TxPool first;
    first.addTransaction(messages.ping->id(), Ping{1}, nullptr);
    REQUIRE(buffer->startNextTick(messages.registry.messages(), first).has_value());
    REQUIRE(buffer->finalizeTick().has_value());

    txpool::TxPool second;
    second.addTransaction(messages.ping->id(), Ping{2}, nullptr);
    second.addTransaction(messages.ping->id(), Ping{3}, nullptr);
    storage.failNextCommit();

    auto started = buffer->startNextTick(messages.registry.messages(), second);
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code() == core::ErrorCode::kTransactionFailed);
    REQUIRE(started.error().message().starts_with("failed to end transaction"));

    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 1});
    const auto entries = storedJournal(storage);
    REQUIRE(entries.size() == 1);
    REQUIRE(messages.ping->decodeTyped(entries[0].data).value() == Ping{1});
}

TEST_CASE("Failed finalize keeps the mutation set for a retry", "[gamestate][tick][fault]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    REQUIRE(buffer->startNextTick(messages.registry.messages(), txpool::TxPool{}).has_value());
    const auto hp = tkl::test::bytesOf("hp");
    const std::array<ComponentValue, 1> components{{{3, hp}}};
    const EntityId entity = buffer->createEntity(components).value();
    const core::usize pending = buffer->pendingMutationCount();

    storage.failNextCommit(core::ErrorCode::kTimeout);
    auto finalized = buffer->finalizeTick();
    REQUIRE_FALSE(finalized.has_value());
    REQUIRE(finalized.error().code() == core::ErrorCode::kTimeout);

    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 0});
    REQUIRE(buffer->pendingMutationCount() == pending);
    REQUIRE(storage.getBytes(keys::componentValue(3, entity)).error().isNotFound());

    REQUIRE(buffer->finalizeTick().has_value());
    REQUIRE(ticksOf(*buffer) == TickNumbers{1, 1});
    REQUIRE(storage.getBytes(keys::componentValue(3, entity)).value() == hp);
}

TEST_CASE("Backend read failures are reported with context", "[gamestate][tick][fault]")
{
    storage::MemoryStorage storage;
    auto buffer = makeBuffer(storage);

    storage.failNextRead();
    auto ticks = buffer->getTickNumbers();
    REQUIRE_FALSE(ticks.has_value());
    REQUIRE(ticks.error().code() == core::ErrorCode::kBackendUnavailable);
    REQUIRE(ticks.error().message().starts_with("failed to get start tick"));
}

TEST_CASE("Unregistered or unencodable pool entries abort the start", "[gamestate][tick][fault]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    txpool::TxPool unknown;
    unknown.addTransaction(99, Ping{1}, nullptr);
    auto started = buffer->startNextTick(messages.registry.messages(), unknown);
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code() == core::ErrorCode::kUnknownMessageType);

    txpool::TxPool mistyped;
    mistyped.addTransaction(messages.transfer->id(), Ping{1}, nullptr);
    started = buffer->startNextTick(messages.registry.messages(), mistyped);
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code() == core::ErrorCode::kSerializationFailed);

    REQUIRE(ticksOf(*buffer) == TickNumbers{0, 0});
    REQUIRE(storage.getBytes(keys::kPendingTransactions).error().isNotFound());
}

TEST_CASE("Recover fails when a journaled type is no longer registered", "[gamestate][tick][recover]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    txpool::TxPool pool;
    pool.addTransaction(messages.ping->id(), Ping{1}, nullptr);
    REQUIRE(buffer->startNextTick(messages.registry.messages(), pool).has_value());

    message::MessageRegistry reduced;
    REQUIRE(reduced.create<Transfer>("test", "transfer").has_value());

    auto recovered = buffer->recover(reduced.messages());
    REQUIRE_FALSE(recovered.has_value());
    REQUIRE(recovered.error().code() == core::ErrorCode::kUnknownMessageType);
}

TEST_CASE("Recover reports a damaged journal", "[gamestate][tick][recover]")
{
    storage::MemoryStorage storage;
    Messages messages;
    auto buffer = makeBuffer(storage);

    REQUIRE(storage.setBytes(keys::kPendingTransactions, tkl::test::bytesOf("garbage!")).has_value());

    auto recovered = buffer->recover(messages.registry.messages());
    REQUIRE_FALSE(recovered.has_value());
    REQUIRE(recovered.error().code() == core::ErrorCode::kDeserializationFailed);
}
