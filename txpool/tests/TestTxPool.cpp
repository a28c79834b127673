/**
 * @file TestTxPool.cpp
 * @brief Unit tests for txpool::TxPool and txpool::SignedTransaction.
 */

#include <catch2/catch_test_macros.hpp>

#include <tkl/txpool/SignedTransaction.hpp>
#include <tkl/txpool/TxPool.hpp>
#include <tkl/serial/Bitstream.hpp>

#include <memory>
#include <string>

using namespace tkl;
using namespace tkl::txpool;

namespace {

std::shared_ptr<const SignedTransaction> signedBy(const std::string& persona, core::u64 nonce)
{
    return std::make_shared<const SignedTransaction>(persona, "world-1", nonce, "sig",
                                                     core::Bytes{core::byte{1}, core::byte{2}});
}

} // namespace

TEST_CASE("SignedTransaction hash covers every field", "[txpool][tx]")
{
    const SignedTransaction a{"alice", "world-1", 1, "sig", {}};
    const SignedTransaction b{"alice", "world-1", 2, "sig", {}};
    const SignedTransaction c{"alice", "world-1", 1, "sig", {}};

    REQUIRE_FALSE(a.hash().empty());
    REQUIRE(a.hash() != b.hash());
    REQUIRE(a.hash() == c.hash());
    REQUIRE(a == c);
}

TEST_CASE("SignedTransaction survives serialization", "[txpool][tx]")
{
    const auto original = signedBy("bob", 9);

    serial::Bitstream writer;
    REQUIRE(original->serialize(writer).has_value());
    const core::Bytes bytes = writer.takeBytes();

    serial::Bitstream reader{bytes};
    SignedTransaction decoded;
    REQUIRE(decoded.deserialize(reader).has_value());
    REQUIRE(decoded == *original);
    REQUIRE(decoded.hash() == original->hash());
}

TEST_CASE("TxPool keeps submission order within a type", "[txpool][pool]")
{
    TxPool pool;
    pool.addTransaction(1, std::string{"first"}, signedBy("alice", 1));
    pool.addTransaction(2, 42, signedBy("bob", 1));
    pool.addTransaction(1, std::string{"second"}, signedBy("alice", 2));

    const auto ones = pool.forType(1);
    REQUIRE(ones.size() == 2);
    REQUIRE(std::any_cast<std::string>(ones[0].msg) == "first");
    REQUIRE(std::any_cast<std::string>(ones[1].msg) == "second");

    REQUIRE(pool.forType(2).size() == 1);
    REQUIRE(pool.forType(3).empty());
    REQUIRE(pool.amountOfTxs() == 3);
    REQUIRE(pool.typeIds() == std::vector<MessageId>{1, 2});
}

TEST_CASE("TxPool returns the transaction hash", "[txpool][pool]")
{
    TxPool pool;
    const auto tx = signedBy("carol", 5);

    REQUIRE(pool.addTransaction(1, 0, tx) == tx->hash());
    REQUIRE(pool.addTransaction(1, 0, nullptr).empty());
    REQUIRE(pool.forType(1)[0].txHash == tx->hash());
}

TEST_CASE("copyTransactions moves the contents out", "[txpool][pool]")
{
    TxPool pool;
    pool.addTransaction(1, 10, nullptr);
    pool.addTransaction(2, 20, nullptr);

    TxPool taken = pool.copyTransactions();

    REQUIRE(pool.empty());
    REQUIRE(pool.amountOfTxs() == 0);
    REQUIRE(pool.typeIds().empty());
    REQUIRE(pool.forType(1).empty());

    REQUIRE(taken.amountOfTxs() == 2);
    REQUIRE(std::any_cast<int>(taken.forType(2)[0].msg) == 20);

    pool.addTransaction(1, 30, nullptr);
    REQUIRE(pool.amountOfTxs() == 1);
    REQUIRE(taken.amountOfTxs() == 2);
}
