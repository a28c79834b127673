/**
 * @file SignedTransaction.cpp
 * @brief SignedTransaction implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <tkl/txpool/SignedTransaction.hpp>
#include <tkl/serial/Bitstream.hpp>
#include <tkl/serial/StateHash.hpp>

#include <algorithm>
#include <utility>

namespace tkl::txpool {

SignedTransaction::SignedTransaction()
{
    rehash();
}

SignedTransaction::SignedTransaction(std::string personaTag,
                                     std::string namespaceName,
                                     core::u64 nonce,
                                     std::string signature,
                                     core::Bytes body)
    : _personaTag{std::move(personaTag)}
    , _namespace{std::move(namespaceName)}
    , _nonce{nonce}
    , _signature{std::move(signature)}
    , _body{std::move(body)}
{
    rehash();
}

SignedTransaction::~SignedTransaction() = default;

void SignedTransaction::rehash()
{
    serial::StateHash hasher;
    hasher.hashString(_personaTag);
    hasher.hashString(_namespace);
    hasher.combine(_nonce);
    hasher.hashString(_signature);
    hasher.combine(static_cast<core::u64>(_body.size()));
    hasher.hashBytes(_body);
    _hash = hasher.hexDigest();
}

core::Expected<void> SignedTransaction::serialize(serial::Bitstream& stream) const
{
    stream.writeString(_personaTag);
    stream.writeString(_namespace);
    stream.writeU64(_nonce);
    stream.writeString(_signature);
    stream.writeBytes(_body);
    return {};
}

core::Expected<void> SignedTransaction::deserialize(serial::Bitstream& stream)
{
    _personaTag = TKL_TRY(stream.readString());
    _namespace  = TKL_TRY(stream.readString());
    _nonce      = TKL_TRY(stream.readU64());
    _signature  = TKL_TRY(stream.readString());
    _body       = TKL_TRY(stream.readBytes());
    rehash();
    return {};
}

bool SignedTransaction::operator==(const SignedTransaction& other) const noexcept
{
    return _hash == other._hash
        && _personaTag == other._personaTag
        && _namespace == other._namespace
        && _nonce == other._nonce
        && _signature == other._signature
        && std::ranges::equal(_body, other._body);
}

} // namespace tkl::txpool
