/**
 * @file SignedTransaction.hpp
 * @brief Externally submitted, signed transaction envelope.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TKL_TXPOOL_SIGNEDTRANSACTION_HPP
    #define TKL_TXPOOL_SIGNEDTRANSACTION_HPP

#include <tkl/txpool/Types.hpp>
#include <tkl/serial/ISerializable.hpp>
#include <tkl/core/Types.hpp>

#include <span>
#include <string>

namespace tkl::txpool {

/**
 * @class SignedTransaction
 * @brief The envelope a message arrived in: who sent it, under which
 *        namespace, with which nonce and signature.
 *
 * The hash is derived from every other field and is recomputed whenever
 * the transaction is deserialized, so it can never drift from the content.
 * Signature verification is the sequencer's job, not ours.
 */
class SignedTransaction final : public serial::ISerializable
{
public:
    SignedTransaction();
    SignedTransaction(std::string personaTag,
                      std::string namespaceName,
                      core::u64 nonce,
                      std::string signature,
                      core::Bytes body);
    ~SignedTransaction() override;

    SignedTransaction(const SignedTransaction&) = default;
    SignedTransaction& operator=(const SignedTransaction&) = default;
    SignedTransaction(SignedTransaction&&) = default;
    SignedTransaction& operator=(SignedTransaction&&) = default;

    [[nodiscard]] const std::string& personaTag() const noexcept { return _personaTag; }
    [[nodiscard]] const std::string& namespaceName() const noexcept { return _namespace; }
    [[nodiscard]] core::u64 nonce() const noexcept { return _nonce; }
    [[nodiscard]] const std::string& signature() const noexcept { return _signature; }
    [[nodiscard]] std::span<const core::byte> body() const noexcept { return _body; }
    [[nodiscard]] const TxHash& hash() const noexcept { return _hash; }

    [[nodiscard]] core::Expected<void> serialize(serial::Bitstream& stream) const override;
    [[nodiscard]] core::Expected<void> deserialize(serial::Bitstream& stream) override;

    [[nodiscard]] bool operator==(const SignedTransaction& other) const noexcept;

private:
    void rehash();

    std::string _personaTag;
    std::string _namespace;
    core::u64   _nonce{0};
    std::string _signature;
    core::Bytes _body;
    TxHash      _hash;
};

} // namespace tkl::txpool

#endif // TKL_TXPOOL_SIGNEDTRANSACTION_HPP
