#pragma once
#include "beacon/crypto/certificate.hpp"
#include "beacon/crypto/rs256_signing_key.hpp"
#include "beacon/crypto/rsa_private_key.hpp"
#include "beacon/identity/node_id.hpp"
#include <string>
namespace beacon::node::identity {
using crypto::Certificate;
using crypto::Rs256SigningKey;
using crypto::RsaPrivateKey;

/// The node's own certificate and public key as served by the directory.
struct CryptoPublicPortion {
    NodeId node_id;
    Certificate certificate;
    std::string public_key_pem;
};

/**
 * @brief Key material the node signs and decrypts with.
 *
 * Built once by IdentityBootstrapper and never modified afterwards; after
 * IdentityPublisher::Publish it is shared read-only for the process
 * lifetime.
 */
class CryptoIdentity {
public:
    CryptoIdentity(Rs256SigningKey signing_key,
                   RsaPrivateKey private_key,
                   CryptoPublicPortion public_portion) noexcept
        : signing_key_(std::move(signing_key))
        , private_key_(std::move(private_key))
        , public_portion_(std::move(public_portion)) {}

    /// Signing key whose key id is the formatted certificate serial.
    [[nodiscard]] const Rs256SigningKey& SigningKey() const noexcept { return signing_key_; }
    [[nodiscard]] const RsaPrivateKey& PrivateKey() const noexcept { return private_key_; }
    [[nodiscard]] const CryptoPublicPortion& PublicPortion() const noexcept { return public_portion_; }
    [[nodiscard]] const NodeId& Id() const noexcept { return public_portion_.node_id; }

    CryptoIdentity(CryptoIdentity&&) noexcept = default;
    CryptoIdentity& operator=(CryptoIdentity&&) = delete;
    CryptoIdentity(const CryptoIdentity&) = delete;
    CryptoIdentity& operator=(const CryptoIdentity&) = delete;
    ~CryptoIdentity() = default;
private:
    Rs256SigningKey signing_key_;
    RsaPrivateKey private_key_;
    CryptoPublicPortion public_portion_;
};

}
