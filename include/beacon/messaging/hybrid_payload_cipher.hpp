#pragma once
#include "beacon/messaging/payload_cipher.hpp"
#include "beacon/identity/crypto_identity.hpp"
#include "beacon/identity/directory_lookup.hpp"
#include <memory>
namespace beacon::node::messaging {
using identity::CryptoIdentity;
using identity::IDirectoryLookup;

/**
 * @brief Payload cipher used between nodes.
 *
 * A fresh 32-byte key encrypts the body with XChaCha20-Poly1305; that key is
 * then wrapped with RSA-OAEP (SHA-256) for every recipient, using the public
 * key of the certificate the directory holds for it. The result is a
 * base64-encoded EncryptedPayload message.
 *
 * Stateless apart from the shared, read-only identity and directory; a
 * single instance may be used from any number of threads.
 */
class HybridPayloadCipher final : public IPayloadEncryptor, public IPayloadDecryptor {
public:
    HybridPayloadCipher(std::shared_ptr<const CryptoIdentity> identity,
                        std::shared_ptr<const IDirectoryLookup> directory);

    [[nodiscard]] Result<Encrypted, BeaconFailure> Encrypt(
        const Plain& payload,
        std::span<const NodeId> recipients) const override;

    [[nodiscard]] Result<Plain, BeaconFailure> Decrypt(const Encrypted& payload) const override;

    static constexpr uint32_t PAYLOAD_VERSION = 1;

private:
    [[nodiscard]] Result<std::vector<uint8_t>, BeaconFailure> WrapKeyFor(
        const NodeId& recipient,
        std::span<const uint8_t> payload_key) const;

    std::shared_ptr<const CryptoIdentity> identity_;
    std::shared_ptr<const IDirectoryLookup> directory_;
};

}
