#include "beacon/messaging/hybrid_payload_cipher.hpp"
#include "beacon/crypto/certificate.hpp"
#include "beacon/crypto/rsa_private_key.hpp"
#include "beacon/crypto/sodium_interop.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/format.hpp"
#include "common/message_envelope.pb.h"
#include <openssl/x509.h>
#include <sodium.h>
#include <set>
#include <string>
namespace beacon::node::messaging {
using crypto::Certificate;
using crypto::RsaPublicKey;
using crypto::SodiumInterop;
namespace {
    std::string AssociatedData(const std::set<std::string>& recipients) {
        std::string joined;
        for (const auto& recipient : recipients) {
            joined.append(recipient);
            joined.push_back('\n');
        }
        return joined;
    }

    void Wipe(std::vector<uint8_t>& buffer) {
        auto wipe = SodiumInterop::SecureWipe(std::span(buffer));
        (void) wipe;
    }

    Result<Plain, BeaconFailure> PayloadError(std::string message) {
        return Result<Plain, BeaconFailure>::Err(BeaconFailure::SignEncryptError(std::move(message)));
    }
}

HybridPayloadCipher::HybridPayloadCipher(
    std::shared_ptr<const CryptoIdentity> identity,
    std::shared_ptr<const IDirectoryLookup> directory)
    : identity_(std::move(identity))
    , directory_(std::move(directory)) {}

Result<std::vector<uint8_t>, BeaconFailure> HybridPayloadCipher::WrapKeyFor(
    const NodeId& recipient,
    std::span<const uint8_t> payload_key) const {
    auto record = directory_->Lookup(recipient);
    if (!record.has_value()) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("No certificate known for recipient {}", recipient.Value())));
    }
    auto cert_result = Certificate::FromPem(record->certificate_pem);
    if (cert_result.IsErr()) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(std::move(cert_result).UnwrapErr());
    }
    const Certificate& certificate = cert_result.Unwrap();
    auto public_key = RsaPublicKey::FromNative(X509_get0_pubkey(certificate.Native()));
    if (public_key.IsErr()) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("Certificate of {} has no usable RSA key: {}",
                               recipient.Value(), public_key.UnwrapErr().message)));
    }
    return public_key.Unwrap().EncryptOaep(payload_key);
}

Result<Encrypted, BeaconFailure> HybridPayloadCipher::Encrypt(
    const Plain& payload,
    std::span<const NodeId> recipients) const {
    if (recipients.empty()) {
        return Result<Encrypted, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Cannot encrypt a payload without recipients"));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Encrypted, BeaconFailure>::Err(BeaconFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    const std::set<NodeId> unique_recipients(recipients.begin(), recipients.end());
    std::set<std::string> recipient_names;
    for (const auto& recipient : unique_recipients) {
        recipient_names.insert(recipient.Value());
    }
    const std::string associated_data = AssociatedData(recipient_names);

    std::vector<uint8_t> payload_key = SodiumInterop::GetRandomBytes(Constants::PAYLOAD_KEY_SIZE);
    std::vector<uint8_t> nonce = SodiumInterop::GetRandomBytes(Constants::PAYLOAD_NONCE_SIZE);

    proto::common::EncryptedPayload message;
    message.set_version(PAYLOAD_VERSION);
    message.set_nonce(nonce.data(), nonce.size());

    for (const auto& recipient : unique_recipients) {
        auto wrapped = WrapKeyFor(recipient, payload_key);
        if (wrapped.IsErr()) {
            Wipe(payload_key);
            return Result<Encrypted, BeaconFailure>::Err(std::move(wrapped).UnwrapErr());
        }
        const auto& encrypted_key = wrapped.Unwrap();
        auto* entry = message.add_keys();
        entry->set_recipient(recipient.Value());
        entry->set_encrypted_key(encrypted_key.data(), encrypted_key.size());
    }

    std::string ciphertext(payload.body.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES, '\0');
    unsigned long long ciphertext_len = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        reinterpret_cast<unsigned char*>(ciphertext.data()), &ciphertext_len,
        reinterpret_cast<const unsigned char*>(payload.body.data()), payload.body.size(),
        reinterpret_cast<const unsigned char*>(associated_data.data()), associated_data.size(),
        nullptr, nonce.data(), payload_key.data());
    Wipe(payload_key);
    if (rc != SodiumConstants::SUCCESS) {
        return Result<Encrypted, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError("Payload encryption failed"));
    }
    ciphertext.resize(static_cast<size_t>(ciphertext_len));
    message.set_ciphertext(std::move(ciphertext));

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        return Result<Encrypted, BeaconFailure>::Err(
            BeaconFailure::Encode("Failed to serialize EncryptedPayload to protobuf"));
    }
    auto encoded = SodiumInterop::ToBase64(
        std::span(reinterpret_cast<const uint8_t*>(serialized.data()), serialized.size()));
    if (encoded.IsErr()) {
        return Result<Encrypted, BeaconFailure>::Err(BeaconFailure::FromSodiumFailure(encoded.UnwrapErr()));
    }
    return Result<Encrypted, BeaconFailure>::Ok(Encrypted{std::move(encoded).Unwrap()});
}

Result<Plain, BeaconFailure> HybridPayloadCipher::Decrypt(const Encrypted& payload) const {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Plain, BeaconFailure>::Err(BeaconFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto decoded = SodiumInterop::FromBase64(payload.blob);
    if (decoded.IsErr()) {
        return PayloadError(compat::format("Encrypted payload is not valid base64: {}",
                                           decoded.UnwrapErr().message));
    }
    const auto& raw = decoded.Unwrap();
    proto::common::EncryptedPayload message;
    if (!message.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
        return PayloadError("Failed to parse EncryptedPayload from protobuf");
    }
    if (message.version() != PAYLOAD_VERSION) {
        return PayloadError(compat::format("Unsupported payload version {}", message.version()));
    }
    if (message.nonce().size() != Constants::PAYLOAD_NONCE_SIZE ||
        message.ciphertext().size() < crypto_aead_xchacha20poly1305_ietf_ABYTES) {
        return PayloadError("Encrypted payload is truncated");
    }

    std::set<std::string> recipients;
    for (const auto& entry : message.keys()) {
        recipients.insert(entry.recipient());
    }
    const std::string associated_data = AssociatedData(recipients);

    // Our own entry first; then any other entry in case we were addressed
    // under a different id.
    const std::string& own_id = identity_->Id().Value();
    std::vector<const proto::common::WrappedKey*> candidates;
    for (const auto& entry : message.keys()) {
        if (entry.recipient() == own_id) {
            candidates.insert(candidates.begin(), &entry);
        } else {
            candidates.push_back(&entry);
        }
    }

    std::vector<uint8_t> payload_key;
    for (const auto* entry : candidates) {
        const auto& wrapped = entry->encrypted_key();
        auto unwrapped = identity_->PrivateKey().DecryptOaep(
            std::span(reinterpret_cast<const uint8_t*>(wrapped.data()), wrapped.size()));
        if (unwrapped.IsOk() && unwrapped.Unwrap().size() == Constants::PAYLOAD_KEY_SIZE) {
            payload_key = std::move(unwrapped).Unwrap();
            break;
        }
    }
    if (payload_key.empty()) {
        return PayloadError(std::string(ErrorMessages::PAYLOAD_NOT_FOR_US));
    }

    const std::string& ciphertext = message.ciphertext();
    std::string plaintext(ciphertext.size() - crypto_aead_xchacha20poly1305_ietf_ABYTES, '\0');
    unsigned long long plaintext_len = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        reinterpret_cast<unsigned char*>(plaintext.data()), &plaintext_len,
        nullptr,
        reinterpret_cast<const unsigned char*>(ciphertext.data()), ciphertext.size(),
        reinterpret_cast<const unsigned char*>(associated_data.data()), associated_data.size(),
        reinterpret_cast<const unsigned char*>(message.nonce().data()), payload_key.data());
    Wipe(payload_key);
    if (rc != SodiumConstants::SUCCESS) {
        return PayloadError(std::string(ErrorMessages::PAYLOAD_AUTH_FAILED));
    }
    plaintext.resize(static_cast<size_t>(plaintext_len));
    return Result<Plain, BeaconFailure>::Ok(Plain{std::move(plaintext)});
}

}
