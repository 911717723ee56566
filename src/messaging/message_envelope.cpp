#include "beacon/messaging/message_envelope.hpp"
#include "beacon/debug/identity_logger.hpp"
#include <google/protobuf/util/message_differencer.h>
#include <span>
namespace beacon::node::messaging {

bool MetadataEquals(const Metadata& a, const Metadata& b) {
    return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

Result<MessageEnvelope<Encrypted>, BeaconFailure> Encrypt(
    MessageEnvelope<Plain>&& envelope,
    const IPayloadEncryptor& encryptor) {
    auto encrypted = encryptor.Encrypt(envelope.secret_, std::span<const NodeId>(envelope.to_));
    if (encrypted.IsErr()) {
        return Result<MessageEnvelope<Encrypted>, BeaconFailure>::Err(
            std::move(encrypted).UnwrapErr());
    }
    Encrypted secret = std::move(encrypted).Unwrap();
    debug::LogEnvelopeEncrypted(envelope.id_.ToString(), envelope.secret_.body.size(),
                                secret.blob.size(), envelope.to_.size());
    return Result<MessageEnvelope<Encrypted>, BeaconFailure>::Ok(
        std::move(envelope).ReplaceSecret(std::move(secret)));
}

Result<MessageEnvelope<Plain>, BeaconFailure> Decrypt(
    MessageEnvelope<Encrypted>&& envelope,
    const IPayloadDecryptor& decryptor) {
    auto decrypted = decryptor.Decrypt(envelope.secret_);
    if (decrypted.IsErr()) {
        return Result<MessageEnvelope<Plain>, BeaconFailure>::Err(
            std::move(decrypted).UnwrapErr());
    }
    Plain secret = std::move(decrypted).Unwrap();
    debug::LogEnvelopeDecrypted(envelope.id_.ToString(), envelope.secret_.blob.size(),
                                secret.body.size());
    return Result<MessageEnvelope<Plain>, BeaconFailure>::Ok(
        std::move(envelope).ReplaceSecret(std::move(secret)));
}

}
