#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/identity/node_id.hpp"
#include "beacon/messaging/message_state.hpp"
#include "beacon/messaging/msg_id.hpp"
#include "beacon/messaging/payload_cipher.hpp"
#include <google/protobuf/struct.pb.h>
#include <chrono>
#include <concepts>
#include <string>
#include <utility>
#include <vector>
namespace beacon::node::messaging {
using identity::NodeId;
using Timestamp = std::chrono::system_clock::time_point;
using Metadata = google::protobuf::Struct;

template<MessageState State>
class MessageEnvelope;
class EnvelopeCodec;

/**
 * Replaces the plaintext with ciphertext for every recipient in To(). All
 * other fields, the correlation id included, move over unchanged.
 */
[[nodiscard]] Result<MessageEnvelope<Encrypted>, BeaconFailure> Encrypt(
    MessageEnvelope<Plain>&& envelope,
    const IPayloadEncryptor& encryptor);

/**
 * Inverse of Encrypt. Decryption failures come from @p decryptor unchanged.
 */
[[nodiscard]] Result<MessageEnvelope<Plain>, BeaconFailure> Decrypt(
    MessageEnvelope<Encrypted>&& envelope,
    const IPayloadDecryptor& decryptor);

[[nodiscard]] bool MetadataEquals(const Metadata& a, const Metadata& b);

/**
 * @brief Message exchanged between nodes, typed by payload state.
 *
 * MessageEnvelope<Plain> exposes Body() and can only leave that state
 * through Encrypt; MessageEnvelope<Encrypted> exposes Ciphertext() and can
 * only be read through Decrypt. Code that sends to peers takes
 * MessageEnvelope<Encrypted>, so an unencrypted payload cannot reach it.
 */
template<MessageState State>
class MessageEnvelope {
public:
    /// New plaintext envelope with a fresh id, expiring @p ttl from now.
    [[nodiscard]] static Result<MessageEnvelope, BeaconFailure> Create(
        NodeId from,
        std::vector<NodeId> to,
        std::string body,
        std::chrono::seconds ttl = EnvelopeConstants::DEFAULT_TTL,
        Metadata metadata = {}) requires std::same_as<State, Plain> {
        if (to.empty()) {
            return Result<MessageEnvelope, BeaconFailure>::Err(
                BeaconFailure::InvalidInput("Envelope needs at least one recipient"));
        }
        if (to.size() > EnvelopeConstants::MAX_RECIPIENTS) {
            return Result<MessageEnvelope, BeaconFailure>::Err(
                BeaconFailure::InvalidInput("Envelope has too many recipients"));
        }
        if (ttl <= std::chrono::seconds::zero() || ttl > EnvelopeConstants::MAX_TTL) {
            return Result<MessageEnvelope, BeaconFailure>::Err(
                BeaconFailure::InvalidInput("Envelope ttl is out of range"));
        }
        if (body.size() > EnvelopeConstants::MAX_BODY_SIZE) {
            return Result<MessageEnvelope, BeaconFailure>::Err(
                BeaconFailure::InvalidInput("Envelope body is too large"));
        }
        return Result<MessageEnvelope, BeaconFailure>::Ok(MessageEnvelope(
            std::move(from),
            std::move(to),
            MsgId::Generate(),
            std::chrono::system_clock::now() + ttl,
            Plain{std::move(body)},
            std::move(metadata)));
    }

    [[nodiscard]] const NodeId& From() const noexcept { return from_; }
    [[nodiscard]] const std::vector<NodeId>& To() const noexcept { return to_; }
    [[nodiscard]] const MsgId& Id() const noexcept { return id_; }
    /// Key under which a waiter matches the response to this envelope.
    [[nodiscard]] MsgId WaitId() const noexcept { return id_; }
    [[nodiscard]] Timestamp Expire() const noexcept { return expire_; }
    [[nodiscard]] const Metadata& GetMetadata() const noexcept { return metadata_; }
    [[nodiscard]] const State& Secret() const noexcept { return secret_; }

    [[nodiscard]] const std::string& Body() const noexcept requires std::same_as<State, Plain> {
        return secret_.body;
    }
    [[nodiscard]] const std::string& Ciphertext() const noexcept requires std::same_as<State, Encrypted> {
        return secret_.blob;
    }

    [[nodiscard]] bool IsExpired(const Timestamp now) const noexcept { return now >= expire_; }

    bool operator==(const MessageEnvelope& other) const {
        return from_ == other.from_ &&
               to_ == other.to_ &&
               id_ == other.id_ &&
               expire_ == other.expire_ &&
               secret_ == other.secret_ &&
               MetadataEquals(metadata_, other.metadata_);
    }

    MessageEnvelope(const MessageEnvelope&) = default;
    MessageEnvelope(MessageEnvelope&&) noexcept = default;
    MessageEnvelope& operator=(const MessageEnvelope&) = delete;
    MessageEnvelope& operator=(MessageEnvelope&&) = delete;
    ~MessageEnvelope() = default;

private:
    // Envelopes come only from Create, the codec, or a state transition.
    MessageEnvelope(NodeId from,
                    std::vector<NodeId> to,
                    MsgId id,
                    Timestamp expire,
                    State secret,
                    Metadata metadata)
        : from_(std::move(from))
        , to_(std::move(to))
        , id_(id)
        , expire_(expire)
        , secret_(std::move(secret))
        , metadata_(std::move(metadata)) {}

    template<MessageState Other>
    [[nodiscard]] MessageEnvelope<Other> ReplaceSecret(Other secret) && {
        return MessageEnvelope<Other>(
            std::move(from_),
            std::move(to_),
            id_,
            expire_,
            std::move(secret),
            std::move(metadata_));
    }

    template<MessageState Other>
    friend class MessageEnvelope;
    friend class EnvelopeCodec;
    friend Result<MessageEnvelope<Encrypted>, BeaconFailure> Encrypt(
        MessageEnvelope<Plain>&& envelope,
        const IPayloadEncryptor& encryptor);
    friend Result<MessageEnvelope<Plain>, BeaconFailure> Decrypt(
        MessageEnvelope<Encrypted>&& envelope,
        const IPayloadDecryptor& decryptor);

    NodeId from_;
    std::vector<NodeId> to_;
    MsgId id_;
    Timestamp expire_;
    State secret_;
    Metadata metadata_;
};

using PlainEnvelope = MessageEnvelope<Plain>;
using EncryptedEnvelope = MessageEnvelope<Encrypted>;

}
