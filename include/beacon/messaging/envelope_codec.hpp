#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/messaging/message_envelope.hpp"
#include <string>
#include <string_view>
namespace beacon::proto::common {
class MessageEnvelope;
}

namespace beacon::node::messaging {

/**
 * @brief Wire encodings of MessageEnvelope.
 *
 * JSON objects carry the fields `from`, `to`, `ttl` (RFC 3339 expiry),
 * `id`, `secret` and `metadata`. The binary form is the same
 * beacon.proto.common.MessageEnvelope message in protobuf encoding.
 * Decoding validates every node id and the message id and reports
 * problems as Decode failures.
 */
class EnvelopeCodec {
public:
    template<MessageState State>
    [[nodiscard]] static Result<std::string, BeaconFailure> ToJson(const MessageEnvelope<State>& envelope);

    template<MessageState State>
    [[nodiscard]] static Result<MessageEnvelope<State>, BeaconFailure> FromJson(std::string_view json);

    template<MessageState State>
    [[nodiscard]] static Result<std::string, BeaconFailure> ToBinary(const MessageEnvelope<State>& envelope);

    template<MessageState State>
    [[nodiscard]] static Result<MessageEnvelope<State>, BeaconFailure> FromBinary(std::string_view bytes);

    /// The only encoding used for traffic leaving the node.
    [[nodiscard]] static Result<std::string, BeaconFailure> EncodeForTransmission(
        const MessageEnvelope<Encrypted>& envelope) {
        return ToJson(envelope);
    }

private:
    template<MessageState State>
    [[nodiscard]] static Result<MessageEnvelope<State>, BeaconFailure> FromProto(
        proto::common::MessageEnvelope&& message);

    EnvelopeCodec() = delete;
};

extern template Result<std::string, BeaconFailure> EnvelopeCodec::ToJson(const MessageEnvelope<Plain>&);
extern template Result<std::string, BeaconFailure> EnvelopeCodec::ToJson(const MessageEnvelope<Encrypted>&);
extern template Result<MessageEnvelope<Plain>, BeaconFailure> EnvelopeCodec::FromJson<Plain>(std::string_view);
extern template Result<MessageEnvelope<Encrypted>, BeaconFailure> EnvelopeCodec::FromJson<Encrypted>(std::string_view);
extern template Result<std::string, BeaconFailure> EnvelopeCodec::ToBinary(const MessageEnvelope<Plain>&);
extern template Result<std::string, BeaconFailure> EnvelopeCodec::ToBinary(const MessageEnvelope<Encrypted>&);
extern template Result<MessageEnvelope<Plain>, BeaconFailure> EnvelopeCodec::FromBinary<Plain>(std::string_view);
extern template Result<MessageEnvelope<Encrypted>, BeaconFailure> EnvelopeCodec::FromBinary<Encrypted>(std::string_view);

}
