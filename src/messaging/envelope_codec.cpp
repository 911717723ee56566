#include "beacon/messaging/envelope_codec.hpp"
#include "beacon/core/format.hpp"
#include "common/message_envelope.pb.h"
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <chrono>
#include <cstdint>
#include <limits>
namespace beacon::node::messaging {
using google::protobuf::util::TimeUtil;
namespace {
    const std::string& SecretText(const Plain& secret) { return secret.body; }
    const std::string& SecretText(const Encrypted& secret) { return secret.blob; }

    template<MessageState State>
    proto::common::MessageEnvelope ToProto(const MessageEnvelope<State>& envelope) {
        proto::common::MessageEnvelope message;
        message.set_from(envelope.From().Value());
        for (const auto& recipient : envelope.To()) {
            message.add_to(recipient.Value());
        }
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
            envelope.Expire().time_since_epoch());
        *message.mutable_ttl() = TimeUtil::NanosecondsToTimestamp(nanos.count());
        message.set_id(envelope.Id().ToString());
        message.set_secret(SecretText(envelope.Secret()));
        *message.mutable_metadata() = envelope.GetMetadata();
        return message;
    }

    // Wire timestamps span years 1 to 9999; the clock only covers a few
    // centuries around 1970, so seconds are range-checked before scaling.
    Result<Timestamp, BeaconFailure> ExpiryFromWire(const google::protobuf::Timestamp& ttl) {
        using std::chrono::duration_cast;
        constexpr auto MAX_SECONDS = duration_cast<std::chrono::seconds>(Timestamp::duration::max()).count();
        constexpr auto MIN_SECONDS = duration_cast<std::chrono::seconds>(Timestamp::duration::min()).count();
        constexpr int32_t NANOS_PER_SECOND = 1'000'000'000;
        if (ttl.nanos() < 0 || ttl.nanos() >= NANOS_PER_SECOND) {
            return Result<Timestamp, BeaconFailure>::Err(
                BeaconFailure::Decode(compat::format("Invalid expiry nanoseconds {}", ttl.nanos())));
        }
        if (ttl.seconds() >= MAX_SECONDS || ttl.seconds() <= MIN_SECONDS) {
            return Result<Timestamp, BeaconFailure>::Err(
                BeaconFailure::Decode(compat::format("Envelope expiry {} s is out of range", ttl.seconds())));
        }
        const auto since_epoch = duration_cast<Timestamp::duration>(std::chrono::seconds(ttl.seconds())) +
                                 duration_cast<Timestamp::duration>(std::chrono::nanoseconds(ttl.nanos()));
        return Result<Timestamp, BeaconFailure>::Ok(Timestamp(since_epoch));
    }

    google::protobuf::util::JsonPrintOptions PrintOptions() {
        google::protobuf::util::JsonPrintOptions options;
        options.preserve_proto_field_names = true;
        return options;
    }
}

template<MessageState State>
Result<MessageEnvelope<State>, BeaconFailure> EnvelopeCodec::FromProto(proto::common::MessageEnvelope&& message) {
    using ResultType = Result<MessageEnvelope<State>, BeaconFailure>;
    auto from = NodeId::Create(message.from());
    if (from.IsErr()) {
        return ResultType::Err(BeaconFailure::Decode(
            compat::format("Invalid sender: {}", from.UnwrapErr().message)));
    }
    if (message.to_size() == 0) {
        return ResultType::Err(BeaconFailure::Decode("Envelope has no recipients"));
    }
    std::vector<NodeId> to;
    to.reserve(static_cast<size_t>(message.to_size()));
    for (const auto& value : message.to()) {
        auto recipient = NodeId::Create(value);
        if (recipient.IsErr()) {
            return ResultType::Err(BeaconFailure::Decode(
                compat::format("Invalid recipient: {}", recipient.UnwrapErr().message)));
        }
        to.push_back(std::move(recipient).Unwrap());
    }
    auto id = MsgId::Parse(message.id());
    if (id.IsErr()) {
        return ResultType::Err(std::move(id).UnwrapErr());
    }
    if (!message.has_ttl()) {
        return ResultType::Err(BeaconFailure::Decode("Envelope has no expiry"));
    }
    auto expire = ExpiryFromWire(message.ttl());
    if (expire.IsErr()) {
        return ResultType::Err(std::move(expire).UnwrapErr());
    }
    return ResultType::Ok(MessageEnvelope<State>(
        std::move(from).Unwrap(),
        std::move(to),
        id.Unwrap(),
        expire.Unwrap(),
        State{std::move(*message.mutable_secret())},
        std::move(*message.mutable_metadata())));
}

template<MessageState State>
Result<std::string, BeaconFailure> EnvelopeCodec::ToJson(const MessageEnvelope<State>& envelope) {
    const auto message = ToProto(envelope);
    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(message, &json, PrintOptions());
    if (!status.ok()) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::Encode(compat::format("Failed to encode envelope as JSON: {}", status.ToString())));
    }
    return Result<std::string, BeaconFailure>::Ok(std::move(json));
}

template<MessageState State>
Result<MessageEnvelope<State>, BeaconFailure> EnvelopeCodec::FromJson(const std::string_view json) {
    proto::common::MessageEnvelope message;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), &message, options);
    if (!status.ok()) {
        return Result<MessageEnvelope<State>, BeaconFailure>::Err(
            BeaconFailure::Decode(compat::format("Malformed envelope JSON: {}", status.ToString())));
    }
    return FromProto<State>(std::move(message));
}

template<MessageState State>
Result<std::string, BeaconFailure> EnvelopeCodec::ToBinary(const MessageEnvelope<State>& envelope) {
    const auto message = ToProto(envelope);
    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::Encode("Failed to serialize MessageEnvelope to protobuf"));
    }
    return Result<std::string, BeaconFailure>::Ok(std::move(bytes));
}

template<MessageState State>
Result<MessageEnvelope<State>, BeaconFailure> EnvelopeCodec::FromBinary(const std::string_view bytes) {
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<MessageEnvelope<State>, BeaconFailure>::Err(
            BeaconFailure::Decode("Envelope is too large"));
    }
    proto::common::MessageEnvelope message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<MessageEnvelope<State>, BeaconFailure>::Err(
            BeaconFailure::Decode("Failed to parse MessageEnvelope from protobuf"));
    }
    return FromProto<State>(std::move(message));
}

template Result<std::string, BeaconFailure> EnvelopeCodec::ToJson(const MessageEnvelope<Plain>&);
template Result<std::string, BeaconFailure> EnvelopeCodec::ToJson(const MessageEnvelope<Encrypted>&);
template Result<MessageEnvelope<Plain>, BeaconFailure> EnvelopeCodec::FromJson<Plain>(std::string_view);
template Result<MessageEnvelope<Encrypted>, BeaconFailure> EnvelopeCodec::FromJson<Encrypted>(std::string_view);
template Result<std::string, BeaconFailure> EnvelopeCodec::ToBinary(const MessageEnvelope<Plain>&);
template Result<std::string, BeaconFailure> EnvelopeCodec::ToBinary(const MessageEnvelope<Encrypted>&);
template Result<MessageEnvelope<Plain>, BeaconFailure> EnvelopeCodec::FromBinary<Plain>(std::string_view);
template Result<MessageEnvelope<Encrypted>, BeaconFailure> EnvelopeCodec::FromBinary<Encrypted>(std::string_view);

}
