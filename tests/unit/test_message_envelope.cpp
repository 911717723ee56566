#include <catch2/catch_test_macros.hpp>
#include "beacon/messaging/message_envelope.hpp"
#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>
using namespace beacon::node;
using namespace beacon::node::messaging;

namespace {
    /// Reverses the body and tags it; remembers which recipients it was asked for.
    class ReversingCipher final : public IPayloadEncryptor, public IPayloadDecryptor {
    public:
        [[nodiscard]] Result<Encrypted, BeaconFailure> Encrypt(
            const Plain& payload,
            std::span<const NodeId> recipients) const override {
            seen_recipients_.assign(recipients.begin(), recipients.end());
            std::string blob(payload.body.rbegin(), payload.body.rend());
            return Result<Encrypted, BeaconFailure>::Ok(Encrypted{"rev:" + blob});
        }

        [[nodiscard]] Result<Plain, BeaconFailure> Decrypt(const Encrypted& payload) const override {
            if (payload.blob.rfind("rev:", 0) != 0) {
                return Result<Plain, BeaconFailure>::Err(
                    BeaconFailure::SignEncryptError("blob was not produced by this cipher"));
            }
            const std::string reversed = payload.blob.substr(4);
            return Result<Plain, BeaconFailure>::Ok(Plain{std::string(reversed.rbegin(), reversed.rend())});
        }

        [[nodiscard]] const std::vector<NodeId>& SeenRecipients() const noexcept { return seen_recipients_; }
    private:
        mutable std::vector<NodeId> seen_recipients_;
    };

    class RefusingEncryptor final : public IPayloadEncryptor {
    public:
        [[nodiscard]] Result<Encrypted, BeaconFailure> Encrypt(
            const Plain&, std::span<const NodeId>) const override {
            return Result<Encrypted, BeaconFailure>::Err(
                BeaconFailure::SignEncryptError("No certificate known for recipient"));
        }
    };

    NodeId Id(const std::string& value) {
        return NodeId::Create(value).Unwrap();
    }

    Metadata TaskMetadata(const std::string& task) {
        Metadata metadata;
        (*metadata.mutable_fields())["task"].set_string_value(task);
        (*metadata.mutable_fields())["attempt"].set_number_value(2);
        return metadata;
    }

    PlainEnvelope SampleEnvelope() {
        auto envelope = PlainEnvelope::Create(
            Id("alpha.broker.example.org"),
            {Id("bravo.broker.example.org"), Id("charlie.broker.example.org")},
            "{\"query\":\"SELECT 1\"}",
            std::chrono::seconds(600),
            TaskMetadata("sync"));
        REQUIRE(envelope.IsOk());
        return std::move(envelope).Unwrap();
    }

    template<typename E>
    concept HasBody = requires(const E& e) { e.Body(); };

    template<typename E>
    concept HasCiphertext = requires(const E& e) { e.Ciphertext(); };

    template<typename E>
    concept CanEncrypt = requires(E&& e, const IPayloadEncryptor& encryptor) {
        Encrypt(std::move(e), encryptor);
    };

    template<typename E>
    concept CanDecrypt = requires(E&& e, const IPayloadDecryptor& decryptor) {
        Decrypt(std::move(e), decryptor);
    };

    template<typename E>
    concept CanCreate = requires(NodeId from, std::vector<NodeId> to, std::string body) {
        E::Create(from, to, body);
    };
}

static_assert(HasBody<PlainEnvelope>);
static_assert(!HasBody<EncryptedEnvelope>);
static_assert(HasCiphertext<EncryptedEnvelope>);
static_assert(!HasCiphertext<PlainEnvelope>);
static_assert(CanEncrypt<PlainEnvelope>);
static_assert(!CanEncrypt<EncryptedEnvelope>);
static_assert(CanDecrypt<EncryptedEnvelope>);
static_assert(!CanDecrypt<PlainEnvelope>);
static_assert(CanCreate<PlainEnvelope>);
static_assert(!CanCreate<EncryptedEnvelope>);
static_assert(!std::is_copy_assignable_v<PlainEnvelope>);
static_assert(!std::is_move_assignable_v<EncryptedEnvelope>);
static_assert(!std::is_constructible_v<EncryptedEnvelope,
    NodeId, std::vector<NodeId>, MsgId, Timestamp, Encrypted, Metadata>);
static_assert(!std::is_constructible_v<PlainEnvelope,
    NodeId, std::vector<NodeId>, MsgId, Timestamp, Plain, Metadata>);

TEST_CASE("MessageEnvelope - Create", "[messaging][envelope]") {
    const auto from = Id("alpha.broker.example.org");
    const std::vector<NodeId> to = {Id("bravo.broker.example.org")};

    SECTION("Defaults") {
        const auto before = std::chrono::system_clock::now();
        auto envelope = PlainEnvelope::Create(from, to, "hello");
        const auto after = std::chrono::system_clock::now();
        REQUIRE(envelope.IsOk());
        const auto& e = envelope.Unwrap();
        REQUIRE(e.From() == from);
        REQUIRE(e.To() == to);
        REQUIRE(e.Body() == "hello");
        REQUIRE(e.WaitId() == e.Id());
        REQUIRE(e.GetMetadata().fields().empty());
        REQUIRE(e.Expire() >= before + EnvelopeConstants::DEFAULT_TTL);
        REQUIRE(e.Expire() <= after + EnvelopeConstants::DEFAULT_TTL);
    }
    SECTION("Each envelope gets its own id") {
        auto a = PlainEnvelope::Create(from, to, "x");
        auto b = PlainEnvelope::Create(from, to, "x");
        REQUIRE(a.IsOk());
        REQUIRE(b.IsOk());
        REQUIRE_FALSE(a.Unwrap().Id() == b.Unwrap().Id());
    }
    SECTION("Empty body is allowed") {
        REQUIRE(PlainEnvelope::Create(from, to, "").IsOk());
    }
    SECTION("No recipients") {
        auto envelope = PlainEnvelope::Create(from, {}, "hello");
        REQUIRE(envelope.IsErr());
        REQUIRE(envelope.UnwrapErr().Is(BeaconFailureType::InvalidInput));
    }
    SECTION("Too many recipients") {
        std::vector<NodeId> crowd(EnvelopeConstants::MAX_RECIPIENTS + 1, Id("bravo.broker.example.org"));
        auto envelope = PlainEnvelope::Create(from, std::move(crowd), "hello");
        REQUIRE(envelope.IsErr());
        REQUIRE(envelope.UnwrapErr().Is(BeaconFailureType::InvalidInput));
    }
    SECTION("Lifetime out of range") {
        REQUIRE(PlainEnvelope::Create(from, to, "x", std::chrono::seconds(0)).IsErr());
        REQUIRE(PlainEnvelope::Create(from, to, "x", std::chrono::seconds(-5)).IsErr());
        REQUIRE(PlainEnvelope::Create(from, to, "x", EnvelopeConstants::MAX_TTL + std::chrono::seconds(1)).IsErr());
        REQUIRE(PlainEnvelope::Create(from, to, "x", EnvelopeConstants::MAX_TTL).IsOk());
    }
    SECTION("Oversized body") {
        auto envelope = PlainEnvelope::Create(from, to, std::string(EnvelopeConstants::MAX_BODY_SIZE + 1, 'a'));
        REQUIRE(envelope.IsErr());
        REQUIRE(envelope.UnwrapErr().Is(BeaconFailureType::InvalidInput));
    }
}

TEST_CASE("MessageEnvelope - Encrypt and decrypt", "[messaging][envelope]") {
    ReversingCipher cipher;
    const PlainEnvelope original = SampleEnvelope();

    SECTION("Encrypt keeps every field but the payload") {
        auto encrypted = Encrypt(PlainEnvelope(original), cipher);
        REQUIRE(encrypted.IsOk());
        const auto& e = encrypted.Unwrap();
        REQUIRE(e.From() == original.From());
        REQUIRE(e.To() == original.To());
        REQUIRE(e.Id() == original.Id());
        REQUIRE(e.WaitId() == original.WaitId());
        REQUIRE(e.Expire() == original.Expire());
        REQUIRE(MetadataEquals(e.GetMetadata(), original.GetMetadata()));
        REQUIRE(e.Ciphertext() != original.Body());
        REQUIRE(cipher.SeenRecipients() == original.To());
    }
    SECTION("Decrypt restores the original envelope") {
        auto encrypted = Encrypt(PlainEnvelope(original), cipher);
        REQUIRE(encrypted.IsOk());
        auto decrypted = Decrypt(std::move(encrypted).Unwrap(), cipher);
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == original);
        REQUIRE(decrypted.Unwrap().Body() == "{\"query\":\"SELECT 1\"}");
    }
    SECTION("Encryption failure is passed through") {
        RefusingEncryptor refusing;
        auto encrypted = Encrypt(PlainEnvelope(original), refusing);
        REQUIRE(encrypted.IsErr());
        REQUIRE(encrypted.UnwrapErr().Is(BeaconFailureType::SignEncryptError));
    }
    SECTION("Decryption failure is passed through") {
        EncryptedEnvelope foreign(original.From(), original.To(), original.Id(), original.Expire(),
                                  Encrypted{"opaque"}, original.GetMetadata());
        auto decrypted = Decrypt(std::move(foreign), cipher);
        REQUIRE(decrypted.IsErr());
        REQUIRE(decrypted.UnwrapErr().Is(BeaconFailureType::SignEncryptError));
    }
}

TEST_CASE("MessageEnvelope - Equality and expiry", "[messaging][envelope]") {
    const PlainEnvelope original = SampleEnvelope();

    SECTION("Metadata takes part in equality") {
        PlainEnvelope other(original.From(), original.To(), original.Id(), original.Expire(),
                            original.Secret(), TaskMetadata("purge"));
        REQUIRE_FALSE(other == original);
        PlainEnvelope same(original.From(), original.To(), original.Id(), original.Expire(),
                           original.Secret(), TaskMetadata("sync"));
        REQUIRE(same == original);
    }
    SECTION("Body takes part in equality") {
        PlainEnvelope other(original.From(), original.To(), original.Id(), original.Expire(),
                            Plain{"different"}, original.GetMetadata());
        REQUIRE_FALSE(other == original);
    }
    SECTION("Expiry is inclusive") {
        const auto expire = original.Expire();
        REQUIRE_FALSE(original.IsExpired(expire - std::chrono::seconds(1)));
        REQUIRE(original.IsExpired(expire));
        REQUIRE(original.IsExpired(expire + std::chrono::hours(1)));
    }
}
