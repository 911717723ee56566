#include <catch2/catch_test_macros.hpp>
#include "beacon/identity/identity_initializer.hpp"
#include "beacon/identity/identity_publisher.hpp"
#include "beacon/messaging/envelope_codec.hpp"
#include "beacon/messaging/hybrid_payload_cipher.hpp"
#include "helpers/process_abort.hpp"
#include "helpers/test_identities.hpp"
#include <string>
#include <vector>
using namespace beacon::node;
using namespace beacon::node::configuration;
using namespace beacon::node::identity;
using namespace beacon::node::messaging;
using namespace beacon::node::test_helpers;

namespace {
    constexpr const char* BROKER_URL = "https://broker.example.org:8443";

    NodeConfig ConfigFor(const TempDirectory& dir, const TestNode& node) {
        return NodeConfig::Default()
            .WithPrivateKeyFile(dir.WriteFile("privkey.pem", node.pkcs1_pem))
            .WithRootCertFile(dir.WriteFile("root.crt", SharedPki().RootCertificatePem()))
            .WithNodeId(node.node_id)
            .WithBrokerUrl(BROKER_URL);
    }
}

// Publishes the process-wide identity. No SECTIONs: Catch2 would re-enter
// the test case and publish a second time.
TEST_CASE("Workflow - Node startup and encrypted exchange", "[integration][workflow]") {
    TempDirectory dir;
    const auto directory = DirectoryOf({&NodeAlpha(), &NodeBravo()});
    const NodeConfig config = ConfigFor(dir, NodeAlpha());

    auto broker_certificate = Certificate::FromPem(
        SharedPki().IssueNode("broker.example.org", "0B", {"broker.example.org"}).certificate_pem);
    REQUIRE(broker_certificate.IsOk());
    REQUIRE(config.VerifyBrokerDomain(broker_certificate.Unwrap()).IsOk());

    REQUIRE_FALSE(IdentityPublisher::IsPublished());
    auto summary = InitForNode(config, *directory);
    REQUIRE(summary.IsOk());
    const IdentitySummary& alpha = summary.Unwrap();
    REQUIRE(alpha.serial == "440E0D94F36966391117BC9F867D84F0C48CFCB7");
    REQUIRE(alpha.common_name == "alpha.broker.example.org");
    REQUIRE(IdentityPublisher::IsPublished());
    REQUIRE(IdentityPublisher::Get().get() == alpha.identity.get());
    REQUIRE(alpha.identity->SigningKey().KeyId() ==
            std::optional<std::string>("44:0e:0d:94:f3:69:66:39:11:17:bc:9f:86:7d:84:f0:c4:8c:fc:b7"));
    REQUIRE(directory->LookupCount() == 1);

    const auto bravo_identity = LoadTestIdentity(NodeBravo(), *directory);
    const HybridPayloadCipher alpha_cipher(IdentityPublisher::Get(), directory);
    const HybridPayloadCipher bravo_cipher(bravo_identity, directory);

    Metadata metadata;
    (*metadata.mutable_fields())["task"].set_string_value("count-patients");
    auto request = PlainEnvelope::Create(
        alpha.identity->Id(), {bravo_identity->Id()}, "{\"query\":\"SELECT count(*)\"}",
        EnvelopeConstants::DEFAULT_TTL, metadata);
    REQUIRE(request.IsOk());
    const MsgId request_id = request.Unwrap().Id();

    auto sealed = Encrypt(std::move(request).Unwrap(), alpha_cipher);
    REQUIRE(sealed.IsOk());
    auto wire = EnvelopeCodec::EncodeForTransmission(sealed.Unwrap());
    REQUIRE(wire.IsOk());
    REQUIRE(wire.Unwrap().find("SELECT") == std::string::npos);

    auto signature = alpha.identity->SigningKey().Sign(
        std::vector<uint8_t>(wire.Unwrap().begin(), wire.Unwrap().end()));
    REQUIRE(signature.IsOk());
    REQUIRE(signature.Unwrap().key_id == alpha.identity->SigningKey().KeyId());

    // Receiving side: verify against the sender's certificate, then decode.
    auto sender_record = directory->Lookup(alpha.identity->Id());
    REQUIRE(sender_record.has_value());
    auto sender_certificate = Certificate::FromPem(sender_record->certificate_pem);
    REQUIRE(sender_certificate.IsOk());
    auto verified = sender_certificate.Unwrap().VerifySignature(
        std::vector<uint8_t>(wire.Unwrap().begin(), wire.Unwrap().end()), signature.Unwrap().bytes);
    REQUIRE(verified.IsOk());
    REQUIRE(verified.Unwrap());

    auto received = EnvelopeCodec::FromJson<Encrypted>(wire.Unwrap());
    REQUIRE(received.IsOk());
    auto opened = Decrypt(std::move(received).Unwrap(), bravo_cipher);
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap().Body() == "{\"query\":\"SELECT count(*)\"}");
    REQUIRE(opened.Unwrap().WaitId() == request_id);
    REQUIRE(MetadataEquals(opened.Unwrap().GetMetadata(), metadata));

    auto reply = PlainEnvelope::Create(bravo_identity->Id(), {opened.Unwrap().From()}, "{\"count\":42}");
    REQUIRE(reply.IsOk());
    auto sealed_reply = Encrypt(std::move(reply).Unwrap(), bravo_cipher);
    REQUIRE(sealed_reply.IsOk());
    auto reply_wire = EnvelopeCodec::EncodeForTransmission(sealed_reply.Unwrap());
    REQUIRE(reply_wire.IsOk());
    auto reply_received = EnvelopeCodec::FromJson<Encrypted>(reply_wire.Unwrap());
    REQUIRE(reply_received.IsOk());
    auto reply_opened = Decrypt(std::move(reply_received).Unwrap(), alpha_cipher);
    REQUIRE(reply_opened.IsOk());
    REQUIRE(reply_opened.Unwrap().Body() == "{\"count\":42}");
}

TEST_CASE("Workflow - Startup failures leave nothing published", "[integration][workflow][errors]") {
    TempDirectory dir;
    const auto directory = DirectoryOf({&NodeAlpha(), &NodeBravo()});

    SECTION("Node certificate from another CA") {
        MockDirectoryLookup foreign;
        foreign.SetCertificate(NodeAlpha().node_id,
                               TestPki::ForeignCertificatePem(NodeAlpha().node_id, "0D"));
        const int status = RunInChildProcess([&]() {
            auto summary = InitForNode(ConfigFor(dir, NodeAlpha()), foreign);
            return summary.IsErr() &&
                   summary.UnwrapErr().Is(BeaconFailureType::SignEncryptError) &&
                   !IdentityPublisher::IsPublished();
        });
        REQUIRE(ExitedSuccessfully(status));
    }
    SECTION("Missing key file") {
        const int status = RunInChildProcess([&]() {
            auto config = ConfigFor(dir, NodeAlpha()).WithPrivateKeyFile(dir.Path() / "absent.pem");
            auto summary = InitForNode(config, *directory);
            return summary.IsErr() &&
                   summary.UnwrapErr().Is(BeaconFailureType::ConfigurationFailed) &&
                   !IdentityPublisher::IsPublished() &&
                   directory->LookupCount() == 0;
        });
        REQUIRE(ExitedSuccessfully(status));
    }
    SECTION("Unreadable root certificate") {
        const int status = RunInChildProcess([&]() {
            auto config = ConfigFor(dir, NodeAlpha()).WithRootCertFile(dir.WriteFile("bad.crt", "nope"));
            auto summary = InitForNode(config, *directory);
            return summary.IsErr() &&
                   summary.UnwrapErr().Is(BeaconFailureType::ConfigurationFailed) &&
                   !IdentityPublisher::IsPublished();
        });
        REQUIRE(ExitedSuccessfully(status));
    }
    SECTION("Invalid broker URL") {
        auto summary = InitForNode(ConfigFor(dir, NodeAlpha()).WithBrokerUrl("broker.example.org"), *directory);
        REQUIRE(summary.IsErr());
        REQUIRE(summary.UnwrapErr().Is(BeaconFailureType::ConfigurationFailed));
        REQUIRE(directory->LookupCount() == 0);
    }
}

TEST_CASE("Workflow - Starting without a node id aborts", "[integration][workflow][fatal]") {
    TempDirectory dir;
    const auto directory = DirectoryOf({&NodeAlpha()});
    const int status = RunInChildProcess([&]() {
        auto config = NodeConfig::Default()
            .WithPrivateKeyFile(dir.WriteFile("privkey.pem", NodeAlpha().pkcs8_pem))
            .WithRootCertFile(dir.WriteFile("root.crt", SharedPki().RootCertificatePem()))
            .WithBrokerUrl(BROKER_URL);
        auto summary = InitForNode(config, *directory);
        return summary.IsOk();
    });
    REQUIRE(TerminatedByAbort(status));
}
