/**
 * @file bootstrap_example.cpp
 * @brief Starts a node identity from files on disk and seals a message to itself
 *
 * Usage:
 *   beacon_bootstrap_example <node-id> <broker-url> <certificate-dir> [key-file] [root-cert-file]
 *
 * <certificate-dir> stands in for the directory service: every *.pem/*.crt
 * file in it is indexed by its subject CN.
 */

#include "beacon/configuration/node_config.hpp"
#include "beacon/identity/certificate_directory.hpp"
#include "beacon/identity/identity_initializer.hpp"
#include "beacon/messaging/envelope_codec.hpp"
#include "beacon/messaging/hybrid_payload_cipher.hpp"

#include <iostream>
#include <memory>

using namespace beacon::node;
using namespace beacon::node::configuration;
using namespace beacon::node::identity;
using namespace beacon::node::messaging;

namespace {
    int Fail(const char* step, const BeaconFailure& failure) {
        std::cerr << step << " failed (" << ToString(failure.type) << "): " << failure.message << std::endl;
        return 1;
    }
}

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0]
                  << " <node-id> <broker-url> <certificate-dir> [key-file] [root-cert-file]" << std::endl;
        return 2;
    }

    auto config = NodeConfig::Default()
        .WithNodeId(argv[1])
        .WithBrokerUrl(argv[2]);
    if (argc > 4) {
        config = std::move(config).WithPrivateKeyFile(argv[4]);
    }
    if (argc > 5) {
        config = std::move(config).WithRootCertFile(argv[5]);
    }

    std::cout << "1. Indexing certificates in " << argv[3] << std::endl;
    auto loaded = CertificateDirectory::LoadFromDirectory(argv[3]);
    if (loaded.IsErr()) {
        return Fail("Certificate directory", loaded.UnwrapErr());
    }
    const auto directory = std::make_shared<const CertificateDirectory>(std::move(loaded).Unwrap());
    std::cout << "   " << directory->Size() << " certificate(s)" << std::endl;

    std::cout << "2. Bootstrapping identity" << std::endl;
    auto summary = InitForNode(config, *directory);
    if (summary.IsErr()) {
        return Fail("Identity bootstrap", summary.UnwrapErr());
    }
    const IdentitySummary& node = summary.Unwrap();
    std::cout << "   Certificate serial: " << node.serial << std::endl;
    std::cout << "   Common name:        " << node.common_name << std::endl;

    std::cout << "3. Sealing a message to ourselves" << std::endl;
    const HybridPayloadCipher cipher(node.identity, directory);
    auto envelope = PlainEnvelope::Create(node.identity->Id(), {node.identity->Id()}, "{\"ping\":true}");
    if (envelope.IsErr()) {
        return Fail("Envelope", envelope.UnwrapErr());
    }
    auto sealed = Encrypt(std::move(envelope).Unwrap(), cipher);
    if (sealed.IsErr()) {
        return Fail("Encrypt", sealed.UnwrapErr());
    }
    auto wire = EnvelopeCodec::EncodeForTransmission(sealed.Unwrap());
    if (wire.IsErr()) {
        return Fail("Encode", wire.UnwrapErr());
    }
    std::cout << "   " << wire.Unwrap() << std::endl;

    auto opened = Decrypt(std::move(sealed).Unwrap(), cipher);
    if (opened.IsErr()) {
        return Fail("Decrypt", opened.UnwrapErr());
    }
    std::cout << "   Decrypted body: " << opened.Unwrap().Body() << std::endl;
    return 0;
}
