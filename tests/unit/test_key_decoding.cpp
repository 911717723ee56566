#include <catch2/catch_test_macros.hpp>
#include "beacon/crypto/key_decoding.hpp"
#include "beacon/crypto/rsa_private_key.hpp"
#include "beacon/crypto/rs256_signing_key.hpp"
#include "helpers/test_pki.hpp"
#include <string>
#include <vector>
using namespace beacon::node;
using namespace beacon::node::crypto;
using namespace beacon::node::test_helpers;

namespace {
    std::vector<uint8_t> Bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

TEST_CASE("Key decoding - PKCS#1 and PKCS#8", "[crypto][keys]") {
    const auto& node = NodeAlpha();

    SECTION("PKCS#1 text decodes as PKCS#1") {
        auto key = RsaPrivateKey::FromPem(node.pkcs1_pem);
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap().SourceEncoding() == PrivateKeyEncoding::Pkcs1);
        REQUIRE(key.Unwrap().Bits() == Constants::RSA_DEFAULT_BITS);
    }
    SECTION("PKCS#8 text falls through to PKCS#8") {
        auto key = RsaPrivateKey::FromPem(node.pkcs8_pem);
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap().SourceEncoding() == PrivateKeyEncoding::Pkcs8);
    }
    SECTION("Both encodings carry the same public key") {
        auto from_pkcs1 = RsaPrivateKey::FromPem(node.pkcs1_pem);
        auto from_pkcs8 = RsaPrivateKey::FromPem(node.pkcs8_pem);
        REQUIRE(from_pkcs1.IsOk());
        REQUIRE(from_pkcs8.IsOk());
        auto der1 = from_pkcs1.Unwrap().PublicKeyDer();
        auto der8 = from_pkcs8.Unwrap().PublicKeyDer();
        REQUIRE(der1.IsOk());
        REQUIRE(der8.IsOk());
        REQUIRE(der1.Unwrap() == der8.Unwrap());
    }
    SECTION("Single-encoding decoders reject the other encoding") {
        REQUIRE(RsaPrivateKey::FromPkcs1Pem(node.pkcs1_pem).IsOk());
        REQUIRE(RsaPrivateKey::FromPkcs8Pem(node.pkcs8_pem).IsOk());
        auto wrong = RsaPrivateKey::FromPkcs1Pem(node.pkcs8_pem);
        REQUIRE(wrong.IsErr());
        REQUIRE(wrong.UnwrapErr().Is(BeaconFailureType::InvalidInput));
    }
}

TEST_CASE("Key decoding - Unusable key text", "[crypto][keys][errors]") {
    SECTION("Arbitrary bytes") {
        auto key = DecodeRsaPrivateKeyAnyEncoding("\x01\x02 this is not a key \xff");
        REQUIRE(key.IsErr());
        REQUIRE(key.UnwrapErr().Is(BeaconFailureType::ConfigurationFailed));
        REQUIRE(key.UnwrapErr().message.find(ErrorMessages::KEY_FORMAT_UNSUPPORTED) == 0);
    }
    SECTION("Certificate instead of key") {
        auto key = RsaPrivateKey::FromPem(NodeAlpha().certificate_pem);
        REQUIRE(key.IsErr());
        REQUIRE(key.UnwrapErr().Is(BeaconFailureType::ConfigurationFailed));
    }
    SECTION("Truncated PEM body") {
        const std::string& pem = NodeAlpha().pkcs1_pem;
        const std::string truncated = pem.substr(0, pem.size() / 2) + "\n-----END RSA PRIVATE KEY-----\n";
        REQUIRE(Rs256SigningKey::FromPem(truncated).IsErr());
    }
    SECTION("Empty text") {
        REQUIRE(RsaPrivateKey::FromPem("").IsErr());
    }
}

TEST_CASE("RSA-OAEP - Wrap and unwrap", "[crypto][keys][oaep]") {
    auto private_key = RsaPrivateKey::FromPem(NodeAlpha().pkcs8_pem);
    REQUIRE(private_key.IsOk());
    auto public_key = RsaPublicKey::FromNative(const_cast<EVP_PKEY*>(private_key.Unwrap().Native()));
    REQUIRE(public_key.IsOk());
    const std::vector<uint8_t> secret(32, 0x5A);

    SECTION("Round trip") {
        auto wrapped = public_key.Unwrap().EncryptOaep(secret);
        REQUIRE(wrapped.IsOk());
        REQUIRE(wrapped.Unwrap().size() == static_cast<size_t>(Constants::RSA_DEFAULT_BITS / 8));
        auto unwrapped = private_key.Unwrap().DecryptOaep(wrapped.Unwrap());
        REQUIRE(unwrapped.IsOk());
        REQUIRE(unwrapped.Unwrap() == secret);
    }
    SECTION("Other key cannot unwrap") {
        auto wrapped = public_key.Unwrap().EncryptOaep(secret);
        REQUIRE(wrapped.IsOk());
        auto other = RsaPrivateKey::FromPem(NodeBravo().pkcs1_pem);
        REQUIRE(other.IsOk());
        auto unwrapped = other.Unwrap().DecryptOaep(wrapped.Unwrap());
        REQUIRE(unwrapped.IsErr());
        REQUIRE(unwrapped.UnwrapErr().Is(BeaconFailureType::SignEncryptError));
    }
}

TEST_CASE("Rs256SigningKey - Signatures", "[crypto][keys][signing]") {
    auto pkcs1 = Rs256SigningKey::FromPem(NodeAlpha().pkcs1_pem);
    auto pkcs8 = Rs256SigningKey::FromPem(NodeAlpha().pkcs8_pem);
    REQUIRE(pkcs1.IsOk());
    REQUIRE(pkcs8.IsOk());
    const auto message = Bytes("beacon message");

    SECTION("PKCS#1 v1.5 signatures are deterministic across encodings") {
        auto sig1 = pkcs1.Unwrap().Sign(message);
        auto sig8 = pkcs8.Unwrap().Sign(message);
        REQUIRE(sig1.IsOk());
        REQUIRE(sig8.IsOk());
        REQUIRE(sig1.Unwrap().bytes == sig8.Unwrap().bytes);
    }
    SECTION("Signature verifies with the key and not after tampering") {
        auto signature = pkcs1.Unwrap().Sign(message);
        REQUIRE(signature.IsOk());
        auto verified = VerifyRs256(pkcs1.Unwrap().Native(), message, signature.Unwrap().bytes);
        REQUIRE(verified.IsOk());
        REQUIRE(verified.Unwrap());
        auto tampered = VerifyRs256(pkcs1.Unwrap().Native(), Bytes("beacon messagE"), signature.Unwrap().bytes);
        REQUIRE(tampered.IsOk());
        REQUIRE_FALSE(tampered.Unwrap());
    }
    SECTION("Key id travels with the signature") {
        REQUIRE_FALSE(pkcs1.Unwrap().KeyId().has_value());
        auto tagged = std::move(pkcs1).Unwrap().WithKeyId("44:0e");
        REQUIRE(tagged.KeyId() == std::optional<std::string>("44:0e"));
        auto signature = tagged.Sign(message);
        REQUIRE(signature.IsOk());
        REQUIRE(signature.Unwrap().key_id == std::optional<std::string>("44:0e"));
    }
}
