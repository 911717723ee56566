#include "beacon/crypto/rs256_signing_key.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/format.hpp"
#include <openssl/err.h>
#include <openssl/rsa.h>
namespace beacon::node::crypto {
using OpenSSL = OpenSSLConstants;

Result<Rs256SigningKey, BeaconFailure> Rs256SigningKey::FromPem(const std::string_view pem) {
    return DecodeRsaPrivateKeyAnyEncoding(pem).Map([](DecodedPrivateKey decoded) {
        return Rs256SigningKey(std::move(decoded.key));
    });
}

Rs256SigningKey Rs256SigningKey::WithKeyId(std::string key_id) && {
    key_id_ = std::move(key_id);
    return std::move(*this);
}

Result<Rs256SigningKey::Signature, BeaconFailure> Rs256SigningKey::Sign(
    std::span<const uint8_t> message) const {
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<Signature, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("Failed to create digest context: {}", GetOpenSSLError())));
    }
    EVP_PKEY_CTX* pkey_ctx = nullptr;
    if (EVP_DigestSignInit(ctx.get(), &pkey_ctx, EVP_sha256(), nullptr,
                           const_cast<EVP_PKEY*>(key_.get())) != OpenSSL::SUCCESS ||
        EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PADDING) <= 0) {
        return Result<Signature, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("Failed to initialize RS256 signer: {}", GetOpenSSLError())));
    }
    size_t signature_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &signature_len, message.data(), message.size()) != OpenSSL::SUCCESS) {
        return Result<Signature, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("RS256 signing failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> signature(signature_len);
    if (EVP_DigestSign(ctx.get(), signature.data(), &signature_len, message.data(), message.size()) != OpenSSL::SUCCESS) {
        return Result<Signature, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("RS256 signing failed: {}", GetOpenSSLError())));
    }
    signature.resize(signature_len);
    return Result<Signature, BeaconFailure>::Ok(Signature{key_id_, std::move(signature)});
}

Result<std::vector<uint8_t>, BeaconFailure> Rs256SigningKey::PublicKeyDer() const {
    return EncodePublicKeyDer(key_.get());
}

Result<bool, BeaconFailure> VerifyRs256(
    const EVP_PKEY* public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (public_key == nullptr) {
        return Result<bool, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Verification key is null"));
    }
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    EVP_PKEY_CTX* pkey_ctx = nullptr;
    if (!ctx ||
        EVP_DigestVerifyInit(ctx.get(), &pkey_ctx, EVP_sha256(), nullptr,
                             const_cast<EVP_PKEY*>(public_key)) != OpenSSL::SUCCESS ||
        EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PADDING) <= 0) {
        return Result<bool, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("Failed to initialize RS256 verifier: {}", GetOpenSSLError())));
    }
    const int verdict = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                         message.data(), message.size());
    ERR_clear_error();
    return Result<bool, BeaconFailure>::Ok(verdict == OpenSSL::SUCCESS);
}

}
