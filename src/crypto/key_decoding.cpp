#include "beacon/crypto/key_decoding.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/format.hpp"
#include <openssl/decoder.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <memory>
#include <string>
namespace beacon::node::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct OSSL_DECODER_CTX_Deleter {
        void operator()(OSSL_DECODER_CTX* ctx) const { OSSL_DECODER_CTX_free(ctx); }
    };
    using OSSL_DECODER_CTX_ptr = std::unique_ptr<OSSL_DECODER_CTX, OSSL_DECODER_CTX_Deleter>;

    std::string_view StructureFor(const PrivateKeyEncoding encoding) {
        return encoding == PrivateKeyEncoding::Pkcs1
            ? OpenSSL::STRUCTURE_PKCS1
            : OpenSSL::STRUCTURE_PKCS8;
    }
}

std::string_view ToString(const PrivateKeyEncoding encoding) noexcept {
    switch (encoding) {
        case PrivateKeyEncoding::Pkcs1: return "PKCS#1";
        case PrivateKeyEncoding::Pkcs8: return "PKCS#8";
    }
    return "unknown";
}

Result<EVP_PKEY_ptr, BeaconFailure> DecodeRsaPrivateKey(
    const std::string_view pem,
    const PrivateKeyEncoding encoding) {
    BIO_ptr bio = MakeReadBio(pem);
    if (!bio) {
        return Result<EVP_PKEY_ptr, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Unable to buffer private key text"));
    }
    EVP_PKEY* raw_key = nullptr;
    const std::string structure(StructureFor(encoding));
    OSSL_DECODER_CTX_ptr ctx(OSSL_DECODER_CTX_new_for_pkey(
        &raw_key,
        std::string(OpenSSL::INPUT_TYPE_PEM).c_str(),
        structure.c_str(),
        std::string(OpenSSL::KEY_TYPE_RSA).c_str(),
        EVP_PKEY_KEYPAIR,
        nullptr,
        nullptr));
    if (!ctx) {
        return Result<EVP_PKEY_ptr, BeaconFailure>::Err(
            BeaconFailure::Generic(
                compat::format("Failed to create {} decoder: {}", ToString(encoding), GetOpenSSLError())));
    }
    if (OSSL_DECODER_from_bio(ctx.get(), bio.get()) != OpenSSL::SUCCESS || raw_key == nullptr) {
        EVP_PKEY_free(raw_key);
        return Result<EVP_PKEY_ptr, BeaconFailure>::Err(
            BeaconFailure::InvalidInput(
                compat::format("not a {} RSA private key ({})", ToString(encoding), GetOpenSSLError())));
    }
    ERR_clear_error();
    return Result<EVP_PKEY_ptr, BeaconFailure>::Ok(EVP_PKEY_ptr(raw_key));
}

Result<DecodedPrivateKey, BeaconFailure> DecodeRsaPrivateKeyAnyEncoding(const std::string_view pem) {
    auto pkcs1 = DecodeRsaPrivateKey(pem, PrivateKeyEncoding::Pkcs1);
    if (pkcs1.IsOk()) {
        return Result<DecodedPrivateKey, BeaconFailure>::Ok(
            DecodedPrivateKey{std::move(pkcs1).Unwrap(), PrivateKeyEncoding::Pkcs1});
    }
    auto pkcs8 = DecodeRsaPrivateKey(pem, PrivateKeyEncoding::Pkcs8);
    if (pkcs8.IsOk()) {
        return Result<DecodedPrivateKey, BeaconFailure>::Ok(
            DecodedPrivateKey{std::move(pkcs8).Unwrap(), PrivateKeyEncoding::Pkcs8});
    }
    return Result<DecodedPrivateKey, BeaconFailure>::Err(
        BeaconFailure::ConfigurationFailed(
            compat::format("{}: {}", ErrorMessages::KEY_FORMAT_UNSUPPORTED, pkcs8.UnwrapErr().message)));
}

Result<std::vector<uint8_t>, BeaconFailure> EncodePublicKeyDer(const EVP_PKEY* key) {
    if (key == nullptr) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Key is null"));
    }
    const int length = i2d_PUBKEY(key, nullptr);
    if (length <= 0) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::Encode(
                compat::format("Failed to encode public key: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* out = der.data();
    if (i2d_PUBKEY(key, &out) != length) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::Encode(
                compat::format("Failed to encode public key: {}", GetOpenSSLError())));
    }
    return Result<std::vector<uint8_t>, BeaconFailure>::Ok(std::move(der));
}

Result<std::string, BeaconFailure> EncodePublicKeyPem(const EVP_PKEY* key) {
    if (key == nullptr) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Key is null"));
    }
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != OpenSSL::SUCCESS) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::Encode(
                compat::format("Failed to write public key PEM: {}", GetOpenSSLError())));
    }
    return Result<std::string, BeaconFailure>::Ok(DrainBio(bio.get()));
}

}
