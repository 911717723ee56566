#include "beacon/crypto/rsa_private_key.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/format.hpp"
#include <openssl/pem.h>
#include <openssl/rsa.h>
namespace beacon::node::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    Result<EVP_PKEY_CTX_ptr, BeaconFailure> MakeOaepContext(const EVP_PKEY* key, const bool encrypt) {
        EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, const_cast<EVP_PKEY*>(key), nullptr));
        if (!ctx) {
            return Result<EVP_PKEY_CTX_ptr, BeaconFailure>::Err(
                BeaconFailure::SignEncryptError(
                    compat::format("Failed to create RSA context: {}", GetOpenSSLError())));
        }
        const int init = encrypt ? EVP_PKEY_encrypt_init(ctx.get()) : EVP_PKEY_decrypt_init(ctx.get());
        if (init != OpenSSL::SUCCESS ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) <= 0) {
            return Result<EVP_PKEY_CTX_ptr, BeaconFailure>::Err(
                BeaconFailure::SignEncryptError(
                    compat::format("Failed to configure RSA-OAEP: {}", GetOpenSSLError())));
        }
        return Result<EVP_PKEY_CTX_ptr, BeaconFailure>::Ok(std::move(ctx));
    }
}

Result<RsaPrivateKey, BeaconFailure> RsaPrivateKey::FromPkcs1Pem(const std::string_view pem) {
    return DecodeRsaPrivateKey(pem, PrivateKeyEncoding::Pkcs1).Map([](EVP_PKEY_ptr key) {
        return RsaPrivateKey(std::move(key), PrivateKeyEncoding::Pkcs1);
    });
}

Result<RsaPrivateKey, BeaconFailure> RsaPrivateKey::FromPkcs8Pem(const std::string_view pem) {
    return DecodeRsaPrivateKey(pem, PrivateKeyEncoding::Pkcs8).Map([](EVP_PKEY_ptr key) {
        return RsaPrivateKey(std::move(key), PrivateKeyEncoding::Pkcs8);
    });
}

Result<RsaPrivateKey, BeaconFailure> RsaPrivateKey::FromPem(const std::string_view pem) {
    return DecodeRsaPrivateKeyAnyEncoding(pem).Map([](DecodedPrivateKey decoded) {
        return RsaPrivateKey(std::move(decoded.key), decoded.encoding);
    });
}

Result<std::vector<uint8_t>, BeaconFailure> RsaPrivateKey::DecryptOaep(
    std::span<const uint8_t> ciphertext) const {
    auto ctx_result = MakeOaepContext(key_.get(), false);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();
    size_t out_len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, ciphertext.data(), ciphertext.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("RSA-OAEP decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> plaintext(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &out_len, ciphertext.data(), ciphertext.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("RSA-OAEP decryption failed: {}", GetOpenSSLError())));
    }
    plaintext.resize(out_len);
    return Result<std::vector<uint8_t>, BeaconFailure>::Ok(std::move(plaintext));
}

Result<std::vector<uint8_t>, BeaconFailure> RsaPrivateKey::PublicKeyDer() const {
    return EncodePublicKeyDer(key_.get());
}

int RsaPrivateKey::Bits() const noexcept {
    return EVP_PKEY_get_bits(key_.get());
}

Result<RsaPublicKey, BeaconFailure> RsaPublicKey::FromPem(const std::string_view pem) {
    BIO_ptr bio = MakeReadBio(pem);
    if (!bio) {
        return Result<RsaPublicKey, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Unable to buffer public key text"));
    }
    EVP_PKEY_ptr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        return Result<RsaPublicKey, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("Unable to parse public key PEM: {}", GetOpenSSLError())));
    }
    return FromNative(key.get());
}

Result<RsaPublicKey, BeaconFailure> RsaPublicKey::FromNative(EVP_PKEY* key) {
    if (key == nullptr) {
        return Result<RsaPublicKey, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Public key is null"));
    }
    if (EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) {
        return Result<RsaPublicKey, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError("Public key is not an RSA key"));
    }
    if (EVP_PKEY_up_ref(key) != OpenSSL::SUCCESS) {
        return Result<RsaPublicKey, BeaconFailure>::Err(
            BeaconFailure::Generic(
                compat::format("Failed to reference public key: {}", GetOpenSSLError())));
    }
    return Result<RsaPublicKey, BeaconFailure>::Ok(RsaPublicKey(EVP_PKEY_ptr(key)));
}

Result<std::vector<uint8_t>, BeaconFailure> RsaPublicKey::EncryptOaep(
    std::span<const uint8_t> plaintext) const {
    auto ctx_result = MakeOaepContext(key_.get(), true);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();
    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, plaintext.data(), plaintext.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("RSA-OAEP encryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> ciphertext(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), ciphertext.data(), &out_len, plaintext.data(), plaintext.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("RSA-OAEP encryption failed: {}", GetOpenSSLError())));
    }
    ciphertext.resize(out_len);
    return Result<std::vector<uint8_t>, BeaconFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, BeaconFailure> RsaPublicKey::Der() const {
    return EncodePublicKeyDer(key_.get());
}

}
