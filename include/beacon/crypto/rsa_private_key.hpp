#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/crypto/key_decoding.hpp"
#include "beacon/crypto/openssl_handles.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace beacon::node::crypto {

/**
 * @brief The node's raw RSA private key, used to unwrap payload keys.
 *
 * Move-only; the underlying EVP_PKEY is freed with the object. All const
 * operations are safe to call concurrently.
 */
class RsaPrivateKey {
public:
    [[nodiscard]] static Result<RsaPrivateKey, BeaconFailure> FromPkcs1Pem(std::string_view pem);
    [[nodiscard]] static Result<RsaPrivateKey, BeaconFailure> FromPkcs8Pem(std::string_view pem);
    /// PKCS#1 first, PKCS#8 second; ConfigurationFailed if neither decodes.
    [[nodiscard]] static Result<RsaPrivateKey, BeaconFailure> FromPem(std::string_view pem);

    [[nodiscard]] Result<std::vector<uint8_t>, BeaconFailure> DecryptOaep(
        std::span<const uint8_t> ciphertext) const;
    [[nodiscard]] Result<std::vector<uint8_t>, BeaconFailure> PublicKeyDer() const;
    [[nodiscard]] int Bits() const noexcept;
    [[nodiscard]] PrivateKeyEncoding SourceEncoding() const noexcept { return encoding_; }
    [[nodiscard]] const EVP_PKEY* Native() const noexcept { return key_.get(); }

    RsaPrivateKey(RsaPrivateKey&&) noexcept = default;
    RsaPrivateKey& operator=(RsaPrivateKey&&) noexcept = default;
    RsaPrivateKey(const RsaPrivateKey&) = delete;
    RsaPrivateKey& operator=(const RsaPrivateKey&) = delete;
    ~RsaPrivateKey() = default;
private:
    RsaPrivateKey(EVP_PKEY_ptr key, PrivateKeyEncoding encoding) noexcept
        : key_(std::move(key)), encoding_(encoding) {}
    EVP_PKEY_ptr key_;
    PrivateKeyEncoding encoding_;
};

/**
 * @brief RSA public half used to wrap payload keys for a recipient.
 */
class RsaPublicKey {
public:
    [[nodiscard]] static Result<RsaPublicKey, BeaconFailure> FromPem(std::string_view pem);
    /// Takes an additional reference on an existing key.
    [[nodiscard]] static Result<RsaPublicKey, BeaconFailure> FromNative(EVP_PKEY* key);

    [[nodiscard]] Result<std::vector<uint8_t>, BeaconFailure> EncryptOaep(
        std::span<const uint8_t> plaintext) const;
    [[nodiscard]] Result<std::vector<uint8_t>, BeaconFailure> Der() const;
    [[nodiscard]] const EVP_PKEY* Native() const noexcept { return key_.get(); }

    RsaPublicKey(RsaPublicKey&&) noexcept = default;
    RsaPublicKey& operator=(RsaPublicKey&&) noexcept = default;
    RsaPublicKey(const RsaPublicKey&) = delete;
    RsaPublicKey& operator=(const RsaPublicKey&) = delete;
    ~RsaPublicKey() = default;
private:
    explicit RsaPublicKey(EVP_PKEY_ptr key) noexcept : key_(std::move(key)) {}
    EVP_PKEY_ptr key_;
};

}
