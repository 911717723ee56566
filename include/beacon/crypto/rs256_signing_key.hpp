#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/crypto/key_decoding.hpp"
#include "beacon/crypto/openssl_handles.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace beacon::node::crypto {

/**
 * @brief RSASSA-PKCS1-v1_5 / SHA-256 signing key with an optional key id.
 *
 * Peers look up the verifying certificate by the key id, which is the
 * node certificate's formatted serial.
 */
class Rs256SigningKey {
public:
    struct Signature {
        std::optional<std::string> key_id;
        std::vector<uint8_t> bytes;
    };

    [[nodiscard]] static Result<Rs256SigningKey, BeaconFailure> FromPem(std::string_view pem);

    /// Returns the same key tagged with @p key_id.
    [[nodiscard]] Rs256SigningKey WithKeyId(std::string key_id) &&;

    [[nodiscard]] Result<Signature, BeaconFailure> Sign(std::span<const uint8_t> message) const;

    [[nodiscard]] const std::optional<std::string>& KeyId() const noexcept { return key_id_; }
    [[nodiscard]] Result<std::vector<uint8_t>, BeaconFailure> PublicKeyDer() const;
    [[nodiscard]] const EVP_PKEY* Native() const noexcept { return key_.get(); }

    Rs256SigningKey(Rs256SigningKey&&) noexcept = default;
    Rs256SigningKey& operator=(Rs256SigningKey&&) noexcept = default;
    Rs256SigningKey(const Rs256SigningKey&) = delete;
    Rs256SigningKey& operator=(const Rs256SigningKey&) = delete;
    ~Rs256SigningKey() = default;
private:
    explicit Rs256SigningKey(EVP_PKEY_ptr key) noexcept : key_(std::move(key)) {}
    EVP_PKEY_ptr key_;
    std::optional<std::string> key_id_;
};

/**
 * @brief Verifies an RS256 signature against any RSA public key.
 *
 * Ok(false) means the signature does not match; Err is reserved for
 * failures to run the check at all.
 */
[[nodiscard]] Result<bool, BeaconFailure> VerifyRs256(
    const EVP_PKEY* public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature);

}
