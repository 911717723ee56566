#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/crypto/openssl_handles.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace beacon::node::crypto {

/**
 * @brief Immutable X.509 certificate.
 *
 * Copies share the underlying X509 (reference counted by OpenSSL); the
 * object is never modified after parsing, so copies may be read from any
 * thread.
 */
class Certificate {
public:
    /// Parses the first certificate in @p pem. Failures are SignEncryptError.
    [[nodiscard]] static Result<Certificate, BeaconFailure> FromPem(std::string_view pem);

    /// Parses every certificate in a PEM bundle, in order.
    [[nodiscard]] static Result<std::vector<Certificate>, BeaconFailure> AllFromPem(std::string_view pem);

    [[nodiscard]] Result<std::string, BeaconFailure> FormattedSerial() const;
    /// Serial as plain uppercase hex, e.g. "440E0D94F3".
    [[nodiscard]] Result<std::string, BeaconFailure> SerialHex() const;
    [[nodiscard]] Result<std::string, BeaconFailure> CommonName() const;
    [[nodiscard]] Result<std::string, BeaconFailure> PublicKeyPem() const;
    [[nodiscard]] Result<std::vector<uint8_t>, BeaconFailure> PublicKeyDer() const;
    [[nodiscard]] Result<std::string, BeaconFailure> ToPem() const;

    /// True if this certificate's signature verifies with @p issuer's key.
    [[nodiscard]] bool IsIssuedBy(const Certificate& issuer) const;

    /**
     * Host name check (subjectAltName dNSName first, subject CN only when no
     * DNS SAN exists; wildcards only as a whole left-most label).
     */
    [[nodiscard]] bool MatchesHost(std::string_view host) const;

    [[nodiscard]] Result<bool, BeaconFailure> VerifySignature(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const;

    [[nodiscard]] const X509* Native() const noexcept { return cert_.get(); }

    Certificate(const Certificate& other);
    Certificate& operator=(const Certificate& other);
    Certificate(Certificate&&) noexcept = default;
    Certificate& operator=(Certificate&&) noexcept = default;
    ~Certificate() = default;
private:
    explicit Certificate(X509_ptr cert) noexcept : cert_(std::move(cert)) {}
    X509_ptr cert_;
};

}
