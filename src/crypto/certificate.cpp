#include "beacon/crypto/certificate.hpp"
#include "beacon/crypto/key_decoding.hpp"
#include "beacon/crypto/rs256_signing_key.hpp"
#include "beacon/crypto/serial_formatter.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/format.hpp"
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
namespace beacon::node::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    X509* UpRef(X509* cert) {
        if (cert != nullptr) {
            X509_up_ref(cert);
        }
        return cert;
    }
    BeaconFailure Unparsable(const std::string& cause) {
        return BeaconFailure::SignEncryptError(
            compat::format("{}: {}", ErrorMessages::CERTIFICATE_UNPARSABLE, cause));
    }
}

Certificate::Certificate(const Certificate& other)
    : cert_(UpRef(other.cert_.get())) {}

Certificate& Certificate::operator=(const Certificate& other) {
    if (this != &other) {
        cert_.reset(UpRef(other.cert_.get()));
    }
    return *this;
}

Result<Certificate, BeaconFailure> Certificate::FromPem(const std::string_view pem) {
    BIO_ptr bio = MakeReadBio(pem);
    if (!bio) {
        return Result<Certificate, BeaconFailure>::Err(Unparsable("unable to buffer certificate text"));
    }
    X509_ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        return Result<Certificate, BeaconFailure>::Err(Unparsable(GetOpenSSLError()));
    }
    return Result<Certificate, BeaconFailure>::Ok(Certificate(std::move(cert)));
}

Result<std::vector<Certificate>, BeaconFailure> Certificate::AllFromPem(const std::string_view pem) {
    BIO_ptr bio = MakeReadBio(pem);
    if (!bio) {
        return Result<std::vector<Certificate>, BeaconFailure>::Err(
            Unparsable("unable to buffer certificate text"));
    }
    std::vector<Certificate> certificates;
    while (true) {
        X509_ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert) {
            break;
        }
        certificates.push_back(Certificate(std::move(cert)));
    }
    // The loop always ends on a PEM "no start line" error.
    ERR_clear_error();
    if (certificates.empty()) {
        return Result<std::vector<Certificate>, BeaconFailure>::Err(
            Unparsable("no certificate found in PEM data"));
    }
    return Result<std::vector<Certificate>, BeaconFailure>::Ok(std::move(certificates));
}

Result<std::string, BeaconFailure> Certificate::FormattedSerial() const {
    return SerialFormatter::Format(X509_get0_serialNumber(cert_.get()));
}

Result<std::string, BeaconFailure> Certificate::SerialHex() const {
    BIGNUM_ptr bn(ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert_.get()), nullptr));
    if (!bn) {
        return Result<std::string, BeaconFailure>::Err(Unparsable(GetOpenSSLError()));
    }
    OPENSSL_String_ptr hex(BN_bn2hex(bn.get()));
    if (!hex) {
        return Result<std::string, BeaconFailure>::Err(Unparsable(GetOpenSSLError()));
    }
    return Result<std::string, BeaconFailure>::Ok(std::string(hex.get()));
}

Result<std::string, BeaconFailure> Certificate::CommonName() const {
    const X509_NAME* subject = X509_get_subject_name(cert_.get());
    const int index = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (index < 0) {
        return Result<std::string, BeaconFailure>::Err(Unparsable("subject has no common name"));
    }
    const ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, index));
    unsigned char* utf8 = nullptr;
    const int length = ASN1_STRING_to_UTF8(&utf8, data);
    if (length < 0) {
        return Result<std::string, BeaconFailure>::Err(Unparsable(GetOpenSSLError()));
    }
    std::string common_name(reinterpret_cast<const char*>(utf8), static_cast<size_t>(length));
    OPENSSL_free(utf8);
    return Result<std::string, BeaconFailure>::Ok(std::move(common_name));
}

Result<std::string, BeaconFailure> Certificate::PublicKeyPem() const {
    return EncodePublicKeyPem(X509_get0_pubkey(cert_.get()));
}

Result<std::vector<uint8_t>, BeaconFailure> Certificate::PublicKeyDer() const {
    return EncodePublicKeyDer(X509_get0_pubkey(cert_.get()));
}

Result<std::string, BeaconFailure> Certificate::ToPem() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert_.get()) != OpenSSL::SUCCESS) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::Encode(
                compat::format("Failed to write certificate PEM: {}", GetOpenSSLError())));
    }
    return Result<std::string, BeaconFailure>::Ok(DrainBio(bio.get()));
}

bool Certificate::IsIssuedBy(const Certificate& issuer) const {
    EVP_PKEY* issuer_key = X509_get0_pubkey(issuer.cert_.get());
    if (issuer_key == nullptr) {
        ERR_clear_error();
        return false;
    }
    const bool verified = X509_verify(cert_.get(), issuer_key) == OpenSSL::SUCCESS;
    ERR_clear_error();
    return verified;
}

bool Certificate::MatchesHost(const std::string_view host) const {
    if (host.empty()) {
        return false;
    }
    const int matched = X509_check_host(cert_.get(), host.data(), host.size(),
                                        X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS, nullptr);
    ERR_clear_error();
    return matched == OpenSSL::SUCCESS;
}

Result<bool, BeaconFailure> Certificate::VerifySignature(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) const {
    return VerifyRs256(X509_get0_pubkey(cert_.get()), message, signature);
}

}
