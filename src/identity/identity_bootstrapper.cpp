#include "beacon/identity/identity_bootstrapper.hpp"
#include "beacon/crypto/sodium_interop.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/fatal.hpp"
#include "beacon/core/format.hpp"
#include "beacon/core/text_file.hpp"
#include "beacon/debug/identity_logger.hpp"
namespace beacon::node::identity {
using crypto::SodiumInterop;

std::string IdentityBootstrapper::EnrollmentMessage(const std::optional<NodeId>& node_id) {
    return compat::format(
        "If you are not yet enrolled in the central vault, please execute the {} companion tool{} "
        "and follow the steps on the screen.\n"
        "After your enrollment, please restart this node, this message should disappear.",
        ConfigDefaults::ENROLLMENT_TOOL_NAME,
        node_id.has_value() ? compat::format(" with the node id {}", node_id->Value()) : std::string());
}

Result<CryptoIdentity, BeaconFailure> IdentityBootstrapper::Load(
    const std::filesystem::path& key_file,
    const std::optional<NodeId>& node_id,
    const IDirectoryLookup& directory,
    const BootstrapOptions& options) {
    if (!node_id.has_value()) {
        Fatal(ErrorMessages::MISSING_NODE_ID);
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<CryptoIdentity, BeaconFailure>::Err(
            BeaconFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    debug::LogBootstrapStart(node_id->Value(), key_file.string());

    auto key_text = ReadKeyFile(key_file, node_id);
    if (key_text.IsErr()) {
        return Result<CryptoIdentity, BeaconFailure>::Err(std::move(key_text).UnwrapErr());
    }
    std::string key_pem = std::move(key_text).Unwrap();
    auto identity = Compose(key_pem, *node_id, directory, options);
    {
        auto __wipe = SodiumInterop::SecureWipe(key_pem);
        (void) __wipe;
    }
    return identity;
}

Result<std::string, BeaconFailure> IdentityBootstrapper::ReadKeyFile(
    const std::filesystem::path& key_file,
    const std::optional<NodeId>& node_id) {
    auto content = ReadTextFile(key_file, Constants::MAX_KEY_FILE_SIZE);
    if (content.IsErr()) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::ConfigurationFailed(
                compat::format("Unable to load private key from file {}: {}\n{}",
                               key_file.string(),
                               content.UnwrapErr().message,
                               EnrollmentMessage(node_id))));
    }
    std::string raw = std::move(content).Unwrap();
    std::string trimmed = TrimWhitespace(raw);
    {
        auto __wipe = SodiumInterop::SecureWipe(raw);
        (void) __wipe;
    }
    return Result<std::string, BeaconFailure>::Ok(std::move(trimmed));
}

Result<CryptoIdentity, BeaconFailure> IdentityBootstrapper::Compose(
    const std::string& key_pem,
    const NodeId& node_id,
    const IDirectoryLookup& directory,
    const BootstrapOptions& options) {
    auto private_key = RsaPrivateKey::FromPem(key_pem);
    if (private_key.IsErr()) {
        return Result<CryptoIdentity, BeaconFailure>::Err(std::move(private_key).UnwrapErr());
    }
    debug::LogPrivateKeyDecoded("private_key",
                                crypto::ToString(private_key.Unwrap().SourceEncoding()),
                                private_key.Unwrap().Bits());

    auto signing_key = Rs256SigningKey::FromPem(key_pem);
    if (signing_key.IsErr()) {
        return Result<CryptoIdentity, BeaconFailure>::Err(std::move(signing_key).UnwrapErr());
    }

    auto public_portion = ResolvePublicPortion(node_id, directory, options);
    if (public_portion.IsErr()) {
        return Result<CryptoIdentity, BeaconFailure>::Err(std::move(public_portion).UnwrapErr());
    }
    auto serial = public_portion.Unwrap().certificate.FormattedSerial();
    if (serial.IsErr()) {
        return Result<CryptoIdentity, BeaconFailure>::Err(std::move(serial).UnwrapErr());
    }
    debug::LogCertificateResolved(serial.Unwrap(),
                                  public_portion.Unwrap().certificate.CommonName().UnwrapOr("<none>"));

    return Result<CryptoIdentity, BeaconFailure>::Ok(CryptoIdentity(
        std::move(signing_key).Unwrap().WithKeyId(std::move(serial).Unwrap()),
        std::move(private_key).Unwrap(),
        std::move(public_portion).Unwrap()));
}

Result<CryptoPublicPortion, BeaconFailure> IdentityBootstrapper::ResolvePublicPortion(
    const NodeId& node_id,
    const IDirectoryLookup& directory,
    const BootstrapOptions& options) {
    const auto record = directory.Lookup(node_id);
    if (!record.has_value()) {
        return Result<CryptoPublicPortion, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(
                compat::format("{}.", ErrorMessages::CERTIFICATE_UNPARSABLE)));
    }
    auto certificate = Certificate::FromPem(record->certificate_pem);
    if (certificate.IsErr()) {
        return Result<CryptoPublicPortion, BeaconFailure>::Err(std::move(certificate).UnwrapErr());
    }
    if (options.root_certificate.has_value() &&
        !certificate.Unwrap().IsIssuedBy(*options.root_certificate)) {
        return Result<CryptoPublicPortion, BeaconFailure>::Err(
            BeaconFailure::SignEncryptError(std::string(ErrorMessages::CERTIFICATE_NOT_ISSUED_BY_ROOT)));
    }
    std::string public_key_pem = record->public_key_pem;
    if (public_key_pem.empty()) {
        auto derived = certificate.Unwrap().PublicKeyPem();
        if (derived.IsErr()) {
            return Result<CryptoPublicPortion, BeaconFailure>::Err(std::move(derived).UnwrapErr());
        }
        public_key_pem = std::move(derived).Unwrap();
    }
    return Result<CryptoPublicPortion, BeaconFailure>::Ok(CryptoPublicPortion{
        node_id,
        std::move(certificate).Unwrap(),
        std::move(public_key_pem)});
}

}
