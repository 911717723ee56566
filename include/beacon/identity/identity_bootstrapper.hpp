#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/identity/crypto_identity.hpp"
#include "beacon/identity/directory_lookup.hpp"
#include <filesystem>
#include <optional>
#include <string>
namespace beacon::node::identity {

struct BootstrapOptions {
    /// When set, the directory's certificate must be signed by this CA.
    std::optional<Certificate> root_certificate;
};

/**
 * @brief Builds the node's CryptoIdentity from its private key file and the
 * certificate the directory holds for it.
 *
 * Steps, each surfaced to the caller on failure (nothing is retried):
 *  1. read the key file (ConfigurationFailed, with enrollment instructions);
 *  2. decode it as PKCS#1, then PKCS#8, once for the raw private key and
 *     once for the signing key (ConfigurationFailed);
 *  3. look up the node's certificate (SignEncryptError);
 *  4. tag the signing key with the certificate's formatted serial.
 *
 * Calling Load without a node id is a sequencing error and aborts before
 * the key file is touched.
 */
class IdentityBootstrapper {
public:
    [[nodiscard]] static Result<CryptoIdentity, BeaconFailure> Load(
        const std::filesystem::path& key_file,
        const std::optional<NodeId>& node_id,
        const IDirectoryLookup& directory,
        const BootstrapOptions& options = {});

    /// Operator guidance appended to key file errors.
    [[nodiscard]] static std::string EnrollmentMessage(const std::optional<NodeId>& node_id);
private:
    [[nodiscard]] static Result<std::string, BeaconFailure> ReadKeyFile(
        const std::filesystem::path& key_file,
        const std::optional<NodeId>& node_id);
    [[nodiscard]] static Result<CryptoPublicPortion, BeaconFailure> ResolvePublicPortion(
        const NodeId& node_id,
        const IDirectoryLookup& directory,
        const BootstrapOptions& options);
    [[nodiscard]] static Result<CryptoIdentity, BeaconFailure> Compose(
        const std::string& key_pem,
        const NodeId& node_id,
        const IDirectoryLookup& directory,
        const BootstrapOptions& options);
    IdentityBootstrapper() = delete;
};

}
