#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/crypto/certificate.hpp"
#include "beacon/identity/node_id.hpp"
#include <filesystem>
#include <optional>
#include <string>
namespace beacon::node::configuration {
using crypto::Certificate;
using identity::NodeId;

/// Startup settings of a node, as collected by the CLI/environment layer.
///
/// Plain value object: nothing is read from disk until LoadRootCertificate
/// is called, and Validate only checks the values themselves.
///
/// @example
/// ```cpp
/// auto config = NodeConfig::Default()
///     .WithNodeId("proxy1.broker.example.org")
///     .WithBrokerUrl("https://broker.example.org");
/// if (auto valid = config.Validate(); valid.IsErr()) { ... }
/// ```
class NodeConfig {
public:
    /// Key at /run/secrets/privkey.pem, root CA at /etc/beacon/root-ca.crt,
    /// no node id and no broker.
    [[nodiscard]] static NodeConfig Default();

    [[nodiscard]] NodeConfig WithPrivateKeyFile(std::filesystem::path path) &&;
    [[nodiscard]] NodeConfig WithRootCertFile(std::filesystem::path path) &&;
    [[nodiscard]] NodeConfig WithTlsCaCertificatesDir(std::filesystem::path path) &&;
    [[nodiscard]] NodeConfig WithNodeId(std::string node_id) &&;
    [[nodiscard]] NodeConfig WithBrokerUrl(std::string broker_url) &&;

    [[nodiscard]] const std::filesystem::path& PrivateKeyFile() const noexcept { return private_key_file_; }
    [[nodiscard]] const std::filesystem::path& RootCertFile() const noexcept { return root_cert_file_; }
    [[nodiscard]] const std::optional<std::filesystem::path>& TlsCaCertificatesDir() const noexcept {
        return tls_ca_certificates_dir_;
    }
    [[nodiscard]] const std::optional<std::string>& RawNodeId() const noexcept { return node_id_; }
    [[nodiscard]] const std::string& BrokerUrl() const noexcept { return broker_url_; }

    /// ConfigurationFailed naming the first offending value.
    [[nodiscard]] Result<Unit, BeaconFailure> Validate() const;

    /// std::nullopt when no node id is configured (broker role).
    [[nodiscard]] Result<std::optional<NodeId>, BeaconFailure> ParsedNodeId() const;

    /// Host part of the broker URL, lowercased, without port or brackets.
    [[nodiscard]] Result<std::string, BeaconFailure> BrokerDomain() const;

    /// First certificate of the root certificate file.
    [[nodiscard]] Result<Certificate, BeaconFailure> LoadRootCertificate() const;

    /**
     * Checks that @p certificate is valid for the broker domain: a
     * subjectAltName dNSName must match (a wildcard only as the whole
     * left-most label), and the subject CN is consulted only when the
     * certificate has no DNS names at all.
     */
    [[nodiscard]] Result<Unit, BeaconFailure> VerifyBrokerDomain(const Certificate& certificate) const;

private:
    NodeConfig() = default;

    std::filesystem::path private_key_file_;
    std::filesystem::path root_cert_file_;
    std::optional<std::filesystem::path> tls_ca_certificates_dir_;
    std::optional<std::string> node_id_;
    std::string broker_url_;
};

}
