#include "beacon/configuration/node_config.hpp"
#include "beacon/core/text_file.hpp"
#include "beacon/core/format.hpp"
#include <algorithm>
#include <cctype>
namespace beacon::node::configuration {
namespace {
    constexpr size_t MAX_ROOT_CERT_FILE_SIZE = 1024 * 1024;
    constexpr std::string_view SCHEME_SEPARATOR = "://";

    Result<Unit, BeaconFailure> Invalid(std::string message) {
        return Result<Unit, BeaconFailure>::Err(BeaconFailure::ConfigurationFailed(std::move(message)));
    }
}

NodeConfig NodeConfig::Default() {
    NodeConfig config;
    config.private_key_file_ = std::filesystem::path(std::string(ConfigDefaults::PRIVATE_KEY_FILE));
    config.root_cert_file_ = std::filesystem::path(std::string(ConfigDefaults::ROOT_CERT_FILE));
    return config;
}

NodeConfig NodeConfig::WithPrivateKeyFile(std::filesystem::path path) && {
    private_key_file_ = std::move(path);
    return std::move(*this);
}

NodeConfig NodeConfig::WithRootCertFile(std::filesystem::path path) && {
    root_cert_file_ = std::move(path);
    return std::move(*this);
}

NodeConfig NodeConfig::WithTlsCaCertificatesDir(std::filesystem::path path) && {
    tls_ca_certificates_dir_ = std::move(path);
    return std::move(*this);
}

NodeConfig NodeConfig::WithNodeId(std::string node_id) && {
    node_id_ = std::move(node_id);
    return std::move(*this);
}

NodeConfig NodeConfig::WithBrokerUrl(std::string broker_url) && {
    broker_url_ = std::move(broker_url);
    return std::move(*this);
}

Result<Unit, BeaconFailure> NodeConfig::Validate() const {
    if (private_key_file_.empty()) {
        return Invalid("Private key file path is empty");
    }
    if (root_cert_file_.empty()) {
        return Invalid("Root certificate file path is empty");
    }
    if (tls_ca_certificates_dir_.has_value() && tls_ca_certificates_dir_->empty()) {
        return Invalid("TLS CA certificates directory is empty");
    }
    if (auto node_id = ParsedNodeId(); node_id.IsErr()) {
        return Result<Unit, BeaconFailure>::Err(std::move(node_id).UnwrapErr());
    }
    if (auto domain = BrokerDomain(); domain.IsErr()) {
        return Result<Unit, BeaconFailure>::Err(std::move(domain).UnwrapErr());
    }
    return Result<Unit, BeaconFailure>::Ok(unit);
}

Result<std::optional<NodeId>, BeaconFailure> NodeConfig::ParsedNodeId() const {
    if (!node_id_.has_value()) {
        return Result<std::optional<NodeId>, BeaconFailure>::Ok(std::nullopt);
    }
    auto node_id = NodeId::Create(*node_id_);
    if (node_id.IsErr()) {
        return Result<std::optional<NodeId>, BeaconFailure>::Err(
            BeaconFailure::ConfigurationFailed(
                compat::format("Invalid node id '{}': {}", *node_id_, node_id.UnwrapErr().message)));
    }
    return Result<std::optional<NodeId>, BeaconFailure>::Ok(std::move(node_id).Unwrap());
}

Result<std::string, BeaconFailure> NodeConfig::BrokerDomain() const {
    const auto invalid = [this](std::string_view cause) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::ConfigurationFailed(
                compat::format("Invalid broker URL '{}': {}", broker_url_, cause)));
    };
    const size_t scheme_end = broker_url_.find(SCHEME_SEPARATOR);
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return invalid("missing scheme");
    }
    std::string_view rest(broker_url_);
    rest.remove_prefix(scheme_end + SCHEME_SEPARATOR.size());
    rest = rest.substr(0, rest.find_first_of("/?#"));
    if (const size_t at = rest.rfind('@'); at != std::string_view::npos) {
        rest.remove_prefix(at + 1);
    }
    std::string_view host;
    if (!rest.empty() && rest.front() == '[') {
        const size_t close = rest.find(']');
        if (close == std::string_view::npos) {
            return invalid("unterminated IPv6 literal");
        }
        host = rest.substr(1, close - 1);
    } else {
        host = rest.substr(0, rest.find(':'));
    }
    if (host.empty()) {
        return invalid("missing host");
    }
    std::string domain(host);
    std::transform(domain.begin(), domain.end(), domain.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Result<std::string, BeaconFailure>::Ok(std::move(domain));
}

Result<Certificate, BeaconFailure> NodeConfig::LoadRootCertificate() const {
    auto text = ReadTextFile(root_cert_file_, MAX_ROOT_CERT_FILE_SIZE);
    if (text.IsErr()) {
        return Result<Certificate, BeaconFailure>::Err(
            BeaconFailure::ConfigurationFailed(
                compat::format("Unable to load root certificate from file {}: {}",
                               root_cert_file_.string(), text.UnwrapErr().message)));
    }
    auto certificate = Certificate::FromPem(text.Unwrap());
    if (certificate.IsErr()) {
        return Result<Certificate, BeaconFailure>::Err(
            BeaconFailure::ConfigurationFailed(
                compat::format("Root certificate file {} is unusable: {}",
                               root_cert_file_.string(), certificate.UnwrapErr().message)));
    }
    return certificate;
}

Result<Unit, BeaconFailure> NodeConfig::VerifyBrokerDomain(const Certificate& certificate) const {
    auto domain = BrokerDomain();
    if (domain.IsErr()) {
        return Result<Unit, BeaconFailure>::Err(std::move(domain).UnwrapErr());
    }
    if (!certificate.MatchesHost(domain.Unwrap())) {
        const auto common_name = certificate.CommonName();
        return Invalid(compat::format("Broker domain {} does not match certificate {}",
                                      domain.Unwrap(),
                                      common_name.IsOk() ? common_name.Unwrap() : std::string("<no CN>")));
    }
    return Result<Unit, BeaconFailure>::Ok(unit);
}

}
