#include "beacon/identity/identity_initializer.hpp"
#include "beacon/identity/identity_bootstrapper.hpp"
#include "beacon/identity/identity_publisher.hpp"
namespace beacon::node::identity {

Result<IdentitySummary, BeaconFailure> InitForNode(
    const configuration::NodeConfig& config,
    const IDirectoryLookup& directory) {
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<IdentitySummary, BeaconFailure>::Err(std::move(valid).UnwrapErr());
    }
    auto root_certificate = config.LoadRootCertificate();
    if (root_certificate.IsErr()) {
        return Result<IdentitySummary, BeaconFailure>::Err(std::move(root_certificate).UnwrapErr());
    }
    auto node_id = config.ParsedNodeId();
    if (node_id.IsErr()) {
        return Result<IdentitySummary, BeaconFailure>::Err(std::move(node_id).UnwrapErr());
    }

    BootstrapOptions options;
    options.root_certificate = std::move(root_certificate).Unwrap();
    auto identity = IdentityBootstrapper::Load(
        config.PrivateKeyFile(), node_id.Unwrap(), directory, options);
    if (identity.IsErr()) {
        return Result<IdentitySummary, BeaconFailure>::Err(std::move(identity).UnwrapErr());
    }

    const Certificate& certificate = identity.Unwrap().PublicPortion().certificate;
    auto serial = certificate.SerialHex();
    if (serial.IsErr()) {
        return Result<IdentitySummary, BeaconFailure>::Err(std::move(serial).UnwrapErr());
    }
    auto common_name = certificate.CommonName();
    if (common_name.IsErr()) {
        return Result<IdentitySummary, BeaconFailure>::Err(std::move(common_name).UnwrapErr());
    }

    auto handle = IdentityPublisher::Publish(std::move(identity).Unwrap());
    return Result<IdentitySummary, BeaconFailure>::Ok(IdentitySummary{
        std::move(serial).Unwrap(),
        std::move(common_name).Unwrap(),
        std::move(handle)});
}

}
