#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/configuration/node_config.hpp"
#include "beacon/identity/crypto_identity.hpp"
#include "beacon/identity/directory_lookup.hpp"
#include <memory>
#include <string>
namespace beacon::node::identity {

/// What a node reports about itself once its identity is live.
struct IdentitySummary {
    /// Certificate serial as uppercase hex without separators.
    std::string serial;
    std::string common_name;
    std::shared_ptr<const CryptoIdentity> identity;
};

/**
 * @brief Node startup: validate @p config, load the root CA, bootstrap the
 * identity and publish it.
 *
 * The directory's certificate for the node must be issued by the configured
 * root CA. Aborts if the config has no node id or an identity was already
 * published.
 */
[[nodiscard]] Result<IdentitySummary, BeaconFailure> InitForNode(
    const configuration::NodeConfig& config,
    const IDirectoryLookup& directory);

}
