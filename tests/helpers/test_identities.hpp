#pragma once
#include "beacon/identity/identity_bootstrapper.hpp"
#include "helpers/mock_directory_lookup.hpp"
#include "helpers/test_pki.hpp"
#include <initializer_list>
#include <memory>
#include <stdexcept>

namespace beacon::node::test_helpers {

using identity::CryptoIdentity;
using identity::IdentityBootstrapper;

inline const TestNode& NodeCharlie() {
    static const TestNode node = SharedPki().IssueNode("charlie.broker.example.org", "0C");
    return node;
}

/// Directory that knows the certificates of @p nodes.
inline std::shared_ptr<MockDirectoryLookup> DirectoryOf(std::initializer_list<const TestNode*> nodes) {
    auto directory = std::make_shared<MockDirectoryLookup>();
    for (const TestNode* node : nodes) {
        directory->SetCertificate(node->node_id, node->certificate_pem);
    }
    return directory;
}

/**
 * Bootstraps @p node from a key file on disk, the same way a node does at
 * startup, without publishing it.
 */
inline std::shared_ptr<const CryptoIdentity> LoadTestIdentity(
    const TestNode& node,
    const identity::IDirectoryLookup& directory) {
    TempDirectory dir;
    const auto key_file = dir.WriteFile("privkey.pem", node.pkcs8_pem);
    auto identity = IdentityBootstrapper::Load(
        key_file, identity::NodeId::Create(node.node_id).Unwrap(), directory);
    if (identity.IsErr()) {
        throw std::runtime_error(identity.UnwrapErr().message);
    }
    return std::make_shared<const CryptoIdentity>(std::move(identity).Unwrap());
}

}
