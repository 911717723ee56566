#pragma once
#include "beacon/identity/node_id.hpp"
#include <optional>
#include <string>
namespace beacon::node::identity {

/// Raw answer of the directory service for one node.
struct DirectoryRecord {
    std::string certificate_pem;
    std::string public_key_pem;
};

/**
 * @brief Capability to resolve a node id to its certificate.
 *
 * The directory service itself lives outside this library. Implementations
 * may block; the bootstrapper calls Lookup exactly once and never retries.
 * std::nullopt means the node is unknown or the service gave no usable
 * answer.
 */
class IDirectoryLookup {
public:
    virtual ~IDirectoryLookup() = default;
    [[nodiscard]] virtual std::optional<DirectoryRecord> Lookup(const NodeId& node_id) const = 0;
};

}
