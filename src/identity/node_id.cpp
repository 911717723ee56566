#include "beacon/identity/node_id.hpp"
#include "beacon/core/format.hpp"
#include <algorithm>
#include <cctype>
namespace beacon::node::identity {

Result<NodeId, BeaconFailure> NodeId::Create(const std::string_view value) {
    if (value.empty()) {
        return Result<NodeId, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Node id must not be empty"));
    }
    const bool has_space = std::any_of(value.begin(), value.end(), [](const unsigned char c) {
        return std::isspace(c) != 0 || std::iscntrl(c) != 0;
    });
    if (has_space) {
        return Result<NodeId, BeaconFailure>::Err(
            BeaconFailure::InvalidInput(
                compat::format("Node id '{}' contains whitespace or control characters", value)));
    }
    return Result<NodeId, BeaconFailure>::Ok(NodeId(std::string(value)));
}

}
