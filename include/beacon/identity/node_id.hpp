#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include <compare>
#include <functional>
#include <string>
#include <string_view>
namespace beacon::node::identity {

/**
 * @brief Identifier of a node (proxy or application) in the peer network.
 *
 * Opaque to this library apart from being non-empty and free of
 * whitespace; it is the key used for directory lookups.
 */
class NodeId {
public:
    [[nodiscard]] static Result<NodeId, BeaconFailure> Create(std::string_view value);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    auto operator<=>(const NodeId&) const = default;
    bool operator==(const NodeId&) const = default;
private:
    explicit NodeId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

}

template<>
struct std::hash<beacon::node::identity::NodeId> {
    size_t operator()(const beacon::node::identity::NodeId& id) const noexcept {
        return std::hash<std::string>{}(id.Value());
    }
};
