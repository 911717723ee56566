#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/core/constants.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
namespace beacon::node::messaging {

/**
 * @brief Correlation id of an envelope: a random (version 4) UUID.
 *
 * Text form is the lowercase 8-4-4-4-12 hyphenated layout.
 */
class MsgId {
public:
    using Bytes = std::array<uint8_t, Constants::MSG_ID_SIZE>;

    [[nodiscard]] static MsgId Generate();
    [[nodiscard]] static Result<MsgId, BeaconFailure> Parse(std::string_view text);
    [[nodiscard]] static MsgId FromBytes(const Bytes& bytes) noexcept { return MsgId(bytes); }

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] const Bytes& AsBytes() const noexcept { return bytes_; }

    bool operator==(const MsgId&) const = default;
    auto operator<=>(const MsgId&) const = default;
private:
    explicit MsgId(const Bytes& bytes) noexcept : bytes_(bytes) {}
    Bytes bytes_;
};

}

template<>
struct std::hash<beacon::node::messaging::MsgId> {
    size_t operator()(const beacon::node::messaging::MsgId& id) const noexcept {
        size_t hash = 0;
        for (const auto byte : id.AsBytes()) {
            hash = hash * 31 + byte;
        }
        return hash;
    }
};
