#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/identity/node_id.hpp"
#include "beacon/messaging/message_state.hpp"
#include <span>
namespace beacon::node::messaging {
using identity::NodeId;

/**
 * @brief Turns a plaintext payload into ciphertext readable by @p recipients.
 */
class IPayloadEncryptor {
public:
    virtual ~IPayloadEncryptor() = default;
    [[nodiscard]] virtual Result<Encrypted, BeaconFailure> Encrypt(
        const Plain& payload,
        std::span<const NodeId> recipients) const = 0;
};

/**
 * @brief Recovers a plaintext payload; reports bad keys or corrupted
 * ciphertext as SignEncryptError.
 */
class IPayloadDecryptor {
public:
    virtual ~IPayloadDecryptor() = default;
    [[nodiscard]] virtual Result<Plain, BeaconFailure> Decrypt(const Encrypted& payload) const = 0;
};

}
