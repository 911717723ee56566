#pragma once
#include "beacon/identity/crypto_identity.hpp"
#include <memory>
namespace beacon::node::identity {

/**
 * @brief Process-wide, write-once slot for the node's CryptoIdentity.
 *
 * Publish claims the slot with an atomic check-and-set. A second Publish,
 * from any thread, aborts the process: replacing key material that is
 * already in use is never valid. Reads after publication are lock-free.
 *
 * Prefer passing the handle returned by Publish to consumers; Get exists
 * for code paths that cannot receive it explicitly.
 */
class IdentityPublisher {
public:
    static std::shared_ptr<const CryptoIdentity> Publish(CryptoIdentity identity);

    /// Aborts if nothing has been published yet.
    [[nodiscard]] static std::shared_ptr<const CryptoIdentity> Get();

    [[nodiscard]] static bool IsPublished() noexcept;
private:
    IdentityPublisher() = delete;
};

}
