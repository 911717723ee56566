#include "beacon/identity/identity_publisher.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/fatal.hpp"
#include "beacon/debug/identity_logger.hpp"
#include <atomic>
namespace beacon::node::identity {
namespace {
    std::atomic<bool> slot_claimed{false};
    std::atomic<bool> published{false};
    // Written once by the thread that claims the slot, before published is set.
    std::shared_ptr<const CryptoIdentity> slot;
}

std::shared_ptr<const CryptoIdentity> IdentityPublisher::Publish(CryptoIdentity identity) {
    bool expected = false;
    if (!slot_claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        Fatal(ErrorMessages::IDENTITY_PUBLISHED_TWICE);
    }
    slot = std::make_shared<const CryptoIdentity>(std::move(identity));
    published.store(true, std::memory_order_release);
    debug::LogIdentityPublished(slot->Id().Value(),
                                slot->SigningKey().KeyId().value_or("<none>"));
    return slot;
}

std::shared_ptr<const CryptoIdentity> IdentityPublisher::Get() {
    if (!published.load(std::memory_order_acquire)) {
        Fatal(ErrorMessages::IDENTITY_NOT_PUBLISHED);
    }
    return slot;
}

bool IdentityPublisher::IsPublished() noexcept {
    return published.load(std::memory_order_acquire);
}

}
