#pragma once
#include <concepts>
#include <string>
namespace beacon::node::messaging {

/// Payload readable as text. Never put on the wire towards a peer.
struct Plain {
    std::string body;
    bool operator==(const Plain&) const = default;
};

/// Opaque ciphertext blob produced by an IPayloadEncryptor.
struct Encrypted {
    std::string blob;
    bool operator==(const Encrypted&) const = default;
};

template<typename S>
concept MessageState = std::same_as<S, Plain> || std::same_as<S, Encrypted>;

}
