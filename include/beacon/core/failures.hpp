#pragma once
#include <string>
#include <string_view>
namespace beacon::node {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    SecureWipeFailed,
    EncodingFailed,
    InvalidOperation
};
enum class BeaconFailureType {
    Generic,
    ConfigurationFailed,
    SignEncryptError,
    InvalidInput,
    Decode,
    Encode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Recoverable failure reported by the identity and messaging layers.
 *
 * ConfigurationFailed covers bad local input (unreadable or undecodable key
 * files, invalid configuration). SignEncryptError covers certificate,
 * signature and payload encryption problems.
 */
class BeaconFailure {
public:
    BeaconFailureType type;
    std::string message;
    BeaconFailure(const BeaconFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static BeaconFailure Generic(std::string msg) {
        return {BeaconFailureType::Generic, std::move(msg)};
    }
    static BeaconFailure ConfigurationFailed(std::string msg) {
        return {BeaconFailureType::ConfigurationFailed, std::move(msg)};
    }
    static BeaconFailure SignEncryptError(std::string msg) {
        return {BeaconFailureType::SignEncryptError, std::move(msg)};
    }
    static BeaconFailure InvalidInput(std::string msg) {
        return {BeaconFailureType::InvalidInput, std::move(msg)};
    }
    static BeaconFailure Decode(std::string msg) {
        return {BeaconFailureType::Decode, std::move(msg)};
    }
    static BeaconFailure Encode(std::string msg) {
        return {BeaconFailureType::Encode, std::move(msg)};
    }
    static BeaconFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool Is(const BeaconFailureType t) const noexcept {
        return type == t;
    }
};
[[nodiscard]] constexpr std::string_view ToString(const BeaconFailureType type) noexcept {
    switch (type) {
        case BeaconFailureType::ConfigurationFailed: return "ConfigurationFailed";
        case BeaconFailureType::SignEncryptError: return "SignEncryptError";
        case BeaconFailureType::InvalidInput: return "InvalidInput";
        case BeaconFailureType::Decode: return "Decode";
        case BeaconFailureType::Encode: return "Encode";
        default: return "Generic";
    }
}
}
