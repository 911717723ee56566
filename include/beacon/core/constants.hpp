#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace beacon::node {
struct Constants {
    static constexpr size_t MSG_ID_SIZE = 16;
    static constexpr size_t MSG_ID_TEXT_LENGTH = 36;
    static constexpr size_t PAYLOAD_KEY_SIZE = 32;
    static constexpr size_t PAYLOAD_NONCE_SIZE = 24;
    static constexpr size_t PAYLOAD_TAG_SIZE = 16;
    static constexpr size_t SERIAL_GROUP_WIDTH = 2;
    static constexpr size_t SERIAL_GROUP_STRIDE = 3;
    static constexpr char SERIAL_SEPARATOR = ':';
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_KEY_FILE_SIZE = 64 * 1024;
    static constexpr int RSA_DEFAULT_BITS = 2048;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view INPUT_TYPE_PEM = "PEM";
    static constexpr std::string_view KEY_TYPE_RSA = "RSA";
    static constexpr std::string_view STRUCTURE_PKCS1 = "type-specific";
    static constexpr std::string_view STRUCTURE_PKCS8 = "PrivateKeyInfo";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct EnvelopeConstants {
    static constexpr std::chrono::seconds DEFAULT_TTL{3600};
    static constexpr std::chrono::seconds MAX_TTL{7 * 24 * 3600};
    static constexpr size_t MAX_RECIPIENTS = 1024;
    static constexpr size_t MAX_BODY_SIZE = 10 * 1024 * 1024;
};
struct ConfigDefaults {
    static constexpr std::string_view PRIVATE_KEY_FILE = "/run/secrets/privkey.pem";
    static constexpr std::string_view ROOT_CERT_FILE = "/etc/beacon/root-ca.crt";
    static constexpr std::string_view ENROLLMENT_TOOL_NAME = "beacon-enroll";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view KEY_FORMAT_UNSUPPORTED = "Unable to interpret private key PEM as PKCS#1 or PKCS#8";
    static constexpr std::string_view CERTIFICATE_UNPARSABLE = "Unable to parse your certificate";
    static constexpr std::string_view CERTIFICATE_NOT_ISSUED_BY_ROOT = "Your certificate was not issued by the configured root CA";
    static constexpr std::string_view IDENTITY_PUBLISHED_TWICE = "Tried to initialize crypto twice (IdentityPublisher::Publish())";
    static constexpr std::string_view IDENTITY_NOT_PUBLISHED = "Crypto identity requested before IdentityPublisher::Publish()";
    static constexpr std::string_view MISSING_NODE_ID =
        "IdentityBootstrapper::Load() has been called without a node id (maybe in broker?). This should not happen.";
    static constexpr std::string_view PAYLOAD_NOT_FOR_US = "No wrapped payload key could be opened with our private key";
    static constexpr std::string_view PAYLOAD_AUTH_FAILED = "Payload authentication failed - ciphertext may have been tampered with";
};
}
