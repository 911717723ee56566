#pragma once

/**
 * @file identity_logger.hpp
 * @brief Debug logging for identity bootstrap and envelope conversions.
 *
 * Prints identifiers, serials, key sizes and payload sizes to stdout so the
 * startup sequence can be followed on a misbehaving node. Private key
 * material is never passed to these functions.
 *
 * Enable via CMake: -DBEACON_DEBUG_IDENTITY=ON
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace beacon::debug {

#ifdef BEACON_DEBUG_IDENTITY

// ============================================================================
// Core logging macros
// ============================================================================

#define BCN_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[BCN-DEBUG] %s %s\n", operation, message); \
        fflush(stdout); \
    } while(0)

#define BCN_LOG_VALUE(operation, name, value) \
    do { \
        const std::string __bcn_value(value); \
        fprintf(stdout, "[BCN-DEBUG] %s %s: %s\n", operation, name, __bcn_value.c_str()); \
        fflush(stdout); \
    } while(0)

#define BCN_LOG_SIZE(operation, name, size) \
    do { \
        fprintf(stdout, "[BCN-DEBUG] %s %s: %zu\n", operation, name, static_cast<size_t>(size)); \
        fflush(stdout); \
    } while(0)

#define BCN_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[BCN-DEBUG] ========== %s ==========\n", section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Identity bootstrap
// ============================================================================

inline void LogBootstrapStart(std::string_view node_id, std::string_view key_file) {
    BCN_LOG_SECTION("IDENTITY BOOTSTRAP");
    BCN_LOG_VALUE("BOOTSTRAP", "node_id", node_id);
    BCN_LOG_VALUE("BOOTSTRAP", "key_file", key_file);
}

inline void LogPrivateKeyDecoded(std::string_view role, std::string_view encoding, int bits) {
    BCN_LOG_VALUE("BOOTSTRAP", "key_role", role);
    BCN_LOG_VALUE("BOOTSTRAP", "key_encoding", encoding);
    BCN_LOG_SIZE("BOOTSTRAP", "key_bits", bits);
}

inline void LogCertificateResolved(std::string_view serial, std::string_view common_name) {
    BCN_LOG_VALUE("BOOTSTRAP", "certificate_serial", serial);
    BCN_LOG_VALUE("BOOTSTRAP", "certificate_cn", common_name);
}

inline void LogIdentityPublished(std::string_view node_id, std::string_view key_id) {
    BCN_LOG_SECTION("IDENTITY PUBLISHED");
    BCN_LOG_VALUE("PUBLISH", "node_id", node_id);
    BCN_LOG_VALUE("PUBLISH", "key_id", key_id);
}

// ============================================================================
// Envelope conversions
// ============================================================================

inline void LogEnvelopeEncrypted(std::string_view msg_id, size_t plaintext_size,
                                 size_t ciphertext_size, size_t recipients) {
    BCN_LOG_VALUE("ENVELOPE", "encrypt", msg_id);
    BCN_LOG_SIZE("ENVELOPE", "plaintext_size", plaintext_size);
    BCN_LOG_SIZE("ENVELOPE", "ciphertext_size", ciphertext_size);
    BCN_LOG_SIZE("ENVELOPE", "recipients", recipients);
}

inline void LogEnvelopeDecrypted(std::string_view msg_id, size_t ciphertext_size,
                                 size_t plaintext_size) {
    BCN_LOG_VALUE("ENVELOPE", "decrypt", msg_id);
    BCN_LOG_SIZE("ENVELOPE", "ciphertext_size", ciphertext_size);
    BCN_LOG_SIZE("ENVELOPE", "plaintext_size", plaintext_size);
}

#else // !BEACON_DEBUG_IDENTITY

#define BCN_LOG_MSG(operation, message) ((void)0)
#define BCN_LOG_VALUE(operation, name, value) ((void)0)
#define BCN_LOG_SIZE(operation, name, size) ((void)0)
#define BCN_LOG_SECTION(section_name) ((void)0)

inline void LogBootstrapStart(std::string_view, std::string_view) {}
inline void LogPrivateKeyDecoded(std::string_view, std::string_view, int) {}
inline void LogCertificateResolved(std::string_view, std::string_view) {}
inline void LogIdentityPublished(std::string_view, std::string_view) {}
inline void LogEnvelopeEncrypted(std::string_view, size_t, size_t, size_t) {}
inline void LogEnvelopeDecrypted(std::string_view, size_t, size_t) {}

#endif // BEACON_DEBUG_IDENTITY

} // namespace beacon::debug
