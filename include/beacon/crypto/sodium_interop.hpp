#pragma once

#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include "beacon/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beacon::node::crypto {

/**
 * @brief Interop layer for libsodium operations used by the node
 *
 * Covers library initialization, wiping of buffers that held key material,
 * constant-time comparison, the CSPRNG and base64 transport encoding.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other sodium operation.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, large ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Wipe and clear a string that held secret text (e.g. a PEM key)
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Standard base64 with padding (sodium_base64_VARIANT_ORIGINAL)
     */
    static Result<std::string, SodiumFailure> ToBase64(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view text);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace beacon::node::crypto
