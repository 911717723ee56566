#include "beacon/crypto/sodium_interop.hpp"
#include "beacon/core/format.hpp"

#include <string>

namespace beacon::node::crypto {
namespace {
    template<typename T>
    Result<T, SodiumFailure> NotInitialized() {
        return Result<T, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return NotInitialized<Unit>();
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooLarge(
            compat::format("Refusing to wipe {} bytes (limit {})", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& text) {
    // Bytes past size() may still hold earlier contents.
    text.resize(text.capacity());
    auto wiped = SecureWipe(std::span(reinterpret_cast<uint8_t*>(text.data()), text.size()));
    text.clear();
    return wiped;
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* target = buffer.data();
    for (size_t offset = 0; offset != buffer.size(); ++offset) {
        target[offset] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return NotInitialized<bool>();
    }
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

Result<std::string, SodiumFailure> SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    if (!IsInitialized()) {
        return NotInitialized<std::string>();
    }
    const size_t encoded_capacity =
        sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_capacity, '\0');
    if (sodium_bin2base64(encoded.data(), encoded.size(),
                          data.data(), data.size(),
                          sodium_base64_VARIANT_ORIGINAL) == nullptr) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Base64 encoding failed"));
    }
    // encoded_capacity includes the terminating NUL
    encoded.resize(encoded_capacity - 1);
    return Result<std::string, SodiumFailure>::Ok(std::move(encoded));
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(const std::string_view text) {
    if (!IsInitialized()) {
        return NotInitialized<std::vector<uint8_t>>();
    }
    std::vector<uint8_t> decoded(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          text.data(), text.size(),
                          nullptr, &decoded_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != SodiumConstants::SUCCESS ||
        end != text.data() + text.size()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Input is not valid base64"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(decoded));
}

} // namespace beacon::node::crypto
