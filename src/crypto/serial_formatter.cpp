#include "beacon/crypto/serial_formatter.hpp"
#include "beacon/crypto/openssl_handles.hpp"
#include "beacon/core/constants.hpp"
#include "beacon/core/format.hpp"
#include <algorithm>
#include <cctype>
#include <openssl/bn.h>
namespace beacon::node::crypto {
namespace {
    BeaconFailure SerialFailure(const std::string& cause) {
        return BeaconFailure::SignEncryptError(
            compat::format("{}: {}", ErrorMessages::CERTIFICATE_UNPARSABLE, cause));
    }
}

Result<std::string, BeaconFailure> SerialFormatter::Format(const ASN1_INTEGER* serial) {
    if (serial == nullptr) {
        return Result<std::string, BeaconFailure>::Err(SerialFailure("certificate has no serial number"));
    }
    BIGNUM_ptr bn(ASN1_INTEGER_to_BN(serial, nullptr));
    if (!bn) {
        return Result<std::string, BeaconFailure>::Err(SerialFailure(GetOpenSSLError()));
    }
    return Format(bn.get());
}

Result<std::string, BeaconFailure> SerialFormatter::FormatHex(const std::string_view hex) {
    if (hex.empty()) {
        return Result<std::string, BeaconFailure>::Err(SerialFailure("empty serial number"));
    }
    const std::string hex_copy(hex);
    BIGNUM* raw = nullptr;
    const int consumed = BN_hex2bn(&raw, hex_copy.c_str());
    BIGNUM_ptr bn(raw);
    if (!bn || consumed != static_cast<int>(hex_copy.size())) {
        return Result<std::string, BeaconFailure>::Err(
            SerialFailure(compat::format("'{}' is not a hexadecimal number", hex_copy)));
    }
    return Format(bn.get());
}

Result<std::string, BeaconFailure> SerialFormatter::Format(const BIGNUM* serial) {
    if (serial == nullptr) {
        return Result<std::string, BeaconFailure>::Err(SerialFailure("certificate has no serial number"));
    }
    if (BN_is_negative(serial)) {
        return Result<std::string, BeaconFailure>::Err(SerialFailure("serial number is negative"));
    }
    OPENSSL_String_ptr hex(BN_bn2hex(serial));
    if (!hex) {
        return Result<std::string, BeaconFailure>::Err(SerialFailure(GetOpenSSLError()));
    }
    std::string lowered(hex.get());
    // BN_bn2hex pads to whole bytes except for zero, which it prints as "0".
    if (lowered.size() % 2 != 0) {
        lowered.insert(lowered.begin(), '0');
    }
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Result<std::string, BeaconFailure>::Ok(InsertSeparators(std::move(lowered)));
}

std::string SerialFormatter::InsertSeparators(std::string hex) {
    for (size_t i = Constants::SERIAL_GROUP_WIDTH; i < hex.size(); i += Constants::SERIAL_GROUP_STRIDE) {
        hex.insert(hex.begin() + static_cast<std::ptrdiff_t>(i), Constants::SERIAL_SEPARATOR);
    }
    return hex;
}

}
