#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <string>
#include <string_view>
namespace beacon::node::crypto {

/**
 * Renders certificate serial numbers the way the directory service keys
 * them: lowercase hex split into two-character groups joined by ':'.
 *
 *   440E0D94F3... -> 44:0e:0d:94:f3:...
 *
 * All failures are SignEncryptError, since an unreadable serial means the
 * certificate itself cannot be used.
 */
class SerialFormatter {
public:
    [[nodiscard]] static Result<std::string, BeaconFailure> Format(const ASN1_INTEGER* serial);

    [[nodiscard]] static Result<std::string, BeaconFailure> FormatHex(std::string_view hex);

    [[nodiscard]] static Result<std::string, BeaconFailure> Format(const BIGNUM* serial);
private:
    [[nodiscard]] static std::string InsertSeparators(std::string hex);
    SerialFormatter() = delete;
};
}
