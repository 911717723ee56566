#include "beacon/messaging/msg_id.hpp"
#include "beacon/crypto/sodium_interop.hpp"
#include "beacon/core/fatal.hpp"
#include "beacon/core/format.hpp"
#include <sodium.h>
namespace beacon::node::messaging {
namespace {
    constexpr std::array<size_t, 4> HYPHEN_POSITIONS = {8, 13, 18, 23};
    constexpr uint8_t VERSION_MASK = 0x0F;
    constexpr uint8_t VERSION_4 = 0x40;
    constexpr uint8_t VARIANT_MASK = 0x3F;
    constexpr uint8_t VARIANT_RFC4122 = 0x80;

    bool IsHyphenPosition(const size_t index) {
        for (const auto position : HYPHEN_POSITIONS) {
            if (position == index) {
                return true;
            }
        }
        return false;
    }

    int HexValue(const char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

MsgId MsgId::Generate() {
    if (crypto::SodiumInterop::Initialize().IsErr()) {
        Fatal(ErrorMessages::SODIUM_INIT_FAILED);
    }
    Bytes bytes{};
    randombytes_buf(bytes.data(), bytes.size());
    bytes[6] = static_cast<uint8_t>((bytes[6] & VERSION_MASK) | VERSION_4);
    bytes[8] = static_cast<uint8_t>((bytes[8] & VARIANT_MASK) | VARIANT_RFC4122);
    return MsgId(bytes);
}

Result<MsgId, BeaconFailure> MsgId::Parse(const std::string_view text) {
    if (text.size() != Constants::MSG_ID_TEXT_LENGTH) {
        return Result<MsgId, BeaconFailure>::Err(
            BeaconFailure::Decode(
                compat::format("Message id must be {} characters, got {}",
                               Constants::MSG_ID_TEXT_LENGTH, text.size())));
    }
    Bytes bytes{};
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (IsHyphenPosition(i)) {
            if (text[i] != '-') {
                return Result<MsgId, BeaconFailure>::Err(
                    BeaconFailure::Decode(compat::format("Malformed message id '{}'", text)));
            }
            ++i;
            continue;
        }
        const int high = HexValue(text[i]);
        const int low = HexValue(text[i + 1]);
        if (high < 0 || low < 0 || IsHyphenPosition(i + 1)) {
            return Result<MsgId, BeaconFailure>::Err(
                BeaconFailure::Decode(compat::format("Malformed message id '{}'", text)));
        }
        bytes[out++] = static_cast<uint8_t>((high << 4) | low);
        i += 2;
    }
    return Result<MsgId, BeaconFailure>::Ok(MsgId(bytes));
}

std::string MsgId::ToString() const {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string text;
    text.reserve(Constants::MSG_ID_TEXT_LENGTH);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text.push_back('-');
        }
        text.push_back(hex_chars[(bytes_[i] >> 4) & 0x0F]);
        text.push_back(hex_chars[bytes_[i] & 0x0F]);
    }
    return text;
}

}
