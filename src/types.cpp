// =============================================================================
// types.cpp - Address helpers and error code names
// =============================================================================

#include "vox/types.hpp"
#include <stdexcept>

namespace vox {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must be 20 bytes of hex: " + std::string(hex));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case EXPIRY_EXCEEDS_HORIZON: return "EXPIRY_EXCEEDS_HORIZON";
        case INVALID_FEE: return "INVALID_FEE";
        case ZERO_LIQUIDITY: return "ZERO_LIQUIDITY";
        case ZERO_DURATION: return "ZERO_DURATION";
        case INVALID_RATE: return "INVALID_RATE";
        case INVALID_THRESHOLD: return "INVALID_THRESHOLD";
        case INVALID_MULTIPLIER: return "INVALID_MULTIPLIER";
        case INVALID_FACTOR: return "INVALID_FACTOR";
        case INVALID_TICK: return "INVALID_TICK";
        case INVALID_TICK_SPACING: return "INVALID_TICK_SPACING";
        case INVALID_PRICE: return "INVALID_PRICE";
        case ZERO_ELAPSED: return "ZERO_ELAPSED";
        case INVALID_TIMESTAMP: return "INVALID_TIMESTAMP";
        case OBSERVATION_UNAVAILABLE: return "OBSERVATION_UNAVAILABLE";
        case ZERO_TVL: return "ZERO_TVL";
        case RESULT_OVERFLOW: return "RESULT_OVERFLOW";
        case ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        case INVALID_OPTION: return "INVALID_OPTION";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case INSUFFICIENT_RESERVES: return "INSUFFICIENT_RESERVES";
        case EXPIRY_NOT_REACHED: return "EXPIRY_NOT_REACHED";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace errors

} // namespace vox
