#ifndef VOX_TYPES_HPP
#define VOX_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>

namespace vox {

// =============================================================================
// EVM-style Addresses (20 bytes)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Check if address is zero
constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Parse "0x" + 40 hex digits; throws std::invalid_argument on bad input
Address from_hex(std::string_view hex);

// Lowercase "0x..." rendering
std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Wide Integers & Fixed-Point Scale (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr uint64_t X18_ONE_U64 = 1000000000000000000ULL;  // 1e18
constexpr U128 U128_MAX = ~U128(0);

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // Fee in hundredths of a bip (3000 = 0.3%)
    int32_t tick_spacing;    // Tick spacing for concentrated liquidity
    Address hooks;           // Hook contract address

    // Compute pool ID hash
    uint64_t id() const {
        uint64_t h = 0;
        for (auto b : currency0.addr) h = h * 31 + b;
        for (auto b : currency1.addr) h = h * 31 + b;
        h = h * 31 + fee;
        h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_spacing));
        for (auto b : hooks) h = h * 31 + b;
        return h;
    }

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
};

// Standard fee tiers (in hundredths of a bip)
namespace fees {
constexpr uint32_t FEE_001 = 100;      // 0.01%
constexpr uint32_t FEE_005 = 500;      // 0.05%
constexpr uint32_t FEE_030 = 3000;     // 0.30%
constexpr uint32_t FEE_100 = 10000;    // 1.00%
constexpr uint32_t FEE_DENOMINATOR = 1000000;
}

// =============================================================================
// Balance Delta (Signed Token Amounts)
// =============================================================================

struct BalanceDelta {
    I128 amount0;  // positive = owed to the pool
    I128 amount1;
};

// =============================================================================
// Swap Parameters
// =============================================================================

struct SwapParams {
    bool zero_for_one;       // true = sell token0 for token1
    I128 amount_specified;   // positive = exact input, negative = exact output
    I128 sqrt_price_limit;   // X96: price limit (0 = no limit)
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Precondition violations
constexpr int32_t EXPIRY_EXCEEDS_HORIZON = -1;
constexpr int32_t INVALID_FEE = -2;
constexpr int32_t ZERO_LIQUIDITY = -3;
constexpr int32_t ZERO_DURATION = -4;
constexpr int32_t INVALID_RATE = -5;
constexpr int32_t INVALID_THRESHOLD = -6;
constexpr int32_t INVALID_MULTIPLIER = -7;
constexpr int32_t INVALID_FACTOR = -8;
constexpr int32_t INVALID_TICK = -9;
constexpr int32_t INVALID_TICK_SPACING = -10;
constexpr int32_t INVALID_PRICE = -11;
constexpr int32_t ZERO_ELAPSED = -12;
constexpr int32_t INVALID_TIMESTAMP = -13;
constexpr int32_t OBSERVATION_UNAVAILABLE = -14;

// Arithmetic bounds
constexpr int32_t ZERO_TVL = -20;
constexpr int32_t RESULT_OVERFLOW = -21;     // Taylor sum below unit
constexpr int32_t ARITHMETIC_OVERFLOW = -22;
constexpr int32_t DIVISION_BY_ZERO = -23;

// Identity / authorization
constexpr int32_t INVALID_OPTION = -30;
constexpr int32_t INVALID_AMOUNT = -31;
constexpr int32_t INSUFFICIENT_BALANCE = -32;
constexpr int32_t INSUFFICIENT_FUNDS = -33;
constexpr int32_t INSUFFICIENT_RESERVES = -34;
constexpr int32_t EXPIRY_NOT_REACHED = -35;
constexpr int32_t UNAUTHORIZED = -40;

// Stable identifier for a code ("UNKNOWN_ERROR" for unlisted values)
const char* name(int32_t code);
}

// =============================================================================
// VoxError - thrown by pure computations, carries an errors:: code
// =============================================================================

class VoxError : public std::runtime_error {
public:
    explicit VoxError(int32_t code)
        : std::runtime_error(errors::name(code)), code_(code) {}
    VoxError(int32_t code, const std::string& detail)
        : std::runtime_error(std::string(errors::name(code)) + ": " + detail), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace vox

#endif // VOX_TYPES_HPP
