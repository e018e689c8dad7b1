#ifndef VOX_UINT256_HPP
#define VOX_UINT256_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace vox {

// =============================================================================
// U256 - 256-bit unsigned integer (two U128 limbs)
//
// + - * wrap modulo 2^256, matching EVM unchecked arithmetic. Division by zero
// throws VoxError(DIVISION_BY_ZERO).
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    static constexpr U256 max() { return U256(U128_MAX, U128_MAX); }

    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }

    // Number of significant bits (0 for zero)
    int bit_length() const;
    bool bit(int i) const {
        return i < 128 ? ((lo >> i) & 1) != 0 : ((hi >> (i - 128)) & 1) != 0;
    }

    // Narrowing with overflow check
    U128 to_u128() const {
        if (hi != 0) throw VoxError(errors::ARITHMETIC_OVERFLOW, "value exceeds 128 bits");
        return lo;
    }
    uint64_t to_u64() const {
        if (hi != 0 || (lo >> 64) != 0) {
            throw VoxError(errors::ARITHMETIC_OVERFLOW, "value exceeds 64 bits");
        }
        return static_cast<uint64_t>(lo);
    }

    // Decimal rendering
    std::string to_string() const;
    std::string to_hex() const;

    // Decimal or 0x-prefixed hex. Throws std::invalid_argument on malformed
    // text and std::out_of_range when the value exceeds 256 bits.
    static U256 from_string(std::string_view text);

    U256& operator+=(const U256& other);
    U256& operator-=(const U256& other);
    U256& operator*=(const U256& other);
    U256& operator/=(const U256& other);
    U256& operator%=(const U256& other);
    U256& operator<<=(int n);
    U256& operator>>=(int n);
    U256& operator|=(const U256& other) { lo |= other.lo; hi |= other.hi; return *this; }
    U256& operator&=(const U256& other) { lo &= other.lo; hi &= other.hi; return *this; }
};

// =============================================================================
// Comparison
// =============================================================================

inline bool operator==(const U256& a, const U256& b) { return a.lo == b.lo && a.hi == b.hi; }
inline bool operator!=(const U256& a, const U256& b) { return !(a == b); }
inline bool operator<(const U256& a, const U256& b) {
    return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
}
inline bool operator>(const U256& a, const U256& b) { return b < a; }
inline bool operator<=(const U256& a, const U256& b) { return !(b < a); }
inline bool operator>=(const U256& a, const U256& b) { return !(a < b); }

// =============================================================================
// Wrapping Arithmetic
// =============================================================================

inline U256 operator+(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo + b.lo;
    r.hi = a.hi + b.hi + (r.lo < a.lo ? 1 : 0);
    return r;
}

inline U256 operator-(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo - b.lo;
    r.hi = a.hi - b.hi - (a.lo < b.lo ? 1 : 0);
    return r;
}

U256 operator*(const U256& a, const U256& b);
U256 operator/(const U256& a, const U256& b);
U256 operator%(const U256& a, const U256& b);

U256 operator<<(const U256& a, int n);
U256 operator>>(const U256& a, int n);

inline U256 operator|(const U256& a, const U256& b) { return U256(a.lo | b.lo, a.hi | b.hi); }
inline U256 operator&(const U256& a, const U256& b) { return U256(a.lo & b.lo, a.hi & b.hi); }

// Quotient and remainder in one pass
void divmod(const U256& num, const U256& denom, U256& quot, U256& rem);

// =============================================================================
// Constants
// =============================================================================

inline constexpr U256 Q96 = U256(U128(1) << 96);
inline constexpr U256 Q128 = U256(0, 1);
inline constexpr U256 X18_ONE = U256(X18_ONE_U64);

// =============================================================================
// FullMath - 512-bit intermediate multiply/divide
// =============================================================================

namespace full_math {

// 512-bit product (lo = low 256 bits)
struct U512 {
    U256 lo;
    U256 hi;
};

U512 mul_wide(const U256& a, const U256& b);

// floor(a * b / denom). Throws DIVISION_BY_ZERO when denom == 0 and
// ARITHMETIC_OVERFLOW when the quotient does not fit 256 bits.
U256 mul_div(const U256& a, const U256& b, const U256& denom);

// ceil(a * b / denom), same failure modes
U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denom);

// floor(sqrt(x))
U256 sqrt(const U256& x);

// a + b, throws ARITHMETIC_OVERFLOW instead of wrapping
U256 checked_add(const U256& a, const U256& b);

// a * b, throws ARITHMETIC_OVERFLOW instead of wrapping
U256 checked_mul(const U256& a, const U256& b);

} // namespace full_math

} // namespace vox

#endif // VOX_UINT256_HPP
