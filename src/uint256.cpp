// =============================================================================
// uint256.cpp - 256-bit integer arithmetic and FullMath
// =============================================================================

#include "vox/uint256.hpp"
#include <stdexcept>

namespace vox {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

inline int bits_u128(U128 x) {
    int n = 0;
    uint64_t high = static_cast<uint64_t>(x >> 64);
    if (high != 0) {
        n = 64;
        x = high;
    }
    uint64_t v = static_cast<uint64_t>(x);
    while (v != 0) { v >>= 1; ++n; }
    return n;
}

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

inline void set_bit(U256& x, int i) {
    if (i < 128) {
        x.lo |= U128(1) << i;
    } else {
        x.hi |= U128(1) << (i - 128);
    }
}

// Shift-subtract division of (high:low) by denom where high < denom.
// `bits` low-word bits are consumed; the quotient fits in 256 bits.
U256 long_divide(U256 rem, const U256& low, int bits, const U256& denom, U256& rem_out) {
    U256 quot;
    for (int i = bits - 1; i >= 0; --i) {
        bool top = (rem.hi >> 127) != 0;
        rem <<= 1;
        if (low.bit(i)) rem.lo |= 1;
        if (top || rem >= denom) {
            rem -= denom;  // Wraps back into range when top was set
            set_bit(quot, i);
        }
    }
    rem_out = rem;
    return quot;
}

} // anonymous namespace

// =============================================================================
// U256 Members
// =============================================================================

int U256::bit_length() const {
    return hi != 0 ? 128 + bits_u128(hi) : bits_u128(lo);
}

U256& U256::operator+=(const U256& other) { *this = *this + other; return *this; }
U256& U256::operator-=(const U256& other) { *this = *this - other; return *this; }
U256& U256::operator*=(const U256& other) { *this = *this * other; return *this; }
U256& U256::operator/=(const U256& other) { *this = *this / other; return *this; }
U256& U256::operator%=(const U256& other) { *this = *this % other; return *this; }
U256& U256::operator<<=(int n) { *this = *this << n; return *this; }
U256& U256::operator>>=(int n) { *this = *this >> n; return *this; }

std::string U256::to_string() const {
    if (is_zero()) return "0";

    // Peel off 19 decimal digits at a time
    const U256 chunk_base(static_cast<U128>(10000000000000000000ULL));
    std::string out;
    U256 value = *this;
    while (!value.is_zero()) {
        U256 quot, rem;
        divmod(value, chunk_base, quot, rem);
        uint64_t chunk = static_cast<uint64_t>(rem.lo);
        std::string digits = std::to_string(chunk);
        if (!quot.is_zero()) {
            digits.insert(0, 19 - digits.size(), '0');
        }
        out.insert(0, digits);
        value = quot;
    }
    return out;
}

std::string U256::to_hex() const {
    static const char* digits = "0123456789abcdef";
    if (is_zero()) return "0x0";
    std::string out;
    U256 value = *this;
    while (!value.is_zero()) {
        out.insert(out.begin(), digits[static_cast<unsigned>(value.lo & 0xF)]);
        value >>= 4;
    }
    return "0x" + out;
}

U256 U256::from_string(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty integer literal");
    }

    U256 value;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        if (text.size() > 64) {
            throw std::out_of_range("hex literal exceeds 256 bits");
        }
        for (char c : text) {
            int d;
            if (c >= '0' && c <= '9') d = c - '0';
            else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
            else throw std::invalid_argument("invalid hex digit: " + std::string(1, c));
            value = (value << 4) | U256(static_cast<U128>(d));
        }
        return value;
    }

    const U256 max_div10 = U256::max() / U256(10);
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid decimal digit: " + std::string(1, c));
        }
        U256 d(static_cast<U128>(c - '0'));
        if (value > max_div10) {
            throw std::out_of_range("decimal literal exceeds 256 bits");
        }
        U256 shifted = value * U256(10);
        U256 next = shifted + d;
        if (next < shifted) {
            throw std::out_of_range("decimal literal exceeds 256 bits");
        }
        value = next;
    }
    return value;
}

// =============================================================================
// Multiplication / Division / Shifts
// =============================================================================

U256 operator*(const U256& a, const U256& b) {
    U256 r = mul_u128(a.lo, b.lo);
    r.hi += a.lo * b.hi + a.hi * b.lo;  // Wraps
    return r;
}

void divmod(const U256& num, const U256& denom, U256& quot, U256& rem) {
    if (denom.is_zero()) {
        throw VoxError(errors::DIVISION_BY_ZERO);
    }
    if (num.hi == 0 && denom.hi == 0) {
        quot = U256(num.lo / denom.lo);
        rem = U256(num.lo % denom.lo);
        return;
    }
    if (num < denom) {
        quot = U256();
        rem = num;
        return;
    }
    quot = long_divide(U256(), num, num.bit_length(), denom, rem);
}

U256 operator/(const U256& a, const U256& b) {
    U256 q, r;
    divmod(a, b, q, r);
    return q;
}

U256 operator%(const U256& a, const U256& b) {
    U256 q, r;
    divmod(a, b, q, r);
    return r;
}

U256 operator<<(const U256& a, int n) {
    if (n <= 0) return a;
    if (n >= 256) return U256();
    if (n >= 128) return U256(0, a.lo << (n - 128));
    return U256(a.lo << n, (a.hi << n) | (a.lo >> (128 - n)));
}

U256 operator>>(const U256& a, int n) {
    if (n <= 0) return a;
    if (n >= 256) return U256();
    if (n >= 128) return U256(a.hi >> (n - 128), 0);
    return U256((a.lo >> n) | (a.hi << (128 - n)), a.hi >> n);
}

// =============================================================================
// FullMath
// =============================================================================

namespace full_math {

U512 mul_wide(const U256& a, const U256& b) {
    uint64_t x[4] = {
        static_cast<uint64_t>(a.lo), static_cast<uint64_t>(a.lo >> 64),
        static_cast<uint64_t>(a.hi), static_cast<uint64_t>(a.hi >> 64)
    };
    uint64_t y[4] = {
        static_cast<uint64_t>(b.lo), static_cast<uint64_t>(b.lo >> 64),
        static_cast<uint64_t>(b.hi), static_cast<uint64_t>(b.hi >> 64)
    };

    // Schoolbook multiplication on 64-bit limbs
    uint64_t out[8] = {0, 0, 0, 0, 0, 0, 0, 0};
    for (int i = 0; i < 4; ++i) {
        U128 carry = 0;
        for (int j = 0; j < 4; ++j) {
            U128 cur = static_cast<U128>(x[i]) * y[j] + out[i + j] + carry;
            out[i + j] = static_cast<uint64_t>(cur);
            carry = cur >> 64;
        }
        out[i + 4] = static_cast<uint64_t>(carry);
    }

    U512 r;
    r.lo = U256((static_cast<U128>(out[1]) << 64) | out[0],
                (static_cast<U128>(out[3]) << 64) | out[2]);
    r.hi = U256((static_cast<U128>(out[5]) << 64) | out[4],
                (static_cast<U128>(out[7]) << 64) | out[6]);
    return r;
}

namespace {

U256 mul_div_impl(const U256& a, const U256& b, const U256& denom, U256& rem) {
    if (denom.is_zero()) {
        throw VoxError(errors::DIVISION_BY_ZERO);
    }
    U512 prod = mul_wide(a, b);
    if (prod.hi.is_zero()) {
        U256 q;
        divmod(prod.lo, denom, q, rem);
        return q;
    }
    if (prod.hi >= denom) {
        throw VoxError(errors::ARITHMETIC_OVERFLOW, "mul_div result exceeds 256 bits");
    }
    return long_divide(prod.hi, prod.lo, 256, denom, rem);
}

} // anonymous namespace

U256 mul_div(const U256& a, const U256& b, const U256& denom) {
    U256 rem;
    return mul_div_impl(a, b, denom, rem);
}

U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denom) {
    U256 rem;
    U256 q = mul_div_impl(a, b, denom, rem);
    if (!rem.is_zero()) {
        if (q == U256::max()) {
            throw VoxError(errors::ARITHMETIC_OVERFLOW, "mul_div rounding exceeds 256 bits");
        }
        q += U256(1);
    }
    return q;
}

U256 sqrt(const U256& x) {
    if (x.is_zero()) return U256();

    // Newton-Raphson from an initial guess >= sqrt(x)
    U256 z = U256(1) << ((x.bit_length() + 1) / 2);
    U256 y = (z + x / z) >> 1;
    while (y < z) {
        z = y;
        y = (z + x / z) >> 1;
    }
    return z;
}

U256 checked_add(const U256& a, const U256& b) {
    U256 sum = a + b;
    if (sum < a) {
        throw VoxError(errors::ARITHMETIC_OVERFLOW, "addition exceeds 256 bits");
    }
    return sum;
}

U256 checked_mul(const U256& a, const U256& b) {
    U512 prod = mul_wide(a, b);
    if (!prod.hi.is_zero()) {
        throw VoxError(errors::ARITHMETIC_OVERFLOW, "multiplication exceeds 256 bits");
    }
    return prod.lo;
}

} // namespace full_math

} // namespace vox
