// =============================================================================
// tick_math.cpp - Exact Q64.96 sqrt ratios for concentrated liquidity ticks
// =============================================================================

#include "vox/tick_math.hpp"

namespace vox {

namespace tick_math {

namespace {

constexpr U128 make_u128(uint64_t high, uint64_t low) {
    return (static_cast<U128>(high) << 64) | low;
}

// 2^128 / sqrt(1.0001^(2^i)) for i = 0..19
constexpr U128 RATIO_FACTORS[20] = {
    make_u128(0xfffcb933bd6fad37ULL, 0xaa2d162d1a594001ULL),
    make_u128(0xfff97272373d4132ULL, 0x59a46990580e213aULL),
    make_u128(0xfff2e50f5f656932ULL, 0xef12357cf3c7fdccULL),
    make_u128(0xffe5caca7e10e4e6ULL, 0x1c3624eaa0941cd0ULL),
    make_u128(0xffcb9843d60f6159ULL, 0xc9db58835c926644ULL),
    make_u128(0xff973b41fa98c081ULL, 0x472e6896dfb254c0ULL),
    make_u128(0xff2ea16466c96a38ULL, 0x43ec78b326b52861ULL),
    make_u128(0xfe5dee046a99a2a8ULL, 0x11c461f1969c3053ULL),
    make_u128(0xfcbe86c7900a88aeULL, 0xdcffc83b479aa3a4ULL),
    make_u128(0xf987a7253ac41317ULL, 0x6f2b074cf7815e54ULL),
    make_u128(0xf3392b0822b70005ULL, 0x940c7a398e4b70f3ULL),
    make_u128(0xe7159475a2c29b74ULL, 0x43b29c7fa6e889d9ULL),
    make_u128(0xd097f3bdfd2022b8ULL, 0x845ad8f792aa5825ULL),
    make_u128(0xa9f746462d870fdfULL, 0x8a65dc1f90e061e5ULL),
    make_u128(0x70d869a156d2a1b8ULL, 0x90bb3df62baf32f7ULL),
    make_u128(0x31be135f97d08fd9ULL, 0x81231505542fcfa6ULL),
    make_u128(0x09aa508b5b7a84e1ULL, 0xc677de54f3e99bc9ULL),
    make_u128(0x005d6af8dedb8119ULL, 0x6699c329225ee604ULL),
    make_u128(0x00002216e584f5faULL, 0x1ea926041bedfe98ULL),
    make_u128(0x00000000048a1703ULL, 0x91f7dc42444e8fa2ULL),
};

} // anonymous namespace

U256 get_sqrt_ratio_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw VoxError(errors::INVALID_TICK, std::to_string(tick));
    }

    uint32_t abs_tick = tick < 0 ? static_cast<uint32_t>(-static_cast<int64_t>(tick))
                                 : static_cast<uint32_t>(tick);

    // Q128.128 ratio of 1 / sqrt(1.0001^|tick|)
    U256 ratio = (abs_tick & 0x1) != 0 ? U256(RATIO_FACTORS[0]) : Q128;
    for (int i = 1; i < 20; ++i) {
        if ((abs_tick & (1u << i)) != 0) {
            ratio = (ratio * U256(RATIO_FACTORS[i])) >> 128;
        }
    }

    if (tick > 0) {
        ratio = U256::max() / ratio;
    }

    // Q128.128 -> Q64.96, rounding up
    U256 sqrt_price = ratio >> 32;
    if ((ratio.lo & 0xFFFFFFFFu) != 0) {
        sqrt_price += U256(1);
    }
    return sqrt_price;
}

int32_t floor_tick(int32_t tick, int32_t tick_spacing) {
    if (tick_spacing <= 0) {
        throw VoxError(errors::INVALID_TICK_SPACING, std::to_string(tick_spacing));
    }
    int32_t compressed = tick / tick_spacing;
    if (tick < 0 && tick % tick_spacing != 0) {
        --compressed;
    }
    return compressed * tick_spacing;
}

} // namespace tick_math

} // namespace vox
