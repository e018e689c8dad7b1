// =============================================================================
// volatility.cpp - Implied volatility estimate from pool fee growth
// =============================================================================

#include "vox/volatility.hpp"
#include "vox/tick_math.hpp"

namespace vox {

namespace volatility {

namespace {

const U256 FEE_SCALE(static_cast<U128>(fees::FEE_DENOMINATOR));

// sqrt(TVL << shift); shift 64 leaves the root in X32
U256 sqrt_tick_tvl(const PoolMetadata& metadata, const PoolSnapshot& snapshot, int shift) {
    U256 tvl_x64 = compute_tick_tvl_x64(metadata.tick_spacing, snapshot.tick,
                                        snapshot.sqrt_price_x96, snapshot.tick_liquidity);
    U256 root = full_math::sqrt(tvl_x64 >> (64 - shift));
    if (root.is_zero()) {
        throw VoxError(errors::ZERO_TVL, "TVL cannot be zero");
    }
    return root;
}

} // anonymous namespace

// =============================================================================
// Revenue
// =============================================================================

U128 compute_revenue_gamma(const U256& fee_growth_a_x128,
                           const U256& fee_growth_b_x128,
                           const U256& seconds_per_liquidity_x128,
                           uint32_t lookback_seconds,
                           uint32_t gamma) {
    if (seconds_per_liquidity_x128.is_zero()) {
        throw VoxError(errors::DIVISION_BY_ZERO, "seconds per liquidity is zero");
    }

    // Accumulators wrap; the modular difference is the growth over the window
    U256 delta = fee_growth_b_x128 - fee_growth_a_x128;

    U256 scale = U256(lookback_seconds) * U256(gamma);
    U256 denom = full_math::checked_mul(seconds_per_liquidity_x128, FEE_SCALE);

    // Quotient beyond 256 bits saturates like any other value above 2^128
    full_math::U512 product = full_math::mul_wide(delta, scale);
    if (!product.hi.is_zero() && product.hi >= denom) {
        return U128_MAX;
    }

    U256 revenue = full_math::mul_div(delta, scale, denom);
    return revenue.fits_u128() ? revenue.lo : U128_MAX;
}

U256 amount0_to_amount1(const U256& amount0, const U256& sqrt_price_x96) {
    U256 price_x96 = full_math::mul_div(sqrt_price_x96, sqrt_price_x96, Q96);
    return full_math::mul_div(amount0, price_x96, Q96);
}

U256 compute_volume_gamma(const PoolMetadata& metadata,
                          const PoolSnapshot& snapshot,
                          const FeeGrowthSnapshot& a,
                          const FeeGrowthSnapshot& b) {
    U128 revenue0 = compute_revenue_gamma(a.fee_growth_global0_x128, b.fee_growth_global0_x128,
                                          snapshot.seconds_per_liquidity_x128,
                                          snapshot.oracle_lookback, metadata.base_fee);
    U128 revenue1 = compute_revenue_gamma(a.fee_growth_global1_x128, b.fee_growth_global1_x128,
                                          snapshot.seconds_per_liquidity_x128,
                                          snapshot.oracle_lookback, metadata.base_fee);

    return full_math::checked_add(U256(revenue1),
                                  amount0_to_amount1(U256(revenue0), snapshot.sqrt_price_x96));
}

// =============================================================================
// Tick-local TVL
// =============================================================================

U256 compute_tick_tvl_x64(int32_t tick_spacing, int32_t tick,
                          const U256& sqrt_price_x96, U128 liquidity) {
    int32_t lower_tick = tick_math::floor_tick(tick, tick_spacing);
    U256 sqrt_lower = tick_math::get_sqrt_ratio_at_tick(lower_tick);
    U256 sqrt_upper = tick_math::get_sqrt_ratio_at_tick(lower_tick + tick_spacing);

    if (sqrt_price_x96 < sqrt_lower || sqrt_price_x96 > sqrt_upper) {
        throw VoxError(errors::INVALID_PRICE, "sqrt price outside tick range");
    }

    // value0 = L * sqrtP * (sqrtU - sqrtP) / (Q96 * sqrtU), in token1
    U256 numerator = full_math::mul_div(sqrt_price_x96, sqrt_upper - sqrt_price_x96, Q96);
    U256 value0 = full_math::mul_div(U256(liquidity), numerator, sqrt_upper);
    U256 value1 = full_math::mul_div(U256(liquidity), sqrt_price_x96 - sqrt_lower, Q96);

    U256 tvl = full_math::checked_add(value0, value1);
    if (tvl.bit_length() > 192) {
        throw VoxError(errors::ARITHMETIC_OVERFLOW, "tick TVL exceeds 192 bits");
    }
    return tvl << 64;
}

// =============================================================================
// Greeks
// =============================================================================

U256 exp_taylor(const U256& x_x18) {
    U256 sum = X18_ONE;
    U256 term = X18_ONE;

    for (int i = 1; i < TAYLOR_TERMS; ++i) {
        // term_i = term_{i-1} * x / i
        term = full_math::mul_div(term, x_x18, U256(static_cast<U128>(i)) * X18_ONE);
        if (term < U256(TAYLOR_EPSILON)) break;
        sum = full_math::checked_add(sum, term);
    }

    if (sum < X18_ONE) {
        throw VoxError(errors::RESULT_OVERFLOW, "Taylor series below unit");
    }
    return sum;
}

U256 theta_adjust(const U256& value, uint64_t time_to_expiry, uint64_t total_duration) {
    if (total_duration == 0) {
        throw VoxError(errors::ZERO_DURATION);
    }
    if (time_to_expiry >= total_duration) {
        throw VoxError(errors::EXPIRY_EXCEEDS_HORIZON);
    }
    if (time_to_expiry == 0) {
        return value;
    }

    U256 normalized = full_math::mul_div(U256(time_to_expiry), X18_ONE, U256(total_duration));
    U256 growth = exp_taylor(normalized);
    U256 decay = full_math::mul_div(X18_ONE, X18_ONE, growth);
    return full_math::mul_div(value, decay, X18_ONE);
}

U256 rho_adjust(const U256& value, const U256& risk_free_rate_x18) {
    if (risk_free_rate_x18 > X18_ONE) {
        throw VoxError(errors::INVALID_RATE, risk_free_rate_x18.to_string());
    }
    return full_math::mul_div(value, X18_ONE - risk_free_rate_x18, X18_ONE);
}

// =============================================================================
// Estimators
// =============================================================================

U256 estimate(const PoolMetadata& metadata,
              const PoolSnapshot& snapshot,
              const FeeGrowthSnapshot& a,
              const FeeGrowthSnapshot& b,
              uint64_t time_to_expiry,
              const U256& risk_free_rate_x18,
              uint64_t total_duration) {
    if (total_duration == 0) {
        throw VoxError(errors::ZERO_DURATION);
    }
    if (time_to_expiry >= total_duration) {
        throw VoxError(errors::EXPIRY_EXCEEDS_HORIZON);
    }
    if (metadata.base_fee == 0) {
        throw VoxError(errors::INVALID_FEE);
    }
    if (snapshot.tick_liquidity == 0) {
        throw VoxError(errors::ZERO_LIQUIDITY);
    }
    if (risk_free_rate_x18 > X18_ONE) {
        throw VoxError(errors::INVALID_RATE, risk_free_rate_x18.to_string());
    }

    U256 volume = compute_volume_gamma(metadata, snapshot, a, b);
    U256 sqrt_tvl = sqrt_tick_tvl(metadata, snapshot, 0);

    volume = theta_adjust(volume, time_to_expiry, total_duration);
    volume = rho_adjust(volume, risk_free_rate_x18);

    return volume / sqrt_tvl;
}

U256 estimate_24h(const PoolMetadata& metadata,
                  const PoolSnapshot& snapshot,
                  const FeeGrowthSnapshot& a,
                  const FeeGrowthSnapshot& b) {
    if (metadata.base_fee == 0) {
        throw VoxError(errors::INVALID_FEE);
    }
    if (snapshot.tick_liquidity == 0) {
        throw VoxError(errors::ZERO_LIQUIDITY);
    }
    if (b.timestamp <= a.timestamp) {
        throw VoxError(errors::ZERO_ELAPSED);
    }

    U256 volume = compute_volume_gamma(metadata, snapshot, a, b);
    U256 sqrt_tvl_x32 = sqrt_tick_tvl(metadata, snapshot, 64);

    U256 elapsed(b.timestamp - a.timestamp);
    U256 time_adjustment_x32 = full_math::sqrt((U256(ONE_DAY) << 64) / elapsed);

    return full_math::mul_div(U256(2) * X18_ONE * time_adjustment_x32,
                              full_math::sqrt(volume), sqrt_tvl_x32);
}

} // namespace volatility

} // namespace vox
