#ifndef VOX_VOLATILITY_HPP
#define VOX_VOLATILITY_HPP

#include <cstdint>

#include "uint256.hpp"

namespace vox {

// =============================================================================
// Pool Metadata (static per pool)
// =============================================================================

struct PoolMetadata {
    uint32_t max_seconds_ago;   // Oracle lookback window
    uint32_t base_fee;          // Fee rate in hundredths of a bip (gamma)
    int32_t tick_spacing;
};

// =============================================================================
// Pool Snapshot (read from the oracle per call)
// =============================================================================

struct PoolSnapshot {
    U256 sqrt_price_x96;              // Spot sqrt(price) as Q64.96
    int32_t tick;                     // Current tick
    U128 tick_liquidity;              // In-range liquidity
    U256 seconds_per_liquidity_x128;  // Seconds-per-liquidity over the lookback
    uint32_t oracle_lookback;         // Seconds covered by the lookback
};

// =============================================================================
// Fee Growth Snapshot
// =============================================================================

struct FeeGrowthSnapshot {
    U256 fee_growth_global0_x128;
    U256 fee_growth_global1_x128;
    uint64_t timestamp;
};

// =============================================================================
// Volatility - implied volatility from fee revenue and tick-local TVL
//
// All functions are pure and throw VoxError on failure.
// =============================================================================

namespace volatility {

// Early-exit bound for Taylor terms (1e-9 in X18)
constexpr uint64_t TAYLOR_EPSILON = 1000000000ULL;
constexpr int TAYLOR_TERMS = 10;
constexpr uint64_t ONE_DAY = 86400;

// Fee revenue over the lookback scaled by the fee rate:
//   ((b - a) mod 2^256) * lookback * gamma / (seconds_per_liquidity * 1e6)
// saturating at the 128-bit maximum.
U128 compute_revenue_gamma(const U256& fee_growth_a_x128,
                           const U256& fee_growth_b_x128,
                           const U256& seconds_per_liquidity_x128,
                           uint32_t lookback_seconds,
                           uint32_t gamma);

// Token0 amount converted into token1 at sqrt_price_x96
U256 amount0_to_amount1(const U256& amount0, const U256& sqrt_price_x96);

// Combined token1-denominated revenue of both tokens
U256 compute_volume_gamma(const PoolMetadata& metadata,
                          const PoolSnapshot& snapshot,
                          const FeeGrowthSnapshot& a,
                          const FeeGrowthSnapshot& b);

// Value of the liquidity between floor(tick) and floor(tick) + spacing at the
// current price, in token1, shifted left by 64
U256 compute_tick_tvl_x64(int32_t tick_spacing, int32_t tick,
                          const U256& sqrt_price_x96, U128 liquidity);

// e^x for x in X18, 10-term Taylor series
U256 exp_taylor(const U256& x_x18);

// value * e^-(time_to_expiry / total_duration); identity when time_to_expiry == 0
U256 theta_adjust(const U256& value, uint64_t time_to_expiry, uint64_t total_duration);

// value * (1 - rate), rate in X18 and at most 1.0
U256 rho_adjust(const U256& value, const U256& risk_free_rate_x18);

// Implied volatility: theta- and rho-adjusted volume / sqrt(TVL). Fails with
// ZERO_DURATION, EXPIRY_EXCEEDS_HORIZON, INVALID_FEE, ZERO_LIQUIDITY,
// INVALID_RATE, ZERO_TVL or RESULT_OVERFLOW.
U256 estimate(const PoolMetadata& metadata,
              const PoolSnapshot& snapshot,
              const FeeGrowthSnapshot& a,
              const FeeGrowthSnapshot& b,
              uint64_t time_to_expiry,
              const U256& risk_free_rate_x18,
              uint64_t total_duration);

// Daily-normalised estimate over the fee growth interval b - a, no theta/rho:
//   2e18 * sqrt((1 day << 64) / (b.t - a.t)) * sqrt(volume) / sqrt(tvl)
U256 estimate_24h(const PoolMetadata& metadata,
                  const PoolSnapshot& snapshot,
                  const FeeGrowthSnapshot& a,
                  const FeeGrowthSnapshot& b);

} // namespace volatility

} // namespace vox

#endif // VOX_VOLATILITY_HPP
