#ifndef VOX_STRIKE_HPP
#define VOX_STRIKE_HPP

#include <cstdint>

#include "uint256.hpp"

namespace vox {

// =============================================================================
// Strike Configuration
//
// Multipliers are scaled by 10 (12 = 1.2x). min must stay in [12, max) and max
// in (min, 32]; threshold is a liquidity amount and must be non-zero.
// =============================================================================

struct StrikeConfig {
    uint32_t min_multiplier = 12;
    uint32_t max_multiplier = 32;
    U128 threshold = 0;
};

namespace strike_bounds {
constexpr uint32_t MULTIPLIER_SCALE = 10;
constexpr uint32_t MIN_MULTIPLIER_FLOOR = 12;
constexpr uint32_t MAX_MULTIPLIER_CEILING = 32;
}

// =============================================================================
// StrikePricer - piecewise-linear strike and symmetric expiry price
// =============================================================================

class StrikePricer {
public:
    // Throws VoxError when config violates the bounds above
    explicit StrikePricer(const StrikeConfig& config);

    const StrikeConfig& config() const { return config_; }

    // Flat floor spot * min / 10 when liquidity >= threshold; otherwise the
    // line from (threshold, spot * min / 10) to (0, spot * max / 10).
    U256 strike_price(const U256& spot, U128 liquidity) const;

    // spot^2 / strike. Throws DIVISION_BY_ZERO for a zero strike.
    static U256 expiry_price(const U256& spot, const U256& strike);

    // token1 owed for `amount` token0 at price (strike / 2^96)^2, rounded up
    static U256 quote_at_strike(const U256& amount, const U256& strike_sqrt_x96);

    // Validated setters; on failure the configuration is unchanged
    int32_t set_min_multiplier(uint32_t value);
    int32_t set_max_multiplier(uint32_t value);
    int32_t set_threshold(U128 value);

    static int32_t validate(const StrikeConfig& config);

private:
    StrikeConfig config_;
};

} // namespace vox

#endif // VOX_STRIKE_HPP
