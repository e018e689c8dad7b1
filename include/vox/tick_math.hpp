#ifndef VOX_TICK_MATH_HPP
#define VOX_TICK_MATH_HPP

#include <cstdint>

#include "uint256.hpp"

namespace vox {

// =============================================================================
// Tick Math Utilities
// =============================================================================

namespace tick_math {

// Minimum and maximum ticks
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// sqrt(1.0001^MIN_TICK) * 2^96 and sqrt(1.0001^MAX_TICK) * 2^96
inline constexpr U256 MIN_SQRT_RATIO = U256(4295128739ULL);
const U256 MAX_SQRT_RATIO = U256::from_string("1461446703485210103287273052203988822378723970342");

// sqrt(1.0001^tick) as Q64.96, rounded up. Throws INVALID_TICK outside
// [MIN_TICK, MAX_TICK].
U256 get_sqrt_ratio_at_tick(int32_t tick);

// Round tick toward negative infinity onto the spacing grid.
// Throws INVALID_TICK_SPACING when spacing <= 0.
int32_t floor_tick(int32_t tick, int32_t tick_spacing);

} // namespace tick_math

} // namespace vox

#endif // VOX_TICK_MATH_HPP
