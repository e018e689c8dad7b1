#ifndef VOX_VOX_HPP
#define VOX_VOX_HPP

// =============================================================================
// VOX - Volume-Issued Options for concentrated-liquidity pools
//
// Components:
//   uint256 / tick_math  Wide fixed-point arithmetic and Q64.96 tick ratios
//   volatility           Implied volatility from fee growth and tick TVL
//   strike               Liquidity-ramped strike and symmetric expiry price
//   ledger               Option identity, balances and void lifecycle
//   oracle               Pool observation history
//   treasury             Custody for settlement and rescue
//   hook                 Swap hook tying the above together
//
// =============================================================================

#include "types.hpp"
#include "uint256.hpp"
#include "tick_math.hpp"
#include "volatility.hpp"
#include "strike.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "treasury.hpp"
#include "hooks.hpp"
#include "config.hpp"
#include "hook.hpp"

#endif // VOX_VOX_HPP
