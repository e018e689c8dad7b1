#ifndef VOX_CONFIG_HPP
#define VOX_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "uint256.hpp"
#include "strike.hpp"
#include "volatility.hpp"
#include "oracle.hpp"

namespace vox {

// =============================================================================
// HookConfig - Deployment parameters for one option hook
//
// JSON layout:
//   {
//     "admin": "0x..", "hook_address": "0x..",
//     "strike": {"min_multiplier": 12, "max_multiplier": 32, "threshold": "1000"},
//     "factor": "1000000000000000000",
//     "total_duration": 86400, "time_to_expiry": 0,
//     "risk_free_rate": "0",
//     "pool": {"max_seconds_ago": 3600, "base_fee": 3000, "tick_spacing": 60}
//   }
// Big integers are decimal or 0x-hex strings; every field is optional.
// =============================================================================

struct HookConfig {
    Address admin{};
    Address hook_address{};
    StrikeConfig strike{12, 32, X18_ONE_U64};
    U256 factor = X18_ONE;                          // Trade amount scale, X18
    uint64_t total_duration = volatility::ONE_DAY;  // Option horizon, seconds
    uint64_t time_to_expiry = 0;                    // Used for issue-time estimates
    U256 risk_free_rate{};                          // X18, at most 1.0
    PoolMetadata metadata{3600, fees::FEE_030, 60};

    // Throws std::runtime_error on unreadable or malformed input and
    // VoxError when the strike bounds are violated
    static HookConfig from_file(std::string_view path);
    static HookConfig from_json(std::string_view content);

    std::string to_json() const;
};

// =============================================================================
// Observation Files
//
// A JSON array of objects with the Observation field names; big integers as
// strings. Throws std::runtime_error naming the offending element and field.
// =============================================================================

std::vector<Observation> observations_from_json(std::string_view content);
std::vector<Observation> load_observations(std::string_view path);

} // namespace vox

#endif // VOX_CONFIG_HPP
