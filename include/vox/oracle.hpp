#ifndef VOX_ORACLE_HPP
#define VOX_ORACLE_HPP

#include <deque>
#include <unordered_map>
#include <shared_mutex>
#include <optional>

#include "types.hpp"
#include "uint256.hpp"
#include "volatility.hpp"

namespace vox {

// =============================================================================
// Pool Observation (one per block/write)
// =============================================================================

struct Observation {
    uint64_t timestamp;
    U256 sqrt_price_x96;
    int32_t tick;
    U128 liquidity;
    U256 seconds_per_liquidity_cumulative_x128;
    U256 fee_growth_global0_x128;
    U256 fee_growth_global1_x128;
};

// =============================================================================
// Pool Oracle Interface
// =============================================================================

class IPoolOracle {
public:
    virtual ~IPoolOracle() = default;

    // Latest pool state with seconds-per-liquidity accrued over `lookback`
    // seconds. nullopt when the pool is unknown or history is too short.
    virtual std::optional<PoolSnapshot> snapshot(const PoolKey& key, uint32_t lookback) const = 0;

    // Fee growth accumulators `seconds_ago` before the latest observation
    virtual std::optional<FeeGrowthSnapshot> fee_growth(const PoolKey& key,
                                                        uint32_t seconds_ago) const = 0;
};

// =============================================================================
// VXOracle - Bounded observation history per pool
// =============================================================================

class VXOracle : public IPoolOracle {
public:
    static constexpr size_t DEFAULT_CARDINALITY = 720;

    explicit VXOracle(size_t cardinality = DEFAULT_CARDINALITY);
    ~VXOracle() override = default;

    // Non-copyable
    VXOracle(const VXOracle&) = delete;
    VXOracle& operator=(const VXOracle&) = delete;

    // Append an observation; timestamps must strictly increase per pool
    int32_t record(const PoolKey& key, const Observation& observation);

    std::optional<Observation> latest(const PoolKey& key) const;

    // Newest observation with timestamp <= `timestamp`
    std::optional<Observation> observation_at(const PoolKey& key, uint64_t timestamp) const;

    size_t observation_count(const PoolKey& key) const;

    // IPoolOracle
    std::optional<PoolSnapshot> snapshot(const PoolKey& key, uint32_t lookback) const override;
    std::optional<FeeGrowthSnapshot> fee_growth(const PoolKey& key,
                                                uint32_t seconds_ago) const override;

private:
    size_t cardinality_;

    // pool_id -> observations, oldest first
    std::unordered_map<uint64_t, std::deque<Observation>> history_;
    mutable std::shared_mutex mutex_;

    const Observation* find_at_locked(uint64_t pool_id, uint64_t timestamp) const;
};

} // namespace vox

#endif // VOX_ORACLE_HPP
