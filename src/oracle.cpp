// =============================================================================
// oracle.cpp - VXOracle observation history
// =============================================================================

#include "vox/oracle.hpp"
#include <algorithm>
#include <mutex>

namespace vox {

VXOracle::VXOracle(size_t cardinality)
    : cardinality_(cardinality == 0 ? 1 : cardinality) {}

// =============================================================================
// Recording
// =============================================================================

int32_t VXOracle::record(const PoolKey& key, const Observation& observation) {
    if (observation.sqrt_price_x96.is_zero()) {
        return errors::INVALID_PRICE;
    }

    std::unique_lock lock(mutex_);

    auto& history = history_[key.id()];
    if (!history.empty() && observation.timestamp <= history.back().timestamp) {
        return errors::INVALID_TIMESTAMP;
    }

    history.push_back(observation);
    while (history.size() > cardinality_) {
        history.pop_front();
    }
    return errors::OK;
}

// =============================================================================
// Lookups
// =============================================================================

const Observation* VXOracle::find_at_locked(uint64_t pool_id, uint64_t timestamp) const {
    auto it = history_.find(pool_id);
    if (it == history_.end() || it->second.empty()) return nullptr;

    const auto& history = it->second;
    auto pos = std::upper_bound(history.begin(), history.end(), timestamp,
        [](uint64_t t, const Observation& o) { return t < o.timestamp; });
    if (pos == history.begin()) return nullptr;
    return &*std::prev(pos);
}

std::optional<Observation> VXOracle::latest(const PoolKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = history_.find(key.id());
    if (it == history_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

std::optional<Observation> VXOracle::observation_at(const PoolKey& key, uint64_t timestamp) const {
    std::shared_lock lock(mutex_);
    const Observation* obs = find_at_locked(key.id(), timestamp);
    if (!obs) return std::nullopt;
    return *obs;
}

size_t VXOracle::observation_count(const PoolKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = history_.find(key.id());
    return it != history_.end() ? it->second.size() : 0;
}

// =============================================================================
// IPoolOracle
// =============================================================================

std::optional<PoolSnapshot> VXOracle::snapshot(const PoolKey& key, uint32_t lookback) const {
    std::shared_lock lock(mutex_);

    auto it = history_.find(key.id());
    if (it == history_.end() || it->second.empty()) return std::nullopt;

    const Observation& now = it->second.back();
    if (lookback > now.timestamp) return std::nullopt;

    const Observation* past = find_at_locked(key.id(), now.timestamp - lookback);
    if (!past) return std::nullopt;

    PoolSnapshot snap;
    snap.sqrt_price_x96 = now.sqrt_price_x96;
    snap.tick = now.tick;
    snap.tick_liquidity = now.liquidity;
    // Cumulative may wrap; modular difference is the window's accrual
    snap.seconds_per_liquidity_x128 = now.seconds_per_liquidity_cumulative_x128 -
                                      past->seconds_per_liquidity_cumulative_x128;
    snap.oracle_lookback = static_cast<uint32_t>(now.timestamp - past->timestamp);
    return snap;
}

std::optional<FeeGrowthSnapshot> VXOracle::fee_growth(const PoolKey& key,
                                                      uint32_t seconds_ago) const {
    std::shared_lock lock(mutex_);

    auto it = history_.find(key.id());
    if (it == history_.end() || it->second.empty()) return std::nullopt;

    uint64_t now = it->second.back().timestamp;
    if (seconds_ago > now) return std::nullopt;

    const Observation* obs = find_at_locked(key.id(), now - seconds_ago);
    if (!obs) return std::nullopt;

    return FeeGrowthSnapshot{obs->fee_growth_global0_x128, obs->fee_growth_global1_x128,
                             obs->timestamp};
}

} // namespace vox
