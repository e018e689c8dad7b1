#ifndef VOX_HOOK_HPP
#define VOX_HOOK_HPP

#include <functional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "uint256.hpp"
#include "hooks.hpp"
#include "config.hpp"
#include "strike.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "treasury.hpp"

namespace vox {

// =============================================================================
// Mint Event
// =============================================================================

struct MintEvent {
    Address recipient;
    uint64_t token_id;
    U128 amount;
    U256 strike_price;
    U256 expiry_price;
    U256 volatility;   // Issue-time estimate, daily volume / sqrt(TVL)
};

using MintCallback = std::function<void(const MintEvent&)>;

// =============================================================================
// Strike Quote (current pool state priced through the strike curve)
// =============================================================================

struct StrikeQuote {
    U256 spot_sqrt_price_x96;
    U128 liquidity;
    U256 strike_price;
    U256 expiry_price;
};

// =============================================================================
// VXHook - Option issuance hook for a single pool
//
// Every mutating entry point returns an errors:: code and leaves state as it
// was when it fails. View functions throw VoxError.
// =============================================================================

class VXHook : public IHooks {
public:
    // Throws VoxError when the configuration is invalid
    VXHook(const PoolKey& key, const IPoolOracle& oracle, VXTreasury& treasury,
           const HookConfig& config);
    ~VXHook() override = default;

    // Non-copyable
    VXHook(const VXHook&) = delete;
    VXHook& operator=(const VXHook&) = delete;

    // =========================================================================
    // Mint Trigger
    // =========================================================================

    // Issues options for |delta.amount0| to `sender`. Swaps on other pools
    // are ignored.
    int32_t after_swap(const Address& sender, const PoolKey& key,
                       const SwapParams& params, const BalanceDelta& delta) override;

    // Scale `amount` by factor and mint at the current strike/expiry.
    // A scaled amount of zero mints nothing.
    int32_t on_trade(const Address& recipient, U128 amount);

    void set_mint_callback(MintCallback callback);

    // =========================================================================
    // Administration (admin only)
    // =========================================================================

    int32_t set_factor(const Address& caller, const U256& factor);
    int32_t set_threshold(const Address& caller, U128 threshold);
    int32_t set_min_multiplier(const Address& caller, uint32_t value);
    int32_t set_max_multiplier(const Address& caller, uint32_t value);
    int32_t set_risk_free_rate(const Address& caller, const U256& rate_x18);

    // =========================================================================
    // Keeper
    // =========================================================================

    // Void every listed expiry bucket. Fails with EXPIRY_NOT_REACHED, voiding
    // nothing, if spot is above any listed expiry price.
    int32_t void_by_expiry_prices(const std::vector<U256>& expiry_prices);

    // Void every listed id. Unknown ids fail with INVALID_OPTION; void ids
    // are skipped.
    int32_t void_by_token_ids(const std::vector<uint64_t>& token_ids);

    // =========================================================================
    // Exercise / Rescue
    // =========================================================================

    // Burn `amount` of token_id, collect its strike settlement in currency1
    // from `caller` and release `amount` currency0 from the hook's reserves.
    int32_t exercise(const Address& caller, uint64_t token_id, U128 amount);

    int32_t rescue(const Address& caller, const Currency& currency,
                   const Address& to, U128 amount);

    // =========================================================================
    // Views
    // =========================================================================

    StrikeQuote current_quote() const;
    U256 implied_volatility(uint64_t time_to_expiry) const;
    U256 implied_volatility_24h() const;

    const VXLedger& ledger() const { return ledger_; }
    const PoolKey& pool_key() const { return key_; }
    HookConfig config() const;

private:
    PoolKey key_;
    const IPoolOracle& oracle_;
    VXTreasury& treasury_;

    HookConfig config_;
    StrikePricer pricer_;
    VXLedger ledger_;
    MintCallback mint_callback_;

    mutable std::shared_mutex mutex_;

    bool is_admin(const Address& caller) const { return caller == config_.admin; }

    // Current state plus fee growth across the metadata lookback
    struct Window {
        PoolSnapshot snapshot;
        FeeGrowthSnapshot past;
        FeeGrowthSnapshot now;
    };

    PoolSnapshot spot_snapshot() const;
    Window window_locked() const;  // Throws OBSERVATION_UNAVAILABLE
};

} // namespace vox

#endif // VOX_HOOK_HPP
