// =============================================================================
// hook.cpp - VXHook option issuance, keeper, exercise and admin surfaces
// =============================================================================

#include "vox/hook.hpp"
#include "vox/volatility.hpp"
#include <mutex>

namespace vox {

namespace {

void validate_config(const HookConfig& config) {
    if (config.factor.is_zero()) {
        throw VoxError(errors::INVALID_FACTOR, "factor is zero");
    }
    if (config.risk_free_rate > X18_ONE) {
        throw VoxError(errors::INVALID_RATE, "risk-free rate above 1.0");
    }
    if (config.total_duration == 0) {
        throw VoxError(errors::ZERO_DURATION);
    }
    if (config.time_to_expiry >= config.total_duration) {
        throw VoxError(errors::EXPIRY_EXCEEDS_HORIZON);
    }
}

// |x| without overflow at the I128 minimum
U128 magnitude(I128 x) {
    return x < 0 ? U128(0) - static_cast<U128>(x) : static_cast<U128>(x);
}

}  // namespace

// =============================================================================
// Constructor
// =============================================================================

VXHook::VXHook(const PoolKey& key, const IPoolOracle& oracle, VXTreasury& treasury,
               const HookConfig& config)
    : key_(key)
    , oracle_(oracle)
    , treasury_(treasury)
    , config_(config)
    , pricer_(config.strike) {
    validate_config(config_);
}

// =============================================================================
// Mint Trigger
// =============================================================================

int32_t VXHook::after_swap(const Address& sender, const PoolKey& key,
                           const SwapParams& params, const BalanceDelta& delta) {
    if (key != key_) {
        return errors::OK;
    }
    return on_trade(sender, magnitude(delta.amount0));
}

int32_t VXHook::on_trade(const Address& recipient, U128 amount) {
    std::unique_lock lock(mutex_);

    MintEvent event{};
    try {
        U256 scaled = full_math::mul_div(U256(amount), config_.factor, X18_ONE);
        if (scaled.is_zero()) {
            return errors::OK;
        }
        U128 issue = scaled.to_u128();

        Window w = window_locked();
        const PoolSnapshot& snapshot = w.snapshot;

        U256 strike = pricer_.strike_price(snapshot.sqrt_price_x96, snapshot.tick_liquidity);
        U256 expiry = StrikePricer::expiry_price(snapshot.sqrt_price_x96, strike);
        U256 vol = volatility::estimate(config_.metadata, snapshot, w.past, w.now,
                                        config_.time_to_expiry, config_.risk_free_rate,
                                        config_.total_duration);

        uint64_t token_id = ledger_.mint(recipient, issue, strike, expiry);
        event = MintEvent{recipient, token_id, issue, strike, expiry, vol};
    } catch (const VoxError& e) {
        return e.code();
    }

    // Notify outside the lock so the callback may query the hook
    MintCallback callback = mint_callback_;
    lock.unlock();
    if (callback) {
        callback(event);
    }
    return errors::OK;
}

void VXHook::set_mint_callback(MintCallback callback) {
    std::unique_lock lock(mutex_);
    mint_callback_ = std::move(callback);
}

// =============================================================================
// Administration
// =============================================================================

int32_t VXHook::set_factor(const Address& caller, const U256& factor) {
    std::unique_lock lock(mutex_);
    if (!is_admin(caller)) return errors::UNAUTHORIZED;
    if (factor.is_zero()) return errors::INVALID_FACTOR;

    config_.factor = factor;
    return errors::OK;
}

int32_t VXHook::set_threshold(const Address& caller, U128 threshold) {
    std::unique_lock lock(mutex_);
    if (!is_admin(caller)) return errors::UNAUTHORIZED;

    int32_t rc = pricer_.set_threshold(threshold);
    if (rc == errors::OK) config_.strike = pricer_.config();
    return rc;
}

int32_t VXHook::set_min_multiplier(const Address& caller, uint32_t value) {
    std::unique_lock lock(mutex_);
    if (!is_admin(caller)) return errors::UNAUTHORIZED;

    int32_t rc = pricer_.set_min_multiplier(value);
    if (rc == errors::OK) config_.strike = pricer_.config();
    return rc;
}

int32_t VXHook::set_max_multiplier(const Address& caller, uint32_t value) {
    std::unique_lock lock(mutex_);
    if (!is_admin(caller)) return errors::UNAUTHORIZED;

    int32_t rc = pricer_.set_max_multiplier(value);
    if (rc == errors::OK) config_.strike = pricer_.config();
    return rc;
}

int32_t VXHook::set_risk_free_rate(const Address& caller, const U256& rate_x18) {
    std::unique_lock lock(mutex_);
    if (!is_admin(caller)) return errors::UNAUTHORIZED;
    if (rate_x18 > X18_ONE) return errors::INVALID_RATE;

    config_.risk_free_rate = rate_x18;
    return errors::OK;
}

// =============================================================================
// Keeper
// =============================================================================

int32_t VXHook::void_by_expiry_prices(const std::vector<U256>& expiry_prices) {
    std::unique_lock lock(mutex_);

    U256 spot;
    try {
        spot = spot_snapshot().sqrt_price_x96;
    } catch (const VoxError& e) {
        return e.code();
    }

    // Check the whole batch before touching the ledger
    for (const auto& expiry : expiry_prices) {
        if (spot > expiry) return errors::EXPIRY_NOT_REACHED;
    }

    for (const auto& expiry : expiry_prices) {
        ledger_.void_by_expiry_price(expiry);
    }
    return errors::OK;
}

int32_t VXHook::void_by_token_ids(const std::vector<uint64_t>& token_ids) {
    std::unique_lock lock(mutex_);

    U256 spot;
    try {
        spot = spot_snapshot().sqrt_price_x96;
    } catch (const VoxError& e) {
        return e.code();
    }

    for (uint64_t id : token_ids) {
        auto token = ledger_.token(id);
        if (!token) return errors::INVALID_OPTION;
        if (token->is_void) continue;
        if (spot > token->expiry_price) return errors::EXPIRY_NOT_REACHED;
    }

    for (uint64_t id : token_ids) {
        ledger_.void_by_token_id(id);
    }
    return errors::OK;
}

// =============================================================================
// Exercise / Rescue
// =============================================================================

int32_t VXHook::exercise(const Address& caller, uint64_t token_id, U128 amount) {
    std::unique_lock lock(mutex_);

    auto token = ledger_.token(token_id);
    if (!token || !ledger_.is_valid(token_id)) return errors::INVALID_OPTION;
    if (amount == 0) return errors::INVALID_AMOUNT;
    if (ledger_.balance_of(caller, token_id) < amount) return errors::INSUFFICIENT_BALANCE;

    U128 owed;
    try {
        owed = StrikePricer::quote_at_strike(U256(amount), token->strike_price).to_u128();
    } catch (const VoxError& e) {
        return e.code();
    }

    const Address& hook = config_.hook_address;
    if (treasury_.balance(caller, key_.currency1) < owed) return errors::INSUFFICIENT_FUNDS;
    if (treasury_.balance(hook, key_.currency0) < amount) return errors::INSUFFICIENT_RESERVES;

    int32_t rc = treasury_.settle(caller, hook, key_.currency1, owed, key_.currency0, amount);
    if (rc != errors::OK) return rc;

    // Balance was checked under the same lock
    ledger_.burn(caller, token_id, amount);
    return errors::OK;
}

int32_t VXHook::rescue(const Address& caller, const Currency& currency,
                       const Address& to, U128 amount) {
    std::unique_lock lock(mutex_);
    if (!is_admin(caller)) return errors::UNAUTHORIZED;
    return treasury_.transfer(config_.hook_address, to, currency, amount);
}

// =============================================================================
// Views
// =============================================================================

PoolSnapshot VXHook::spot_snapshot() const {
    auto snapshot = oracle_.snapshot(key_, 0);
    if (!snapshot) {
        throw VoxError(errors::OBSERVATION_UNAVAILABLE, "no observation for pool");
    }
    return *snapshot;
}

StrikeQuote VXHook::current_quote() const {
    std::shared_lock lock(mutex_);

    PoolSnapshot snapshot = spot_snapshot();
    U256 strike = pricer_.strike_price(snapshot.sqrt_price_x96, snapshot.tick_liquidity);
    U256 expiry = StrikePricer::expiry_price(snapshot.sqrt_price_x96, strike);
    return StrikeQuote{snapshot.sqrt_price_x96, snapshot.tick_liquidity, strike, expiry};
}

VXHook::Window VXHook::window_locked() const {
    uint32_t lookback = config_.metadata.max_seconds_ago;
    auto snapshot = oracle_.snapshot(key_, lookback);
    auto past = oracle_.fee_growth(key_, lookback);
    auto now = oracle_.fee_growth(key_, 0);
    if (!snapshot || !past || !now) {
        throw VoxError(errors::OBSERVATION_UNAVAILABLE, "insufficient observation history");
    }
    return Window{*snapshot, *past, *now};
}

U256 VXHook::implied_volatility(uint64_t time_to_expiry) const {
    std::shared_lock lock(mutex_);
    Window w = window_locked();
    return volatility::estimate(config_.metadata, w.snapshot, w.past, w.now, time_to_expiry,
                                config_.risk_free_rate, config_.total_duration);
}

U256 VXHook::implied_volatility_24h() const {
    std::shared_lock lock(mutex_);
    Window w = window_locked();
    return volatility::estimate_24h(config_.metadata, w.snapshot, w.past, w.now);
}

HookConfig VXHook::config() const {
    std::shared_lock lock(mutex_);
    return config_;
}

} // namespace vox
