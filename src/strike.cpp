// =============================================================================
// strike.cpp - Strike and expiry price derivation
// =============================================================================

#include "vox/strike.hpp"

namespace vox {

StrikePricer::StrikePricer(const StrikeConfig& config) : config_(config) {
    int32_t status = validate(config_);
    if (status != errors::OK) {
        throw VoxError(status, "invalid strike configuration");
    }
}

int32_t StrikePricer::validate(const StrikeConfig& config) {
    if (config.threshold == 0) {
        return errors::INVALID_THRESHOLD;
    }
    if (config.min_multiplier < strike_bounds::MIN_MULTIPLIER_FLOOR ||
        config.min_multiplier >= config.max_multiplier ||
        config.max_multiplier > strike_bounds::MAX_MULTIPLIER_CEILING) {
        return errors::INVALID_MULTIPLIER;
    }
    return errors::OK;
}

// =============================================================================
// Pricing
// =============================================================================

U256 StrikePricer::strike_price(const U256& spot, U128 liquidity) const {
    const U256 scale(strike_bounds::MULTIPLIER_SCALE);
    U256 floor_price = full_math::mul_div(spot, U256(config_.min_multiplier), scale);

    if (liquidity >= config_.threshold) {
        return floor_price;
    }

    // (max - min) * spot / (10 * threshold) * (threshold - liquidity)
    U256 spread = U256(config_.max_multiplier - config_.min_multiplier) *
                  U256(config_.threshold - liquidity);
    U256 ramp = full_math::mul_div(spot, spread, U256(config_.threshold) * scale);

    return full_math::checked_add(floor_price, ramp);
}

U256 StrikePricer::expiry_price(const U256& spot, const U256& strike) {
    return full_math::mul_div(spot, spot, strike);
}

U256 StrikePricer::quote_at_strike(const U256& amount, const U256& strike_sqrt_x96) {
    // Rounded up at both steps so the holder never underpays
    U256 price_x96 = full_math::mul_div_rounding_up(strike_sqrt_x96, strike_sqrt_x96, Q96);
    return full_math::mul_div_rounding_up(amount, price_x96, Q96);
}

// =============================================================================
// Configuration Updates
// =============================================================================

int32_t StrikePricer::set_min_multiplier(uint32_t value) {
    StrikeConfig next = config_;
    next.min_multiplier = value;
    int32_t status = validate(next);
    if (status == errors::OK) config_ = next;
    return status;
}

int32_t StrikePricer::set_max_multiplier(uint32_t value) {
    StrikeConfig next = config_;
    next.max_multiplier = value;
    int32_t status = validate(next);
    if (status == errors::OK) config_ = next;
    return status;
}

int32_t StrikePricer::set_threshold(U128 value) {
    StrikeConfig next = config_;
    next.threshold = value;
    int32_t status = validate(next);
    if (status == errors::OK) config_ = next;
    return status;
}

} // namespace vox
