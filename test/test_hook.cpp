// VOX - Option Hook Tests

#include <catch2/catch.hpp>
#include <vox/hook.hpp>

#include <functional>

using namespace vox;

namespace {

constexpr U128 ETHER = X18_ONE_U64;
const U256 E24 = U256::from_string("1000000000000000000000000");

Address addr(uint8_t tag) {
    Address a{};
    a[19] = tag;
    return a;
}

const Address ADMIN = addr(0xAD);
const Address HOOK = addr(0xF0);
const Address TRADER = addr(0x7A);
const Address KEEPER = addr(0x6B);

PoolKey test_pool() {
    PoolKey key{};
    key.currency0.addr[19] = 0x01;
    key.currency1.addr[19] = 0x02;
    key.fee = fees::FEE_030;
    key.tick_spacing = 60;
    key.hooks = HOOK;
    return key;
}

Observation obs(uint64_t timestamp, const U256& sqrt_price, uint64_t spl, const U256& fee1) {
    Observation o{};
    o.timestamp = timestamp;
    o.sqrt_price_x96 = sqrt_price;
    o.tick = 0;
    o.liquidity = ETHER;
    o.seconds_per_liquidity_cumulative_x128 = U256(spl);
    o.fee_growth_global1_x128 = fee1;
    return o;
}

HookConfig test_config() {
    HookConfig config;
    config.admin = ADMIN;
    config.hook_address = HOOK;
    config.strike = StrikeConfig{12, 32, 100 * ETHER};
    config.metadata = PoolMetadata{3600, fees::FEE_030, 60};
    return config;
}

int32_t code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const VoxError& e) {
        return e.code();
    }
    return errors::OK;
}

// One hour of history: 1e24 token1 fee growth at price 1.0
struct Fixture {
    PoolKey key = test_pool();
    VXOracle oracle;
    VXTreasury treasury;
    VXHook hook{key, oracle, treasury, test_config()};

    Fixture() {
        oracle.record(key, obs(1000, Q96, 0, U256()));
        oracle.record(key, obs(4600, Q96, 3600, E24));
    }

    // Sell token0 so the pool owes `amount` of it
    int32_t swap(const Address& sender, I128 amount0) {
        SwapParams params{true, amount0, 0};
        return hook.after_swap(sender, key, params, BalanceDelta{amount0, 0});
    }

    void drop_price() {
        oracle.record(key, obs(4700, Q96 / U256(4), 3700, E24));
    }
};

} // namespace

TEST_CASE("VXHook construction", "[hook]") {
    PoolKey key = test_pool();
    VXOracle oracle;
    VXTreasury treasury;

    auto build = [&](const HookConfig& config) {
        VXHook hook(key, oracle, treasury, config);
    };

    REQUIRE(code_of([&] { build(test_config()); }) == errors::OK);

    HookConfig config = test_config();
    config.factor = U256();
    REQUIRE(code_of([&] { build(config); }) == errors::INVALID_FACTOR);

    config = test_config();
    config.risk_free_rate = X18_ONE + U256(1);
    REQUIRE(code_of([&] { build(config); }) == errors::INVALID_RATE);

    config = test_config();
    config.total_duration = 0;
    REQUIRE(code_of([&] { build(config); }) == errors::ZERO_DURATION);

    config = test_config();
    config.time_to_expiry = config.total_duration;
    REQUIRE(code_of([&] { build(config); }) == errors::EXPIRY_EXCEEDS_HORIZON);

    config = test_config();
    config.strike.min_multiplier = 5;
    REQUIRE(code_of([&] { build(config); }) == errors::INVALID_MULTIPLIER);
}

TEST_CASE("VXHook mints on swaps", "[hook]") {
    Fixture f;
    std::vector<MintEvent> events;
    f.hook.set_mint_callback([&](const MintEvent& e) { events.push_back(e); });

    SECTION("Issues |amount0| at the current quote") {
        StrikeQuote quote = f.hook.current_quote();
        REQUIRE(quote.spot_sqrt_price_x96 == Q96);
        REQUIRE(quote.liquidity == ETHER);
        REQUIRE(quote.strike_price > Q96);
        REQUIRE(quote.expiry_price < Q96);

        REQUIRE(f.swap(TRADER, -static_cast<I128>(ETHER / 2)) == errors::OK);
        REQUIRE(events.size() == 1);

        const MintEvent& e = events[0];
        REQUIRE(e.recipient == TRADER);
        REQUIRE(e.amount == ETHER / 2);
        REQUIRE(e.strike_price == quote.strike_price);
        REQUIRE(e.expiry_price == quote.expiry_price);
        REQUIRE(e.volatility.to_string() == "54814708379539");
        REQUIRE(f.hook.ledger().balance_of(TRADER, e.token_id) == ETHER / 2);
    }

    SECTION("Repeat swaps at the same quote share a token id") {
        REQUIRE(f.swap(TRADER, 100) == errors::OK);
        REQUIRE(f.swap(KEEPER, -300) == errors::OK);
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].token_id == events[1].token_id);
        REQUIRE(f.hook.ledger().total_supply(events[0].token_id) == 400);
    }

    SECTION("Swaps on other pools are ignored") {
        PoolKey other = f.key;
        other.fee = fees::FEE_005;
        BalanceDelta delta{-1000, 0};
        REQUIRE(f.hook.after_swap(TRADER, other, SwapParams{true, -1000, 0}, delta) ==
                errors::OK);
        REQUIRE(events.empty());
        REQUIRE(f.hook.ledger().next_token_id() == 1);
    }

    SECTION("Factor scales the issued amount") {
        REQUIRE(f.hook.set_factor(ADMIN, X18_ONE / U256(4)) == errors::OK);
        REQUIRE(f.swap(TRADER, 1000) == errors::OK);
        REQUIRE(events.at(0).amount == 250);

        // Scales to zero
        REQUIRE(f.swap(TRADER, 3) == errors::OK);
        REQUIRE(events.size() == 1);
    }

    SECTION("Zero delta mints nothing") {
        REQUIRE(f.swap(TRADER, 0) == errors::OK);
        REQUIRE(events.empty());
    }
}

TEST_CASE("VXHook needs observation history", "[hook]") {
    PoolKey key = test_pool();
    VXOracle oracle;
    VXTreasury treasury;
    VXHook hook(key, oracle, treasury, test_config());

    REQUIRE(hook.on_trade(TRADER, ETHER) == errors::OBSERVATION_UNAVAILABLE);
    REQUIRE(hook.void_by_expiry_prices({Q96}) == errors::OBSERVATION_UNAVAILABLE);
    REQUIRE(code_of([&] { hook.current_quote(); }) == errors::OBSERVATION_UNAVAILABLE);
    REQUIRE(code_of([&] { hook.implied_volatility_24h(); }) == errors::OBSERVATION_UNAVAILABLE);

    // A single observation covers spot but not the lookback window
    oracle.record(key, obs(4600, Q96, 3600, E24));
    REQUIRE(code_of([&] { hook.current_quote(); }) == errors::OK);
    REQUIRE(hook.on_trade(TRADER, ETHER) == errors::OBSERVATION_UNAVAILABLE);
    REQUIRE(hook.ledger().next_token_id() == 1);
}

TEST_CASE("VXHook volatility views", "[hook]") {
    Fixture f;
    REQUIRE(f.hook.implied_volatility(0).to_string() == "54814708379539");
    REQUIRE(f.hook.implied_volatility(43200).to_string() == "33246801241081");
    REQUIRE(f.hook.implied_volatility_24h().to_string() == "9805553116066363568357");
    REQUIRE(code_of([&] { f.hook.implied_volatility(86400); }) ==
            errors::EXPIRY_EXCEEDS_HORIZON);

    REQUIRE(f.hook.set_risk_free_rate(ADMIN, X18_ONE / U256(2)) == errors::OK);
    REQUIRE(f.hook.implied_volatility(0).to_string() == "27407354189769");
}

TEST_CASE("VXHook administration", "[hook]") {
    Fixture f;

    SECTION("Only the admin may configure") {
        REQUIRE(f.hook.set_factor(TRADER, X18_ONE) == errors::UNAUTHORIZED);
        REQUIRE(f.hook.set_threshold(TRADER, ETHER) == errors::UNAUTHORIZED);
        REQUIRE(f.hook.set_min_multiplier(TRADER, 15) == errors::UNAUTHORIZED);
        REQUIRE(f.hook.set_max_multiplier(TRADER, 30) == errors::UNAUTHORIZED);
        REQUIRE(f.hook.set_risk_free_rate(TRADER, U256()) == errors::UNAUTHORIZED);
        REQUIRE(f.hook.rescue(TRADER, f.key.currency0, TRADER, 1) == errors::UNAUTHORIZED);
    }

    SECTION("Bounds are enforced") {
        REQUIRE(f.hook.set_factor(ADMIN, U256()) == errors::INVALID_FACTOR);
        REQUIRE(f.hook.set_threshold(ADMIN, 0) == errors::INVALID_THRESHOLD);
        REQUIRE(f.hook.set_min_multiplier(ADMIN, 32) == errors::INVALID_MULTIPLIER);
        REQUIRE(f.hook.set_max_multiplier(ADMIN, 33) == errors::INVALID_MULTIPLIER);
        REQUIRE(f.hook.set_risk_free_rate(ADMIN, X18_ONE + U256(1)) == errors::INVALID_RATE);

        HookConfig config = f.hook.config();
        REQUIRE(config.factor == X18_ONE);
        REQUIRE(config.strike.threshold == 100 * ETHER);
        REQUIRE(config.strike.min_multiplier == 12);
        REQUIRE(config.strike.max_multiplier == 32);
        REQUIRE(config.risk_free_rate.is_zero());
    }

    SECTION("Updates take effect") {
        REQUIRE(f.hook.set_threshold(ADMIN, ETHER / 2) == errors::OK);
        REQUIRE(f.hook.set_min_multiplier(ADMIN, 15) == errors::OK);
        REQUIRE(f.hook.set_max_multiplier(ADMIN, 20) == errors::OK);

        HookConfig config = f.hook.config();
        REQUIRE(config.strike.threshold == ETHER / 2);
        REQUIRE(config.strike.min_multiplier == 15);
        REQUIRE(config.strike.max_multiplier == 20);

        // Liquidity above the threshold quotes the floor
        REQUIRE(f.hook.current_quote().strike_price ==
                full_math::mul_div(Q96, U256(15), U256(10)));
    }

    SECTION("Rescue moves hook funds") {
        REQUIRE(f.treasury.deposit(HOOK, f.key.currency0, 100) == errors::OK);
        REQUIRE(f.hook.rescue(ADMIN, f.key.currency0, ADMIN, 40) == errors::OK);
        REQUIRE(f.treasury.balance(HOOK, f.key.currency0) == 60);
        REQUIRE(f.treasury.balance(ADMIN, f.key.currency0) == 40);
        REQUIRE(f.hook.rescue(ADMIN, f.key.currency0, ADMIN, 61) ==
                errors::INSUFFICIENT_BALANCE);
    }
}

TEST_CASE("VXHook keeper voiding", "[hook]") {
    Fixture f;
    std::vector<MintEvent> events;
    f.hook.set_mint_callback([&](const MintEvent& e) { events.push_back(e); });
    REQUIRE(f.swap(TRADER, 1000) == errors::OK);
    const uint64_t id = events.at(0).token_id;
    const U256 expiry = events.at(0).expiry_price;

    SECTION("Spot above expiry voids nothing") {
        REQUIRE(f.hook.void_by_expiry_prices({expiry}) == errors::EXPIRY_NOT_REACHED);
        REQUIRE(f.hook.void_by_token_ids({id}) == errors::EXPIRY_NOT_REACHED);
        REQUIRE(f.hook.ledger().is_valid(id));
    }

    SECTION("Void by expiry once spot falls") {
        f.drop_price();
        REQUIRE(f.hook.void_by_expiry_prices({expiry}) == errors::OK);
        REQUIRE_FALSE(f.hook.ledger().is_valid(id));

        // Idempotent
        REQUIRE(f.hook.void_by_expiry_prices({expiry}) == errors::OK);
        REQUIRE(f.hook.void_by_token_ids({id}) == errors::OK);
    }

    SECTION("Void by id once spot falls") {
        f.drop_price();
        REQUIRE(f.hook.void_by_token_ids({id, 999}) == errors::INVALID_OPTION);
        REQUIRE(f.hook.ledger().is_valid(id));

        REQUIRE(f.hook.void_by_token_ids({id}) == errors::OK);
        REQUIRE_FALSE(f.hook.ledger().is_valid(id));
    }

    SECTION("Mixed batch fails as a whole") {
        f.drop_price();
        REQUIRE(f.hook.void_by_expiry_prices({expiry, U256(1)}) == errors::EXPIRY_NOT_REACHED);
        REQUIRE(f.hook.ledger().is_valid(id));
    }
}

TEST_CASE("VXHook exercise", "[hook]") {
    Fixture f;
    std::vector<MintEvent> events;
    f.hook.set_mint_callback([&](const MintEvent& e) { events.push_back(e); });
    REQUIRE(f.swap(TRADER, static_cast<I128>(ETHER)) == errors::OK);
    const uint64_t id = events.at(0).token_id;
    const U128 amount = ETHER / 4;
    const U128 owed =
        StrikePricer::quote_at_strike(U256(amount), events.at(0).strike_price).to_u128();
    REQUIRE(owed > amount);

    const Currency& token0 = f.key.currency0;
    const Currency& token1 = f.key.currency1;

    SECTION("Checks run in order") {
        REQUIRE(f.hook.exercise(TRADER, 999, amount) == errors::INVALID_OPTION);
        REQUIRE(f.hook.exercise(TRADER, id, 0) == errors::INVALID_AMOUNT);
        REQUIRE(f.hook.exercise(KEEPER, id, amount) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.hook.exercise(TRADER, id, amount) == errors::INSUFFICIENT_FUNDS);

        REQUIRE(f.treasury.deposit(TRADER, token1, owed) == errors::OK);
        REQUIRE(f.hook.exercise(TRADER, id, amount) == errors::INSUFFICIENT_RESERVES);

        REQUIRE(f.treasury.balance(TRADER, token1) == owed);
        REQUIRE(f.hook.ledger().balance_of(TRADER, id) == ETHER);
    }

    SECTION("Settles both legs and burns") {
        REQUIRE(f.treasury.deposit(TRADER, token1, owed + 7) == errors::OK);
        REQUIRE(f.treasury.deposit(HOOK, token0, ETHER) == errors::OK);

        REQUIRE(f.hook.exercise(TRADER, id, amount) == errors::OK);
        REQUIRE(f.treasury.balance(TRADER, token1) == 7);
        REQUIRE(f.treasury.balance(HOOK, token1) == owed);
        REQUIRE(f.treasury.balance(TRADER, token0) == amount);
        REQUIRE(f.treasury.balance(HOOK, token0) == ETHER - amount);
        REQUIRE(f.hook.ledger().balance_of(TRADER, id) == ETHER - amount);
        REQUIRE(f.hook.ledger().total_supply(id) == ETHER - amount);
    }

    SECTION("Void options cannot be exercised") {
        REQUIRE(f.treasury.deposit(TRADER, token1, owed) == errors::OK);
        REQUIRE(f.treasury.deposit(HOOK, token0, ETHER) == errors::OK);
        f.drop_price();
        REQUIRE(f.hook.void_by_token_ids({id}) == errors::OK);
        REQUIRE(f.hook.exercise(TRADER, id, amount) == errors::INVALID_OPTION);
        REQUIRE(f.treasury.balance(TRADER, token1) == owed);
    }
}

TEST_CASE("VXHook exercise below unit price", "[hook]") {
    PoolKey key = test_pool();
    VXOracle oracle;
    VXTreasury treasury;
    HookConfig config = test_config();
    config.strike.threshold = ETHER / 2;
    VXHook hook(key, oracle, treasury, config);

    // sqrt price 0.25 sits in tick -27728; the floor strike is 0.3, price 0.09
    Observation first = obs(1000, Q96 / U256(4), 0, U256());
    Observation second = obs(4600, Q96 / U256(4), 3600, E24);
    first.tick = -27728;
    second.tick = -27728;
    REQUIRE(oracle.record(key, first) == errors::OK);
    REQUIRE(oracle.record(key, second) == errors::OK);

    std::vector<MintEvent> events;
    hook.set_mint_callback([&](const MintEvent& e) { events.push_back(e); });
    REQUIRE(hook.on_trade(TRADER, 100) == errors::OK);
    const uint64_t id = events.at(0).token_id;
    REQUIRE(events.at(0).strike_price < Q96);

    REQUIRE(treasury.deposit(HOOK, key.currency0, 100) == errors::OK);

    // 11 * 0.09 rounds up to one unit of token1
    REQUIRE(hook.exercise(TRADER, id, 11) == errors::INSUFFICIENT_FUNDS);
    REQUIRE(treasury.deposit(TRADER, key.currency1, 1) == errors::OK);
    REQUIRE(hook.exercise(TRADER, id, 11) == errors::OK);
    REQUIRE(treasury.balance(TRADER, key.currency1) == 0);
    REQUIRE(treasury.balance(HOOK, key.currency1) == 1);
    REQUIRE(treasury.balance(TRADER, key.currency0) == 11);

    // Nothing left to pay with
    REQUIRE(hook.exercise(TRADER, id, 1) == errors::INSUFFICIENT_FUNDS);
    REQUIRE(hook.ledger().balance_of(TRADER, id) == 89);
}
