// VOX - Strike Pricer Tests

#include <catch2/catch.hpp>
#include <vox/strike.hpp>

using namespace vox;

namespace {
constexpr U128 ETHER = X18_ONE_U64;
}

TEST_CASE("StrikePricer configuration", "[strike]") {
    SECTION("Valid bounds") {
        REQUIRE(StrikePricer::validate({12, 32, 1}) == errors::OK);
        REQUIRE(StrikePricer::validate({12, 13, 1}) == errors::OK);
        REQUIRE(StrikePricer::validate({31, 32, 1}) == errors::OK);
    }

    SECTION("Invalid bounds") {
        REQUIRE(StrikePricer::validate({12, 32, 0}) == errors::INVALID_THRESHOLD);
        REQUIRE(StrikePricer::validate({11, 32, 1}) == errors::INVALID_MULTIPLIER);
        REQUIRE(StrikePricer::validate({20, 20, 1}) == errors::INVALID_MULTIPLIER);
        REQUIRE(StrikePricer::validate({25, 20, 1}) == errors::INVALID_MULTIPLIER);
        REQUIRE(StrikePricer::validate({12, 33, 1}) == errors::INVALID_MULTIPLIER);
    }

    SECTION("Constructor rejects invalid config") {
        REQUIRE_THROWS_AS(StrikePricer(StrikeConfig{12, 32, 0}), VoxError);
        REQUIRE_THROWS_AS(StrikePricer(StrikeConfig{10, 32, 1}), VoxError);
    }

    SECTION("Setters leave config untouched on failure") {
        StrikePricer pricer({12, 32, 100 * ETHER});

        REQUIRE(pricer.set_min_multiplier(32) == errors::INVALID_MULTIPLIER);
        REQUIRE(pricer.set_max_multiplier(12) == errors::INVALID_MULTIPLIER);
        REQUIRE(pricer.set_max_multiplier(40) == errors::INVALID_MULTIPLIER);
        REQUIRE(pricer.set_threshold(0) == errors::INVALID_THRESHOLD);
        REQUIRE(pricer.config().min_multiplier == 12);
        REQUIRE(pricer.config().max_multiplier == 32);
        REQUIRE(pricer.config().threshold == 100 * ETHER);

        REQUIRE(pricer.set_min_multiplier(15) == errors::OK);
        REQUIRE(pricer.set_max_multiplier(30) == errors::OK);
        REQUIRE(pricer.set_threshold(5 * ETHER) == errors::OK);
        REQUIRE(pricer.config().min_multiplier == 15);
        REQUIRE(pricer.config().max_multiplier == 30);
        REQUIRE(pricer.config().threshold == 5 * ETHER);
    }
}

TEST_CASE("Strike price curve", "[strike]") {
    StrikePricer pricer({12, 32, 100 * ETHER});
    const U256 spot = Q96;  // price 1.0
    const U256 floor_price = full_math::mul_div(spot, U256(12), U256(10));
    const U256 ceiling_price = full_math::mul_div(spot, U256(32), U256(10));

    SECTION("Ramp branch lies strictly between floor and zero-liquidity extreme") {
        U256 strike = pricer.strike_price(spot, 50 * ETHER);
        REQUIRE(strike > floor_price);
        REQUIRE(strike < ceiling_price);
        // Halfway down the ramp adds (3.2 - 1.2) / 2 = 1.0x spot
        REQUIRE(strike == floor_price + spot);
        REQUIRE(strike.to_string() == "174301957531381542705796690739");
    }

    SECTION("Continuity at the threshold") {
        REQUIRE(pricer.strike_price(spot, 100 * ETHER) == floor_price);
        REQUIRE(pricer.strike_price(spot, 100 * ETHER - 1) >= floor_price);
    }

    SECTION("Flat above the threshold") {
        REQUIRE(pricer.strike_price(spot, 101 * ETHER) == floor_price);
        REQUIRE(pricer.strike_price(spot, U128_MAX) == floor_price);
    }

    SECTION("Zero liquidity reaches the ceiling") {
        REQUIRE(pricer.strike_price(spot, 0) == ceiling_price);
    }

    SECTION("Decreasing in liquidity") {
        U256 prev = pricer.strike_price(spot, 0);
        for (U128 liq = 10 * ETHER; liq <= 100 * ETHER; liq += 10 * ETHER) {
            U256 cur = pricer.strike_price(spot, liq);
            REQUIRE(cur < prev);
            prev = cur;
        }
    }
}

TEST_CASE("Expiry price", "[strike]") {
    SECTION("Symmetric to strike around spot") {
        U256 spot = Q96;
        U256 strike = U256::from_string("174301957531381542705796690739");
        U256 expiry = StrikePricer::expiry_price(spot, strike);
        REQUIRE(expiry.to_string() == "36012801142847426178883613789");
        REQUIRE(expiry < spot);
    }

    SECTION("Round trip within one unit at the floor multiplier") {
        StrikePricer pricer({12, 32, 1});
        for (const char* text : {"79228162514264337593543950336",
                                 "118842243771396506390315925504",
                                 "123456789000000000000",
                                 "1267650600228229401496703217721"}) {
            U256 spot = U256::from_string(text);
            U256 strike = pricer.strike_price(spot, 1);
            U256 expiry = StrikePricer::expiry_price(spot, strike);
            U256 back = StrikePricer::expiry_price(spot, expiry);
            U256 diff = back > strike ? back - strike : strike - back;
            REQUIRE(diff <= U256(1));
        }
    }

    SECTION("Zero strike") {
        REQUIRE_THROWS_AS(StrikePricer::expiry_price(Q96, U256()), VoxError);
    }
}

TEST_CASE("Quote at strike", "[strike]") {
    // (2.2)^2 = 4.84 token1 per token0
    U256 strike = U256::from_string("174301957531381542705796690739");
    REQUIRE(StrikePricer::quote_at_strike(X18_ONE, strike).to_string() == "4840000000000000000");
    REQUIRE(StrikePricer::quote_at_strike(X18_ONE, Q96) == X18_ONE);
    REQUIRE(StrikePricer::quote_at_strike(U256(), strike).is_zero());
}

TEST_CASE("Quote at strike rounds up", "[strike]") {
    // 1.2 * 0.25 = 0.3 sqrt price, 0.09 token1 per token0
    U256 strike = full_math::mul_div(Q96 / U256(4), U256(12), U256(10));
    for (uint64_t amount : {1ULL, 5ULL, 11ULL}) {
        REQUIRE(StrikePricer::quote_at_strike(U256(amount), strike) == U256(1));
    }
    REQUIRE(StrikePricer::quote_at_strike(U256(12), strike) == U256(2));
    REQUIRE(StrikePricer::quote_at_strike(U256(100), strike) == U256(9));
}
