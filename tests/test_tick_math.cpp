// TickVault - Tick Math Tests

#include <catch2/catch.hpp>
#include <tickvault/errors.hpp>
#include <tickvault/tick_math.hpp>

#include <vector>

using namespace tickvault;

TEST_CASE("Price at tick", "[tick_math]") {
    SECTION("Tick zero is one") {
        REQUIRE(tick_math::price_at_tick(0) == X18_ONE);
    }

    SECTION("Strictly increasing") {
        for (int32_t tick : {-322378, -100000, -1, 0, 1, 69081, 200000, 459999}) {
            REQUIRE(tick_math::price_at_tick(tick) < tick_math::price_at_tick(tick + 1));
        }
    }

    SECTION("Range bounds") {
        REQUIRE(tick_math::price_at_tick(tick_math::MIN_TICK) == tick_math::min_price());
        REQUIRE(tick_math::price_at_tick(tick_math::MAX_TICK) == tick_math::max_price());
        REQUIRE(tick_math::min_price() > 0);
    }

    SECTION("Out of range ticks throw") {
        REQUIRE_THROWS_AS(tick_math::price_at_tick(tick_math::MAX_TICK + 1), ProtocolError);
        REQUIRE_THROWS_AS(tick_math::price_at_tick(tick_math::MIN_TICK - 1), ProtocolError);
    }
}

TEST_CASE("Tick at price", "[tick_math]") {
    SECTION("Inverse of price_at_tick") {
        for (int32_t tick : {-300000, -5000, -1, 0, 1, 69000, 69081, 123456, 460000}) {
            REQUIRE(tick_math::tick_at_price(tick_math::price_at_tick(tick)) == tick);
        }
    }

    SECTION("Largest tick whose price is <= price") {
        I128 between = tick_math::price_at_tick(1000) + 1;
        REQUIRE(tick_math::tick_at_price(between) == 1000);
        REQUIRE(tick_math::tick_at_price(tick_math::price_at_tick(1001) - 1) == 1000);
    }

    SECTION("1000 lands in tick 69081") {
        REQUIRE(tick_math::tick_at_price(x18::from_int(1000)) == 69081);
    }

    SECTION("Out of range prices") {
        try {
            tick_math::tick_at_price(0);
            FAIL("expected INVALID_PRICE");
        } catch (const ProtocolError& e) {
            REQUIRE(e.code() == Error::INVALID_PRICE);
            REQUIRE(e.context().price.has_value());
        }
        REQUIRE(tick_math::tick_at_price_clamped(0) == tick_math::MIN_TICK);
        REQUIRE(tick_math::tick_at_price_clamped(I128_MAX) == tick_math::MAX_TICK);
    }
}

TEST_CASE("Usable ticks and rounding", "[tick_math]") {
    REQUIRE(tick_math::min_usable_tick(100) == -322300);
    REQUIRE(tick_math::max_usable_tick(100) == 460000);
    REQUIRE(tick_math::min_usable_tick(1) == tick_math::MIN_TICK);
    REQUIRE(tick_math::max_usable_tick(60) == 459960);

    REQUIRE(tick_math::round_down(150, 100) == 100);
    REQUIRE(tick_math::round_down(-150, 100) == -200);
    REQUIRE(tick_math::round_down(-200, 100) == -200);
    REQUIRE(tick_math::round_down(0, 100) == 0);
}
