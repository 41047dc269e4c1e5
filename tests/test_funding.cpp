// TickVault - Funding & PnL Tests

#include <catch2/catch.hpp>
#include <tickvault/errors.hpp>
#include <tickvault/events.hpp>
#include <tickvault/funding.hpp>

using namespace tickvault;

namespace {

const I128 EMA = 300000000000000;  // 0.0003 per day

// Long trading expo 1000, vault trading expo `vault`
ProtocolState book_with_vault(int64_t vault) {
    ProtocolState state;
    state.total_expo = x18::from_int(2000);
    state.balance_long = x18::from_int(1000);
    state.balance_vault = x18::from_int(vault);
    state.last_price = x18::from_int(2000);
    state.last_update_timestamp = 1000;
    state.ema = EMA;
    return state;
}

I128 abs128(I128 v) { return v < 0 ? -v : v; }

} // namespace

TEST_CASE("Funding per day", "[funding]") {
    ProtocolConfig config;

    SECTION("Imbalance of half the long expo") {
        // imbalance^2 / long^2 = 0.25
        auto result = funding::compute(book_with_vault(500), config, 2000);
        REQUIRE(result.funding_per_day == 12 * constants::FUNDING_SF_SCALE / 4 + EMA);
        REQUIRE(result.old_long_expo == x18::from_int(1000));
        REQUIRE(result.funding == mul_div(result.funding_per_day, 1000, 86400));
    }

    SECTION("Doubling the scaling factor doubles the premium") {
        ProtocolConfig doubled = ProtocolConfig().with_funding(24, EMA, config.ema_period);
        auto base = funding::compute(book_with_vault(500), config, 2000);
        auto twice = funding::compute(book_with_vault(500), doubled, 2000);
        REQUIRE(twice.funding_per_day - EMA == 2 * (base.funding_per_day - EMA));
    }

    SECTION("Sign follows the imbalance") {
        REQUIRE(funding::compute(book_with_vault(500), config, 2000).funding_per_day > EMA);
        REQUIRE(funding::compute(book_with_vault(1500), config, 2000).funding_per_day < EMA);
        REQUIRE(funding::compute(book_with_vault(1000), config, 2000).funding_per_day == EMA);
    }

    SECTION("Halving the imbalance quarters the premium") {
        I128 full = funding::compute(book_with_vault(500), config, 2000).funding_per_day - EMA;
        I128 half = funding::compute(book_with_vault(750), config, 2000).funding_per_day - EMA;
        REQUIRE(abs128(full - 4 * half) <= 4);
    }

    SECTION("Empty vault") {
        auto result = funding::compute(book_with_vault(0), config, 2000);
        REQUIRE(result.funding_per_day == 12 * constants::FUNDING_SF_SCALE + EMA);
    }

    SECTION("Same timestamp returns the EMA and no funding") {
        auto result = funding::compute(book_with_vault(500), config, 1000);
        REQUIRE(result.funding_per_day == EMA);
        REQUIRE(result.funding == 0);
    }

    SECTION("Earlier timestamp") {
        try {
            funding::compute(book_with_vault(500), config, 999);
            FAIL("expected TIMESTAMP_TOO_OLD");
        } catch (const ProtocolError& e) {
            REQUIRE(e.code() == Error::TIMESTAMP_TOO_OLD);
            REQUIRE(e.kind() == ErrorKind::STALENESS);
            REQUIRE(e.context().timestamp == 999);
        }
    }

    SECTION("A full day accrues one day of funding") {
        auto result = funding::compute(book_with_vault(500), config, 1000 + constants::SECONDS_PER_DAY);
        REQUIRE(result.funding == result.funding_per_day);
        REQUIRE(funding::funding_asset(result) == mul_div(result.funding, x18::from_int(1000), X18_ONE));
    }
}

TEST_CASE("EMA", "[funding]") {
    const uint64_t period = 432000;

    REQUIRE(funding::updated_ema(100, 200, 0, period) == 100);
    REQUIRE(funding::updated_ema(100, 200, period / 2, period) == 150);
    REQUIRE(funding::updated_ema(100, 200, period, period) == 200);
    REQUIRE(funding::updated_ema(100, 200, period * 3, period) == 200);
}

TEST_CASE("Asset availability", "[funding]") {
    const I128 total = x18::from_int(2000);
    const I128 long_balance = x18::from_int(1000);

    SECTION("Price PnL") {
        REQUIRE(funding::long_asset_available(total, long_balance, x18::from_int(2000), x18::from_int(2000)) ==
                long_balance);
        REQUIRE(funding::long_asset_available(total, long_balance, x18::from_int(4000), x18::from_int(2000)) ==
                x18::from_int(1500));
        REQUIRE(funding::vault_asset_available(total, x18::from_int(500), long_balance, x18::from_int(4000),
                                               x18::from_int(2000)) == 0);
    }

    SECTION("Long side keeps a minimum trading expo") {
        ProtocolConfig config;
        ProtocolState state = book_with_vault(1000);
        I128 available = funding::long_asset_available_with_funding(state, config, x18::from_int(1000000),
                                                                    state.last_update_timestamp);
        REQUIRE(available == mul_div(total, 9900, 10000));
    }
}

TEST_CASE("Bad debt clamping", "[funding]") {
    auto a = funding::clamp_bad_debt(-10, 50);
    REQUIRE(a.balance_long == 0);
    REQUIRE(a.balance_vault == 40);

    auto b = funding::clamp_bad_debt(50, -10);
    REQUIRE(b.balance_long == 40);
    REQUIRE(b.balance_vault == 0);

    auto c = funding::clamp_bad_debt(30, 20);
    REQUIRE(c.balance_long == 30);
    REQUIRE(c.balance_vault == 20);
}

TEST_CASE("Applying PnL and funding", "[funding]") {
    ProtocolConfig config;
    EventBuffer events;

    SECTION("Conserves the total balance") {
        ProtocolState state = book_with_vault(500);
        I128 before = state.balance_long + state.balance_vault;

        auto result = funding::apply_pnl_and_funding(state, config, x18::from_int(1800), 5000, events);
        REQUIRE(result.price_recent);
        REQUIRE(state.balance_long + state.balance_vault == before);
        REQUIRE(state.balance_long < x18::from_int(1000));
        REQUIRE(state.last_price == x18::from_int(1800));
        REQUIRE(state.last_update_timestamp == 5000);
        REQUIRE(state.last_funding_per_day > EMA);
        REQUIRE(events.size() == 1);
    }

    SECTION("Longs pay funding at a constant price") {
        ProtocolState state = book_with_vault(500);
        funding::apply_pnl_and_funding(state, config, state.last_price, 1000 + constants::SECONDS_PER_DAY, events);
        REQUIRE(state.balance_long < x18::from_int(1000));
        REQUIRE(state.balance_vault > x18::from_int(500));
    }

    SECTION("A crash wipes the long side onto the vault") {
        ProtocolState state = book_with_vault(500);
        funding::apply_pnl_and_funding(state, config, x18::from_int(100), 2000, events);
        REQUIRE(state.balance_long == 0);
        REQUIRE(state.balance_vault == x18::from_int(1500));
    }

    SECTION("Non-recent price leaves the state untouched") {
        ProtocolState state = book_with_vault(500);
        auto result = funding::apply_pnl_and_funding(state, config, x18::from_int(1000), 1000, events);
        REQUIRE_FALSE(result.price_recent);
        REQUIRE(state.last_price == x18::from_int(2000));
        REQUIRE(state.balance_long == x18::from_int(1000));
        REQUIRE(events.empty());
    }
}
