// =============================================================================
// funding.cpp - Funding rate, EMA and PnL application
// =============================================================================

#include "tickvault/funding.hpp"
#include "tickvault/errors.hpp"
#include "tickvault/uint512.hpp"

#include <algorithm>

namespace tickvault {

namespace funding {

namespace {

I128 abs128(I128 x) { return x < 0 ? -x : x; }

I128 sign(I128 x) { return x > 0 ? 1 : (x < 0 ? -1 : 0); }

// sf * 1e15 * imbalance^2 / denominator^2 without intermediate overflow
I128 squared_ratio_scaled(I128 sf_scaled, I128 imbalance, I128 denominator) {
    U128 imb = static_cast<U128>(abs128(imbalance));
    U128 den = static_cast<U128>(denominator);
    Uint512 numerator = huge_uint::mul(huge_uint::mul(U256(imb), U256(imb)), static_cast<U128>(sf_scaled));
    Uint512 divisor = huge_uint::mul(U256(den), U256(den));
    return static_cast<I128>(huge_uint::to_u128(huge_uint::div(numerator, divisor)));
}

} // namespace

FundingResult compute(const ProtocolState& state, const ProtocolConfig& config, uint64_t timestamp) {
    if (timestamp < state.last_update_timestamp) {
        throw ProtocolError(Error::TIMESTAMP_TOO_OLD, "funding requested before last update",
                            {.timestamp = timestamp});
    }

    FundingResult result;
    result.old_long_expo = state.long_trading_expo();

    if (timestamp == state.last_update_timestamp) {
        result.funding_per_day = state.ema;
        return result;
    }

    I128 long_expo = result.old_long_expo;
    I128 vault_expo = state.balance_vault;
    I128 sf_scaled = config.funding_sf * constants::FUNDING_SF_SCALE;

    if (vault_expo == 0) {
        result.funding_per_day = sign(long_expo) * sf_scaled + state.ema;
    } else {
        I128 imbalance = long_expo - vault_expo;
        I128 denominator = std::max(long_expo, vault_expo);
        I128 magnitude = imbalance == 0 ? 0 : squared_ratio_scaled(sf_scaled, imbalance, denominator);
        result.funding_per_day = sign(imbalance) * magnitude + state.ema;
    }

    uint64_t elapsed = timestamp - state.last_update_timestamp;
    result.funding = mul_div(result.funding_per_day, static_cast<I128>(elapsed),
                             static_cast<I128>(constants::SECONDS_PER_DAY));
    return result;
}

I128 funding_asset(const FundingResult& result) {
    if (result.old_long_expo <= 0) return 0;
    return mul_div(result.funding, result.old_long_expo, X18_ONE);
}

I128 updated_ema(I128 ema, I128 funding_per_day, uint64_t elapsed, uint64_t ema_period) {
    if (elapsed >= ema_period) {
        return funding_per_day;
    }
    I128 e = static_cast<I128>(elapsed);
    I128 p = static_cast<I128>(ema_period);
    return (funding_per_day * e + ema * (p - e)) / p;
}

I128 long_asset_available(I128 total_expo, I128 balance_long, I128 new_price, I128 old_price) {
    if (new_price <= 0) {
        throw ProtocolError(Error::INVALID_PRICE, "", {.price = new_price});
    }
    return total_expo - mul_div(total_expo - balance_long, old_price, new_price);
}

I128 vault_asset_available(I128 total_expo, I128 balance_vault, I128 balance_long, I128 new_price,
                           I128 old_price) {
    I128 available = balance_vault + balance_long -
                     long_asset_available(total_expo, balance_long, new_price, old_price);
    return available < 0 ? 0 : available;
}

I128 long_asset_available_with_funding(const ProtocolState& state, const ProtocolConfig& config,
                                       I128 price, uint64_t timestamp) {
    FundingResult f = compute(state, config, timestamp);
    I128 available = long_asset_available(state.total_expo, state.balance_long, price, state.last_price) -
                     funding_asset(f);

    // The long side always keeps a minimum trading expo
    I128 max_long_balance = mul_div(state.total_expo,
                                    constants::BPS_DIVISOR - constants::MIN_LONG_TRADING_EXPO_BPS,
                                    constants::BPS_DIVISOR);
    if (state.total_expo > 0 && available > max_long_balance) {
        available = max_long_balance;
    }
    return available;
}

Balances clamp_bad_debt(I128 balance_long, I128 balance_vault) {
    if (balance_long < 0) {
        balance_vault += balance_long;
        balance_long = 0;
    }
    if (balance_vault < 0) {
        balance_long += balance_vault;
        balance_vault = 0;
    }
    return {balance_long, balance_vault};
}

ApplyResult apply_pnl_and_funding(ProtocolState& state, const ProtocolConfig& config, I128 price,
                                  uint64_t timestamp, IEventSink& events) {
    if (timestamp <= state.last_update_timestamp) {
        return {false, state.balance_long, state.balance_vault};
    }

    FundingResult f = compute(state, config, timestamp);
    I128 total_balance = state.balance_long + state.balance_vault;
    I128 new_long = long_asset_available_with_funding(state, config, price, timestamp);
    Balances clamped = clamp_bad_debt(new_long, total_balance - new_long);

    state.ema = updated_ema(state.ema, f.funding_per_day, timestamp - state.last_update_timestamp,
                            config.ema_period);
    state.last_funding_per_day = f.funding_per_day;
    state.balance_long = clamped.balance_long;
    state.balance_vault = clamped.balance_vault;
    state.last_price = price;
    state.last_update_timestamp = timestamp;

    events.on_funding_updated(f.funding_per_day, state.ema, timestamp);
    return {true, new_long, total_balance - new_long};
}

} // namespace funding

} // namespace tickvault
