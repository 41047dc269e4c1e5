// =============================================================================
// liquidation.cpp - Bounded sweep over underwater ticks
// =============================================================================

#include "tickvault/liquidation.hpp"
#include "tickvault/funding.hpp"
#include "tickvault/liquidation_multiplier.hpp"
#include "tickvault/log.hpp"
#include "tickvault/positions.hpp"
#include "tickvault/tick_bitmap.hpp"
#include "tickvault/tick_math.hpp"

#include <algorithm>

namespace tickvault {

LiquidationEffects liquidate_positions(ProtocolState& state, const ProtocolConfig& config,
                                       I128 current_price, uint16_t iterations,
                                       I128 long_balance, I128 vault_balance, IEventSink& events) {
    LiquidationEffects effects;
    funding::Balances unchanged = funding::clamp_bad_debt(long_balance, vault_balance);
    effects.new_long_balance = unchanged.balance_long;
    effects.new_vault_balance = unchanged.balance_vault;

    iterations = std::min(iterations, constants::MAX_LIQUIDATION_ITERATION);
    if (state.total_long_positions == 0 || iterations == 0) {
        return effects;
    }

    // The multiplier is frozen for the whole sweep
    I128 long_trading_expo = state.total_expo - long_balance;
    U256 mult = multiplier::fixed_precision_multiplier(current_price, long_trading_expo,
                                                       state.liq_multiplier_accumulator);

    int32_t min_tick = tick_math::min_usable_tick(config.tick_spacing);
    int32_t search_start = state.highest_populated_tick;
    I128 expo_to_remove = 0;
    Uint512 accumulator_to_remove;

    while (effects.liquidated_ticks < iterations) {
        size_t index = state.bitmap.find_last_set(
            tick_to_bitmap_index(std::max(search_start, min_tick), config.tick_spacing));
        if (index == TickBitmap::NOT_FOUND) break;

        int32_t tick = bitmap_index_to_tick(index, config.tick_spacing);
        // A tick is reached once the price is at or below its effective price
        if (book::effective_price_for_tick(tick, mult) < current_price) break;

        TickBucket& bucket = state.ticks[tick];
        int32_t penalty = bucket.data.liquidation_penalty;
        I128 unadjusted_without_penalty = tick_math::price_at_tick(tick - penalty);
        I128 price_without_penalty = multiplier::adjust_price(unadjusted_without_penalty, mult);
        I128 value = pricing::position_value(bucket.data.total_expo, current_price, price_without_penalty);

        LiquidatedTick liquidated{
            tick,
            bucket.version,
            LiqTickInfo{
                bucket.data.total_pos,
                bucket.data.total_expo,
                value,
                book::effective_price_for_tick(tick, mult),
                price_without_penalty,
            },
            value,
        };

        effects.remaining_collateral += value;
        effects.liquidated_positions += bucket.data.total_pos;
        expo_to_remove += bucket.data.total_expo;
        accumulator_to_remove = huge_uint::add(
            accumulator_to_remove,
            multiplier::accumulator_term(unadjusted_without_penalty, bucket.data.total_expo));

        bucket.version += 1;
        bucket.data = TickData{};
        bucket.positions.clear();
        state.bitmap.unset(index);

        events.on_liquidated_tick(tick, liquidated.old_version, current_price, liquidated.info.tick_price, value);
        log::logger()->info("liquidated tick {} (v{}): {} positions, value {}",
                            tick, liquidated.old_version, liquidated.info.total_positions,
                            x18::to_decimal_string(value));

        effects.ticks.push_back(liquidated);
        effects.liquidated_ticks += 1;
        search_start = tick - config.tick_spacing;
        if (search_start < min_tick) break;
    }

    if (effects.liquidated_ticks == 0) {
        return effects;
    }

    state.total_expo -= expo_to_remove;
    state.total_long_positions -= effects.liquidated_positions;
    state.liq_multiplier_accumulator = huge_uint::sub(state.liq_multiplier_accumulator, accumulator_to_remove);
    state.highest_populated_tick = book::find_highest_populated_tick(state, config, search_start);
    events.on_highest_populated_tick_updated(state.highest_populated_tick);

    if (effects.liquidated_ticks == iterations && state.total_long_positions > 0 &&
        state.tick_data(state.highest_populated_tick) != nullptr &&
        state.tick_data(state.highest_populated_tick)->total_pos > 0 &&
        book::effective_price_for_tick(state.highest_populated_tick, mult) >= current_price) {
        effects.is_liquidation_pending = true;
    }

    // Positive remaining collateral goes to the vault, bad debt is taken from it
    funding::Balances balances = funding::clamp_bad_debt(long_balance - effects.remaining_collateral,
                                                         vault_balance + effects.remaining_collateral);
    effects.new_long_balance = balances.balance_long;
    effects.new_vault_balance = balances.balance_vault;
    return effects;
}

} // namespace tickvault
