// =============================================================================
// positions.cpp - Tick-indexed long position store and pricing
// =============================================================================

#include "tickvault/positions.hpp"
#include "tickvault/errors.hpp"
#include "tickvault/liquidation_multiplier.hpp"
#include "tickvault/tick_bitmap.hpp"
#include "tickvault/tick_math.hpp"

#include <algorithm>

namespace tickvault {

// =============================================================================
// Pricing
// =============================================================================

namespace pricing {

I128 position_value(I128 total_expo, I128 current_price, I128 liq_price_without_penalty) {
    if (current_price <= 0) {
        throw ProtocolError(Error::INVALID_PRICE, "position value needs a positive price",
                            {.price = current_price});
    }
    return mul_div(total_expo, current_price - liq_price_without_penalty, current_price);
}

I128 calc_position_total_expo(I128 amount, I128 start_price, I128 liq_price) {
    if (liq_price >= start_price) {
        throw ProtocolError(Error::INVALID_LIQUIDATION_PRICE, "liquidation price above start price",
                            {.price = liq_price});
    }
    return mul_div(amount, start_price, start_price - liq_price);
}

I128 get_leverage(I128 start_price, I128 liq_price) {
    if (liq_price >= start_price) {
        throw ProtocolError(Error::INVALID_LIQUIDATION_PRICE, "liquidation price above start price",
                            {.price = liq_price});
    }
    return mul_div(start_price, X18_ONE, start_price - liq_price);
}

I128 get_liquidation_price(I128 start_price, I128 leverage) {
    if (leverage <= X18_ONE) {
        throw ProtocolError(Error::LEVERAGE_TOO_LOW, "leverage must be above 1x");
    }
    return start_price - mul_div(start_price, X18_ONE, leverage);
}

I128 imbalance_open_bps(I128 vault_expo, I128 long_expo) {
    if (vault_expo <= 0) {
        throw ProtocolError(Error::EMPTY_VAULT, "vault expo is not positive");
    }
    return mul_div(long_expo - vault_expo, constants::BPS_DIVISOR, vault_expo);
}

I128 imbalance_close_bps(I128 vault_expo, I128 long_expo) {
    if (long_expo <= 0) {
        throw ProtocolError(Error::ZERO_TOTAL_EXPO, "long trading expo is not positive");
    }
    return mul_div(vault_expo - long_expo, constants::BPS_DIVISOR, long_expo);
}

} // namespace pricing

// =============================================================================
// Long Book
// =============================================================================

namespace book {

namespace {

// State is ProtocolState or const ProtocolState
template <typename State>
auto& live_bucket(State& state, const PositionId& pos_id) {
    auto it = state.ticks.find(pos_id.tick);
    uint64_t version = it == state.ticks.end() ? 0 : it->second.version;
    if (version != pos_id.tick_version) {
        throw ProtocolError(Error::OUTDATED_TICK, "tick was liquidated", {.tick = pos_id.tick});
    }
    if (it == state.ticks.end()) {
        throw ProtocolError(Error::POSITION_NOT_FOUND, "", {.tick = pos_id.tick});
    }
    return it->second;
}

template <typename Bucket>
auto& live_slot(Bucket& bucket, const PositionId& pos_id) {
    if (pos_id.index >= bucket.positions.size() || !bucket.positions[pos_id.index]) {
        throw ProtocolError(Error::POSITION_NOT_FOUND,
                            "no position at index " + std::to_string(pos_id.index),
                            {.tick = pos_id.tick});
    }
    return bucket.positions[pos_id.index];
}

} // namespace

U256 current_multiplier(const ProtocolState& state) {
    return multiplier::fixed_precision_multiplier(state.last_price, state.long_trading_expo(),
                                                  state.liq_multiplier_accumulator);
}

I128 effective_price_for_tick(const ProtocolState& state, int32_t tick) {
    return effective_price_for_tick(tick, current_multiplier(state));
}

I128 effective_price_for_tick(int32_t tick, const U256& multiplier) {
    return multiplier::adjust_price(tick_math::price_at_tick(tick), multiplier);
}

int32_t effective_tick_for_price(const ProtocolState& state, const ProtocolConfig& config, I128 price) {
    return effective_tick_for_price(price, state.last_price, state.long_trading_expo(),
                                    state.liq_multiplier_accumulator, config.tick_spacing);
}

int32_t effective_tick_for_price(I128 price, I128 asset_price, I128 long_trading_expo,
                                 const Uint512& accumulator, int32_t tick_spacing) {
    int32_t min_tick = tick_math::min_usable_tick(tick_spacing);
    int32_t max_tick = tick_math::max_usable_tick(tick_spacing);
    if (price <= 0) return min_tick;

    I128 unadjusted = multiplier::unadjust_price(price, asset_price, long_trading_expo, accumulator);
    int32_t tick = tick_math::round_down(tick_math::tick_at_price_clamped(unadjusted), tick_spacing);
    return std::clamp(tick, min_tick, max_tick);
}

std::pair<int32_t, int32_t> get_tick_from_desired_liq_price(const ProtocolState& state,
                                                             const ProtocolConfig& config,
                                                             I128 desired_liq_price_without_penalty,
                                                             int32_t liquidation_penalty) {
    int32_t tick_without_penalty = effective_tick_for_price(state, config, desired_liq_price_without_penalty);
    int32_t tick = std::min(tick_without_penalty + liquidation_penalty,
                            tick_math::max_usable_tick(config.tick_spacing));

    const TickData* data = state.tick_data(tick);
    if (data != nullptr && data->total_pos > 0) {
        liquidation_penalty = data->liquidation_penalty;
    }
    return {tick, liquidation_penalty};
}

I128 tick_value(const ProtocolState& state, int32_t tick, I128 current_price, const U256& multiplier) {
    const TickData* data = state.tick_data(tick);
    if (data == nullptr || data->total_pos == 0) return 0;
    I128 liq_price = effective_price_for_tick(tick - data->liquidation_penalty, multiplier);
    return pricing::position_value(data->total_expo, current_price, liq_price);
}

int32_t find_highest_populated_tick(const ProtocolState& state, const ProtocolConfig& config,
                                    int32_t search_start) {
    int32_t min_tick = tick_math::min_usable_tick(config.tick_spacing);
    int32_t max_tick = tick_math::max_usable_tick(config.tick_spacing);
    if (search_start < min_tick || state.bitmap.empty()) return min_tick;
    search_start = tick_math::round_down(std::min(search_start, max_tick), config.tick_spacing);

    size_t index = state.bitmap.find_last_set(tick_to_bitmap_index(search_start, config.tick_spacing));
    if (index == TickBitmap::NOT_FOUND) return min_tick;
    return bitmap_index_to_tick(index, config.tick_spacing);
}

PositionId save_new_position(ProtocolState& state, const ProtocolConfig& config, int32_t tick,
                             const Position& position, int32_t liquidation_penalty) {
    size_t bitmap_index = tick_to_bitmap_index(tick, config.tick_spacing);

    TickBucket& bucket = state.ticks[tick];
    if (bucket.data.total_pos == 0) {
        bucket.data.liquidation_penalty = liquidation_penalty;
        state.bitmap.set(bitmap_index);
    } else if (bucket.data.liquidation_penalty != liquidation_penalty) {
        throw ProtocolError(Error::INVALID_TICK, "liquidation penalty differs from the tick's", {.tick = tick});
    }

    bucket.positions.emplace_back(position);
    bucket.data.total_expo += position.total_expo;
    bucket.data.total_pos += 1;

    state.total_expo += position.total_expo;
    state.total_long_positions += 1;
    state.liq_multiplier_accumulator = huge_uint::add(
        state.liq_multiplier_accumulator,
        multiplier::accumulator_term(tick_math::price_at_tick(tick - liquidation_penalty), position.total_expo));

    if (tick > state.highest_populated_tick) {
        state.highest_populated_tick = tick;
    }

    return PositionId{tick, bucket.version, bucket.positions.size() - 1};
}

void remove_amount_from_position(ProtocolState& state, const ProtocolConfig& config,
                                 const PositionId& pos_id, I128 amount_to_remove,
                                 I128 total_expo_to_remove) {
    TickBucket& bucket = live_bucket(state, pos_id);
    auto& slot = live_slot(bucket, pos_id);

    if (amount_to_remove > slot->amount) {
        throw ProtocolError(Error::AMOUNT_TO_CLOSE_TOO_HIGH, "", {.tick = pos_id.tick});
    }

    if (amount_to_remove == slot->amount) {
        total_expo_to_remove = slot->total_expo;
        slot.reset();
        bucket.data.total_pos -= 1;
        state.total_long_positions -= 1;
    } else {
        slot->amount -= amount_to_remove;
        slot->total_expo -= total_expo_to_remove;
    }

    bucket.data.total_expo -= total_expo_to_remove;
    state.total_expo -= total_expo_to_remove;
    state.liq_multiplier_accumulator = huge_uint::sub(
        state.liq_multiplier_accumulator,
        multiplier::accumulator_term(tick_math::price_at_tick(pos_id.tick - bucket.data.liquidation_penalty),
                                     total_expo_to_remove));

    if (bucket.data.total_pos == 0) {
        bucket.data.total_expo = 0;
        state.bitmap.unset(tick_to_bitmap_index(pos_id.tick, config.tick_spacing));
        if (pos_id.tick == state.highest_populated_tick) {
            state.highest_populated_tick =
                find_highest_populated_tick(state, config, pos_id.tick - config.tick_spacing);
        }
    }
}

std::pair<Position, int32_t> get_long_position(const ProtocolState& state, const PositionId& pos_id) {
    const TickBucket& bucket = live_bucket(state, pos_id);
    return {*live_slot(bucket, pos_id), bucket.data.liquidation_penalty};
}

void finalize_position(ProtocolState& state, const PositionId& pos_id, I128 new_total_expo) {
    TickBucket& bucket = live_bucket(state, pos_id);
    auto& slot = live_slot(bucket, pos_id);

    I128 delta = new_total_expo - slot->total_expo;
    slot->total_expo = new_total_expo;
    slot->validated = true;
    bucket.data.total_expo += delta;
    state.total_expo += delta;

    Uint512 term = multiplier::accumulator_term(
        tick_math::price_at_tick(pos_id.tick - bucket.data.liquidation_penalty), delta < 0 ? -delta : delta);
    state.liq_multiplier_accumulator = delta >= 0 ? huge_uint::add(state.liq_multiplier_accumulator, term)
                                                  : huge_uint::sub(state.liq_multiplier_accumulator, term);
}

I128 get_position_value(const ProtocolState& state, const PositionId& pos_id, I128 price) {
    auto [position, penalty] = get_long_position(state, pos_id);
    I128 liq_price = effective_price_for_tick(pos_id.tick - penalty, current_multiplier(state));
    return pricing::position_value(position.total_expo, price, liq_price);
}

} // namespace book

} // namespace tickvault
